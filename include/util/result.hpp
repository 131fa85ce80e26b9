#pragma once
#include <string>
#include <utility>

namespace tzupdater {

enum class ErrorKind : int {
    None = 0,
    InvalidArgument,
    ToolMissing,
    SourceUnreachable,
    ReleaseNotFound,
    FetchFailed,
    ExtractFailed,
    ComponentCompileError,
    VersionUnresolvable,
    ConfigError,
    IoError,
    Internal,
};

const char* ToString(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .err = -1, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
};

} // namespace tzupdater
