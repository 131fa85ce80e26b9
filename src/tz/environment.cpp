#include "tz/environment.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace tzupdater {

std::optional<std::string> PosixEnvironment::Get(const std::string& name) const {
    const char* v = std::getenv(name.c_str());
    if (!v)
        return std::nullopt;
    return std::string(v);
}

Result PosixEnvironment::Set(const std::string& name, const std::string& value) {
    if (::setenv(name.c_str(), value.c_str(), 1) != 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::IoError, err, "setenv " + name + " failed: " + std::strerror(err));
    }
    return Result::Ok();
}

Result PosixEnvironment::Unset(const std::string& name) {
    if (::unsetenv(name.c_str()) != 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::IoError, err, "unsetenv " + name + " failed: " + std::strerror(err));
    }
    return Result::Ok();
}

} // namespace tzupdater
