#pragma once

#include "util/result.hpp"

#include <memory>
#include <optional>
#include <string>

namespace tzupdater {

inline constexpr const char kTzDirEnv[] = "TZDIR";
inline constexpr const char kSearchPathEnv[] = "PATH";

class IEnvironment {
  public:
    virtual ~IEnvironment() = default;
    virtual std::optional<std::string> Get(const std::string& name) const = 0;
    virtual Result Set(const std::string& name, const std::string& value) = 0;
    virtual Result Unset(const std::string& name) = 0;
};

// getenv/setenv on the current process.
class PosixEnvironment final : public IEnvironment {
  public:
    std::optional<std::string> Get(const std::string& name) const override;
    Result Set(const std::string& name, const std::string& value) override;
    Result Unset(const std::string& name) override;
};

} // namespace tzupdater
