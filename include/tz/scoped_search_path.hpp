#pragma once

#include "tz/environment.hpp"

#include <optional>
#include <string>

namespace tzupdater {

// Prepends a directory to PATH for the lifetime of the object and restores
// the previous value (or absence) when destroyed.
class ScopedSearchPath {
  public:
    ScopedSearchPath(IEnvironment& env, const std::string& dir);
    ScopedSearchPath(const ScopedSearchPath&) = delete;
    ScopedSearchPath& operator=(const ScopedSearchPath&) = delete;
    ~ScopedSearchPath();

    bool Active() const { return active_; }

  private:
    IEnvironment& env_;
    std::optional<std::string> previous_;
    bool active_ = false;
};

} // namespace tzupdater
