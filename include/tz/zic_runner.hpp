#pragma once

#include "tz/environment.hpp"
#include "util/result.hpp"

#include <string>

namespace tzupdater {

struct ZicInvocation {
    int exit_status = -1;
    std::string output;  // stdout and stderr combined
};

class IZicRunner {
  public:
    virtual ~IZicRunner() = default;

    // True when the compiler can be found; `resolved` receives its location.
    virtual bool IsAvailable(std::string& resolved) const = 0;

    // zic -d <output_dir> <source_file>. A failed Result means the compiler
    // could not be started; a non-zero exit is reported in `out`.
    virtual Result Compile(const std::string& output_dir,
                           const std::string& source_file,
                           ZicInvocation& out) = 0;
};

// Runs the zic binary found through the PATH of `env`.
class ProcessZicRunner final : public IZicRunner {
  public:
    explicit ProcessZicRunner(const IEnvironment& env, std::string program = "zic");

    bool IsAvailable(std::string& resolved) const override;
    Result Compile(const std::string& output_dir,
                   const std::string& source_file,
                   ZicInvocation& out) override;

  private:
    const IEnvironment& env_;
    std::string program_;
};

} // namespace tzupdater
