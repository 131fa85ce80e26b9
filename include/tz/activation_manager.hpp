#pragma once

#include "tz/environment.hpp"
#include "tz/session_context.hpp"

#include <string>

namespace tzupdater {

class ActivationManager {
  public:
    explicit ActivationManager(IEnvironment& env);

    // Points the session at `compiled_dir` and publishes it as TZDIR. The
    // directory is not inspected.
    void Activate(SessionContext& ctx, const std::string& compiled_dir, bool verbose = false);

    // Release recorded in the active dataset's marker, kNoActiveRelease when
    // nothing was activated or the marker cannot be read.
    std::string CurrentVersion(const SessionContext& ctx) const;

    // Marker content of `compiled_dir`, empty when absent or unreadable.
    static std::string ReadVersionMarker(const std::string& compiled_dir);

  private:
    IEnvironment& env_;
};

} // namespace tzupdater
