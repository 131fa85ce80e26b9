#include "tz/activation_manager.hpp"

#include "io/file_reader.hpp"
#include "tz/release.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace tzupdater {

ActivationManager::ActivationManager(IEnvironment& env) : env_(env) {}

void ActivationManager::Activate(SessionContext& ctx, const std::string& compiled_dir, bool verbose) {
    ctx.active_dataset_dir = compiled_dir;

    auto res = env_.Set(kTzDirEnv, compiled_dir);
    if (!res.is_ok()) {
        LogError("Cannot publish %s: %s", kTzDirEnv, res.message().c_str());
    }

    if (verbose) {
        LogInfo("Active tz db: %s", CurrentVersion(ctx).c_str());
    }
}

std::string ActivationManager::CurrentVersion(const SessionContext& ctx) const {
    if (!ctx.active_dataset_dir)
        return kNoActiveRelease;

    std::string version = ReadVersionMarker(*ctx.active_dataset_dir);
    if (version.empty())
        return kNoActiveRelease;
    return version;
}

std::string ActivationManager::ReadVersionMarker(const std::string& compiled_dir) {
    const std::string path = (std::filesystem::path(compiled_dir) / kVersionMarkerName).string();
    std::string content;
    auto res = ReadTextFile(path, content);
    if (!res.is_ok()) {
        LogDebug("No version marker: %s", res.message().c_str());
        return {};
    }
    return content;
}

} // namespace tzupdater
