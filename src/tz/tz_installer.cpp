#include "tz/tz_installer.hpp"

#include "tz/release.hpp"
#include "tz/scoped_search_path.hpp"
#include "util/logger.hpp"

#include <exception>
#include <filesystem>
#include <mutex>
#include <optional>

namespace tzupdater {

namespace {

bool IsCompiled(const ReleaseLayout& layout, const std::string& release) {
    return ActivationManager::ReadVersionMarker(layout.compiled_dir.string()) == release;
}

} // namespace

const char* ToString(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:             return "Idle";
        case PipelineState::ResolvingVersion: return "ResolvingVersion";
        case PipelineState::UpToDate:         return "UpToDate";
        case PipelineState::Fetching:         return "Fetching";
        case PipelineState::Extracting:       return "Extracting";
        case PipelineState::Compiling:        return "Compiling";
        case PipelineState::Activating:       return "Activating";
        case PipelineState::Done:             return "Done";
        case PipelineState::Unresolvable:     return "Unresolvable";
        case PipelineState::ToolMissing:      return "ToolMissing";
        case PipelineState::FetchFailed:      return "FetchFailed";
        case PipelineState::ExtractFailed:    return "ExtractFailed";
        case PipelineState::CompileFailed:    return "CompileFailed";
        case PipelineState::InternalError:    return "InternalError";
    }
    return "Unknown";
}

InstallOptions InstallOptions::FromSettings(const Settings& s) {
    InstallOptions o;
    o.target_folder = s.target_folder;
    o.zic_path = s.zic_path;
    o.show_zic_log = s.show_zic_log;
    o.err_stop = s.err_stop;
    o.activate = s.activate;
    o.verbose = s.verbose;
    return o;
}

TzInstaller::TzInstaller(IHttpTransport& transport, IZicRunner& zic, IEnvironment& env, const Settings& settings)
    : zic_(zic),
      env_(env),
      resolver_(transport, settings.iana_website_url),
      fetcher_(transport, settings.download_base_url),
      orchestrator_(zic),
      activation_(env) {
    fetcher_.SetExpectedDigests(settings.checksums);
}

Result TzInstaller::Guarded(const char* what, const std::function<Result()>& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        state_ = PipelineState::InternalError;
        LogError("Unexpected error when %s: %s", what, e.what());
        LogError("If you keep experiencing the issue please report at %s", kBugReportUrl);
        return Result::Fail(ErrorKind::Internal, std::string("unexpected error: ") + e.what());
    }
}

Result TzInstaller::InstallVersion(SessionContext& ctx, const std::string& release, const InstallOptions& opt) {
    std::lock_guard<std::mutex> lk(ctx.mu);
    return Guarded("installing a given Time Zone Database from the IANA website",
                   [&] { return InstallVersionLocked(ctx, release, opt); });
}

Result TzInstaller::InstallLatest(SessionContext& ctx, const InstallOptions& opt) {
    std::lock_guard<std::mutex> lk(ctx.mu);
    return Guarded("installing the latest Time Zone Database", [&]() -> Result {
        state_ = PipelineState::ResolvingVersion;
        const std::string latest = resolver_.ResolveLatest(ctx);
        const std::string active = activation_.CurrentVersion(ctx);

        if (latest == kUnknownRelease) {
            state_ = PipelineState::Unresolvable;
            LogWarn("Please fetch the name of the last IANA tz database at %s and install it with "
                    "'tzupdater install <release>' in case it does not match with your active tz db, %s",
                    resolver_.PageUrl().c_str(), active.c_str());
            return Result::Fail(ErrorKind::VersionUnresolvable,
                                "cannot determine the latest published tz database");
        }

        if (latest == active) {
            state_ = PipelineState::UpToDate;
            if (opt.verbose) {
                LogInfo("Local tz database %s is up to date.", active.c_str());
            }
            return Result::Ok();
        }

        if (opt.verbose) {
            LogInfo("Local tz database %s outdated. Will install %s now.", active.c_str(), latest.c_str());
        }

        InstallOptions forced = opt;
        forced.show_zic_log = false;
        forced.err_stop = true;
        forced.activate = true;
        return InstallVersionLocked(ctx, latest, forced);
    });
}

std::string TzInstaller::GetActiveVersion(SessionContext& ctx) {
    std::lock_guard<std::mutex> lk(ctx.mu);
    return activation_.CurrentVersion(ctx);
}

std::string TzInstaller::GetLatestPublishedVersion(SessionContext& ctx) {
    std::lock_guard<std::mutex> lk(ctx.mu);
    return resolver_.ResolveLatest(ctx);
}

Result TzInstaller::InstallVersionLocked(SessionContext& ctx, const std::string& release, const InstallOptions& opt) {
    state_ = PipelineState::Idle;

    auto valid = ValidateReleaseId(release);
    if (!valid.is_ok())
        return valid;
    if (opt.target_folder.empty())
        return Result::Fail(ErrorKind::InvalidArgument, "target folder is empty");

    // Held until return so every exit path restores PATH.
    std::optional<ScopedSearchPath> search_path;
    if (!opt.zic_path.empty()) {
        search_path.emplace(env_, opt.zic_path);
    }

    const ReleaseLayout layout = ReleaseLayout::For(opt.target_folder, release);

    if (IsCompiled(layout, release)) {
        LogInfo("IANA Time Zone Database %s already compiled in %s", release.c_str(), layout.compiled_dir.c_str());
    } else {
        auto res = CompileRelease(ctx, layout, release, opt);
        if (!res.is_ok()) {
            LogError("Cannot install tz%s: %s", release.c_str(), res.message().c_str());
            return res;
        }
        if (opt.verbose) {
            LogInfo("IANA Time Zone Database %s installed in %s", release.c_str(), layout.compiled_dir.c_str());
        }
    }

    if (opt.activate) {
        state_ = PipelineState::Activating;
        activation_.Activate(ctx, layout.compiled_dir.string(), opt.verbose);
    }

    state_ = PipelineState::Done;
    return Result::Ok();
}

void TzInstaller::ReportFetchFailure(const SessionContext& ctx, const std::string& release, const Result& res) const {
    switch (res.kind) {
        case ErrorKind::ReleaseNotFound:
            // A 404 on the release IANA itself announces points at the site, not the release.
            if (ctx.latest_release && *ctx.latest_release == release) {
                LogError("IANA website is not serving %s although it is the latest release. "
                         "Please retry later.", release.c_str());
            } else {
                LogWarn("%s is not available!", release.c_str());
            }
            break;
        case ErrorKind::SourceUnreachable:
            LogError("IANA website is unreachable! Please check %s is reachable or retry later.",
                     resolver_.PageUrl().c_str());
            break;
        default:
            LogError("A critical issue occurred, preventing to download %s.", ArchiveFileName(release).c_str());
            break;
    }
}

Result TzInstaller::CompileRelease(const SessionContext& ctx,
                                   const ReleaseLayout& layout,
                                   const std::string& release,
                                   const InstallOptions& opt) {
    std::string zic_bin;
    if (!zic_.IsAvailable(zic_bin)) {
        state_ = PipelineState::ToolMissing;
        LogError("zic not found on your system!");
        LogError("Please install the package providing zic (tzdata, tzcode or libc-bin) or pass --zic-path");
        LogWarn("%s cannot be compiled because zic cannot be found.", release.c_str());
        return Result::Fail(ErrorKind::ToolMissing, "zic not found on the search path");
    }
    LogDebug("Using zic at %s", zic_bin.c_str());

    state_ = PipelineState::Fetching;
    std::string archive_path;
    auto fetch_res = fetcher_.EnsureArchive(release, layout.root.string(), archive_path);
    if (!fetch_res.is_ok()) {
        state_ = PipelineState::FetchFailed;
        ReportFetchFailure(ctx, release, fetch_res);
        return fetch_res;
    }

    state_ = PipelineState::Extracting;
    auto extract_res = orchestrator_.Extract(archive_path, layout);
    if (!extract_res.is_ok()) {
        state_ = PipelineState::ExtractFailed;
        return extract_res;
    }

    state_ = PipelineState::Compiling;
    CompileOptions copt;
    copt.show_compiler_log = opt.show_zic_log;
    copt.strict_on_error = opt.err_stop;
    copt.verbose = opt.verbose;

    CompileReport report;
    auto compile_res = orchestrator_.CompileSources(layout, release, copt, report);
    if (!compile_res.is_ok()) {
        state_ = PipelineState::CompileFailed;
        return compile_res;
    }
    return Result::Ok();
}

} // namespace tzupdater
