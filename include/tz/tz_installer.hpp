#pragma once

#include "tz/activation_manager.hpp"
#include "tz/archive_fetcher.hpp"
#include "tz/compilation_orchestrator.hpp"
#include "tz/environment.hpp"
#include "tz/http_transport.hpp"
#include "tz/session_context.hpp"
#include "tz/version_resolver.hpp"
#include "tz/zic_runner.hpp"
#include "util/result.hpp"
#include "util/settings.hpp"

#include <functional>
#include <string>

namespace tzupdater {

inline constexpr const char kBugReportUrl[] = "https://github.com/sthonnard/tzupdater";

struct InstallOptions {
    std::string target_folder;
    std::string zic_path;       // prepended to PATH for the operation when set
    bool show_zic_log = false;
    bool err_stop = true;
    bool activate = true;
    bool verbose = true;

    static InstallOptions FromSettings(const Settings& s);
};

enum class PipelineState {
    Idle,
    ResolvingVersion,
    UpToDate,
    Fetching,
    Extracting,
    Compiling,
    Activating,
    Done,
    Unresolvable,
    ToolMissing,
    FetchFailed,
    ExtractFailed,
    CompileFailed,
    InternalError,
};

const char* ToString(PipelineState state);

class TzInstaller {
  public:
    TzInstaller(IHttpTransport& transport, IZicRunner& zic, IEnvironment& env, const Settings& settings);

    void SetProgressSink(IProgress* sink) { fetcher_.SetProgressSink(sink); }

    Result InstallVersion(SessionContext& ctx, const std::string& release, const InstallOptions& opt);
    Result InstallLatest(SessionContext& ctx, const InstallOptions& opt);
    std::string GetActiveVersion(SessionContext& ctx);
    std::string GetLatestPublishedVersion(SessionContext& ctx);

    PipelineState LastState() const { return state_; }

  private:
    Result InstallVersionLocked(SessionContext& ctx, const std::string& release, const InstallOptions& opt);
    Result CompileRelease(const SessionContext& ctx,
                          const ReleaseLayout& layout,
                          const std::string& release,
                          const InstallOptions& opt);
    Result Guarded(const char* what, const std::function<Result()>& fn);
    void ReportFetchFailure(const SessionContext& ctx, const std::string& release, const Result& res) const;

    IZicRunner& zic_;
    IEnvironment& env_;
    VersionResolver resolver_;
    ArchiveFetcher fetcher_;
    CompilationOrchestrator orchestrator_;
    ActivationManager activation_;
    PipelineState state_ = PipelineState::Idle;
};

} // namespace tzupdater
