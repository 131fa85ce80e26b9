#include "tz/compilation_orchestrator.hpp"

#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <array>
#include <filesystem>

namespace tzupdater {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kWarningTag = "warning: ";

constexpr std::array<std::string_view, 4> kOptionalComponents = {
    "backward", "pacificnew", "systemv", "factory",
};

void RemoveTree(const fs::path& dir, const char* what) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LogWarn("Cannot remove %s %s: %s", what, dir.c_str(), ec.message().c_str());
    }
}

} // namespace

const char* ToString(ComponentState state) {
    switch (state) {
        case ComponentState::Compiled: return "compiled";
        case ComponentState::Failed:   return "failed";
        case ComponentState::Missing:  return "missing";
    }
    return "unknown";
}

CompilationOrchestrator::CompilationOrchestrator(IZicRunner& zic) : zic_(zic) {}

CompilationOrchestrator::CompilationOrchestrator(IZicRunner& zic, ArchiveExtractor extractor)
    : zic_(zic), extractor_(extractor) {}

const std::vector<std::string>& CompilationOrchestrator::Components() {
    static const std::vector<std::string> kComponents = {
        "etcetera", "southamerica", "northamerica", "europe",
        "africa", "antarctica", "asia", "australasia",
        "backward", "pacificnew", "systemv", "factory",
    };
    return kComponents;
}

bool CompilationOrchestrator::IsOptional(std::string_view component) {
    return std::find(kOptionalComponents.begin(), kOptionalComponents.end(), component) !=
           kOptionalComponents.end();
}

void CompilationOrchestrator::ClassifyOutput(const std::string& output,
                                             int exit_status,
                                             std::vector<std::string>& errors,
                                             std::vector<std::string>& warnings) {
    ForEachLine(output, [&](std::string_view line) {
        if (line.find(kWarningTag) != std::string_view::npos) {
            warnings.emplace_back(line);
        } else {
            errors.emplace_back(line);
        }
    });

    if (exit_status != 0 && errors.empty()) {
        errors.push_back("zic exited with status " + std::to_string(exit_status));
    }
}

Result CompilationOrchestrator::Compile(const std::string& archive_path,
                                        const std::string& target_dir,
                                        const std::string& release,
                                        const CompileOptions& opt,
                                        CompileReport& report) {
    auto valid = ValidateReleaseId(release);
    if (!valid.is_ok())
        return valid;

    const ReleaseLayout layout = ReleaseLayout::For(target_dir, release);
    auto extract_res = Extract(archive_path, layout);
    if (!extract_res.is_ok())
        return extract_res;

    return CompileSources(layout, release, opt, report);
}

Result CompilationOrchestrator::Extract(const std::string& archive_path, const ReleaseLayout& layout) const {
    ArchiveExtractor::Stats stats{};
    auto res = extractor_.ExtractTarGz(archive_path, layout.source_dir.string(), &stats);
    if (!res.is_ok()) {
        LogError("Cannot extract %s: %s", archive_path.c_str(), res.message().c_str());
        RemoveTree(layout.source_dir, "partial extraction");
        return res;
    }
    LogDebug("Extracted %llu entries (%llu bytes) into %s",
             (unsigned long long)stats.entries,
             (unsigned long long)stats.bytes,
             layout.source_dir.c_str());
    return Result::Ok();
}

void CompilationOrchestrator::CompileComponent(const ReleaseLayout& layout,
                                               const CompileOptions& opt,
                                               ComponentOutcome& outcome) {
    const fs::path source = layout.source_dir / outcome.name;

    ZicInvocation run;
    auto res = zic_.Compile(layout.compiled_dir.string(), source.string(), run);
    if (!res.is_ok()) {
        outcome.state = ComponentState::Failed;
        outcome.exit_status = -1;
        outcome.errors.push_back(res.message());
        return;
    }

    outcome.exit_status = run.exit_status;
    ClassifyOutput(run.output, run.exit_status, outcome.errors, outcome.warnings);

    if (opt.show_compiler_log && !run.output.empty()) {
        ForEachLine(run.output, [&](std::string_view line) {
            LogInfo("  zic[%s]: %.*s", outcome.name.c_str(), (int)line.size(), line.data());
        });
    }

    outcome.state = outcome.errors.empty() ? ComponentState::Compiled : ComponentState::Failed;
}

Result CompilationOrchestrator::CompileSources(const ReleaseLayout& layout,
                                               const std::string& release,
                                               const CompileOptions& opt,
                                               CompileReport& report) {
    report = CompileReport{};
    report.compiled_dir = layout.compiled_dir.string();

    std::error_code ec;
    fs::create_directories(layout.compiled_dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::IoError, ec.value(),
                            "create_directories failed: " + layout.compiled_dir.string() + ": " + ec.message());
    }

    const LogLevel progress_level = opt.verbose ? LogLevel::Info : LogLevel::Debug;

    for (const auto& name : Components()) {
        ComponentOutcome outcome;
        outcome.name = name;
        outcome.optional = IsOptional(name);

        Logger::Instance().Log(progress_level, "Compile %s", name.c_str());

        if (!fs::exists(layout.source_dir / name, ec)) {
            outcome.state = ComponentState::Missing;
            if (outcome.optional) {
                LogDebug("  optional %s not in %s", name.c_str(), release.c_str());
            } else {
                LogWarn("  Expected %s was not in %s!", name.c_str(), release.c_str());
            }
            report.components.push_back(std::move(outcome));
            continue;
        }

        CompileComponent(layout, opt, outcome);

        if (outcome.state == ComponentState::Compiled) {
            ++report.compiled;
            for (const auto& w : outcome.warnings) {
                LogDebug("  %s: %s", name.c_str(), w.c_str());
            }
        } else {
            ++report.failed;
            for (const auto& e : outcome.errors) {
                if (opt.strict_on_error) {
                    LogError("  %s: %s", name.c_str(), e.c_str());
                } else {
                    LogWarn("  %s: %s", name.c_str(), e.c_str());
                }
            }
        }

        const bool stop = opt.strict_on_error && outcome.state == ComponentState::Failed;
        report.components.push_back(std::move(outcome));
        if (stop) {
            report.aborted = true;
            break;
        }
    }

    if (report.aborted) {
        LogError("zic command didn't work as expected! Operation cancelled. "
                 "Compilation can be forced by disabling stop-on-error.");
        RemoveTree(layout.compiled_dir, "incomplete compiled output");
        return Result::Fail(ErrorKind::ComponentCompileError,
                            "compilation of " + release + " stopped at component " +
                                report.components.back().name);
    }

    if (report.compiled == 0) {
        LogError("Cannot install tz%s!", release.c_str());
        RemoveTree(layout.compiled_dir, "incomplete compiled output");
        return Result::Fail(ErrorKind::ComponentCompileError,
                            "no component of " + release + " compiled");
    }

    if (report.failed > 0) {
        LogWarn("%d component(s) of %s failed to compile; continuing", report.failed, release.c_str());
    }

    auto marker_res = WriteTextFileAtomic(layout.version_marker.string(), release);
    if (!marker_res.is_ok()) {
        RemoveTree(layout.compiled_dir, "incomplete compiled output");
        return marker_res;
    }

    return Result::Ok();
}

} // namespace tzupdater
