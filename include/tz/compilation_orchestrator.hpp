#pragma once

#include "tz/archive_extractor.hpp"
#include "tz/release.hpp"
#include "tz/zic_runner.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tzupdater {

struct CompileOptions {
    bool show_compiler_log = false;  // log the full zic output of every component
    bool strict_on_error = true;     // stop at the first component with errors
    bool verbose = true;             // per-component progress at info level
};

enum class ComponentState {
    Compiled,
    Failed,
    Missing,
};

const char* ToString(ComponentState state);

struct ComponentOutcome {
    std::string name;
    bool optional = false;
    ComponentState state = ComponentState::Missing;
    int exit_status = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct CompileReport {
    std::vector<ComponentOutcome> components;
    int compiled = 0;
    int failed = 0;
    bool aborted = false;
    std::string compiled_dir;
};

class CompilationOrchestrator {
  public:
    explicit CompilationOrchestrator(IZicRunner& zic);
    CompilationOrchestrator(IZicRunner& zic, ArchiveExtractor extractor);

    // Extract() followed by CompileSources().
    Result Compile(const std::string& archive_path,
                   const std::string& target_dir,
                   const std::string& release,
                   const CompileOptions& opt,
                   CompileReport& report);

    // Unpacks the archive into {target_dir}/{release}. A failed extraction
    // removes that directory.
    Result Extract(const std::string& archive_path, const ReleaseLayout& layout) const;

    // Runs zic over every component found in layout.source_dir and writes the
    // version marker on success. A failed compilation removes the compiled
    // directory.
    Result CompileSources(const ReleaseLayout& layout,
                          const std::string& release,
                          const CompileOptions& opt,
                          CompileReport& report);

    // Component files zic is run on, in order.
    static const std::vector<std::string>& Components();
    // Components whose absence is expected in some releases.
    static bool IsOptional(std::string_view component);

    // Lines containing "warning: " are informational; every other line is an
    // error. A non-zero exit without error lines yields a synthetic one.
    static void ClassifyOutput(const std::string& output,
                               int exit_status,
                               std::vector<std::string>& errors,
                               std::vector<std::string>& warnings);

  private:
    void CompileComponent(const ReleaseLayout& layout,
                          const CompileOptions& opt,
                          ComponentOutcome& outcome);

    IZicRunner& zic_;
    ArchiveExtractor extractor_;
};

} // namespace tzupdater
