#include "tz/zic_runner.hpp"

#include "io/process.hpp"
#include "util/logger.hpp"

namespace tzupdater {

namespace {
constexpr const char kFallbackSearchPath[] = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
} // namespace

ProcessZicRunner::ProcessZicRunner(const IEnvironment& env, std::string program)
    : env_(env), program_(std::move(program)) {}

bool ProcessZicRunner::IsAvailable(std::string& resolved) const {
    const std::string search_path = env_.Get(kSearchPathEnv).value_or(kFallbackSearchPath);
    return FindExecutable(program_, search_path, resolved);
}

Result ProcessZicRunner::Compile(const std::string& output_dir,
                                 const std::string& source_file,
                                 ZicInvocation& out) {
    ProcessOutput po;
    auto res = RunProcess({program_, "-d", output_dir, source_file}, po);
    if (!res.is_ok()) {
        return Result::Fail(ErrorKind::ToolMissing, res.err, res.message());
    }

    LogDebug("%s -d %s %s -> exit %d", program_.c_str(), output_dir.c_str(),
             source_file.c_str(), po.exit_status);
    out.exit_status = po.exit_status;
    out.output = std::move(po.output);
    return Result::Ok();
}

} // namespace tzupdater
