#include "tz/environment.hpp"
#include "tz/http_transport.hpp"
#include "tz/progress_sinks.hpp"
#include "tz/session_context.hpp"
#include "tz/tz_installer.hpp"
#include "tz/zic_runner.hpp"
#include "util/logger.hpp"
#include "util/settings.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <getopt.h>
#include <optional>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] install <release>\n"
        "   %s [options] install-latest\n"
        "   %s [options] active\n"
        "   %s [options] latest\n"
        "\n"
        "Options:\n"
        "  -c, --config <file>       JSON settings file (default $TZUPDATER_CONFIG_PATH or %s)\n"
        "  -d, --target-folder <dir> Where archives are downloaded and compiled\n"
        "  -z, --zic-path <dir>      Directory holding zic, prepended to PATH\n"
        "      --show-zic-log        Print the zic output of every component\n"
        "      --no-err-stop         Keep compiling after a component fails\n"
        "      --no-activate         Compile only, do not activate\n"
        "      --fail-if-zic-missing Exit with an error when zic cannot be found\n"
        "  -q, --quiet               Warnings and errors only\n"
        "  -v, --verbose             Debug logging\n"
        "  -h, --help                Show this help\n",
        argv, argv, argv, argv, tzupdater::kDefaultConfigPath);
}

enum LongOnly {
    kShowZicLog = 1000,
    kNoErrStop,
    kNoActivate,
    kFailIfZicMissing,
};

struct CliOverrides {
    std::optional<std::string> config_path;
    std::optional<std::string> target_folder;
    std::optional<std::string> zic_path;
    bool show_zic_log = false;
    bool no_err_stop = false;
    bool no_activate = false;
    bool fail_if_zic_missing = false;
    bool quiet = false;
    bool debug = false;
};

bool LoadSettings(const CliOverrides& cli, tzupdater::Settings& settings) {
    std::string path;
    bool required = true;
    if (cli.config_path) {
        path = *cli.config_path;
    } else if (const char* env = std::getenv(tzupdater::kConfigPathEnv); env && *env) {
        path = env;
    } else {
        path = tzupdater::kDefaultConfigPath;
        required = false;
    }

    std::error_code ec;
    if (!required && !std::filesystem::exists(path, ec)) {
        return true;
    }

    auto res = tzupdater::Settings::LoadFromFile(path, settings);
    if (!res.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", res.message().c_str());
        return false;
    }
    return true;
}

void ApplyOverrides(const CliOverrides& cli, tzupdater::Settings& settings) {
    if (cli.target_folder) settings.target_folder = *cli.target_folder;
    if (cli.zic_path) settings.zic_path = *cli.zic_path;
    if (cli.show_zic_log) settings.show_zic_log = true;
    if (cli.no_err_stop) settings.err_stop = false;
    if (cli.no_activate) settings.activate = false;
    if (cli.fail_if_zic_missing) settings.fail_if_zic_missing = true;

    auto& logger = tzupdater::Logger::Instance();
    if (settings.log_level) logger.SetLevel(*settings.log_level);
    if (cli.quiet) {
        settings.verbose = false;
        logger.SetLevel(tzupdater::LogLevel::Warn);
    }
    if (cli.debug) {
        logger.SetLevel(tzupdater::LogLevel::Debug);
    }
}

int ExitCode(const tzupdater::Result& res, const tzupdater::Settings& settings) {
    if (res.is_ok()) return 0;
    if (res.kind == tzupdater::ErrorKind::ToolMissing && !settings.fail_if_zic_missing) {
        std::fprintf(stderr, "WARN: %s\n", res.message().c_str());
        return 0;
    }
    std::fprintf(stderr, "ERROR: [%s] %s\n", tzupdater::ToString(res.kind), res.message().c_str());
    return 1;
}

} // namespace

int main(int argc, char **argv) {
    CliOverrides cli;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"target-folder", required_argument, nullptr, 'd'},
        {"zic-path", required_argument, nullptr, 'z'},
        {"show-zic-log", no_argument, nullptr, kShowZicLog},
        {"no-err-stop", no_argument, nullptr, kNoErrStop},
        {"no-activate", no_argument, nullptr, kNoActivate},
        {"fail-if-zic-missing", no_argument, nullptr, kFailIfZicMissing},
        {"quiet", no_argument, nullptr, 'q'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:d:z:qv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'c': cli.config_path = optarg; break;
            case 'd': cli.target_folder = optarg; break;
            case 'z': cli.zic_path = optarg; break;
            case 'q': cli.quiet = true; break;
            case 'v': cli.debug = true; break;
            case kShowZicLog: cli.show_zic_log = true; break;
            case kNoErrStop: cli.no_err_stop = true; break;
            case kNoActivate: cli.no_activate = true; break;
            case kFailIfZicMissing: cli.fail_if_zic_missing = true; break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string command = argv[optind];
    const int positional = argc - optind - 1;

    tzupdater::Settings settings;
    if (!LoadSettings(cli, settings)) {
        return 1;
    }
    ApplyOverrides(cli, settings);

    tzupdater::PosixEnvironment env;
    tzupdater::HttplibTransport transport(
        tzupdater::HttplibTransport::Options{settings.connect_timeout_sec, settings.read_timeout_sec});
    tzupdater::ProcessZicRunner zic(env);
    tzupdater::TzInstaller installer(transport, zic, env, settings);

    tzupdater::ConsoleProgressSink progress;
    if (settings.verbose) {
        installer.SetProgressSink(&progress);
    }

    // A dataset activated by a parent process is inherited through TZDIR.
    tzupdater::SessionContext ctx;
    if (auto inherited = env.Get(tzupdater::kTzDirEnv); inherited && !inherited->empty()) {
        ctx.active_dataset_dir = *inherited;
    }

    const tzupdater::InstallOptions options = tzupdater::InstallOptions::FromSettings(settings);

    if (command == "install") {
        if (positional != 1) {
            PrintUsage(argv[0]);
            return 2;
        }
        auto res = installer.InstallVersion(ctx, argv[optind + 1], options);
        if (res.is_ok() && options.activate && ctx.active_dataset_dir) {
            std::printf("TZDIR=%s\n", ctx.active_dataset_dir->c_str());
        }
        return ExitCode(res, settings);
    }

    if (command == "install-latest") {
        if (positional != 0) {
            PrintUsage(argv[0]);
            return 2;
        }
        auto res = installer.InstallLatest(ctx, options);
        if (res.is_ok() && installer.LastState() == tzupdater::PipelineState::Done && ctx.active_dataset_dir) {
            std::printf("TZDIR=%s\n", ctx.active_dataset_dir->c_str());
        }
        return ExitCode(res, settings);
    }

    if (command == "active" && positional == 0) {
        std::printf("%s\n", installer.GetActiveVersion(ctx).c_str());
        return 0;
    }

    if (command == "latest" && positional == 0) {
        std::printf("%s\n", installer.GetLatestPublishedVersion(ctx).c_str());
        return 0;
    }

    PrintUsage(argv[0]);
    return 2;
}
