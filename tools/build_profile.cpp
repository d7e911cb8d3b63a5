/**
 * build-profile: convert spectrophotometer CSV measurements plus a TI2
 * chart into a TI3 file and optionally build an ICC profile with colprof.
 *
 * Usage:
 *   build-profile [--config PATH] [--no-profile] [--verbose]
 *
 * Exit codes: 0 success, 1 conversion failure, 2 configuration error or
 * missing input, otherwise the exit code of colprof (127 = not found).
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <string>

#include "cgats/cgats.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitConfig = 2;

/// Check inputs exist and warn when the profiler is missing
bool preflight(const cgats::BuildConfig& cfg, const std::string& config_path,
               bool build_profile) {
    if (!fs::is_regular_file(cfg.inputs.csv)) {
        spdlog::error("CSV not found: {}. Edit inputs.csv in {} or place the file under {}",
                      cfg.inputs.csv, config_path, (fs::path(cfg.base_dir) / "input").string());
        return false;
    }
    if (!fs::is_regular_file(cfg.inputs.ti2)) {
        spdlog::error("TI2 not found: {}. Edit inputs.ti2 in {} or place the file under {}",
                      cfg.inputs.ti2, config_path, (fs::path(cfg.base_dir) / "input").string());
        return false;
    }
    if (build_profile && cfg.colprof.run && !cgats::profile::ColprofInvoker::isAvailable()) {
        spdlog::warn("colprof not found on PATH; install ArgyllCMS or set colprof.run: false. "
                     "The TI3 will still be written.");
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Build a TI3 measurement file (and ICC profile) from CSV + TI2"};

    std::string config_path = "profile_config.yaml";
    bool no_profile = false;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "Path to the YAML configuration")
        ->capture_default_str();
    app.add_flag("--no-profile", no_profile, "Write the TI3 only, do not run colprof");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return rc == 0 ? 0 : kExitConfig;
    }

    cgats::log::init(verbose ? spdlog::level::debug : spdlog::level::info);

    cgats::BuildConfig cfg;
    try {
        cfg = cgats::loadConfig(config_path);
        if (!verbose) {
            cgats::log::setLevel(cgats::log::parseLevel(cfg.logging.level));
        }
    } catch (const cgats::ConfigError& e) {
        spdlog::error("{}", e.what());
        return kExitConfig;
    }

    const bool build_profile = !no_profile;
    if (!preflight(cfg, config_path, build_profile)) {
        return kExitConfig;
    }

    try {
        cgats::Pipeline pipeline(cfg);
        const auto result = pipeline.run(build_profile);

        spdlog::info("TI3: {}", result.ti3_path);
        if (result.icc_path) {
            spdlog::info("ICC: {}", *result.icc_path);
        }
    } catch (const cgats::StageError& e) {
        spdlog::error("{}", e.what());
        return e.stage() == cgats::Stage::INVOKE_PROFILER ? e.exitCode() : kExitFailure;
    } catch (const std::exception& e) {
        spdlog::error("unexpected error: {}", e.what());
        return kExitFailure;
    }

    return 0;
}
