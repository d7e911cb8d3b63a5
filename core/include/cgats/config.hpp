#pragma once

#include "errors.hpp"
#include "profile/colprof.hpp"
#include <string>

namespace cgats {

// ============================================================================
// Build configuration
// ============================================================================

/**
 * @brief Input files of a build.
 */
struct InputPaths {
    std::string csv;
    std::string ti2;
};

/**
 * @brief Output files of a build.
 */
struct OutputPaths {
    /// TI3 measurement file (default: CSV stem + ".ti3")
    std::string ti3;

    /// ICC profile (default: TI3 stem + ".icc")
    std::string icc;

    /// Profile description passed to colprof -D
    std::string description = "profile";
};

/**
 * @brief General conversion options.
 */
struct ConversionOptions {
    /// TI3 DEVICE_CLASS keyword
    std::string device_class = "OUTPUT";

    /// CSV field delimiter
    char csv_delimiter = ';';
};

/**
 * @brief Logging options.
 */
struct LoggingOptions {
    /// trace, debug, info, warn, error, critical or off
    std::string level = "info";
};

/**
 * @brief Complete configuration of one CSV + TI2 -> TI3 [-> ICC] build.
 *
 * All paths are resolved. Empty strings and false flags in the colprof
 * section mean the corresponding flag is not passed.
 */
struct BuildConfig {
    InputPaths inputs;
    OutputPaths outputs;
    ConversionOptions options;
    LoggingOptions logging;
    profile::ColprofOptions colprof;

    /// Directory the relative paths were resolved against
    std::string base_dir;
};

/**
 * @brief Load and resolve a YAML configuration file.
 *
 * @param path Path to the YAML file
 * @return Resolved configuration
 * @throws ConfigError if the file cannot be read, is malformed or lacks
 *         inputs.csv / inputs.ti2
 */
BuildConfig loadConfig(const std::string& path);

/**
 * @brief Parse YAML configuration text.
 *
 * @param yaml_text YAML document
 * @param base_dir Directory relative paths are resolved against
 * @throws ConfigError on malformed YAML, wrong value types or missing inputs
 */
BuildConfig parseConfig(const std::string& yaml_text, const std::string& base_dir);

/**
 * @brief Resolve an input path.
 *
 * Absolute paths are returned unchanged, paths with a directory part are
 * resolved against base_dir, bare file names against base_dir/input.
 */
std::string resolveInputPath(const std::string& path, const std::string& base_dir);

/**
 * @brief Resolve an output path; bare file names go to base_dir/output.
 */
std::string resolveOutputPath(const std::string& path, const std::string& base_dir);

} // namespace cgats
