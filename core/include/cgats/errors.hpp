#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace cgats {

/**
 * @brief Base class for all errors raised by the library.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Malformed or internally inconsistent input file.
 *
 * Raised at parse time: a partially present photometric group,
 * a non-numeric or non-contiguous SAMPLE_ID, a broken CGATS header.
 */
class FormatError : public Error {
public:
    FormatError(const std::string& file, const std::string& msg)
        : Error("format error in " + (file.empty() ? std::string("<string>") : file) +
                ": " + msg),
          file_(file) {}

    /// File the error was found in (empty when parsing a string)
    [[nodiscard]] const std::string& file() const noexcept { return file_; }

private:
    std::string file_;
};

/**
 * @brief Measurement row count differs from the chart patch count.
 */
class CountMismatchError : public Error {
public:
    CountMismatchError(std::size_t csv_count, std::size_t chart_count)
        : Error("count mismatch: CSV has " + std::to_string(csv_count) +
                " measurement rows but the chart has " +
                std::to_string(chart_count) + " patches"),
          csv_count_(csv_count), chart_count_(chart_count) {}

    [[nodiscard]] std::size_t csvCount() const noexcept { return csv_count_; }
    [[nodiscard]] std::size_t chartCount() const noexcept { return chart_count_; }

private:
    std::size_t csv_count_;
    std::size_t chart_count_;
};

/**
 * @brief Unreadable input or unwritable output path.
 */
class IOError : public Error {
public:
    IOError(const std::string& path, const std::string& msg)
        : Error("I/O error on " + path + ": " + msg), path_(path) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief The external profiling tool failed or could not be started.
 */
class ExternalToolError : public Error {
public:
    ExternalToolError(const std::string& tool, int exit_code, std::string output)
        : Error(exit_code == 127
                    ? tool + " not found (is it installed and on PATH?)"
                    : tool + " failed with exit code " + std::to_string(exit_code)),
          exit_code_(exit_code), output_(std::move(output)) {}

    [[nodiscard]] int exitCode() const noexcept { return exit_code_; }

    /// Diagnostic output captured from the tool
    [[nodiscard]] const std::string& output() const noexcept { return output_; }

private:
    int exit_code_;
    std::string output_;
};

/**
 * @brief Invalid or incomplete configuration file.
 */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg)
        : Error("config error: " + msg) {}
};

} // namespace cgats
