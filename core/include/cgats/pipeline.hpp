#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "ti3_document.hpp"
#include "profile/colprof.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace cgats {

// ============================================================================
// Build pipeline
// ============================================================================

/// Steps of a build, in execution order
enum class Stage : std::uint8_t {
    READ_CSV,
    READ_CHART,
    PAIR,
    WRITE_TI3,
    INVOKE_PROFILER
};

/// Human-readable stage name
std::string toString(Stage stage);

/**
 * @brief A pipeline stage failed.
 *
 * Carries the failing stage, the original message and the process exit
 * code the tool should return (1, or the profiler's own exit code).
 */
class StageError : public Error {
public:
    StageError(Stage stage, const std::string& cause, int exit_code = 1)
        : Error(toString(stage) + " failed: " + cause),
          stage_(stage), cause_(cause), exit_code_(exit_code) {}

    [[nodiscard]] Stage stage() const noexcept { return stage_; }
    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }
    [[nodiscard]] int exitCode() const noexcept { return exit_code_; }

private:
    Stage stage_;
    std::string cause_;
    int exit_code_;
};

/**
 * @brief Outcome of a successful run.
 */
struct PipelineResult {
    Ti3Document document;
    std::string ti3_path;

    /// Set when a profile was built
    std::optional<std::string> icc_path;

    /// Profiler exit code and output, when it ran
    std::optional<profile::InvocationResult> profiler;
};

/**
 * @brief Runs CSV + TI2 -> TI3 -> ICC as a linear, fail-fast sequence.
 *
 * Each stage either completes or throws StageError; later stages do not
 * run after a failure. A failed profiler run leaves the TI3 in place.
 *
 * @code
 * auto config = cgats::loadConfig("profile_config.yaml");
 * cgats::Pipeline pipeline(config);
 * auto result = pipeline.run();
 * @endcode
 */
class Pipeline {
public:
    /**
     * @param config Resolved build configuration
     * @param invoker Profile builder; a ColprofInvoker when null
     */
    explicit Pipeline(BuildConfig config,
                      std::unique_ptr<profile::ProfileInvoker> invoker = nullptr);

    /**
     * @brief Run every stage.
     *
     * @param build_profile Run the profiler (also requires colprof.run)
     * @throws StageError naming the failing stage
     */
    PipelineResult run(bool build_profile = true);

    const BuildConfig& config() const { return config_; }

private:
    BuildConfig config_;
    std::unique_ptr<profile::ProfileInvoker> invoker_;
};

} // namespace cgats
