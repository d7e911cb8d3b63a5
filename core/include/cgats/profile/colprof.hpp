#pragma once

#include "../errors.hpp"
#include <string>
#include <vector>

namespace cgats {
namespace profile {

/**
 * @brief colprof settings; empty strings and false flags are left out.
 */
struct ColprofOptions {
    /// Build a profile after writing the TI3
    bool run = true;

    std::string quality = "m";         // -q l/m/h/u
    std::string b2a = "m";             // -b n/l/m/h/u
    std::string illuminant = "D50";    // -i, spectral data only
    std::string observer = "1931_2";   // -o, spectral data only
    int threads = 1;                   // OMP_NUM_THREADS

    std::string algorithm;             // -a
    std::string demphasis;             // -V
    std::string avgdev;                // -r
    bool fwa = false;                  // -f, spectral data only
    std::string fwa_illuminant;        // -f argument

    std::string gamut_map_perceptual;  // -s
    std::string gamut_map_both;        // -S
    bool use_colorimetric_src_for_perceptual = false;  // -nP
    bool use_colorimetric_src_for_saturation = false;  // -nS
    std::string source_gamut_file;     // -g
    std::string abstract_profiles;     // -p
    std::string perceptual_intent;     // -t
    std::string saturation_intent;     // -T
    std::string viewcond_in;           // -c
    std::string viewcond_out;          // -d
    bool create_gamut_vrml = false;    // -P

    std::string manufacturer;          // -A
    std::string model;                 // -M
    std::string copyright;             // -C
    std::string attributes;            // -Z
    std::string default_intent;        // -Z

    std::string total_ink_limit;       // -l
    std::string black_ink_limit;       // -L
    std::string black_generation;      // -k <params>
    std::string k_locus;               // -K <params>

    bool no_device_shaper = false;     // -ni
    bool no_grid_position = false;     // -np
    bool no_output_shaper = false;     // -no
    bool no_embed_ti3 = false;         // -nc
    bool input_auto_scale_wp = false;  // -u
    bool input_force_absolute = false; // -ua
    bool input_clip_above_wp = false;  // -uc
    bool restrict_positive = false;    // -R
    std::string whitepoint_scale;      // -U
};

/**
 * @brief Outcome of running the profiling tool.
 */
struct InvocationResult {
    /// Process exit code (127 when the tool could not be found)
    int exit_code = 0;

    /// stdout and stderr of the tool
    std::string output;

    [[nodiscard]] bool ok() const noexcept { return exit_code == 0; }
};

/**
 * @brief Runs an external profiling tool on a TI3 file.
 *
 * Implementations receive the TI3 path and the command-line flags and
 * report the exit code plus captured output. Tests substitute a fake.
 */
class ProfileInvoker {
public:
    virtual ~ProfileInvoker() = default;

    /**
     * @brief Build a profile from a TI3 file.
     *
     * @param ti3_path Path of the emitted TI3
     * @param args Flags placed before the TI3 base name
     * @return Exit code and captured output
     */
    virtual InvocationResult invoke(const std::string& ti3_path,
                                    const std::vector<std::string>& args) = 0;

    /// Name of the tool for messages
    [[nodiscard]] virtual std::string toolName() const = 0;
};

/**
 * @brief Invokes ArgyllCMS colprof through the shell.
 *
 * colprof takes the TI3 base name without extension as its last
 * argument. Arguments are quoted for /bin/sh and stderr is merged into
 * the captured output.
 */
class ColprofInvoker : public ProfileInvoker {
public:
    explicit ColprofInvoker(std::string executable = "colprof", int threads = 1)
        : executable_(std::move(executable)), threads_(threads) {}

    InvocationResult invoke(const std::string& ti3_path,
                            const std::vector<std::string>& args) override;

    [[nodiscard]] std::string toolName() const override { return executable_; }

    /**
     * @brief Check if an executable can be found on PATH.
     */
    static bool isAvailable(const std::string& executable = "colprof");

private:
    std::string executable_;
    int threads_;
};

/**
 * @brief Map colprof options to command-line flags.
 *
 * @param options colprof settings
 * @param has_spectral Whether the TI3 carries spectral data; -i/-o/-f need it
 * @param icc_path Output profile path (-O)
 * @param description Profile description (-D)
 * @return Flags in colprof order, without the TI3 base name
 */
std::vector<std::string> buildColprofArgs(const ColprofOptions& options, bool has_spectral,
                                          const std::string& icc_path,
                                          const std::string& description);

/**
 * @brief True when a gamut mapping value names a profile or image file.
 */
bool looksLikeProfileFile(const std::string& value);

/**
 * @brief Strip the extension of a TI3 path ("out/a.ti3" -> "out/a").
 */
std::string ti3BaseName(const std::string& ti3_path);

/**
 * @brief Quote an argument for /bin/sh.
 */
std::string shellQuote(const std::string& arg);

/**
 * @brief Run the invoker and turn a non-zero exit into an exception.
 *
 * @throws ExternalToolError if the tool fails or cannot be found
 */
InvocationResult runProfiler(ProfileInvoker& invoker, const std::string& ti3_path,
                             const std::vector<std::string>& args);

} // namespace profile
} // namespace cgats
