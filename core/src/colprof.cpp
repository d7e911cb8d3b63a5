#include "cgats/profile/colprof.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace cgats {
namespace profile {

namespace fs = std::filesystem;

namespace {

/// Split a parameter string on whitespace, honouring single and double quotes
std::vector<std::string> splitParams(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    char quote = 0;
    bool have = false;
    for (char c : s) {
        if (quote) {
            if (c == quote) quote = 0;
            else cur += c;
        } else if (c == '"' || c == '\'') {
            quote = c;
            have = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (have || !cur.empty()) out.push_back(cur);
            cur.clear();
            have = false;
        } else {
            cur += c;
        }
    }
    if (have || !cur.empty()) out.push_back(cur);
    return out;
}

void appendValue(std::vector<std::string>& args, const char* flag, const std::string& value) {
    if (value.empty()) return;
    args.emplace_back(flag);
    args.push_back(value);
}

void appendFlag(std::vector<std::string>& args, const char* flag, bool enabled) {
    if (enabled) args.emplace_back(flag);
}

/// -s/-S take a percentage or a profile/image file; missing files are skipped
void appendSourceMap(std::vector<std::string>& args, const char* flag,
                     const std::string& value) {
    if (value.empty()) return;
    if (looksLikeProfileFile(value) && !fs::exists(value)) {
        spdlog::warn("{} profile '{}' not found; skipping {}", flag, value, flag);
        return;
    }
    appendValue(args, flag, value);
}

struct PipeCloser {
    void operator()(FILE* f) const {
        if (f) pclose(f);
    }
};

} // namespace

bool looksLikeProfileFile(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* ext : {".icc", ".icm", ".jpg", ".jpeg", ".tif", ".tiff"}) {
        const std::string e(ext);
        if (lower.size() >= e.size() &&
            lower.compare(lower.size() - e.size(), e.size(), e) == 0) {
            return true;
        }
    }
    return false;
}

std::string ti3BaseName(const std::string& ti3_path) {
    fs::path p(ti3_path);
    return p.replace_extension().string();
}

std::string shellQuote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += '\'';
    return out;
}

std::vector<std::string> buildColprofArgs(const ColprofOptions& o, bool has_spectral,
                                          const std::string& icc_path,
                                          const std::string& description) {
    std::vector<std::string> args{"-v"};
    if (!o.quality.empty()) args.push_back("-q" + o.quality);
    if (!o.b2a.empty()) args.push_back("-b" + o.b2a);

    appendValue(args, "-a", o.algorithm);
    appendValue(args, "-V", o.demphasis);
    appendValue(args, "-r", o.avgdev);

    if (o.fwa && has_spectral) {
        args.emplace_back("-f");
        if (!o.fwa_illuminant.empty()) args.push_back(o.fwa_illuminant);
    }

    appendSourceMap(args, "-s", o.gamut_map_perceptual);
    appendSourceMap(args, "-S", o.gamut_map_both);
    appendFlag(args, "-nP", o.use_colorimetric_src_for_perceptual);
    appendFlag(args, "-nS", o.use_colorimetric_src_for_saturation);
    appendValue(args, "-g", o.source_gamut_file);
    appendValue(args, "-p", o.abstract_profiles);
    appendValue(args, "-t", o.perceptual_intent);
    appendValue(args, "-T", o.saturation_intent);
    appendValue(args, "-c", o.viewcond_in);
    appendValue(args, "-d", o.viewcond_out);
    appendFlag(args, "-P", o.create_gamut_vrml);

    appendValue(args, "-A", o.manufacturer);
    appendValue(args, "-M", o.model);
    appendValue(args, "-C", o.copyright);
    appendValue(args, "-Z", o.attributes);
    appendValue(args, "-Z", o.default_intent);

    appendValue(args, "-l", o.total_ink_limit);
    appendValue(args, "-L", o.black_ink_limit);
    if (!o.black_generation.empty()) {
        args.emplace_back("-k");
        for (auto& p : splitParams(o.black_generation)) args.push_back(std::move(p));
    }
    if (!o.k_locus.empty()) {
        args.emplace_back("-K");
        for (auto& p : splitParams(o.k_locus)) args.push_back(std::move(p));
    }

    appendFlag(args, "-ni", o.no_device_shaper);
    appendFlag(args, "-np", o.no_grid_position);
    appendFlag(args, "-no", o.no_output_shaper);
    appendFlag(args, "-nc", o.no_embed_ti3);
    appendFlag(args, "-u", o.input_auto_scale_wp);
    appendFlag(args, "-ua", o.input_force_absolute);
    appendFlag(args, "-uc", o.input_clip_above_wp);
    appendFlag(args, "-R", o.restrict_positive);
    appendValue(args, "-U", o.whitepoint_scale);

    if (has_spectral) {
        appendValue(args, "-i", o.illuminant);
        appendValue(args, "-o", o.observer);
    } else {
        spdlog::info("TI3 has no spectral data; skipping -i/-o/-f spectral flags");
    }

    appendValue(args, "-D", description);
    appendValue(args, "-O", icc_path);
    return args;
}

InvocationResult ColprofInvoker::invoke(const std::string& ti3_path,
                                        const std::vector<std::string>& args) {
    std::ostringstream cmd;
    cmd << "OMP_NUM_THREADS=" << std::max(1, threads_) << ' ' << shellQuote(executable_);
    std::string display = executable_;
    for (const auto& a : args) {
        cmd << ' ' << shellQuote(a);
        display += ' ' + a;
    }
    const std::string base = ti3BaseName(ti3_path);
    cmd << ' ' << shellQuote(base) << " 2>&1";
    display += ' ' + base;
    spdlog::info("> {}", display);

    InvocationResult result;
    std::unique_ptr<FILE, PipeCloser> pipe(popen(cmd.str().c_str(), "r"));
    if (!pipe) {
        result.exit_code = 127;
        result.output = "failed to start shell";
        return result;
    }

    char buf[512];
    std::string pending;
    while (std::fgets(buf, sizeof(buf), pipe.get())) {
        result.output += buf;
        pending += buf;
        if (!pending.empty() && pending.back() == '\n') {
            pending.pop_back();
            spdlog::debug("{}: {}", executable_, pending);
            pending.clear();
        }
    }

    int status = pclose(pipe.release());
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

bool ColprofInvoker::isAvailable(const std::string& executable) {
    if (executable.find('/') != std::string::npos) {
        return ::access(executable.c_str(), X_OK) == 0;
    }
    const char* path = std::getenv("PATH");
    if (!path) return false;

    std::stringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        const fs::path candidate = fs::path(dir) / executable;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

InvocationResult runProfiler(ProfileInvoker& invoker, const std::string& ti3_path,
                             const std::vector<std::string>& args) {
    InvocationResult result = invoker.invoke(ti3_path, args);
    if (!result.ok()) {
        throw ExternalToolError(invoker.toolName(), result.exit_code, result.output);
    }
    return result;
}

} // namespace profile
} // namespace cgats
