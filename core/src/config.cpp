#include "cgats/config.hpp"
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace cgats {

namespace fs = std::filesystem;

namespace {

std::string resolveUnder(const std::string& path, const std::string& base_dir,
                         const char* bare_dir) {
    if (path.empty()) return path;
    const fs::path p(path);
    if (p.is_absolute()) {
        return p.lexically_normal().string();
    }
    const fs::path base(base_dir.empty() ? "." : base_dir);
    if (p.has_parent_path()) {
        return (base / p).lexically_normal().string();
    }
    return (base / bare_dir / p).lexically_normal().string();
}

/// Scalar value of section.key, or nullptr node when absent
YAML::Node child(const YAML::Node& section, const char* key) {
    if (!section || !section.IsMap()) return YAML::Node();
    return section[key];
}

void readString(const YAML::Node& section, const char* section_name, const char* key,
                std::string& out) {
    const YAML::Node node = child(section, key);
    if (!node || node.IsNull()) return;
    if (!node.IsScalar()) {
        throw ConfigError(std::string(section_name) + "." + key + " must be a scalar");
    }
    out = node.Scalar();
}

void readBool(const YAML::Node& section, const char* section_name, const char* key,
              bool& out) {
    const YAML::Node node = child(section, key);
    if (!node || node.IsNull()) return;
    try {
        out = node.as<bool>();
    } catch (const YAML::Exception&) {
        throw ConfigError(std::string(section_name) + "." + key + " must be true or false, got '" +
                          (node.IsScalar() ? node.Scalar() : std::string("<non-scalar>")) + "'");
    }
}

void readInt(const YAML::Node& section, const char* section_name, const char* key, int& out) {
    const YAML::Node node = child(section, key);
    if (!node || node.IsNull()) return;
    try {
        out = node.as<int>();
    } catch (const YAML::Exception&) {
        throw ConfigError(std::string(section_name) + "." + key + " must be an integer, got '" +
                          (node.IsScalar() ? node.Scalar() : std::string("<non-scalar>")) + "'");
    }
}

void checkSection(const YAML::Node& root, const char* name) {
    const YAML::Node node = root[name];
    if (node && !node.IsNull() && !node.IsMap()) {
        throw ConfigError(std::string("section '") + name + "' must be a mapping");
    }
}

void readColprof(const YAML::Node& s, profile::ColprofOptions& c) {
    const char* n = "colprof";
    readBool(s, n, "run", c.run);
    readString(s, n, "quality", c.quality);
    readString(s, n, "b2a", c.b2a);
    readString(s, n, "illuminant", c.illuminant);
    readString(s, n, "observer", c.observer);
    readInt(s, n, "threads", c.threads);
    if (c.threads < 1) {
        throw ConfigError("colprof.threads must be at least 1");
    }

    readString(s, n, "algorithm", c.algorithm);
    readString(s, n, "demphasis", c.demphasis);
    readString(s, n, "avgdev", c.avgdev);
    readBool(s, n, "fwa", c.fwa);
    readString(s, n, "fwa_illuminant", c.fwa_illuminant);

    readString(s, n, "gamut_map_perceptual", c.gamut_map_perceptual);
    readString(s, n, "gamut_map_both", c.gamut_map_both);
    readBool(s, n, "use_colorimetric_src_for_perceptual", c.use_colorimetric_src_for_perceptual);
    readBool(s, n, "use_colorimetric_src_for_saturation", c.use_colorimetric_src_for_saturation);
    readString(s, n, "source_gamut_file", c.source_gamut_file);
    readString(s, n, "abstract_profiles", c.abstract_profiles);
    readString(s, n, "perceptual_intent", c.perceptual_intent);
    readString(s, n, "saturation_intent", c.saturation_intent);
    readString(s, n, "viewcond_in", c.viewcond_in);
    readString(s, n, "viewcond_out", c.viewcond_out);
    readBool(s, n, "create_gamut_vrml", c.create_gamut_vrml);

    readString(s, n, "manufacturer", c.manufacturer);
    readString(s, n, "model", c.model);
    readString(s, n, "copyright", c.copyright);
    readString(s, n, "attributes", c.attributes);
    readString(s, n, "default_intent", c.default_intent);

    readString(s, n, "total_ink_limit", c.total_ink_limit);
    readString(s, n, "black_ink_limit", c.black_ink_limit);
    readString(s, n, "black_generation", c.black_generation);
    readString(s, n, "k_locus", c.k_locus);

    readBool(s, n, "no_device_shaper", c.no_device_shaper);
    readBool(s, n, "no_grid_position", c.no_grid_position);
    readBool(s, n, "no_output_shaper", c.no_output_shaper);
    readBool(s, n, "no_embed_ti3", c.no_embed_ti3);
    readBool(s, n, "input_auto_scale_wp", c.input_auto_scale_wp);
    readBool(s, n, "input_force_absolute", c.input_force_absolute);
    readBool(s, n, "input_clip_above_wp", c.input_clip_above_wp);
    readBool(s, n, "restrict_positive", c.restrict_positive);
    readString(s, n, "whitepoint_scale", c.whitepoint_scale);
}

} // namespace

std::string resolveInputPath(const std::string& path, const std::string& base_dir) {
    return resolveUnder(path, base_dir, "input");
}

std::string resolveOutputPath(const std::string& path, const std::string& base_dir) {
    return resolveUnder(path, base_dir, "output");
}

BuildConfig parseConfig(const std::string& yaml_text, const std::string& base_dir) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed YAML: ") + e.what());
    }
    if (root.IsNull()) {
        root = YAML::Node(YAML::NodeType::Map);
    }
    if (!root.IsMap()) {
        throw ConfigError("top level must be a mapping");
    }
    for (const char* section : {"inputs", "outputs", "options", "logging", "colprof"}) {
        checkSection(root, section);
    }

    BuildConfig cfg;
    cfg.base_dir = base_dir;

    const YAML::Node inputs = root["inputs"];
    readString(inputs, "inputs", "csv", cfg.inputs.csv);
    readString(inputs, "inputs", "ti2", cfg.inputs.ti2);
    if (cfg.inputs.csv.empty()) {
        throw ConfigError("inputs.csv is required");
    }
    if (cfg.inputs.ti2.empty()) {
        throw ConfigError("inputs.ti2 is required");
    }

    const YAML::Node outputs = root["outputs"];
    readString(outputs, "outputs", "ti3", cfg.outputs.ti3);
    readString(outputs, "outputs", "icc", cfg.outputs.icc);
    readString(outputs, "outputs", "description", cfg.outputs.description);
    if (cfg.outputs.ti3.empty()) {
        cfg.outputs.ti3 = fs::path(cfg.inputs.csv).stem().string() + ".ti3";
    }
    if (cfg.outputs.icc.empty()) {
        cfg.outputs.icc = fs::path(cfg.outputs.ti3).replace_extension(".icc").string();
    }

    const YAML::Node options = root["options"];
    readString(options, "options", "device_class", cfg.options.device_class);
    std::string delimiter(1, cfg.options.csv_delimiter);
    readString(options, "options", "csv_delimiter", delimiter);
    if (delimiter == "\\t" || delimiter == "tab") {
        delimiter = "\t";
    }
    if (delimiter.size() != 1) {
        throw ConfigError("options.csv_delimiter must be a single character, got '" +
                          delimiter + "'");
    }
    cfg.options.csv_delimiter = delimiter[0];

    readString(root["logging"], "logging", "level", cfg.logging.level);
    readColprof(root["colprof"], cfg.colprof);

    cfg.inputs.csv = resolveInputPath(cfg.inputs.csv, base_dir);
    cfg.inputs.ti2 = resolveInputPath(cfg.inputs.ti2, base_dir);
    cfg.outputs.ti3 = resolveOutputPath(cfg.outputs.ti3, base_dir);
    cfg.outputs.icc = resolveOutputPath(cfg.outputs.icc, base_dir);

    // Gamut mapping sources may name a profile or image next to the inputs
    for (std::string* value : {&cfg.colprof.gamut_map_perceptual, &cfg.colprof.gamut_map_both}) {
        if (profile::looksLikeProfileFile(*value)) {
            *value = resolveInputPath(*value, base_dir);
        }
    }
    return cfg;
}

BuildConfig loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    fs::path dir = fs::path(path).parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    spdlog::debug("Loading config {}", path);
    return parseConfig(buffer.str(), dir.string());
}

} // namespace cgats
