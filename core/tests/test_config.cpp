#include <catch2/catch_test_macros.hpp>
#include "cgats/config.hpp"
#include "cgats/log.hpp"

#include <filesystem>
#include <fstream>

using namespace cgats;

namespace fs = std::filesystem;

namespace {

const char* kMinimal =
    "inputs:\n"
    "  csv: cr30.csv\n"
    "  ti2: chart.ti2\n";

std::string path(const fs::path& p) {
    return p.lexically_normal().string();
}

} // namespace

TEST_CASE("Config defaults", "[config]") {
    BuildConfig cfg = parseConfig(kMinimal, "/work");

    SECTION("Inputs resolve under input/") {
        REQUIRE(cfg.inputs.csv == path("/work/input/cr30.csv"));
        REQUIRE(cfg.inputs.ti2 == path("/work/input/chart.ti2"));
    }

    SECTION("Outputs default from the input names") {
        REQUIRE(cfg.outputs.ti3 == path("/work/output/cr30.ti3"));
        REQUIRE(cfg.outputs.icc == path("/work/output/cr30.icc"));
        REQUIRE(cfg.outputs.description == "profile");
    }

    SECTION("Options, logging and colprof defaults") {
        REQUIRE(cfg.options.device_class == "OUTPUT");
        REQUIRE(cfg.options.csv_delimiter == ';');
        REQUIRE(cfg.logging.level == "info");
        REQUIRE(cfg.colprof.run);
        REQUIRE(cfg.colprof.quality == "m");
        REQUIRE(cfg.colprof.b2a == "m");
        REQUIRE(cfg.colprof.illuminant == "D50");
        REQUIRE(cfg.colprof.observer == "1931_2");
        REQUIRE(cfg.colprof.threads == 1);
        REQUIRE(cfg.colprof.algorithm.empty());
        REQUIRE_FALSE(cfg.colprof.fwa);
        REQUIRE_FALSE(cfg.colprof.no_embed_ti3);
    }
}

TEST_CASE("Config values", "[config]") {
    const std::string text =
        "inputs:\n"
        "  csv: data/cr30.csv\n"
        "  ti2: /charts/chart.ti2\n"
        "outputs:\n"
        "  ti3: result.ti3\n"
        "  icc: profiles/result.icc\n"
        "  description: \"Printer / Matte\"\n"
        "options:\n"
        "  device_class: DISPLAY\n"
        "  csv_delimiter: \",\"\n"
        "logging:\n"
        "  level: debug\n"
        "colprof:\n"
        "  run: false\n"
        "  quality: h\n"
        "  threads: 4\n"
        "  total_ink_limit: 300\n"
        "  black_generation: \"p 0.1 0.9 0.5 0.8 0.6\"\n"
        "  fwa: yes\n"
        "  no_embed_ti3: true\n"
        "  gamut_map_perceptual: source.icc\n"
        "  gamut_map_both: 80\n";
    BuildConfig cfg = parseConfig(text, "/work");

    SECTION("Path resolution") {
        REQUIRE(cfg.inputs.csv == path("/work/data/cr30.csv"));
        REQUIRE(cfg.inputs.ti2 == path("/charts/chart.ti2"));
        REQUIRE(cfg.outputs.ti3 == path("/work/output/result.ti3"));
        REQUIRE(cfg.outputs.icc == path("/work/profiles/result.icc"));
        REQUIRE(cfg.outputs.description == "Printer / Matte");
    }

    SECTION("Options") {
        REQUIRE(cfg.options.device_class == "DISPLAY");
        REQUIRE(cfg.options.csv_delimiter == ',');
        REQUIRE(cfg.logging.level == "debug");
    }

    SECTION("colprof") {
        REQUIRE_FALSE(cfg.colprof.run);
        REQUIRE(cfg.colprof.quality == "h");
        REQUIRE(cfg.colprof.threads == 4);
        REQUIRE(cfg.colprof.total_ink_limit == "300");
        REQUIRE(cfg.colprof.black_generation == "p 0.1 0.9 0.5 0.8 0.6");
        REQUIRE(cfg.colprof.fwa);
        REQUIRE(cfg.colprof.no_embed_ti3);
    }

    SECTION("Gamut mapping files resolve like inputs") {
        REQUIRE(cfg.colprof.gamut_map_perceptual == path("/work/input/source.icc"));
        REQUIRE(cfg.colprof.gamut_map_both == "80");
    }
}

TEST_CASE("Config errors", "[config]") {
    SECTION("Missing inputs") {
        REQUIRE_THROWS_AS(parseConfig("inputs:\n  csv: a.csv\n", "/work"), ConfigError);
        REQUIRE_THROWS_AS(parseConfig("inputs:\n  ti2: a.ti2\n", "/work"), ConfigError);
        REQUIRE_THROWS_AS(parseConfig("", "/work"), ConfigError);
    }

    SECTION("Malformed YAML") {
        REQUIRE_THROWS_AS(parseConfig("inputs: [unclosed\n", "/work"), ConfigError);
    }

    SECTION("Wrong value types") {
        std::string text = std::string(kMinimal) + "colprof:\n  run: maybe\n";
        REQUIRE_THROWS_AS(parseConfig(text, "/work"), ConfigError);

        text = std::string(kMinimal) + "colprof:\n  threads: many\n";
        REQUIRE_THROWS_AS(parseConfig(text, "/work"), ConfigError);

        text = std::string(kMinimal) + "colprof:\n  threads: 0\n";
        REQUIRE_THROWS_AS(parseConfig(text, "/work"), ConfigError);

        text = std::string(kMinimal) + "colprof:\n  quality: [h, m]\n";
        REQUIRE_THROWS_AS(parseConfig(text, "/work"), ConfigError);

        text = std::string(kMinimal) + "options:\n  csv_delimiter: \";;\"\n";
        REQUIRE_THROWS_AS(parseConfig(text, "/work"), ConfigError);
    }

    SECTION("Section must be a mapping") {
        REQUIRE_THROWS_AS(parseConfig("inputs: just text\n", "/work"), ConfigError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(loadConfig("/nonexistent/profile_config.yaml"), ConfigError);
    }
}

TEST_CASE("Config file loading", "[config]") {
    const fs::path dir = fs::temp_directory_path() / "cgats_test_config";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const fs::path file = dir / "profile_config.yaml";
    {
        std::ofstream out(file);
        out << kMinimal;
    }

    BuildConfig cfg = loadConfig(file.string());
    REQUIRE(cfg.inputs.csv == path(dir / "input" / "cr30.csv"));
    REQUIRE(cfg.outputs.ti3 == path(dir / "output" / "cr30.ti3"));
    REQUIRE(cfg.base_dir == dir.string());

    fs::remove_all(dir);
}

TEST_CASE("Log level names", "[config][log]") {
    REQUIRE(log::parseLevel("trace") == spdlog::level::trace);
    REQUIRE(log::parseLevel("DEBUG") == spdlog::level::debug);
    REQUIRE(log::parseLevel("info") == spdlog::level::info);
    REQUIRE(log::parseLevel("warning") == spdlog::level::warn);
    REQUIRE(log::parseLevel("error") == spdlog::level::err);
    REQUIRE(log::parseLevel("off") == spdlog::level::off);
    REQUIRE_THROWS_AS(log::parseLevel("loud"), ConfigError);
}
