#include <catch2/catch_test_macros.hpp>
#include "cgats/profile/colprof.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace cgats;
using namespace cgats::profile;

namespace {

bool contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

/// Value following a flag, or empty when the flag is absent
std::string valueOf(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) return "";
    return *(it + 1);
}

class FakeInvoker : public ProfileInvoker {
public:
    explicit FakeInvoker(InvocationResult result) : result_(std::move(result)) {}

    InvocationResult invoke(const std::string& ti3_path,
                            const std::vector<std::string>& args) override {
        last_path = ti3_path;
        last_args = args;
        return result_;
    }

    std::string toolName() const override { return "fakeprof"; }

    std::string last_path;
    std::vector<std::string> last_args;

private:
    InvocationResult result_;
};

} // namespace

TEST_CASE("colprof base arguments", "[colprof]") {
    ColprofOptions options;

    SECTION("Defaults without spectral data") {
        auto args = buildColprofArgs(options, false, "out/p.icc", "My printer");
        REQUIRE(args == std::vector<std::string>{
            "-v", "-qm", "-bm", "-D", "My printer", "-O", "out/p.icc"});
    }

    SECTION("Spectral data adds illuminant and observer") {
        auto args = buildColprofArgs(options, true, "p.icc", "d");
        REQUIRE(valueOf(args, "-i") == "D50");
        REQUIRE(valueOf(args, "-o") == "1931_2");
        REQUIRE(args[args.size() - 4] == "-D");
    }

    SECTION("Quality settings") {
        options.quality = "h";
        options.b2a = "n";
        auto args = buildColprofArgs(options, false, "p.icc", "d");
        REQUIRE(args[1] == "-qh");
        REQUIRE(args[2] == "-bn");
    }

    SECTION("FWA needs spectral data") {
        options.fwa = true;
        options.fwa_illuminant = "D65";
        REQUIRE_FALSE(contains(buildColprofArgs(options, false, "p.icc", "d"), "-f"));

        auto args = buildColprofArgs(options, true, "p.icc", "d");
        REQUIRE(valueOf(args, "-f") == "D65");
    }
}

TEST_CASE("colprof advanced arguments", "[colprof]") {
    ColprofOptions options;

    SECTION("Empty and false options are omitted") {
        auto args = buildColprofArgs(options, false, "p.icc", "d");
        for (const char* flag : {"-a", "-V", "-r", "-s", "-S", "-nP", "-nS", "-g", "-p",
                                 "-t", "-T", "-c", "-d", "-P", "-A", "-M", "-C", "-Z",
                                 "-l", "-L", "-k", "-K", "-ni", "-np", "-no", "-nc",
                                 "-u", "-ua", "-uc", "-R", "-U"}) {
            REQUIRE_FALSE(contains(args, flag));
        }
    }

    SECTION("Value options") {
        options.algorithm = "X";
        options.demphasis = "2.0";
        options.avgdev = "0.5";
        options.source_gamut_file = "src.gam";
        options.abstract_profiles = "abs.icc";
        options.perceptual_intent = "la";
        options.saturation_intent = "s";
        options.viewcond_in = "pp";
        options.viewcond_out = "mt";
        options.manufacturer = "ACME";
        options.model = "Printer 9000";
        options.copyright = "(c) ACME";
        options.total_ink_limit = "300";
        options.black_ink_limit = "95";
        options.whitepoint_scale = "1.01";
        auto args = buildColprofArgs(options, false, "p.icc", "d");

        REQUIRE(valueOf(args, "-a") == "X");
        REQUIRE(valueOf(args, "-V") == "2.0");
        REQUIRE(valueOf(args, "-r") == "0.5");
        REQUIRE(valueOf(args, "-g") == "src.gam");
        REQUIRE(valueOf(args, "-p") == "abs.icc");
        REQUIRE(valueOf(args, "-t") == "la");
        REQUIRE(valueOf(args, "-T") == "s");
        REQUIRE(valueOf(args, "-c") == "pp");
        REQUIRE(valueOf(args, "-d") == "mt");
        REQUIRE(valueOf(args, "-A") == "ACME");
        REQUIRE(valueOf(args, "-M") == "Printer 9000");
        REQUIRE(valueOf(args, "-C") == "(c) ACME");
        REQUIRE(valueOf(args, "-l") == "300");
        REQUIRE(valueOf(args, "-L") == "95");
        REQUIRE(valueOf(args, "-U") == "1.01");
    }

    SECTION("Boolean options") {
        options.use_colorimetric_src_for_perceptual = true;
        options.use_colorimetric_src_for_saturation = true;
        options.create_gamut_vrml = true;
        options.no_device_shaper = true;
        options.no_grid_position = true;
        options.no_output_shaper = true;
        options.no_embed_ti3 = true;
        options.input_auto_scale_wp = true;
        options.input_force_absolute = true;
        options.input_clip_above_wp = true;
        options.restrict_positive = true;
        auto args = buildColprofArgs(options, false, "p.icc", "d");
        for (const char* flag : {"-nP", "-nS", "-P", "-ni", "-np", "-no", "-nc",
                                 "-u", "-ua", "-uc", "-R"}) {
            REQUIRE(contains(args, flag));
        }
    }

    SECTION("Attributes and default intent both use -Z") {
        options.attributes = "tm";
        options.default_intent = "p";
        auto args = buildColprofArgs(options, false, "p.icc", "d");
        REQUIRE(std::count(args.begin(), args.end(), "-Z") == 2);
        REQUIRE(contains(args, "tm"));
        REQUIRE(contains(args, "p"));
    }

    SECTION("Black generation parameters are split") {
        options.black_generation = "p 0.1 0.9 0.5 0.8 0.6";
        options.k_locus = "'z' 1.0";
        auto args = buildColprofArgs(options, false, "p.icc", "d");

        auto k = std::find(args.begin(), args.end(), "-k");
        REQUIRE(k != args.end());
        REQUIRE(std::vector<std::string>(k + 1, k + 7) ==
                std::vector<std::string>{"p", "0.1", "0.9", "0.5", "0.8", "0.6"});

        auto K = std::find(args.begin(), args.end(), "-K");
        REQUIRE(K != args.end());
        REQUIRE(*(K + 1) == "z");
        REQUIRE(*(K + 2) == "1.0");
    }
}

TEST_CASE("colprof gamut mapping sources", "[colprof]") {
    namespace fs = std::filesystem;
    ColprofOptions options;

    SECTION("Percentage values pass through") {
        options.gamut_map_perceptual = "80";
        auto args = buildColprofArgs(options, false, "p.icc", "d");
        REQUIRE(valueOf(args, "-s") == "80");
    }

    SECTION("Missing profile files are skipped") {
        options.gamut_map_perceptual = "/nonexistent/source.icc";
        options.gamut_map_both = "/nonexistent/image.TIF";
        auto args = buildColprofArgs(options, false, "p.icc", "d");
        REQUIRE_FALSE(contains(args, "-s"));
        REQUIRE_FALSE(contains(args, "-S"));
    }

    SECTION("Existing profile files are passed") {
        const fs::path icc = fs::temp_directory_path() / "cgats_test_source.icm";
        {
            std::ofstream out(icc);
            out << "profile";
        }
        options.gamut_map_both = icc.string();
        auto args = buildColprofArgs(options, false, "p.icc", "d");
        REQUIRE(valueOf(args, "-S") == icc.string());
        fs::remove(icc);
    }

    SECTION("File detection") {
        REQUIRE(looksLikeProfileFile("a.icc"));
        REQUIRE(looksLikeProfileFile("a.ICM"));
        REQUIRE(looksLikeProfileFile("photo.jpeg"));
        REQUIRE(looksLikeProfileFile("scan.tiff"));
        REQUIRE_FALSE(looksLikeProfileFile("80"));
        REQUIRE_FALSE(looksLikeProfileFile("icc"));
    }
}

TEST_CASE("colprof helpers", "[colprof]") {
    SECTION("TI3 base name") {
        REQUIRE(ti3BaseName("out/target.ti3") == "out/target");
        REQUIRE(ti3BaseName("target") == "target");
        REQUIRE(ti3BaseName("/tmp/a.b/target.ti3") == "/tmp/a.b/target");
    }

    SECTION("Shell quoting") {
        REQUIRE(shellQuote("plain") == "'plain'");
        REQUIRE(shellQuote("two words") == "'two words'");
        REQUIRE(shellQuote("it's") == "'it'\\''s'");
        REQUIRE(shellQuote("") == "''");
    }
}

TEST_CASE("Profile invocation", "[colprof]") {
    SECTION("Successful run") {
        FakeInvoker fake(InvocationResult{0, "done"});
        auto result = runProfiler(fake, "out/t.ti3", {"-v"});
        REQUIRE(result.ok());
        REQUIRE(fake.last_path == "out/t.ti3");
        REQUIRE(fake.last_args == std::vector<std::string>{"-v"});
    }

    SECTION("Failure raises ExternalToolError") {
        FakeInvoker fake(InvocationResult{1, "bad data"});
        try {
            runProfiler(fake, "t.ti3", {});
            FAIL("expected ExternalToolError");
        } catch (const ExternalToolError& e) {
            REQUIRE(e.exitCode() == 1);
            REQUIRE(e.output() == "bad data");
        }
    }

    SECTION("Tool not found") {
        FakeInvoker fake(InvocationResult{127, ""});
        try {
            runProfiler(fake, "t.ti3", {});
            FAIL("expected ExternalToolError");
        } catch (const ExternalToolError& e) {
            REQUIRE(e.exitCode() == 127);
            REQUIRE(std::string(e.what()).find("not found") != std::string::npos);
        }
    }
}

TEST_CASE("Process invoker", "[colprof][process]") {
    SECTION("Captures output and passes the base name last") {
        ColprofInvoker echo("echo");
        auto result = echo.invoke("/tmp/my chart.ti3", {"two words", "it's"});
        REQUIRE(result.ok());
        REQUIRE(result.output == "two words it's /tmp/my chart\n");
    }

    SECTION("Sets the thread count") {
        ColprofInvoker sh("sh", 3);
        auto result = sh.invoke("x.ti3", {"-c", "echo $OMP_NUM_THREADS"});
        REQUIRE(result.ok());
        REQUIRE(result.output == "3\n");
    }

    SECTION("Reports the exit code") {
        ColprofInvoker sh("sh");
        auto result = sh.invoke("x.ti3", {"-c", "echo oops >&2; exit 3"});
        REQUIRE(result.exit_code == 3);
        REQUIRE(result.output == "oops\n");
    }

    SECTION("Missing tool") {
        ColprofInvoker missing("cgats-no-such-profiler");
        auto result = missing.invoke("x.ti3", {});
        REQUIRE(result.exit_code == 127);
        REQUIRE_FALSE(ColprofInvoker::isAvailable("cgats-no-such-profiler"));
    }

    SECTION("PATH lookup") {
        REQUIRE(ColprofInvoker::isAvailable("sh"));
        REQUIRE(ColprofInvoker::isAvailable("/bin/sh"));
    }
}
