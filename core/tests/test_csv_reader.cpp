#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "cgats/io/csv_reader.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

using namespace cgats;
using namespace cgats::io;
using Catch::Approx;

namespace {

/// Header with the 31 spectral columns, e.g. "400nm;410nm;...;700nm"
std::string spectralHeader(const std::string& prefix = "", const std::string& suffix = "nm") {
    std::string out;
    for (std::size_t i = 0; i < kSpectralBands; ++i) {
        if (i > 0) out += ';';
        out += prefix + std::to_string(bandWavelength(i)) + suffix;
    }
    return out;
}

/// 31 reflectance values starting at start, step 1 (decimal comma)
std::string spectralValues(int start) {
    std::string out;
    for (std::size_t i = 0; i < kSpectralBands; ++i) {
        if (i > 0) out += ';';
        out += std::to_string(start + static_cast<int>(i)) + ",5";
    }
    return out;
}

} // namespace

TEST_CASE("CSV header detection", "[csv]") {
    CsvReader reader;

    SECTION("Lab with star notation") {
        auto set = reader.parseString("Name;L*;a*;b*\nP1;50,0;10,0;-5,0\n");
        REQUIRE(set.presence().lab);
        REQUIRE_FALSE(set.presence().xyz);
        REQUIRE_FALSE(set.presence().spectral);
        REQUIRE(set.size() == 1);
    }

    SECTION("Lab spelled out and mixed case") {
        auto set = reader.parseString("LSTAR;Astar;bStar\n50;1;2\n");
        REQUIRE(set.presence().lab);
        REQUIRE(set[0].lab()->c0 == Approx(50.0));
    }

    SECTION("XYZ") {
        auto set = reader.parseString("X;Y;Z\n41,24;21,26;1,93\n");
        REQUIRE(set.presence().xyz);
        REQUIRE(set[0].xyz()->c1 == Approx(21.26));
    }

    SECTION("Spectral columns with different spellings") {
        for (const auto& header : {spectralHeader(), spectralHeader("R", "nm"),
                                   spectralHeader("spec_", "")}) {
            auto set = reader.parseString(header + "\n" + spectralValues(10) + "\n");
            REQUIRE(set.presence().spectral);
            REQUIRE(set[0].hasSpectral());
            REQUIRE(set[0].spectral()->front() == Approx(10.5));
            REQUIRE(set[0].spectral()->back() == Approx(40.5));
        }
    }

    SECTION("Out-of-grid wavelengths are ignored") {
        auto set = reader.parseString(spectralHeader() + ";380nm;710nm\n" +
                                      spectralValues(1) + ";0;0\n");
        REQUIRE(set.presence().spectral);
        REQUIRE(set.size() == 1);
    }

    SECTION("UTF-8 BOM and CRLF") {
        auto set = reader.parseString("\xEF\xBB\xBFL;a;b\r\n50;0;0\r\n60;0;0\r\n");
        REQUIRE(set.presence().lab);
        REQUIRE(set.size() == 2);
        REQUIRE(set[1].lab()->c0 == Approx(60.0));
    }
}

TEST_CASE("CSV value parsing", "[csv]") {
    CsvReader reader;

    SECTION("Decimal comma") {
        auto set = reader.parseString("L;a;b\n95,10;-0,52;2,31\n");
        const auto& lab = *set[0].lab();
        REQUIRE(lab.c0 == Approx(95.10));
        REQUIRE(lab.c1 == Approx(-0.52));
        REQUIRE(lab.c2 == Approx(2.31));
    }

    SECTION("Decimal point") {
        auto set = reader.parseString("L;a;b\n95.10;-0.52;2.31\n");
        REQUIRE(set[0].lab()->c0 == Approx(95.10));
    }

    SECTION("Rows keep file order and zero-based indices") {
        auto set = reader.parseString("L;a;b\n10;0;0\n\n20;0;0\n30;0;0\n");
        REQUIRE(set.size() == 3);
        for (Index i = 0; i < set.size(); ++i) {
            REQUIRE(set[i].index() == i);
            REQUIRE(set[i].lab()->c0 == Approx(10.0 * static_cast<double>(i + 1)));
        }
    }

    SECTION("Missing values mark an absent group") {
        auto set = reader.parseString("L;a;b;X;Y;Z\n50;0;0;nan;NULL;\n");
        REQUIRE(set[0].hasLab());
        REQUIRE_FALSE(set[0].hasXyz());
    }

    SECTION("Rows without any measurement are skipped") {
        auto set = reader.parseString("Name;L;a;b\nP1;50;0;0\nAverage;;;\nP2;60;0;0\n");
        REQUIRE(set.size() == 2);
        REQUIRE(set[1].index() == 1);
    }

    SECTION("Rows without any measurement fail when skipping is off") {
        CsvReaderOptions options;
        options.skip_non_measurement_rows = false;
        CsvReader strict(options);
        REQUIRE_THROWS_AS(strict.parseString("L;a;b\n50;0;0\n;;\n"), FormatError);
    }

    SECTION("Custom delimiter") {
        CsvReaderOptions options;
        options.delimiter = '\t';
        options.decimal_comma = false;
        CsvReader tabs(options);
        auto set = tabs.parseString("L\ta\tb\n50.5\t1\t2\n");
        REQUIRE(set[0].lab()->c0 == Approx(50.5));
    }
}

TEST_CASE("CSV metadata", "[csv]") {
    CsvReader reader;
    auto set = reader.parseString(
        "Name;Date;Test Mode;Light Source/Angle;L*;a*;b*\n"
        "P1;2024-05-01;SCI;D50/10\xC2\xB0;50;0;0\n"
        "P2;2024-05-01;SCI;D50/10\xC2\xB0;60;0;0\n");

    SECTION("Row metadata") {
        REQUIRE(set[0].metadata().at("name") == "P1");
        REQUIRE(set[0].metadata().at("test_mode") == "SCI");
        REQUIRE(set[1].metadata().at("date") == "2024-05-01");
    }

    SECTION("Illuminant and observer") {
        REQUIRE(set.illuminant().has_value());
        REQUIRE(*set.illuminant() == "D50");
        REQUIRE(set.observerDegrees() == 10);
    }
}

TEST_CASE("CSV format errors", "[csv]") {
    CsvReader reader;

    SECTION("Empty input") {
        REQUIRE_THROWS_AS(reader.parseString(""), FormatError);
        REQUIRE_THROWS_AS(reader.parseString("\n\n"), FormatError);
    }

    SECTION("No photometric columns") {
        REQUIRE_THROWS_AS(reader.parseString("Name;Date\nP1;today\n"), FormatError);
    }

    SECTION("Partial Lab group in header") {
        REQUIRE_THROWS_AS(reader.parseString("L;a\n50;0\n"), FormatError);
    }

    SECTION("Partial spectral group in header") {
        REQUIRE_THROWS_AS(reader.parseString("400nm;410nm;420nm\n1;2;3\n"), FormatError);
    }

    SECTION("Duplicate column") {
        REQUIRE_THROWS_AS(reader.parseString("L;L*;a;b\n1;1;2;3\n"), FormatError);
    }

    SECTION("Partial row") {
        REQUIRE_THROWS_AS(reader.parseString("L;a;b\n50;0;\n"), FormatError);
    }

    SECTION("Non-numeric value") {
        REQUIRE_THROWS_AS(reader.parseString("L;a;b\n50;zero;0\n"), FormatError);
    }

    SECTION("Observer angle too large for an integer") {
        REQUIRE_THROWS_AS(reader.parseString(
            "Light Source/Angle;L;a;b\nD50/99999999999999999999;50;0;0\n"), FormatError);
    }

    SECTION("Error message is kept") {
        REQUIRE_THROWS_AS(reader.parseString("L;a;b\n50;x;0\n"), FormatError);
        REQUIRE(reader.lastError().find("not a number") != std::string::npos);
    }
}

TEST_CASE("CSV row stream", "[csv]") {
    SECTION("Rows are produced one at a time") {
        CsvRowStream stream(std::make_unique<std::istringstream>("X;Y;Z\n1;2;3\n4;5;6\n"),
                            "inline");
        REQUIRE(stream.presence().xyz);

        auto first = stream.next();
        REQUIRE(first.has_value());
        REQUIRE(first->xyz()->c0 == Approx(1.0));

        auto second = stream.next();
        REQUIRE(second.has_value());
        REQUIRE(second->index() == 1);

        REQUIRE_FALSE(stream.next().has_value());
        REQUIRE_FALSE(stream.next().has_value());
    }

    SECTION("Malformed rows surface when reached") {
        CsvRowStream stream(std::make_unique<std::istringstream>("L;a;b\n1;2;3\n1;bad;3\n"),
                            "inline");
        REQUIRE(stream.next().has_value());
        REQUIRE_THROWS_AS(stream.next(), FormatError);
    }
}

TEST_CASE("CSV file reading", "[csv]") {
    namespace fs = std::filesystem;

    SECTION("Missing file") {
        CsvReader reader;
        REQUIRE_THROWS_AS(reader.read("/nonexistent/measurements.csv"), IOError);
    }

    SECTION("Read from disk") {
        const fs::path path = fs::temp_directory_path() / "cgats_test_read.csv";
        {
            std::ofstream out(path);
            out << "L*;a*;b*\n50,5;1;2\n";
        }
        auto set = loadCsv(path.string());
        REQUIRE(set.size() == 1);
        REQUIRE(set.sourceFile() == path.string());
        fs::remove(path);
    }
}

TEST_CASE("CSV column presence", "[csv]") {
    const std::string text = "Name;L*;a*;b*;X;Y;Z\nP1;50;1;2;;;\nP2;60;1;2;;;\n";

    SECTION("Stream reports the header") {
        CsvRowStream stream(std::make_unique<std::istringstream>(text), "inline");
        REQUIRE(stream.presence().lab);
        REQUIRE(stream.presence().xyz);
    }

    SECTION("Set reports groups with values") {
        CsvReader reader;
        auto set = reader.parseString(text);
        REQUIRE(set.size() == 2);
        REQUIRE(set.presence().lab);
        REQUIRE_FALSE(set.presence().xyz);
        REQUIRE_FALSE(set.presence().spectral);
        REQUIRE_FALSE(set[1].hasXyz());
    }

    SECTION("Rows carry their text columns") {
        MetaData text_columns{{"name", "P9"}};
        MeasurementRow row(0, Triple(1, 2, 3), std::nullopt, std::nullopt, text_columns);
        REQUIRE(row.metadata().at("name") == "P9");
        REQUIRE(row.hasLab());
    }
}
