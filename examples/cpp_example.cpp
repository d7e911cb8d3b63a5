/**
 * Example usage of the cgats-toolkit C++ library.
 *
 * Compile with:
 *   g++ -std=c++17 -I../core/include cpp_example.cpp -o example -lcgats_core -lspdlog -lfmt -lyaml-cpp
 */

#include <iostream>
#include <string>

#include "cgats/cgats.hpp"

using namespace cgats;

namespace {

const char* kMeasurements =
    "Name;Date;Test Mode;Light Source/Angle;L*;a*;b*\n"
    "P1;2024-05-01;SCI;D50/2\xC2\xB0;95,10;-0,52;2,31\n"
    "P2;2024-05-01;SCI;D50/2\xC2\xB0;53,24;80,09;67,20\n"
    "P3;2024-05-01;SCI;D50/2\xC2\xB0;87,73;-86,18;83,18\n"
    "P4;2024-05-01;SCI;D50/2\xC2\xB0;32,30;79,19;-107,86\n";

const char* kChart =
    "CTI2\n"
    "\n"
    "DESCRIPTOR \"Example chart\"\n"
    "CHART_ID \"1\"\n"
    "COLOR_REP \"iRGB\"\n"
    "STEPS_IN_PASS \"2\"\n"
    "PASSES_IN_STRIPS2 \"2\"\n"
    "INDEX_ORDER \"STRIP_THEN_PATCH\"\n"
    "\n"
    "NUMBER_OF_FIELDS 4\n"
    "BEGIN_DATA_FORMAT\n"
    "SAMPLE_ID RGB_R RGB_G RGB_B\n"
    "END_DATA_FORMAT\n"
    "\n"
    "NUMBER_OF_SETS 4\n"
    "BEGIN_DATA\n"
    "1 100.0 100.0 100.0\n"
    "2 100.0 0.0 0.0\n"
    "3 0.0 100.0 0.0\n"
    "4 0.0 0.0 100.0\n"
    "END_DATA\n";

} // namespace

void exampleReadInputs(MeasurementSet& measurements, Chart& chart) {
    std::cout << "========================================\n";
    std::cout << "Reading Inputs\n";
    std::cout << "========================================\n";

    io::CsvReader csv;
    measurements = csv.parseString(kMeasurements);

    std::cout << "Measurements:\n";
    std::cout << "  Rows: " << measurements.size() << "\n";
    std::cout << "  Lab: " << (measurements.presence().lab ? "yes" : "no")
              << ", XYZ: " << (measurements.presence().xyz ? "yes" : "no")
              << ", spectral: " << (measurements.presence().spectral ? "yes" : "no") << "\n";
    if (measurements.illuminant()) {
        std::cout << "  Illuminant: " << *measurements.illuminant() << "\n";
    }

    io::Ti2Reader ti2;
    chart = ti2.parseString(kChart);

    std::cout << "\nChart:\n";
    std::cout << "  Patches: " << chart.size() << "\n";
    std::cout << "  Device space: " << chart.deviceSpace() << "\n";
    std::cout << "  Layout: " << chart.layout().steps_in_pass.value_or(0) << " x "
              << chart.layout().passes_in_strips2.value_or(0) << ", "
              << toString(chart.layout().index_order.value_or(IndexOrder::UNKNOWN)) << "\n";
}

void examplePairing(const MeasurementSet& measurements, const Chart& chart) {
    std::cout << "\n========================================\n";
    std::cout << "Pairing\n";
    std::cout << "========================================\n";

    auto doc = algorithms::pairMeasurements(measurements, chart);

    std::cout << "COLOR_REP: " << doc.colorRep() << "\n";
    for (const auto& sample : doc.samples()) {
        std::cout << "  " << sample.sample_id << " -> "
                  << sample.location.value_or("-")
                  << " (" << toString(sample.location_source) << ")\n";
    }

    io::Ti3WriterOptions options;
    options.include_timestamp = false;
    io::Ti3Writer writer(options);

    std::cout << "\nTI3 output:\n" << writer.toString(doc);
}

void exampleColprofArgs() {
    std::cout << "\n========================================\n";
    std::cout << "colprof Arguments\n";
    std::cout << "========================================\n";

    profile::ColprofOptions options;
    options.quality = "h";
    options.total_ink_limit = "300";
    options.black_generation = "0.1 0.9 0.5 0.8 0.6";

    auto args = profile::buildColprofArgs(options, false, "printer.icc", "My printer");
    std::cout << "colprof";
    for (const auto& a : args) {
        std::cout << " " << profile::shellQuote(a);
    }
    std::cout << " printer\n";
}

int main() {
    std::cout << "cgats-toolkit C++ Library Examples\n\n";

    log::init(spdlog::level::warn);

    try {
        MeasurementSet measurements;
        Chart chart;
        exampleReadInputs(measurements, chart);
        examplePairing(measurements, chart);
        exampleColprofArgs();

        std::cout << "\n========================================\n";
        std::cout << "Examples completed successfully!\n";
        std::cout << "========================================\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
