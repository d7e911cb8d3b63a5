#pragma once

/**
 * @file cgats.hpp
 * @brief Main header for the cgats-toolkit library.
 *
 * Include this header to get access to all library functionality.
 *
 * @example
 * @code
 * #include <cgats/cgats.hpp>
 *
 * int main() {
 *     auto measurements = cgats::io::loadCsv("measurements.csv");
 *     auto chart = cgats::io::loadTi2("target.ti2");
 *
 *     auto doc = cgats::algorithms::pairMeasurements(measurements, chart);
 *     cgats::io::saveTi3(doc, "target.ti3");
 *     return 0;
 * }
 * @endcode
 */

// Core types
#include "types.hpp"
#include "errors.hpp"

// Data structures
#include "measurement.hpp"
#include "chart.hpp"
#include "ti3_document.hpp"

// I/O
#include "io/csv_reader.hpp"
#include "io/ti2_reader.hpp"
#include "io/ti3_writer.hpp"

// Algorithms
#include "algorithms/pairing.hpp"

// Profile building
#include "profile/colprof.hpp"
#include "config.hpp"
#include "log.hpp"
#include "pipeline.hpp"

/**
 * @namespace cgats
 * @brief Root namespace for the cgats-toolkit library.
 */

/**
 * @namespace cgats::io
 * @brief Readers and writers for measurement CSV and CGATS files.
 */

/**
 * @namespace cgats::algorithms
 * @brief Measurement-to-patch pairing and column selection.
 */

/**
 * @namespace cgats::profile
 * @brief ICC profile building through external tools.
 */

/**
 * @namespace cgats::log
 * @brief Logging setup.
 */
