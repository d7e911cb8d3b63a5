#include "cgats/pipeline.hpp"
#include "cgats/io/csv_reader.hpp"
#include "cgats/io/ti2_reader.hpp"
#include "cgats/io/ti3_writer.hpp"
#include "cgats/algorithms/pairing.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace cgats {

namespace fs = std::filesystem;

std::string toString(Stage stage) {
    switch (stage) {
        case Stage::READ_CSV: return "read CSV";
        case Stage::READ_CHART: return "read chart";
        case Stage::PAIR: return "pair measurements";
        case Stage::WRITE_TI3: return "write TI3";
        case Stage::INVOKE_PROFILER: return "build profile";
    }
    return "unknown stage";
}

Pipeline::Pipeline(BuildConfig config, std::unique_ptr<profile::ProfileInvoker> invoker)
    : config_(std::move(config)), invoker_(std::move(invoker)) {
    if (!invoker_) {
        invoker_ = std::make_unique<profile::ColprofInvoker>("colprof", config_.colprof.threads);
    }
}

PipelineResult Pipeline::run(bool build_profile) {
    PipelineResult result;

    MeasurementSet measurements;
    try {
        io::CsvReaderOptions csv_options;
        csv_options.delimiter = config_.options.csv_delimiter;
        measurements = io::loadCsv(config_.inputs.csv, csv_options);
    } catch (const Error& e) {
        throw StageError(Stage::READ_CSV, e.what());
    }

    Chart chart;
    try {
        chart = io::loadTi2(config_.inputs.ti2);
    } catch (const Error& e) {
        throw StageError(Stage::READ_CHART, e.what());
    }

    try {
        result.document = algorithms::pairMeasurements(measurements, chart);
    } catch (const Error& e) {
        throw StageError(Stage::PAIR, e.what());
    }

    try {
        io::Ti3WriterOptions writer_options;
        writer_options.device_class = config_.options.device_class;
        io::saveTi3(result.document, config_.outputs.ti3, writer_options);
    } catch (const Error& e) {
        throw StageError(Stage::WRITE_TI3, e.what());
    }
    result.ti3_path = config_.outputs.ti3;

    if (!build_profile || !config_.colprof.run) {
        spdlog::info("Skipping profile build");
        return result;
    }

    try {
        const fs::path icc(config_.outputs.icc);
        if (icc.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(icc.parent_path(), ec);
            if (ec) {
                throw IOError(config_.outputs.icc, "cannot create directory: " + ec.message());
            }
        }
        const auto args = profile::buildColprofArgs(config_.colprof,
                                                    result.document.hasSpectral(),
                                                    config_.outputs.icc,
                                                    config_.outputs.description);
        result.profiler = profile::runProfiler(*invoker_, result.ti3_path, args);
    } catch (const ExternalToolError& e) {
        if (!e.output().empty()) {
            spdlog::error("{} output:\n{}", invoker_->toolName(), e.output());
        }
        spdlog::warn("TI3 kept at {}", result.ti3_path);
        throw StageError(Stage::INVOKE_PROFILER, e.what(), e.exitCode());
    } catch (const Error& e) {
        throw StageError(Stage::INVOKE_PROFILER, e.what());
    }

    result.icc_path = config_.outputs.icc;
    spdlog::info("Profile written to {}", config_.outputs.icc);
    return result;
}

} // namespace cgats
