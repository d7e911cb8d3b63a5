#include "cgats/io/ti3_writer.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace cgats {
namespace io {

namespace fs = std::filesystem;

namespace {

std::string timestamp() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%a %b %d %H:%M:%S %Y");
    return ss.str();
}

void keyword(std::string& out, const std::string& key, const std::string& value) {
    out += fmt::format("{} \"{}\"\n", key, value);
}

} // namespace

void Ti3Writer::writeHeader(std::string& out, const Ti3Document& doc) const {
    out += "CTI3   \n\n";
    keyword(out, "DESCRIPTOR", options_.descriptor);
    keyword(out, "ORIGINATOR", options_.originator);
    if (options_.include_timestamp) {
        keyword(out, "CREATED", timestamp());
    }
    keyword(out, "DEVICE_CLASS", options_.device_class);
    keyword(out, "COLOR_REP", doc.colorRep());

    if (doc.hasSpectral()) {
        const WavelengthRange range = doc.spectralRange();
        keyword(out, "INSTRUMENT_TYPE_SPECTRAL", "YES");
        keyword(out, "SPECTRAL_BANDS", std::to_string(kSpectralBands));
        keyword(out, "SPECTRAL_START_NM", fmt::format("{:.6f}", double(range.min_value)));
        keyword(out, "SPECTRAL_END_NM", fmt::format("{:.6f}", double(range.max_value)));
    } else {
        keyword(out, "INSTRUMENT_TYPE_SPECTRAL", "NO");
    }

    for (const auto& kv : doc.promotedKeywords()) {
        keyword(out, kv.first, kv.second);
    }

    if (doc.illuminant()) {
        out += fmt::format("# ILLUMINANT_CODE \"{}\"\n", *doc.illuminant());
    }
    if (doc.observerDegrees()) {
        out += fmt::format("# OBSERVER \"{} deg\"\n", *doc.observerDegrees());
    }
    if (!options_.instrument.empty()) {
        out += fmt::format("# INSTRUMENT \"{}\"\n", options_.instrument);
    }

    out += fmt::format("\nNUMBER_OF_FIELDS {}\n", doc.columns().size());
    out += "BEGIN_DATA_FORMAT\n";
    for (const auto& col : doc.columns()) {
        out += col.name;
        out += ' ';
    }
    out += "\nEND_DATA_FORMAT\n\n";
    out += fmt::format("NUMBER_OF_SETS {}\n", doc.sampleCount());
}

void Ti3Writer::writeData(std::string& out, const Ti3Document& doc) const {
    out += "BEGIN_DATA\n";
    for (const PairedSample& s : doc.samples()) {
        std::size_t device = 0;
        std::size_t pcs = 0;
        std::size_t band = 0;
        for (const auto& col : doc.columns()) {
            switch (col.kind) {
                case ColumnKind::SAMPLE_ID:
                    out += std::to_string(s.sample_id);
                    break;
                case ColumnKind::SAMPLE_LOC:
                    out += fmt::format("\"{}\"", s.location.value_or(""));
                    break;
                case ColumnKind::DEVICE:
                    out += fmt::format("{:.5f}", s.device_values.at(device++));
                    break;
                case ColumnKind::XYZ:
                case ColumnKind::LAB:
                    out += fmt::format("{:.4f}", s.pcs.value()[pcs++]);
                    break;
                case ColumnKind::SPECTRAL:
                    out += fmt::format("{:.6f}", s.spectral.value().at(band++));
                    break;
            }
            out += ' ';
        }
        out += '\n';
    }
    out += "END_DATA\n";
}

std::string Ti3Writer::toString(const Ti3Document& doc) const {
    std::string out;
    writeHeader(out, doc);
    writeData(out, doc);
    return out;
}

void Ti3Writer::write(const Ti3Document& doc, const std::string& filename) const {
    const std::string content = toString(doc);
    const fs::path target(filename);
    std::error_code ec;

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw IOError(filename, "cannot create directory " +
                          target.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path temp = target;
    temp += ".partial";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError(filename, "cannot open " + temp.string() + " for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            throw IOError(filename, "write failed");
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw IOError(filename, "cannot replace destination: " + ec.message());
    }
    spdlog::info("Wrote {} ({} samples, {} fields)", filename, doc.sampleCount(),
                 doc.columns().size());
}

} // namespace io
} // namespace cgats
