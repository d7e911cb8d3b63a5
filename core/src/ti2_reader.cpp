#include "cgats/io/ti2_reader.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <sstream>

namespace cgats {
namespace io {

namespace {

/// Split a CGATS line into tokens; quoted tokens are unquoted
std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        if (i >= line.size()) break;
        std::string token;
        if (line[i] == '"') {
            ++i;
            while (i < line.size() && line[i] != '"') token += line[i++];
            if (i < line.size()) ++i;  // closing quote
        } else {
            while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) {
                token += line[i++];
            }
        }
        tokens.push_back(std::move(token));
    }
    return tokens;
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

/// Fields that are not device channels
bool isDeviceField(const std::string& field) {
    if (field == "SAMPLE_ID" || field == "SAMPLE_LOC" || field == "SAMPLE_NAME") {
        return false;
    }
    return !startsWith(field, "XYZ_") && !startsWith(field, "LAB_") &&
           !startsWith(field, "SPEC_");
}

/// COLOR_REP device prefix implied by the device field names
std::string inferDeviceSpace(const std::vector<std::string>& fields) {
    auto any_prefix = [&fields](const char* prefix) {
        return std::any_of(fields.begin(), fields.end(),
            [prefix](const std::string& f) { return startsWith(f, prefix); });
    };
    if (any_prefix("RGB_")) return "iRGB";
    if (any_prefix("CMYK_")) return "iCMYK";
    if (any_prefix("CMY_")) return "iCMY";
    if (any_prefix("GRAY_") || any_prefix("K_")) return "iK";
    return "";
}

} // namespace

class Ti2Reader::Impl {
public:
    Impl() = default;

    Chart parse(std::istream& in, const std::string& source) {
        source_ = source;
        Chart chart;
        chart.setSourceFile(source);

        enum class State { IDENTIFIER, HEADER, FORMAT, DATA, DONE };
        State state = State::IDENTIFIER;

        std::vector<std::string> fields;
        std::vector<std::vector<std::string>> rows;
        std::optional<long> declared_fields;
        std::optional<long> declared_sets;
        bool format_closed = false;

        std::string line;
        std::size_t line_no = 0;
        while (state != State::DONE && std::getline(in, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            auto first = line.find_first_not_of(" \t");
            if (first == std::string::npos || line[first] == '#') continue;
            auto tokens = tokenize(line);
            if (tokens.empty()) continue;

            switch (state) {
                case State::IDENTIFIER:
                    // File identifier, e.g. "CTI2"
                    spdlog::debug("{}: CGATS identifier {}", source_, tokens[0]);
                    state = State::HEADER;
                    break;

                case State::HEADER: {
                    const std::string& key = tokens[0];
                    if (key == "BEGIN_DATA_FORMAT") {
                        if (format_closed) fail(line_no, "second data format block");
                        state = State::FORMAT;
                    } else if (key == "BEGIN_DATA") {
                        if (!format_closed) fail(line_no, "BEGIN_DATA before data format");
                        state = State::DATA;
                    } else if (key == "NUMBER_OF_FIELDS") {
                        declared_fields = parseCount(tokens, line_no);
                    } else if (key == "NUMBER_OF_SETS") {
                        declared_sets = parseCount(tokens, line_no);
                    } else if (key == "KEYWORD") {
                        // declaration of a non-standard keyword; the value follows separately
                    } else {
                        std::string value;
                        for (std::size_t i = 1; i < tokens.size(); ++i) {
                            if (i > 1) value += ' ';
                            value += tokens[i];
                        }
                        chart.addHeaderKeyword(key, value);
                    }
                    break;
                }

                case State::FORMAT:
                    for (const auto& t : tokens) {
                        if (t == "END_DATA_FORMAT") {
                            format_closed = true;
                            state = State::HEADER;
                            break;
                        }
                        fields.push_back(t);
                    }
                    break;

                case State::DATA:
                    if (tokens[0] == "END_DATA") {
                        state = State::DONE;
                        break;
                    }
                    if (tokens.size() != fields.size()) {
                        fail(line_no, "data line has " + std::to_string(tokens.size()) +
                             " values, expected " + std::to_string(fields.size()));
                    }
                    rows.push_back(std::move(tokens));
                    break;

                case State::DONE:
                    break;
            }
        }

        if (!format_closed || fields.empty()) {
            fail("missing BEGIN_DATA_FORMAT/END_DATA_FORMAT block");
        }
        if (state != State::DONE) {
            fail("missing BEGIN_DATA/END_DATA block");
        }
        if (declared_fields && static_cast<std::size_t>(*declared_fields) != fields.size()) {
            fail("NUMBER_OF_FIELDS is " + std::to_string(*declared_fields) +
                 " but the data format names " + std::to_string(fields.size()) + " fields");
        }
        if (declared_sets && static_cast<std::size_t>(*declared_sets) != rows.size()) {
            fail("NUMBER_OF_SETS is " + std::to_string(*declared_sets) +
                 " but the data block has " + std::to_string(rows.size()) + " lines");
        }

        buildChart(chart, fields, rows);
        return chart;
    }

private:
    [[noreturn]] void fail(const std::string& msg) const {
        throw FormatError(source_, msg);
    }

    [[noreturn]] void fail(std::size_t line_no, const std::string& msg) const {
        throw FormatError(source_, "line " + std::to_string(line_no) + ": " + msg);
    }

    long parseCount(const std::vector<std::string>& tokens, std::size_t line_no) const {
        if (tokens.size() < 2) fail(line_no, tokens[0] + " without a value");
        auto v = parseInteger(tokens[1]);
        if (!v || *v < 0) fail(line_no, tokens[0] + " value '" + tokens[1] + "' is invalid");
        return *v;
    }

    /// Integer in decimal notation; "8" and "8.0" are both accepted
    static std::optional<long> parseInteger(const std::string& s) {
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        double v = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0' || std::floor(v) != v) {
            return std::nullopt;
        }
        if (std::fabs(v) > static_cast<double>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<long>(v);
    }

    std::optional<int> layoutValue(const Chart& chart, const char* key) const {
        auto raw = chart.headerValue(key);
        if (!raw) return std::nullopt;
        auto v = parseInteger(*raw);
        if (!v || *v <= 0) {
            fail(std::string(key) + " must be a positive integer, got '" + *raw + "'");
        }
        return static_cast<int>(*v);
    }

    void buildChart(Chart& chart, const std::vector<std::string>& fields,
                    const std::vector<std::vector<std::string>>& rows) const {
        auto id_it = std::find(fields.begin(), fields.end(), "SAMPLE_ID");
        if (id_it == fields.end()) {
            fail("data format has no SAMPLE_ID field");
        }
        const std::size_t id_col = static_cast<std::size_t>(id_it - fields.begin());

        auto loc_it = std::find(fields.begin(), fields.end(), "SAMPLE_LOC");
        const bool has_loc = loc_it != fields.end();
        const std::size_t loc_col = static_cast<std::size_t>(loc_it - fields.begin());
        chart.setHasLocationField(has_loc);

        std::vector<std::string> device_fields;
        std::vector<std::size_t> device_cols;
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (isDeviceField(fields[i])) {
                device_fields.push_back(fields[i]);
                device_cols.push_back(i);
            }
        }
        if (device_fields.empty()) {
            fail("data format has no device value fields");
        }

        // Device space
        std::string space;
        if (auto rep = chart.headerValue("COLOR_REP")) {
            space = rep->substr(0, rep->find('_'));
        }
        if (space.empty()) {
            space = inferDeviceSpace(device_fields);
        }
        if (space.empty()) {
            fail("cannot determine device space: no COLOR_REP and unrecognized device fields");
        }
        chart.setDeviceSpace(space);
        chart.setDeviceFields(device_fields);

        // Layout headers
        LayoutHeaders layout;
        layout.steps_in_pass = layoutValue(chart, "STEPS_IN_PASS");
        layout.passes_in_strips2 = layoutValue(chart, "PASSES_IN_STRIPS2");
        if (auto order = chart.headerValue("INDEX_ORDER")) {
            layout.index_order = parseIndexOrder(*order);
            if (*layout.index_order == IndexOrder::UNKNOWN) {
                spdlog::warn("{}: unrecognized INDEX_ORDER '{}', using strip-then-patch",
                             source_, *order);
            }
        }
        chart.setLayout(layout);

        // Patches
        for (std::size_t i = 0; i < rows.size(); ++i) {
            const auto& row = rows[i];
            const std::string& id_text = row[id_col];
            bool digits = !id_text.empty() &&
                std::all_of(id_text.begin(), id_text.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; });
            if (!digits) {
                fail("patch " + std::to_string(i + 1) + ": SAMPLE_ID '" + id_text +
                     "' is not numeric");
            }
            errno = 0;
            const unsigned long long raw_id = std::strtoull(id_text.c_str(), nullptr, 10);
            if (errno == ERANGE) {
                fail("patch " + std::to_string(i + 1) + ": SAMPLE_ID '" + id_text +
                     "' is out of range");
            }
            SampleId id = static_cast<SampleId>(raw_id);
            if (id != i + 1) {
                fail("SAMPLE_ID " + std::to_string(id) + " at position " +
                     std::to_string(i + 1) + ", expected contiguous IDs starting at 1");
            }

            std::vector<double> values;
            values.reserve(device_cols.size());
            for (std::size_t c : device_cols) {
                char* end = nullptr;
                double v = std::strtod(row[c].c_str(), &end);
                if (end == row[c].c_str() || *end != '\0') {
                    fail("SAMPLE_ID " + id_text + ": " + fields[c] + " value '" + row[c] +
                         "' is not a number");
                }
                values.push_back(v);
            }

            std::optional<std::string> loc;
            if (has_loc && !row[loc_col].empty()) {
                loc = row[loc_col];
            }
            chart.addPatch(id, std::move(values), std::move(loc));
        }

        spdlog::debug("{}: {} patches, device space {}, {} device fields", source_,
                      chart.size(), chart.deviceSpace(), device_fields.size());
    }

    std::string source_;
};

Ti2Reader::Ti2Reader() : impl_(std::make_unique<Impl>()) {}
Ti2Reader::~Ti2Reader() = default;
Ti2Reader::Ti2Reader(Ti2Reader&&) noexcept = default;
Ti2Reader& Ti2Reader::operator=(Ti2Reader&&) noexcept = default;

Chart Ti2Reader::read(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        last_error_ = "cannot open TI2 file";
        throw IOError(filename, last_error_);
    }
    try {
        Chart chart = impl_->parse(file, filename);
        spdlog::info("Read {} patches ({}) from {}", chart.size(), chart.deviceSpace(),
                     filename);
        return chart;
    } catch (const Error& e) {
        last_error_ = e.what();
        throw;
    }
}

Chart Ti2Reader::parseString(const std::string& content) {
    std::istringstream in(content);
    try {
        return impl_->parse(in, "");
    } catch (const Error& e) {
        last_error_ = e.what();
        throw;
    }
}

bool Ti2Reader::isValidTi2(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) return false;

    std::string line;
    while (std::getline(file, line)) {
        auto tokens = tokenize(line);
        if (tokens.empty()) continue;
        return tokens[0] == "CTI2" || tokens[0] == "CTI1";
    }
    return false;
}

} // namespace io
} // namespace cgats
