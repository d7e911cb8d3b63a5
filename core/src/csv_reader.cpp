#include "cgats/io/csv_reader.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <regex>
#include <sstream>

namespace cgats {
namespace io {

namespace {

constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

/// Lower-case a header and drop everything but [a-z0-9_]
std::string normalizeHeader(const std::string& h) {
    std::string out;
    out.reserve(h.size());
    for (char c : h) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= 128) continue;
        char lc = static_cast<char>(std::tolower(uc));
        if ((lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9') || lc == '_') {
            out += lc;
        }
    }
    return out;
}

/// Split one line, honouring double-quoted fields
std::vector<std::string> splitLine(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == delimiter && !in_quotes) {
            fields.push_back(trim(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(trim(field));
    return fields;
}

bool isMissingValue(const std::string& s) {
    if (s.empty()) return true;
    std::string lower = normalizeHeader(s);
    return lower == "nan" || lower == "null";
}

constexpr std::size_t kNoColumn = static_cast<std::size_t>(-1);

} // namespace

class CsvRowStream::Impl {
public:
    Impl(std::unique_ptr<std::istream> input, std::string source,
         const CsvReaderOptions& options)
        : input_(std::move(input)), source_(std::move(source)), options_(options) {
        lab_.fill(kNoColumn);
        xyz_.fill(kNoColumn);
        spectral_.fill(kNoColumn);
        parseHeader();
    }

    std::optional<MeasurementRow> next() {
        std::string line;
        while (std::getline(*input_, line)) {
            ++line_no_;
            if (trim(line).empty()) continue;

            auto parts = splitLine(line, options_.delimiter);
            auto lab = readGroup(parts, lab_, "Lab");
            auto xyz = readGroup(parts, xyz_, "XYZ");
            auto spectral = readSpectral(parts);

            if (!lab && !xyz && !spectral) {
                if (options_.skip_non_measurement_rows) {
                    spdlog::warn("{}:{}: no Lab, XYZ or spectral values, row skipped",
                                 source_, line_no_);
                    continue;
                }
                fail("line " + std::to_string(line_no_) +
                     ": row has no Lab, XYZ or spectral values");
            }

            captureConditions(parts);

            MetaData text;
            copyText(parts, name_col_, "name", text);
            copyText(parts, date_col_, "date", text);
            copyText(parts, mode_col_, "test_mode", text);
            copyText(parts, light_col_, "light_source_angle", text);
            return MeasurementRow(next_index_++, std::move(lab), std::move(xyz),
                                  std::move(spectral), std::move(text));
        }
        spdlog::debug("{}: {} measurement rows read", source_, next_index_);
        return std::nullopt;
    }

    const ColumnPresence& presence() const noexcept { return presence_; }
    const std::optional<std::string>& illuminant() const noexcept { return illuminant_; }
    std::optional<int> observerDegrees() const noexcept { return observer_deg_; }
    const std::string& source() const noexcept { return source_; }

private:
    [[noreturn]] void fail(const std::string& msg) const {
        throw FormatError(source_, msg);
    }

    void parseHeader() {
        std::string header_line;
        while (std::getline(*input_, header_line)) {
            ++line_no_;
            if (!trim(header_line).empty()) break;
        }
        if (trim(header_line).empty()) {
            fail("empty file, no header line");
        }
        if (header_line.compare(0, 3, kUtf8Bom) == 0) {
            header_line.erase(0, 3);
        }

        static const std::regex spectral_re("(\\d{3})(?:nm)?$");

        auto headers = splitLine(header_line, options_.delimiter);
        for (std::size_t i = 0; i < headers.size(); ++i) {
            std::string key = normalizeHeader(headers[i]);
            if (key.empty()) continue;

            if (key == "l" || key == "lstar") {
                assign(lab_[0], i, headers[i]);
            } else if (key == "a" || key == "astar") {
                assign(lab_[1], i, headers[i]);
            } else if (key == "b" || key == "bstar") {
                assign(lab_[2], i, headers[i]);
            } else if (key == "x") {
                assign(xyz_[0], i, headers[i]);
            } else if (key == "y") {
                assign(xyz_[1], i, headers[i]);
            } else if (key == "z") {
                assign(xyz_[2], i, headers[i]);
            } else if (key == "name") {
                name_col_ = i;
            } else if (key == "date") {
                date_col_ = i;
            } else if (key == "testmode") {
                mode_col_ = i;
            } else if (key == "lightsourceangle") {
                light_col_ = i;
            } else {
                std::smatch match;
                if (std::regex_search(key, match, spectral_re)) {
                    Wavelength nm = std::stoi(match[1].str());
                    if (auto band = bandIndex(nm)) {
                        assign(spectral_[*band], i, headers[i]);
                    } else {
                        spdlog::debug("{}: column '{}' ({} nm) is outside the 400-700 nm "
                                      "grid, ignored", source_, headers[i], nm);
                    }
                }
            }
        }

        presence_.lab = checkGroup(lab_.begin(), lab_.end(), "Lab (L, a, b)");
        presence_.xyz = checkGroup(xyz_.begin(), xyz_.end(), "XYZ (X, Y, Z)");
        presence_.spectral = checkSpectral();

        if (!presence_.any()) {
            fail("header declares no Lab, XYZ or spectral columns");
        }
        spdlog::debug("{}: columns lab={} xyz={} spectral={}", source_,
                      presence_.lab, presence_.xyz, presence_.spectral);
    }

    void assign(std::size_t& slot, std::size_t column, const std::string& name) {
        if (slot != kNoColumn) {
            fail("duplicate column '" + name + "' in header");
        }
        slot = column;
    }

    template<typename It>
    bool checkGroup(It begin, It end, const std::string& group) const {
        auto present = std::count_if(begin, end,
            [](std::size_t c) { return c != kNoColumn; });
        if (present == 0) return false;
        if (present != std::distance(begin, end)) {
            fail("header declares only part of the " + group + " column group");
        }
        return true;
    }

    bool checkSpectral() const {
        std::string missing;
        std::size_t present = 0;
        for (std::size_t i = 0; i < kSpectralBands; ++i) {
            if (spectral_[i] != kNoColumn) {
                ++present;
            } else {
                if (!missing.empty()) missing += ", ";
                missing += std::to_string(bandWavelength(i));
            }
        }
        if (present == 0) return false;
        if (present != kSpectralBands) {
            fail("spectral columns incomplete, missing " + missing + " nm");
        }
        return true;
    }

    std::optional<double> readValue(const std::vector<std::string>& parts,
                                    std::size_t column) const {
        if (column >= parts.size()) return std::nullopt;
        std::string s = parts[column];
        if (isMissingValue(s)) return std::nullopt;
        if (options_.decimal_comma) {
            std::replace(s.begin(), s.end(), ',', '.');
        }
        char* end = nullptr;
        double v = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0') {
            fail("line " + std::to_string(line_no_) + ": value '" + parts[column] +
                 "' is not a number");
        }
        return v;
    }

    std::optional<Triple> readGroup(const std::vector<std::string>& parts,
                                    const std::array<std::size_t, 3>& cols,
                                    const std::string& group) const {
        if (cols[0] == kNoColumn) return std::nullopt;
        std::array<std::optional<double>, 3> v;
        for (std::size_t i = 0; i < 3; ++i) {
            v[i] = readValue(parts, cols[i]);
        }
        bool all = v[0] && v[1] && v[2];
        bool none = !v[0] && !v[1] && !v[2];
        if (none) return std::nullopt;
        if (!all) {
            fail("line " + std::to_string(line_no_) + ": partial " + group + " values");
        }
        return Triple(*v[0], *v[1], *v[2]);
    }

    std::optional<SpectralVector> readSpectral(const std::vector<std::string>& parts) const {
        if (!presence_.spectral) return std::nullopt;
        SpectralVector values{};
        std::size_t found = 0;
        for (std::size_t i = 0; i < kSpectralBands; ++i) {
            if (auto v = readValue(parts, spectral_[i])) {
                values[i] = *v;
                ++found;
            }
        }
        if (found == 0) return std::nullopt;
        if (found != kSpectralBands) {
            fail("line " + std::to_string(line_no_) + ": " + std::to_string(found) +
                 " of " + std::to_string(kSpectralBands) + " spectral values present");
        }
        return values;
    }

    /// Take illuminant and observer from the first "D50/10°"-style value
    void captureConditions(const std::vector<std::string>& parts) {
        if (illuminant_ || light_col_ >= parts.size()) return;
        static const std::regex light_re("([A-Za-z0-9]+)\\s*/\\s*(\\d+)");
        std::smatch match;
        const std::string& value = parts[light_col_];
        if (std::regex_search(value, match, light_re)) {
            const std::string degrees = match[2].str();
            errno = 0;
            const long deg = std::strtol(degrees.c_str(), nullptr, 10);
            if (errno == ERANGE || deg > std::numeric_limits<int>::max()) {
                fail("line " + std::to_string(line_no_) + ": observer angle '" + degrees +
                     "' is out of range");
            }
            std::string code = match[1].str();
            std::transform(code.begin(), code.end(), code.begin(),
                [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            illuminant_ = code;
            observer_deg_ = static_cast<int>(deg);
            spdlog::debug("{}: measured under {} / {} deg observer", source_,
                          *illuminant_, *observer_deg_);
        }
    }

    static void copyText(const std::vector<std::string>& parts, std::size_t column,
                         const char* key, MetaData& text) {
        if (column < parts.size() && !parts[column].empty()) {
            text[key] = parts[column];
        }
    }

    std::unique_ptr<std::istream> input_;
    std::string source_;
    CsvReaderOptions options_;

    std::array<std::size_t, 3> lab_{};
    std::array<std::size_t, 3> xyz_{};
    std::array<std::size_t, kSpectralBands> spectral_{};
    std::size_t name_col_ = kNoColumn;
    std::size_t date_col_ = kNoColumn;
    std::size_t mode_col_ = kNoColumn;
    std::size_t light_col_ = kNoColumn;

    ColumnPresence presence_;
    std::optional<std::string> illuminant_;
    std::optional<int> observer_deg_;
    std::size_t line_no_ = 0;
    Index next_index_ = 0;
};

CsvRowStream::CsvRowStream(std::unique_ptr<std::istream> input, std::string source,
                           const CsvReaderOptions& options)
    : impl_(std::make_unique<Impl>(std::move(input), std::move(source), options)) {}
CsvRowStream::~CsvRowStream() = default;
CsvRowStream::CsvRowStream(CsvRowStream&&) noexcept = default;
CsvRowStream& CsvRowStream::operator=(CsvRowStream&&) noexcept = default;

CsvRowStream CsvRowStream::open(const std::string& filename,
                                const CsvReaderOptions& options) {
    auto file = std::make_unique<std::ifstream>(filename, std::ios::binary);
    if (!file->is_open()) {
        throw IOError(filename, "cannot open CSV file");
    }
    return CsvRowStream(std::move(file), filename, options);
}

std::optional<MeasurementRow> CsvRowStream::next() { return impl_->next(); }

const ColumnPresence& CsvRowStream::presence() const noexcept {
    return impl_->presence();
}

const std::optional<std::string>& CsvRowStream::illuminant() const noexcept {
    return impl_->illuminant();
}

std::optional<int> CsvRowStream::observerDegrees() const noexcept {
    return impl_->observerDegrees();
}

const std::string& CsvRowStream::source() const noexcept { return impl_->source(); }

MeasurementSet CsvReader::drain(CsvRowStream& stream) {
    MeasurementSet set;
    while (auto row = stream.next()) {
        set.addRow(std::move(*row));
    }
    if (stream.illuminant()) set.setIlluminant(*stream.illuminant());
    if (auto deg = stream.observerDegrees()) set.setObserverDegrees(*deg);
    return set;
}

MeasurementSet CsvReader::read(const std::string& filename) {
    try {
        auto stream = CsvRowStream::open(filename, default_options_);
        MeasurementSet set = drain(stream);
        set.setSourceFile(filename);
        spdlog::info("Read {} measurement rows from {}", set.size(), filename);
        return set;
    } catch (const Error& e) {
        last_error_ = e.what();
        throw;
    }
}

MeasurementSet CsvReader::parseString(const std::string& content) {
    try {
        CsvRowStream stream(std::make_unique<std::istringstream>(content), "",
                            default_options_);
        return drain(stream);
    } catch (const Error& e) {
        last_error_ = e.what();
        throw;
    }
}

} // namespace io
} // namespace cgats
