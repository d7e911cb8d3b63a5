#pragma once

#include "../measurement.hpp"
#include "../errors.hpp"
#include <istream>
#include <memory>
#include <string>

namespace cgats {
namespace io {

/**
 * @brief Options for measurement CSV reading.
 */
struct CsvReaderOptions {
    /// Field delimiter (CR30 exports use ';')
    char delimiter = ';';

    /// Accept ',' as the decimal separator
    bool decimal_comma = true;

    /// Skip rows that carry no Lab, XYZ or spectral value (e.g. summary rows)
    bool skip_non_measurement_rows = true;
};

/**
 * @brief Lazy sequence of measurement rows from a CSV export.
 *
 * The header is parsed on construction; rows are parsed one at a time by
 * next(). The stream is finite and cannot be restarted.
 *
 * Usage:
 * @code
 * auto stream = CsvRowStream::open("cr30.csv");
 * while (auto row = stream.next()) {
 *     // ...
 * }
 * @endcode
 */
class CsvRowStream {
public:
    /**
     * @brief Start reading from an already opened input stream.
     *
     * @param input Stream positioned at the header line
     * @param source Name used in error messages
     * @param options Reading options
     * @throws FormatError if the header is missing or declares a partial group
     */
    CsvRowStream(std::unique_ptr<std::istream> input, std::string source,
                 const CsvReaderOptions& options = {});
    ~CsvRowStream();

    CsvRowStream(const CsvRowStream&) = delete;
    CsvRowStream& operator=(const CsvRowStream&) = delete;
    CsvRowStream(CsvRowStream&&) noexcept;
    CsvRowStream& operator=(CsvRowStream&&) noexcept;

    /**
     * @brief Open a CSV file.
     *
     * @throws IOError if the file cannot be opened
     * @throws FormatError if the header is malformed
     */
    static CsvRowStream open(const std::string& filename,
                             const CsvReaderOptions& options = {});

    /**
     * @brief Parse the next measurement row.
     *
     * @return The row, or nullopt once the input is exhausted
     * @throws FormatError on a malformed row
     */
    std::optional<MeasurementRow> next();

    /// Column groups declared by the header, whether or not rows fill them
    [[nodiscard]] const ColumnPresence& presence() const noexcept;

    /// Illuminant code seen so far in the Light Source/Angle column
    [[nodiscard]] const std::optional<std::string>& illuminant() const noexcept;

    /// Observer angle seen so far in the Light Source/Angle column
    [[nodiscard]] std::optional<int> observerDegrees() const noexcept;

    /// Name used in error messages
    [[nodiscard]] const std::string& source() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Reader for spectrophotometer CSV exports.
 *
 * Detects Lab, XYZ and spectral (400-700 nm, 10 nm) columns by header
 * name, case-insensitively, and produces the rows in file order.
 *
 * Usage:
 * @code
 * CsvReader reader;
 * MeasurementSet set = reader.read("cr30.csv");
 * @endcode
 */
class CsvReader {
public:
    CsvReader() = default;
    explicit CsvReader(const CsvReaderOptions& options) : default_options_(options) {}

    /**
     * @brief Read a CSV export.
     *
     * @param filename Path to the CSV file
     * @return All measurement rows
     * @throws IOError if the file cannot be opened
     * @throws FormatError if parsing fails
     */
    MeasurementSet read(const std::string& filename);

    /**
     * @brief Parse CSV content from a string.
     */
    MeasurementSet parseString(const std::string& content);

    void setDefaultOptions(const CsvReaderOptions& options) {
        default_options_ = options;
    }

    /**
     * @brief Get the last error message.
     */
    [[nodiscard]] const std::string& lastError() const noexcept {
        return last_error_;
    }

private:
    MeasurementSet drain(CsvRowStream& stream);

    CsvReaderOptions default_options_;
    std::string last_error_;
};

/**
 * @brief Convenience function to load a CSV export.
 */
inline MeasurementSet loadCsv(const std::string& filename,
                              const CsvReaderOptions& options = {}) {
    CsvReader reader(options);
    return reader.read(filename);
}

} // namespace io
} // namespace cgats
