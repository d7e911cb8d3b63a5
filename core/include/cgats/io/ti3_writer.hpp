#pragma once

#include "../ti3_document.hpp"
#include "../errors.hpp"
#include <string>

namespace cgats {
namespace io {

/**
 * @brief Options for TI3 writing.
 */
struct Ti3WriterOptions {
    /// DESCRIPTOR keyword
    std::string descriptor = "Spectrophotometer measurements";

    /// ORIGINATOR keyword
    std::string originator = "cgats-toolkit";

    /// DEVICE_CLASS keyword (OUTPUT, INPUT, DISPLAY)
    std::string device_class = "OUTPUT";

    /// Instrument name written as a comment (empty = none)
    std::string instrument;

    /// Write the CREATED timestamp
    bool include_timestamp = true;
};

/**
 * @brief Writer for CGATS TI3 measurement files.
 *
 * Produces the header keywords, the data format and one data line per
 * paired sample in document order. Device values use 5 decimals,
 * XYZ/Lab 4 decimals and spectral reflectance 6 decimals.
 *
 * Files are written atomically: the content goes to a temporary sibling
 * file which is renamed over the destination once complete.
 */
class Ti3Writer {
public:
    Ti3Writer() = default;
    explicit Ti3Writer(const Ti3WriterOptions& options) : options_(options) {}

    /**
     * @brief Write a document to a file.
     *
     * @param doc Document to write
     * @param filename Destination path; missing parent directories are created
     * @throws IOError if the destination cannot be written
     */
    void write(const Ti3Document& doc, const std::string& filename) const;

    /**
     * @brief Serialize a document to TI3 text.
     */
    [[nodiscard]] std::string toString(const Ti3Document& doc) const;

    /**
     * @brief Get/set options
     */
    const Ti3WriterOptions& options() const { return options_; }
    void setOptions(const Ti3WriterOptions& opt) { options_ = opt; }

private:
    Ti3WriterOptions options_;

    void writeHeader(std::string& out, const Ti3Document& doc) const;
    void writeData(std::string& out, const Ti3Document& doc) const;
};

/**
 * @brief Convenience function to write a TI3 file.
 */
inline void saveTi3(const Ti3Document& doc, const std::string& filename,
                    const Ti3WriterOptions& options = {}) {
    Ti3Writer writer(options);
    writer.write(doc, filename);
}

} // namespace io
} // namespace cgats
