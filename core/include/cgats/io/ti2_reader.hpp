#pragma once

#include "../chart.hpp"
#include "../errors.hpp"
#include <memory>
#include <string>

namespace cgats {
namespace io {

/**
 * @brief Reader for Argyll TI2 chart layout files.
 *
 * TI2 is a CGATS text format: a keyword header, a data format block
 * naming the columns and a data block with one line per patch. The
 * reader keeps device values, SAMPLE_LOC and the layout keywords
 * (STEPS_IN_PASS, PASSES_IN_STRIPS2, INDEX_ORDER); expected XYZ/Lab
 * values in the chart are ignored.
 *
 * SAMPLE_ID values must be 1..N in file order.
 *
 * Usage:
 * @code
 * Ti2Reader reader;
 * Chart chart = reader.read("target.ti2");
 * @endcode
 */
class Ti2Reader {
public:
    Ti2Reader();
    ~Ti2Reader();

    // Non-copyable
    Ti2Reader(const Ti2Reader&) = delete;
    Ti2Reader& operator=(const Ti2Reader&) = delete;

    // Movable
    Ti2Reader(Ti2Reader&&) noexcept;
    Ti2Reader& operator=(Ti2Reader&&) noexcept;

    /**
     * @brief Read a TI2 file.
     *
     * @param filename Path to the TI2 file
     * @return Parsed chart
     * @throws IOError if the file cannot be opened
     * @throws FormatError if parsing fails
     */
    Chart read(const std::string& filename);

    /**
     * @brief Parse TI2 content from a string.
     *
     * @param content TI2 text
     * @return Parsed chart
     */
    Chart parseString(const std::string& content);

    /**
     * @brief Check if a file starts with a CGATS chart identifier.
     *
     * @param filename Path to check
     * @return true if the first line is a CTI1/CTI2 identifier
     */
    static bool isValidTi2(const std::string& filename);

    /**
     * @brief Get the last error message.
     */
    [[nodiscard]] const std::string& lastError() const noexcept {
        return last_error_;
    }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    std::string last_error_;
};

/**
 * @brief Convenience function to load a TI2 file.
 */
inline Chart loadTi2(const std::string& filename) {
    Ti2Reader reader;
    return reader.read(filename);
}

} // namespace io
} // namespace cgats
