#pragma once

#include "../chart.hpp"
#include "../errors.hpp"
#include "../measurement.hpp"
#include "../ti3_document.hpp"
#include <string>
#include <vector>

namespace cgats {
namespace algorithms {

/**
 * @brief Output column groups chosen from the CSV column presence.
 */
struct PcsSelection {
    /// Emit XYZ_X XYZ_Y XYZ_Z
    bool include_xyz = false;

    /// Emit LAB_L LAB_A LAB_B
    bool include_lab = false;

    /// Emit SPEC_400 .. SPEC_700
    bool include_spectral = false;

    /// COLOR_REP suffix
    PcsType pcs = PcsType::XYZ;
};

/**
 * @brief Choose PCS columns and COLOR_REP suffix.
 *
 * XYZ wins over Lab. Spectral columns are added whenever present and do
 * not change the suffix; spectral-only data keeps the XYZ suffix.
 */
PcsSelection selectPcs(const ColumnPresence& presence) noexcept;

/**
 * @brief Label of a strip: 0 -> "A", 25 -> "Z", 26 -> "AA", 27 -> "AB".
 */
std::string stripLabel(std::size_t strip);

/**
 * @brief Compute SAMPLE_LOC from a patch position and the layout headers.
 *
 * With STRIP_THEN_PATCH (or an unrecognized order) patches fill a strip
 * of STEPS_IN_PASS before moving to the next strip; with PATCH_THEN_STRIP
 * consecutive patches step across the PASSES_IN_STRIPS2 strips first.
 *
 * @param position Zero-based ordinal position of the patch
 * @param layout Chart layout headers
 * @return Location such as "B7", or nullopt unless all three headers are set
 */
std::optional<std::string> deriveSampleLoc(Index position, const LayoutHeaders& layout);

/**
 * @brief Options for pairing.
 */
struct PairingOptions {
    /// Chart header keywords copied into the TI3 header
    std::vector<std::string> promoted_keywords = {"CHART_ID", "PAPER_SIZE",
                                                  "COMP_GREY_STEPS"};
};

/**
 * @brief Joins measurement rows with chart patches by position.
 *
 * Row i of the measurement set is paired with the chart patch whose
 * SAMPLE_ID is i+1; rows are never reordered or matched by value. The
 * output column set is decided once for the whole run from the CSV
 * header, and SAMPLE_LOC is copied from the chart, derived from the
 * layout headers, or left out.
 *
 * Usage:
 * @code
 * PatchPairer pairer;
 * Ti3Document doc = pairer.pair(measurements, chart);
 * @endcode
 */
class PatchPairer {
public:
    PatchPairer() = default;
    explicit PatchPairer(const PairingOptions& options) : options_(options) {}

    /**
     * @brief Pair measurements with chart patches.
     *
     * @param measurements Parsed CSV rows
     * @param chart Parsed TI2 chart
     * @return Document ready for the TI3 writer
     * @throws CountMismatchError if the row and patch counts differ
     * @throws FormatError if a row lacks values of an emitted column group
     */
    Ti3Document pair(const MeasurementSet& measurements, const Chart& chart) const;

    /**
     * @brief Get/set options
     */
    const PairingOptions& options() const { return options_; }
    void setOptions(const PairingOptions& opt) { options_ = opt; }

private:
    PairingOptions options_;

    /// Resolve SAMPLE_LOC for every patch; empty when the column is left out
    std::vector<std::pair<std::optional<std::string>, LocationSource>>
    resolveLocations(const Chart& chart) const;

    /// Declare columns in TI3 order
    void declareColumns(Ti3Document& doc, const Chart& chart,
                        const PcsSelection& selection, bool with_location) const;
};

/**
 * @brief Convenience function for pairing with default options.
 */
inline Ti3Document pairMeasurements(const MeasurementSet& measurements,
                                    const Chart& chart) {
    PatchPairer pairer;
    return pairer.pair(measurements, chart);
}

} // namespace algorithms
} // namespace cgats
