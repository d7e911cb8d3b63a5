#pragma once

#include "types.hpp"
#include <stdexcept>
#include <utility>

namespace cgats {

/**
 * @brief Which photometric column groups a measurement export carries.
 *
 * A row stream reports the groups its header declares. A MeasurementSet
 * reports the groups at least one of its rows has values for; the engine
 * selects the output PCS columns from the latter.
 */
struct ColumnPresence {
    bool lab = false;
    bool xyz = false;
    bool spectral = false;

    [[nodiscard]] bool any() const noexcept { return lab || xyz || spectral; }
};

/**
 * @brief One measurement taken by the spectrophotometer.
 *
 * A row carries an optional L*a*b* triple, an optional XYZ triple and an
 * optional 31-band reflectance vector. At least one of the three must be
 * present. Rows are immutable once constructed.
 */
class MeasurementRow {
public:
    MeasurementRow(Index index,
                   std::optional<Triple> lab,
                   std::optional<Triple> xyz,
                   std::optional<SpectralVector> spectral,
                   MetaData metadata = {})
        : index_(index), lab_(std::move(lab)), xyz_(std::move(xyz)),
          spectral_(std::move(spectral)), metadata_(std::move(metadata)) {
        if (!lab_ && !xyz_ && !spectral_) {
            throw std::invalid_argument(
                "measurement row " + std::to_string(index) +
                " has no Lab, XYZ or spectral values");
        }
    }

    /// Zero-based position among the measurement rows of the export
    [[nodiscard]] Index index() const noexcept { return index_; }

    [[nodiscard]] const std::optional<Triple>& lab() const noexcept { return lab_; }
    [[nodiscard]] const std::optional<Triple>& xyz() const noexcept { return xyz_; }
    [[nodiscard]] const std::optional<SpectralVector>& spectral() const noexcept {
        return spectral_;
    }

    [[nodiscard]] bool hasLab() const noexcept { return lab_.has_value(); }
    [[nodiscard]] bool hasXyz() const noexcept { return xyz_.has_value(); }
    [[nodiscard]] bool hasSpectral() const noexcept { return spectral_.has_value(); }

    /// Free-text columns of the export (Name, Date, Test Mode, ...)
    [[nodiscard]] const MetaData& metadata() const noexcept { return metadata_; }

private:
    Index index_;
    std::optional<Triple> lab_;
    std::optional<Triple> xyz_;
    std::optional<SpectralVector> spectral_;
    MetaData metadata_;
};

/**
 * @brief All measurement rows of one export, in file order.
 */
class MeasurementSet {
public:
    MeasurementSet() = default;

    /// Get number of rows
    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }

    /// Check if the set is empty
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    /// Access row by index
    [[nodiscard]] const MeasurementRow& row(Index i) const { return rows_.at(i); }
    [[nodiscard]] const MeasurementRow& operator[](Index i) const { return rows_[i]; }

    /// Get all rows
    [[nodiscard]] const std::vector<MeasurementRow>& rows() const noexcept {
        return rows_;
    }

    void addRow(MeasurementRow row) {
        presence_.lab = presence_.lab || row.hasLab();
        presence_.xyz = presence_.xyz || row.hasXyz();
        presence_.spectral = presence_.spectral || row.hasSpectral();
        rows_.push_back(std::move(row));
    }
    void reserveRows(std::size_t n) { rows_.reserve(n); }

    /// Column groups with values in at least one row
    [[nodiscard]] const ColumnPresence& presence() const noexcept { return presence_; }

    /// Illuminant code from the Light Source/Angle column (e.g. "D50")
    [[nodiscard]] const std::optional<std::string>& illuminant() const noexcept {
        return illuminant_;
    }
    void setIlluminant(std::string code) { illuminant_ = std::move(code); }

    /// Observer angle in degrees (2 or 10)
    [[nodiscard]] std::optional<int> observerDegrees() const noexcept {
        return observer_deg_;
    }
    void setObserverDegrees(int deg) noexcept { observer_deg_ = deg; }

    /// Source file path
    [[nodiscard]] const std::string& sourceFile() const noexcept { return source_file_; }
    void setSourceFile(std::string path) { source_file_ = std::move(path); }

private:
    std::vector<MeasurementRow> rows_;
    ColumnPresence presence_;
    std::optional<std::string> illuminant_;
    std::optional<int> observer_deg_;
    std::string source_file_;
};

} // namespace cgats
