#pragma once

#include "types.hpp"
#include <utility>

namespace cgats {

/// Kind of a TI3 data column; selects the number format on output
enum class ColumnKind : std::uint8_t {
    SAMPLE_ID,
    SAMPLE_LOC,
    DEVICE,
    XYZ,
    LAB,
    SPECTRAL
};

/// One column of the TI3 data format
struct ColumnDef {
    std::string name;
    ColumnKind kind = ColumnKind::DEVICE;

    ColumnDef() = default;
    ColumnDef(std::string n, ColumnKind k) : name(std::move(n)), kind(k) {}
};

/**
 * @brief A measurement joined with the chart patch at the same position.
 */
struct PairedSample {
    /// SAMPLE_ID of the chart patch (position + 1)
    SampleId sample_id = 0;

    /// Device values copied from the chart
    std::vector<double> device_values;

    /// Values of the selected PCS group (absent for spectral-only output)
    std::optional<Triple> pcs;

    /// Reflectance vector, present when spectral columns are emitted
    std::optional<SpectralVector> spectral;

    /// Resolved SAMPLE_LOC
    std::optional<std::string> location;

    /// How the SAMPLE_LOC was resolved
    LocationSource location_source = LocationSource::NONE;
};

/**
 * @brief Everything needed to serialize one TI3 file.
 *
 * Built once by the pairing engine, written once by the TI3 writer.
 */
class Ti3Document {
public:
    Ti3Document() = default;

    // =========================================================================
    // Columns
    // =========================================================================

    [[nodiscard]] const std::vector<ColumnDef>& columns() const noexcept { return columns_; }
    void addColumn(std::string name, ColumnKind kind) {
        columns_.emplace_back(std::move(name), kind);
    }

    /// Check if a column of the given kind is declared
    [[nodiscard]] bool hasColumn(ColumnKind kind) const noexcept {
        for (const auto& c : columns_) {
            if (c.kind == kind) return true;
        }
        return false;
    }

    // =========================================================================
    // Header
    // =========================================================================

    /// COLOR_REP tag, e.g. "iRGB_LAB"
    [[nodiscard]] const std::string& colorRep() const noexcept { return color_rep_; }
    void setColorRep(std::string rep) { color_rep_ = std::move(rep); }

    /// PCS named by the COLOR_REP suffix
    [[nodiscard]] PcsType pcs() const noexcept { return pcs_; }
    void setPcs(PcsType p) noexcept { pcs_ = p; }

    /// True when SPEC_ columns are emitted
    [[nodiscard]] bool hasSpectral() const noexcept { return has_spectral_; }
    void setHasSpectral(bool v) noexcept { has_spectral_ = v; }

    /// Spectral range covered by the SPEC_ columns
    [[nodiscard]] WavelengthRange spectralRange() const noexcept {
        return WavelengthRange(kSpectralStartNm, kSpectralEndNm);
    }

    /// Chart keywords promoted into the TI3 header (key, unquoted value)
    [[nodiscard]] const std::vector<std::pair<std::string, std::string>>&
    promotedKeywords() const noexcept {
        return promoted_keywords_;
    }
    void addPromotedKeyword(std::string key, std::string value) {
        promoted_keywords_.emplace_back(std::move(key), std::move(value));
    }

    /// Measurement conditions, written as comments
    [[nodiscard]] const std::optional<std::string>& illuminant() const noexcept {
        return illuminant_;
    }
    void setIlluminant(std::optional<std::string> code) { illuminant_ = std::move(code); }

    [[nodiscard]] std::optional<int> observerDegrees() const noexcept {
        return observer_deg_;
    }
    void setObserverDegrees(std::optional<int> deg) noexcept { observer_deg_ = deg; }

    // =========================================================================
    // Samples
    // =========================================================================

    [[nodiscard]] std::size_t sampleCount() const noexcept { return samples_.size(); }
    [[nodiscard]] const std::vector<PairedSample>& samples() const noexcept {
        return samples_;
    }
    [[nodiscard]] const PairedSample& sample(Index i) const { return samples_.at(i); }

    void addSample(PairedSample s) { samples_.push_back(std::move(s)); }
    void reserveSamples(std::size_t n) { samples_.reserve(n); }

private:
    std::vector<ColumnDef> columns_;
    std::string color_rep_;
    PcsType pcs_ = PcsType::XYZ;
    bool has_spectral_ = false;
    std::vector<std::pair<std::string, std::string>> promoted_keywords_;
    std::optional<std::string> illuminant_;
    std::optional<int> observer_deg_;
    std::vector<PairedSample> samples_;
};

} // namespace cgats
