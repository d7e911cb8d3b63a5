#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace cgats {

/// Index type for measurement rows and chart patches
using Index = std::size_t;

/// One-based CGATS sample identifier
using SampleId = std::size_t;

/// Wavelength in nanometres
using Wavelength = int;

/// Number of spectral bands (400..700 nm at 10 nm)
constexpr std::size_t kSpectralBands = 31;

/// First spectral band
constexpr Wavelength kSpectralStartNm = 400;

/// Last spectral band
constexpr Wavelength kSpectralEndNm = 700;

/// Spacing between spectral bands
constexpr Wavelength kSpectralStepNm = 10;

/// Reflectance values (0-100) for the 31 bands, ordered by wavelength
using SpectralVector = std::array<double, kSpectralBands>;

/// Three-component colorimetric value (L*a*b* or XYZ)
struct Triple {
    double c0 = 0.0;
    double c1 = 0.0;
    double c2 = 0.0;

    Triple() = default;
    Triple(double a, double b, double c) : c0(a), c1(b), c2(c) {}

    double operator[](std::size_t i) const {
        return i == 0 ? c0 : (i == 1 ? c1 : c2);
    }
};

/// Profile connection space used for the TI3 COLOR_REP suffix
enum class PcsType : std::uint8_t {
    XYZ,
    LAB
};

/// Traversal order of patches on a printed chart (TI2 INDEX_ORDER)
enum class IndexOrder : std::uint8_t {
    UNKNOWN = 0,
    STRIP_THEN_PATCH,
    PATCH_THEN_STRIP
};

/// Where a paired sample's SAMPLE_LOC came from
enum class LocationSource : std::uint8_t {
    NONE = 0,
    CHART,      // copied from the chart's SAMPLE_LOC column
    DERIVED     // computed from the layout headers
};

/// Inclusive min/max pair
template<typename T>
struct Range {
    T min_value{};
    T max_value{};

    Range() = default;
    Range(T min_val, T max_val) : min_value(min_val), max_value(max_val) {}
};

using WavelengthRange = Range<Wavelength>;

/// Key-value metadata container
using MetaData = std::map<std::string, std::string>;

/// Wavelength of the i-th spectral band
constexpr Wavelength bandWavelength(std::size_t i) {
    return kSpectralStartNm + static_cast<Wavelength>(i) * kSpectralStepNm;
}

/// Band index for a wavelength, or nullopt when it is not on the 10 nm grid
inline std::optional<std::size_t> bandIndex(Wavelength nm) {
    if (nm < kSpectralStartNm || nm > kSpectralEndNm ||
        (nm - kSpectralStartNm) % kSpectralStepNm != 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>((nm - kSpectralStartNm) / kSpectralStepNm);
}

/// Convert PCS type to its COLOR_REP suffix
inline std::string toString(PcsType p) {
    switch (p) {
        case PcsType::XYZ: return "XYZ";
        case PcsType::LAB: return "LAB";
    }
    return "XYZ";
}

/// Convert index order to its TI2 keyword value
inline std::string toString(IndexOrder o) {
    switch (o) {
        case IndexOrder::STRIP_THEN_PATCH: return "STRIP_THEN_PATCH";
        case IndexOrder::PATCH_THEN_STRIP: return "PATCH_THEN_STRIP";
        default: return "unknown";
    }
}

/// Convert location source to string
inline std::string toString(LocationSource s) {
    switch (s) {
        case LocationSource::CHART: return "chart";
        case LocationSource::DERIVED: return "derived";
        default: return "none";
    }
}

/// Parse a TI2 INDEX_ORDER value (case-insensitive)
IndexOrder parseIndexOrder(const std::string& value);

} // namespace cgats
