#include "cgats/algorithms/pairing.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace cgats {
namespace algorithms {

PcsSelection selectPcs(const ColumnPresence& presence) noexcept {
    PcsSelection sel;
    sel.include_spectral = presence.spectral;
    if (presence.xyz) {
        sel.include_xyz = true;
        sel.pcs = PcsType::XYZ;
    } else if (presence.lab) {
        sel.include_lab = true;
        sel.pcs = PcsType::LAB;
    } else {
        // Spectral only: no PCS values are written but downstream tools
        // expect an _XYZ COLOR_REP.
        sel.pcs = PcsType::XYZ;
    }
    return sel;
}

std::string stripLabel(std::size_t strip) {
    std::string label;
    std::size_t i = strip + 1;
    while (i > 0) {
        --i;
        label.insert(label.begin(), static_cast<char>('A' + i % 26));
        i /= 26;
    }
    return label;
}

std::optional<std::string> deriveSampleLoc(Index position, const LayoutHeaders& layout) {
    if (!layout.complete()) {
        return std::nullopt;
    }
    const auto steps = static_cast<Index>(*layout.steps_in_pass);
    const auto passes = static_cast<Index>(*layout.passes_in_strips2);
    if (steps == 0 || passes == 0) {
        return std::nullopt;
    }

    Index strip = 0;
    Index patch = 0;
    if (*layout.index_order == IndexOrder::PATCH_THEN_STRIP) {
        strip = position % passes;
        patch = position / passes;
    } else {
        strip = position / steps;
        patch = position % steps;
    }
    return stripLabel(strip) + std::to_string(patch + 1);
}

std::vector<std::pair<std::optional<std::string>, LocationSource>>
PatchPairer::resolveLocations(const Chart& chart) const {
    std::vector<std::pair<std::optional<std::string>, LocationSource>> locs;
    locs.reserve(chart.size());

    std::size_t copied = 0;
    std::size_t derived = 0;
    for (Index i = 0; i < chart.size(); ++i) {
        const ChartPatch& patch = chart[i];
        if (patch.location()) {
            locs.emplace_back(patch.location(), LocationSource::CHART);
            ++copied;
        } else if (auto loc = deriveSampleLoc(i, patch.layout())) {
            locs.emplace_back(std::move(loc), LocationSource::DERIVED);
            ++derived;
        } else {
            locs.emplace_back(std::nullopt, LocationSource::NONE);
        }
    }

    const std::size_t resolved = copied + derived;
    if (resolved == 0) {
        spdlog::info("SAMPLE_LOC: not in chart and no complete layout headers, omitted");
    } else if (resolved < chart.size()) {
        spdlog::warn("SAMPLE_LOC: only {} of {} patches have a location, column omitted",
                     resolved, chart.size());
    } else if (derived > 0) {
        spdlog::info("SAMPLE_LOC: {} copied from chart, {} derived from layout headers",
                     copied, derived);
        const LayoutHeaders& layout = chart.layout();
        if (layout.complete()) {
            auto capacity = static_cast<std::size_t>(*layout.steps_in_pass) *
                            static_cast<std::size_t>(*layout.passes_in_strips2);
            if (capacity != chart.size()) {
                spdlog::warn("SAMPLE_LOC: layout declares {}x{} = {} patches but the chart "
                             "has {}", *layout.steps_in_pass, *layout.passes_in_strips2,
                             capacity, chart.size());
            }
        }
    } else {
        spdlog::info("SAMPLE_LOC: copied from chart");
    }
    return locs;
}

void PatchPairer::declareColumns(Ti3Document& doc, const Chart& chart,
                                 const PcsSelection& selection, bool with_location) const {
    doc.addColumn("SAMPLE_ID", ColumnKind::SAMPLE_ID);
    if (with_location) {
        doc.addColumn("SAMPLE_LOC", ColumnKind::SAMPLE_LOC);
    }
    for (const auto& field : chart.deviceFields()) {
        doc.addColumn(field, ColumnKind::DEVICE);
    }
    if (selection.include_xyz) {
        doc.addColumn("XYZ_X", ColumnKind::XYZ);
        doc.addColumn("XYZ_Y", ColumnKind::XYZ);
        doc.addColumn("XYZ_Z", ColumnKind::XYZ);
    }
    if (selection.include_lab) {
        doc.addColumn("LAB_L", ColumnKind::LAB);
        doc.addColumn("LAB_A", ColumnKind::LAB);
        doc.addColumn("LAB_B", ColumnKind::LAB);
    }
    if (selection.include_spectral) {
        for (std::size_t i = 0; i < kSpectralBands; ++i) {
            doc.addColumn("SPEC_" + std::to_string(bandWavelength(i)), ColumnKind::SPECTRAL);
        }
    }
}

Ti3Document PatchPairer::pair(const MeasurementSet& measurements, const Chart& chart) const {
    if (measurements.size() != chart.size()) {
        throw CountMismatchError(measurements.size(), chart.size());
    }

    const PcsSelection selection = selectPcs(measurements.presence());
    auto locations = resolveLocations(chart);
    const bool with_location = std::all_of(locations.begin(), locations.end(),
        [](const auto& l) { return l.first.has_value(); }) && !locations.empty();

    Ti3Document doc;
    doc.setPcs(selection.pcs);
    doc.setColorRep(chart.deviceSpace() + "_" + toString(selection.pcs));
    doc.setHasSpectral(selection.include_spectral);
    doc.setIlluminant(measurements.illuminant());
    doc.setObserverDegrees(measurements.observerDegrees());
    for (const auto& key : options_.promoted_keywords) {
        if (auto value = chart.headerValue(key)) {
            doc.addPromotedKeyword(key, *value);
        }
    }
    declareColumns(doc, chart, selection, with_location);

    spdlog::info("COLOR_REP {}: {}{}", doc.colorRep(),
                 selection.include_xyz ? "XYZ columns"
                 : selection.include_lab ? "Lab columns" : "no PCS columns",
                 selection.include_spectral ? " + 31 spectral bands" : "");

    doc.reserveSamples(chart.size());
    for (Index i = 0; i < chart.size(); ++i) {
        const MeasurementRow& row = measurements[i];
        const ChartPatch& patch = chart[i];

        PairedSample sample;
        sample.sample_id = patch.id();
        sample.device_values = patch.deviceValues();

        if (selection.include_xyz) {
            if (!row.hasXyz()) {
                throw FormatError(measurements.sourceFile(), "measurement row " +
                                  std::to_string(row.index() + 1) + " has no XYZ values");
            }
            sample.pcs = row.xyz();
        } else if (selection.include_lab) {
            if (!row.hasLab()) {
                throw FormatError(measurements.sourceFile(), "measurement row " +
                                  std::to_string(row.index() + 1) + " has no Lab values");
            }
            sample.pcs = row.lab();
        }

        if (selection.include_spectral) {
            if (!row.hasSpectral()) {
                throw FormatError(measurements.sourceFile(), "measurement row " +
                                  std::to_string(row.index() + 1) + " has no spectral values");
            }
            sample.spectral = row.spectral();
        }

        sample.location = std::move(locations[i].first);
        sample.location_source = locations[i].second;
        doc.addSample(std::move(sample));
    }

    return doc;
}

} // namespace algorithms
} // namespace cgats
