#pragma once

#include "types.hpp"
#include <memory>
#include <utility>

namespace cgats {

/**
 * @brief Global layout keywords of a printed chart.
 *
 * Each value is present only if the TI2 header declares it. The headers
 * are shared read-only by all patches of one chart.
 */
struct LayoutHeaders {
    /// Patches per strip (STEPS_IN_PASS)
    std::optional<int> steps_in_pass;

    /// Strips per page (PASSES_IN_STRIPS2)
    std::optional<int> passes_in_strips2;

    /// Patch traversal order (INDEX_ORDER)
    std::optional<IndexOrder> index_order;

    /// True when all three keywords are declared
    [[nodiscard]] bool complete() const noexcept {
        return steps_in_pass.has_value() && passes_in_strips2.has_value() &&
               index_order.has_value();
    }
};

/**
 * @brief One patch of the chart layout.
 */
class ChartPatch {
public:
    ChartPatch(SampleId id, std::vector<double> device_values,
               std::optional<std::string> location,
               std::shared_ptr<const LayoutHeaders> layout)
        : id_(id), device_values_(std::move(device_values)),
          location_(std::move(location)), layout_(std::move(layout)) {}

    /// One-based SAMPLE_ID
    [[nodiscard]] SampleId id() const noexcept { return id_; }

    /// Device values, ordered like Chart::deviceFields()
    [[nodiscard]] const std::vector<double>& deviceValues() const noexcept {
        return device_values_;
    }

    /// SAMPLE_LOC as written in the chart
    [[nodiscard]] const std::optional<std::string>& location() const noexcept {
        return location_;
    }

    /// Layout headers of the owning chart
    [[nodiscard]] const LayoutHeaders& layout() const noexcept { return *layout_; }

private:
    friend class Chart;

    SampleId id_;
    std::vector<double> device_values_;
    std::optional<std::string> location_;
    std::shared_ptr<const LayoutHeaders> layout_;
};

/**
 * @brief A parsed TI2 chart layout.
 *
 * The chart is authoritative for device space, device values and patch
 * order. Patches are stored in file order; SAMPLE_ID of patch i is i+1.
 * Copies share the layout headers with the chart they were copied from
 * until either of them calls setLayout().
 */
class Chart {
public:
    Chart() : layout_(std::make_shared<const LayoutHeaders>()) {}

    /// Get number of patches
    [[nodiscard]] std::size_t size() const noexcept { return patches_.size(); }

    /// Check if chart has no patches
    [[nodiscard]] bool empty() const noexcept { return patches_.empty(); }

    /// Access patch by ordinal position
    [[nodiscard]] const ChartPatch& patch(Index i) const { return patches_.at(i); }
    [[nodiscard]] const ChartPatch& operator[](Index i) const { return patches_[i]; }

    [[nodiscard]] const std::vector<ChartPatch>& patches() const noexcept {
        return patches_;
    }

    /// Add a patch sharing this chart's layout headers
    void addPatch(SampleId id, std::vector<double> device_values,
                  std::optional<std::string> location) {
        patches_.emplace_back(id, std::move(device_values), std::move(location),
                              layout_);
    }

    /// Device space used as the COLOR_REP prefix (e.g. "iRGB")
    [[nodiscard]] const std::string& deviceSpace() const noexcept { return device_space_; }
    void setDeviceSpace(std::string space) { device_space_ = std::move(space); }

    /// Device field names (e.g. RGB_R, RGB_G, RGB_B)
    [[nodiscard]] const std::vector<std::string>& deviceFields() const noexcept {
        return device_fields_;
    }
    void setDeviceFields(std::vector<std::string> fields) {
        device_fields_ = std::move(fields);
    }

    /// True when the data format declares a SAMPLE_LOC column
    [[nodiscard]] bool hasLocationField() const noexcept { return has_location_field_; }
    void setHasLocationField(bool v) noexcept { has_location_field_ = v; }

    [[nodiscard]] const LayoutHeaders& layout() const noexcept { return *layout_; }

    /// Replace the layout headers of this chart and its patches
    void setLayout(const LayoutHeaders& layout) {
        layout_ = std::make_shared<const LayoutHeaders>(layout);
        for (auto& p : patches_) {
            p.layout_ = layout_;
        }
    }

    /// Header keywords in declaration order (key, unquoted value)
    [[nodiscard]] const std::vector<std::pair<std::string, std::string>>&
    headerKeywords() const noexcept {
        return header_keywords_;
    }
    void addHeaderKeyword(std::string key, std::string value) {
        header_keywords_.emplace_back(std::move(key), std::move(value));
    }

    /// Look up a header keyword value
    [[nodiscard]] std::optional<std::string> headerValue(const std::string& key) const {
        for (const auto& kv : header_keywords_) {
            if (kv.first == key) return kv.second;
        }
        return std::nullopt;
    }

    /// Source file path
    [[nodiscard]] const std::string& sourceFile() const noexcept { return source_file_; }
    void setSourceFile(std::string path) { source_file_ = std::move(path); }

private:
    std::vector<ChartPatch> patches_;
    std::shared_ptr<const LayoutHeaders> layout_;
    std::string device_space_;
    std::vector<std::string> device_fields_;
    bool has_location_field_ = false;
    std::vector<std::pair<std::string, std::string>> header_keywords_;
    std::string source_file_;
};

} // namespace cgats
