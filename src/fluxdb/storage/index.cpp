#include "fluxdb/storage/index.h"
#include <algorithm>

namespace fluxdb {
namespace storage {

Index::Index() : next_id_(1) {}

Index::~Index() = default;

Series* Index::get_or_create(const core::Point& point) {
    std::string key = point.series_key();
    auto it = series_.find(key);
    if (it != series_.end()) {
        return it->second.get();
    }

    auto series = std::make_unique<Series>(next_id_++, key, point.name(), point.tags());
    Series* raw = series.get();
    series_.emplace(std::move(key), std::move(series));

    auto& measurement = measurements_[point.name()];
    measurement.series.push_back(raw);
    for (const auto& [tag_key, tag_value] : point.tags()) {
        measurement.tag_values[tag_key].insert(tag_value);
    }
    return raw;
}

std::vector<const Series*> Index::series_for(const std::string& measurement) const {
    auto it = measurements_.find(measurement);
    if (it == measurements_.end()) {
        return {};
    }
    return std::vector<const Series*>(it->second.series.begin(), it->second.series.end());
}

std::vector<std::string> Index::tag_values(const std::string& measurement, const std::string& key) const {
    auto it = measurements_.find(measurement);
    if (it == measurements_.end()) {
        return {};
    }
    auto vit = it->second.tag_values.find(key);
    if (vit == it->second.tag_values.end()) {
        return {};
    }
    return std::vector<std::string>(vit->second.begin(), vit->second.end());
}

std::vector<std::string> Index::measurements() const {
    std::vector<std::string> names;
    names.reserve(measurements_.size());
    for (const auto& [name, index] : measurements_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool Index::has_measurement(const std::string& measurement) const {
    return measurements_.find(measurement) != measurements_.end();
}

size_t Index::remove_measurement(const std::string& measurement) {
    auto it = measurements_.find(measurement);
    if (it == measurements_.end()) {
        return 0;
    }
    size_t removed = 0;
    for (Series* series : it->second.series) {
        // Copy the key out; erasing destroys the series that owns it
        std::string key = series->key();
        removed += series_.erase(key);
    }
    measurements_.erase(it);
    return removed;
}

} // namespace storage
} // namespace fluxdb
