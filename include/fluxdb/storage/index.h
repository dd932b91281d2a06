#ifndef FLUXDB_STORAGE_INDEX_H_
#define FLUXDB_STORAGE_INDEX_H_

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <absl/container/flat_hash_map.h>
#include "fluxdb/core/point.h"
#include "fluxdb/storage/series.h"

namespace fluxdb {
namespace storage {

/**
 * @brief In-memory series index of one shard.
 *
 * Maps series keys to series, measurements to their series in the order
 * they were first written, and each measurement's tag keys to the values
 * observed on live series. Guarded by the owning shard's lock.
 */
class Index {
public:
    Index();
    ~Index();

    Index(const Index&) = delete;
    Index& operator=(const Index&) = delete;

    // Returns the point's series, creating and indexing it on first sight
    Series* get_or_create(const core::Point& point);

    std::vector<const Series*> series_for(const std::string& measurement) const;

    // Values observed for key on live series of measurement, sorted
    std::vector<std::string> tag_values(const std::string& measurement, const std::string& key) const;

    // Measurements with at least one series, sorted
    std::vector<std::string> measurements() const;

    bool has_measurement(const std::string& measurement) const;

    // Removes every series of measurement, returning how many were removed
    size_t remove_measurement(const std::string& measurement);

    size_t num_series() const { return series_.size(); }

private:
    struct MeasurementIndex {
        std::vector<Series*> series;
        std::map<std::string, std::set<std::string>> tag_values;
    };

    core::SeriesID next_id_;

    // Forward index: series key -> series
    absl::flat_hash_map<std::string, std::unique_ptr<Series>> series_;

    // Measurement name -> series and tag values
    absl::flat_hash_map<std::string, MeasurementIndex> measurements_;
};

} // namespace storage
} // namespace fluxdb

#endif // FLUXDB_STORAGE_INDEX_H_
