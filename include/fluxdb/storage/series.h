#ifndef FLUXDB_STORAGE_SERIES_H_
#define FLUXDB_STORAGE_SERIES_H_

#include <map>
#include <string>
#include <vector>
#include "fluxdb/core/types.h"

namespace fluxdb {
namespace storage {

/**
 * @brief One stored row of a series
 */
struct Record {
    core::Timestamp time;
    core::Fields fields;
};

/**
 * @brief Time-ordered field records of one (measurement, tag set).
 *
 * Not thread-safe; the owning shard's lock guards every access.
 */
class Series {
public:
    Series(core::SeriesID id, std::string key, std::string measurement, core::Tags tags);

    /**
     * @brief Merges fields into the record at time; later writes win per field
     */
    void write(core::Timestamp time, const core::Fields& fields);

    // Records with min_time <= time <= max_time, ascending
    std::vector<Record> read(core::Timestamp min_time, core::Timestamp max_time) const;

    core::SeriesID id() const { return id_; }
    const std::string& key() const { return key_; }
    const std::string& measurement() const { return measurement_; }
    const core::Tags& tags() const { return tags_; }
    size_t num_records() const { return records_.size(); }

private:
    const core::SeriesID id_;
    const std::string key_;
    const std::string measurement_;
    const core::Tags tags_;
    std::map<core::Timestamp, core::Fields> records_;
};

} // namespace storage
} // namespace fluxdb

#endif // FLUXDB_STORAGE_SERIES_H_
