#include "fluxdb/storage/series.h"

namespace fluxdb {
namespace storage {

Series::Series(core::SeriesID id, std::string key, std::string measurement, core::Tags tags)
    : id_(id), key_(std::move(key)), measurement_(std::move(measurement)), tags_(std::move(tags)) {}

void Series::write(core::Timestamp time, const core::Fields& fields) {
    auto& record = records_[time];
    for (const auto& [name, value] : fields) {
        record[name] = value;
    }
}

std::vector<Record> Series::read(core::Timestamp min_time, core::Timestamp max_time) const {
    std::vector<Record> result;
    if (min_time > max_time) {
        return result;
    }
    auto end = records_.upper_bound(max_time);
    for (auto it = records_.lower_bound(min_time); it != end; ++it) {
        result.push_back(Record{it->first, it->second});
    }
    return result;
}

} // namespace storage
} // namespace fluxdb
