#ifndef FLUXDB_CORE_POINT_H_
#define FLUXDB_CORE_POINT_H_

#include <string>
#include "fluxdb/core/types.h"
#include "fluxdb/core/result.h"

namespace fluxdb {
namespace core {

/**
 * @brief A single measurement: name, tag set, field set and timestamp.
 *
 * (name, tags) identifies the series the point belongs to. The timestamp
 * stays mutable so callers can reuse a point across batches; shards copy
 * points on write.
 */
class Point {
public:
    Point() = default;
    Point(std::string name, Tags tags, Fields fields, Timestamp time);

    const std::string& name() const { return name_; }
    const Tags& tags() const { return tags_; }
    const Fields& fields() const { return fields_; }
    Timestamp time() const { return time_; }

    void set_time(Timestamp time) { time_ = time; }
    void add_tag(const std::string& key, const std::string& value);
    void add_field(const std::string& name, FieldValue value);

    /**
     * @brief Canonical series key: measurement[,key=value...] with sorted keys
     */
    std::string series_key() const;

    /**
     * @brief Checks the point can be stored
     */
    Result<void> validate() const;

    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const;

private:
    std::string name_;
    Tags tags_;
    Fields fields_;
    Timestamp time_ = 0;
};

/**
 * @brief Builds the canonical key for a measurement and tag set
 */
std::string MakeSeriesKey(const std::string& measurement, const Tags& tags);

} // namespace core
} // namespace fluxdb

#endif // FLUXDB_CORE_POINT_H_
