#ifndef FLUXDB_CORE_TYPES_H_
#define FLUXDB_CORE_TYPES_H_

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <variant>

namespace fluxdb {
namespace core {

/**
 * @brief Represents a unique identifier for a series within a shard
 */
using SeriesID = uint64_t;

/**
 * @brief Represents a unique identifier for a shard within a store
 */
using ShardID = uint64_t;

/**
 * @brief Represents a timestamp in nanoseconds since Unix epoch
 */
using Timestamp = int64_t;

constexpr Timestamp kMinTimestamp = std::numeric_limits<Timestamp>::min();
constexpr Timestamp kMaxTimestamp = std::numeric_limits<Timestamp>::max();

/**
 * @brief Typed field value: float, integer, string or boolean
 */
using FieldValue = std::variant<double, int64_t, std::string, bool>;

/**
 * @brief Tag set of a point; std::map keeps keys unique and sorted
 */
using Tags = std::map<std::string, std::string>;

/**
 * @brief Field set of a point
 */
using Fields = std::map<std::string, FieldValue>;

/**
 * @brief Formats a timestamp as UTC RFC3339 with nanosecond precision.
 *
 * Trailing zeros of the fraction are trimmed and the fraction is omitted
 * entirely when zero: 1000000002 -> "1970-01-01T00:00:01.000000002Z".
 */
std::string FormatRFC3339Nano(Timestamp ts);

/**
 * @brief Builds a timestamp from seconds and nanoseconds since epoch
 */
inline Timestamp MakeTimestamp(int64_t seconds, int64_t nanos = 0) {
    return seconds * 1000000000LL + nanos;
}

} // namespace core
} // namespace fluxdb

#endif // FLUXDB_CORE_TYPES_H_
