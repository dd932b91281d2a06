#ifndef FLUXDB_STORAGE_CODEC_H_
#define FLUXDB_STORAGE_CODEC_H_

#include <cstdint>
#include <string>
#include <vector>
#include "fluxdb/core/point.h"
#include "fluxdb/core/result.h"

namespace fluxdb {
namespace storage {

/**
 * @brief Kinds of records a shard appends to its log
 */
enum class EntryType : uint8_t {
    WRITE_POINTS = 1,   // One complete write batch
    DROP_SERIES = 2,    // All series of a measurement removed
    SCHEMA = 3          // Tag keys and field names of a measurement
};

/**
 * @brief A decoded log record. Which members are set depends on type.
 */
struct LogEntry {
    EntryType type = EntryType::WRITE_POINTS;
    std::vector<core::Point> points;          // WRITE_POINTS
    std::string measurement;                  // DROP_SERIES, SCHEMA
    std::vector<std::string> tag_keys;        // SCHEMA
    std::vector<std::string> field_names;     // SCHEMA

    static LogEntry WritePoints(std::vector<core::Point> points);
    static LogEntry DropSeries(const std::string& measurement);
    static LogEntry Schema(const std::string& measurement,
                           std::vector<std::string> tag_keys,
                           std::vector<std::string> field_names);
};

/**
 * @brief Serializes an entry as [u8 type][body], little-endian
 */
std::vector<uint8_t> EncodeEntry(const LogEntry& entry);

/**
 * @brief Encodes points as consecutive WRITE_POINTS payloads.
 *
 * Each payload holds at most max_points points and stays within max_bytes,
 * except that a single point larger than max_bytes gets a payload of its
 * own. Point order is preserved across payloads.
 */
std::vector<std::vector<uint8_t>> EncodePointBatches(const std::vector<core::Point>& points,
                                                     size_t max_points, size_t max_bytes);

/**
 * @brief Parses a payload produced by EncodeEntry.
 *
 * Fails with IO_FAILURE when the payload is truncated, carries an unknown
 * entry or field type, or has trailing bytes.
 */
core::Result<LogEntry> DecodeEntry(const uint8_t* data, size_t size);

} // namespace storage
} // namespace fluxdb

#endif // FLUXDB_STORAGE_CODEC_H_
