#ifndef FLUXDB_CORE_LIMITS_H_
#define FLUXDB_CORE_LIMITS_H_

#include <cstdint>

namespace fluxdb {
namespace core {

/**
 * @brief Size bounds of persisted data.
 *
 * Writes are rejected when they exceed these, and log replay treats larger
 * lengths as corruption, so anything accepted can be read back.
 */

// Measurement names, tag keys and values, field names and string values
constexpr uint32_t kMaxStringLength = 64 * 1024 * 1024;

// Elements in any encoded list: points of a batch, tags or fields of a point
constexpr uint32_t kMaxCount = 100000000;

// Payload of a single log record
constexpr uint32_t kMaxFrameLength = 1024 * 1024 * 1024;

} // namespace core
} // namespace fluxdb

#endif // FLUXDB_CORE_LIMITS_H_
