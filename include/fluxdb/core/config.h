#ifndef FLUXDB_CORE_CONFIG_H_
#define FLUXDB_CORE_CONFIG_H_

#include <cstddef>

namespace fluxdb {
namespace core {

/**
 * @brief Configuration for the shard store
 */
struct StoreConfig {
    size_t max_segment_bytes;   // Rotate a shard's log segment past this size
    bool flush_on_write;        // Flush the log after every write batch
    bool compact_on_close;      // Rewrite the log into a snapshot on close

    StoreConfig() : max_segment_bytes(0), flush_on_write(false), compact_on_close(false) {}

    static StoreConfig Default() {
        StoreConfig config;
        config.max_segment_bytes = 64 * 1024 * 1024;  // 64MB segments
        config.flush_on_write = true;
        config.compact_on_close = true;
        return config;
    }
};

/**
 * @brief Configuration for the query executor
 */
struct QueryConfig {
    bool auth_enabled;              // Authorize every statement before running it
    size_t result_buffer_size;      // Results buffered before the producer blocks
    size_t max_series_per_query;    // Maximum series a SELECT may return, 0 = unlimited

    QueryConfig() : auth_enabled(false), result_buffer_size(0), max_series_per_query(0) {}

    static QueryConfig Default() {
        QueryConfig config;
        config.auth_enabled = false;
        config.result_buffer_size = 16;
        config.max_series_per_query = 0;
        return config;
    }
};

} // namespace core
} // namespace fluxdb

#endif // FLUXDB_CORE_CONFIG_H_
