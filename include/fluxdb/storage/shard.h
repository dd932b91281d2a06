#ifndef FLUXDB_STORAGE_SHARD_H_
#define FLUXDB_STORAGE_SHARD_H_

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "fluxdb/core/config.h"
#include "fluxdb/core/point.h"
#include "fluxdb/core/result.h"
#include "fluxdb/storage/index.h"
#include "fluxdb/storage/schema_catalog.h"
#include "fluxdb/storage/wal.h"

namespace fluxdb {
namespace storage {

struct LogEntry;

/**
 * @brief Filters applied by Shard::Scan
 */
struct ScanOptions {
    core::Timestamp min_time = core::kMinTimestamp;
    core::Timestamp max_time = core::kMaxTimestamp;
    core::Tags tag_filters;     // Series must carry every key with the given value
};

/**
 * @brief Scan output for one series
 */
struct SeriesData {
    std::string measurement;
    core::Tags tags;
    std::vector<Record> records;
};

/**
 * @brief A unit of durable storage holding every series routed to it.
 *
 * Writes and drops take the shard's exclusive lock for the whole batch, so
 * readers see either none or all of a batch. Scans and discovery queries
 * share the lock.
 */
class Shard {
public:
    Shard(core::ShardID id, std::string database, std::string retention_policy,
          std::string path, const core::StoreConfig& config);
    ~Shard();

    Shard(const Shard&) = delete;
    Shard& operator=(const Shard&) = delete;

    // Replays persisted state and opens the log; idempotent
    core::Result<void> Open();

    // Flushes (and compacts, if configured) the log; later calls fail with CLOSED
    core::Result<void> Close();

    core::Result<void> WritePoints(const std::vector<core::Point>& points);

    core::Result<std::vector<SeriesData>> Scan(const std::string& measurement,
                                               const ScanOptions& options = ScanOptions()) const;

    /**
     * @brief Removes all series data of a measurement.
     *
     * The measurement's tag keys and field names stay in the schema catalogue.
     */
    core::Result<void> DropSeries(const std::string& measurement);

    core::Result<std::vector<std::string>> TagKeys(const std::string& measurement) const;
    core::Result<std::vector<std::string>> FieldKeys(const std::string& measurement) const;
    core::Result<std::vector<std::string>> TagValues(const std::string& measurement,
                                                     const std::string& key) const;
    // Measurements with live series
    core::Result<std::vector<std::string>> Measurements() const;
    // Every measurement the catalogue has seen
    core::Result<std::vector<std::string>> SchemaMeasurements() const;
    // Series keys of a measurement, first-written order
    core::Result<std::vector<std::pair<std::string, core::Tags>>> SeriesKeys(const std::string& measurement) const;

    size_t SeriesCount() const;
    bool IsOpen() const;

    core::ShardID id() const { return id_; }
    const std::string& database() const { return database_; }
    const std::string& retention_policy() const { return retention_policy_; }
    const std::string& path() const { return path_; }

private:
    void apply(const LogEntry& entry);
    core::Result<void> check_open() const;
    std::vector<std::vector<uint8_t>> snapshot_records() const;

    const core::ShardID id_;
    const std::string database_;
    const std::string retention_policy_;
    const std::string path_;
    const core::StoreConfig config_;

    mutable std::shared_mutex mutex_;
    bool opened_;
    std::unique_ptr<WriteAheadLog> wal_;
    std::unique_ptr<Index> index_;
    SchemaCatalog catalog_;
};

} // namespace storage
} // namespace fluxdb

#endif // FLUXDB_STORAGE_SHARD_H_
