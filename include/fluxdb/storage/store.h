#ifndef FLUXDB_STORAGE_STORE_H_
#define FLUXDB_STORAGE_STORE_H_

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "fluxdb/core/config.h"
#include "fluxdb/core/point.h"
#include "fluxdb/core/result.h"
#include "fluxdb/storage/shard.h"

namespace fluxdb {
namespace storage {

/**
 * @brief Owns the shards persisted under one data directory.
 *
 * Shards live at <path>/<database>/<retention policy>/<shard id>/. The
 * shard map is guarded by a reader/writer lock; writes only take it shared,
 * so writers to different shards never contend on it.
 *
 * Two Store instances must not have the same path open at the same time.
 */
class Store {
public:
    explicit Store(std::string path, const core::StoreConfig& config = core::StoreConfig::Default());
    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    /**
     * @brief Loads every shard found under the data directory.
     *
     * Creates the directory if it is missing. Idempotent once it succeeds.
     */
    core::Result<void> Open();

    /**
     * @brief Closes every shard. Later calls fail with CLOSED until Open().
     */
    core::Result<void> Close();

    core::Result<void> CreateShard(const std::string& database,
                                   const std::string& retention_policy,
                                   core::ShardID shard_id);

    // Closes the shard and removes its files
    core::Result<void> DeleteShard(core::ShardID shard_id);

    core::Result<void> WriteToShard(core::ShardID shard_id, const std::vector<core::Point>& points);

    // nullptr when the shard is unknown or the store is closed
    std::shared_ptr<Shard> GetShard(core::ShardID shard_id) const;

    std::vector<core::ShardID> ShardIDs() const;

    bool IsOpen() const;
    const std::string& path() const { return path_; }

private:
    std::string shard_path(const std::string& database, const std::string& retention_policy,
                           core::ShardID shard_id) const;
    core::Result<void> load_shards();

    const std::string path_;
    const core::StoreConfig config_;

    mutable std::shared_mutex mutex_;
    bool opened_;
    std::map<core::ShardID, std::shared_ptr<Shard>> shards_;
};

} // namespace storage
} // namespace fluxdb

#endif // FLUXDB_STORAGE_STORE_H_
