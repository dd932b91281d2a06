#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>
#include "fluxdb/meta/meta_store.h"

namespace fluxdb {
namespace meta {

/**
 * @brief Thread-safe MetaStore kept entirely in memory.
 *
 * Passwords are stored as SHA-256 digests.
 */
class MemoryMetaStore : public MetaStore {
public:
    MemoryMetaStore();

    core::Result<void> CreateDatabase(const std::string& name);

    /**
     * @brief Adds a retention policy to a database
     * @param make_default Also make it the database's default policy
     */
    core::Result<void> CreateRetentionPolicy(const std::string& database,
                                             const RetentionPolicyInfo& policy,
                                             bool make_default);

    /**
     * @brief Registers shards covering [start_time, end_time) under a policy
     * @return The new group with its assigned ID
     */
    core::Result<ShardGroupInfo> CreateShardGroup(const std::string& database,
                                                  const std::string& retention_policy,
                                                  core::Timestamp start_time,
                                                  core::Timestamp end_time,
                                                  const std::vector<core::ShardID>& shard_ids);

    core::Result<void> SetPrivilege(const std::string& username, const std::string& database,
                                    Privilege privilege);

    core::Result<DatabaseInfo> Database(const std::string& name) override;
    core::Result<std::vector<DatabaseInfo>> Databases() override;
    core::Result<RetentionPolicyInfo> RetentionPolicy(const std::string& database,
                                                      const std::string& name) override;

    core::Result<UserInfo> User(const std::string& name) override;
    core::Result<UserInfo> Authenticate(const std::string& username,
                                        const std::string& password) override;
    core::Result<bool> AdminUserExists() override;
    core::Result<int> UserCount() override;

    core::Result<void> CreateUser(const std::string& name, const std::string& password,
                                  bool admin) override;
    core::Result<void> DropUser(const std::string& name) override;

    /**
     * @brief Hash a password using SHA-256, hex encoded
     */
    static std::string HashPassword(const std::string& password);

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, DatabaseInfo> databases_;
    std::map<std::string, UserInfo> users_;
    uint64_t next_shard_group_id_;
};

} // namespace meta
} // namespace fluxdb
