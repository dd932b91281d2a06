#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "fluxdb/core/result.h"
#include "fluxdb/core/types.h"

namespace fluxdb {
namespace meta {

/**
 * @brief Access level a user holds on a database
 */
enum class Privilege {
    NO_PRIVILEGES = 0,
    READ = 1,
    WRITE = 2,
    ALL = 3
};

const char* PrivilegeName(Privilege privilege);

struct ShardInfo {
    core::ShardID id = 0;
    std::vector<uint64_t> owner_ids;
};

/**
 * @brief Shards covering the time range [start_time, end_time)
 */
struct ShardGroupInfo {
    uint64_t id = 0;
    core::Timestamp start_time = 0;
    core::Timestamp end_time = 0;
    std::vector<ShardInfo> shards;

    bool Overlaps(core::Timestamp min, core::Timestamp max) const {
        return start_time <= max && end_time > min;
    }
};

struct RetentionPolicyInfo {
    std::string name;
    int64_t duration = 0;   // Nanoseconds, 0 = keep forever
    int replica_n = 1;
    std::vector<ShardGroupInfo> shard_groups;
};

struct DatabaseInfo {
    std::string name;
    std::string default_retention_policy;
    std::vector<RetentionPolicyInfo> retention_policies;
};

struct UserInfo {
    std::string name;
    std::string hash;       // Hex SHA-256 digest of the password
    bool admin = false;
    std::map<std::string, Privilege> privileges;   // Database -> privilege

    /**
     * @brief True if the user may exercise privilege on database
     */
    bool Authorize(Privilege privilege, const std::string& database) const;
};

/**
 * @brief Cluster metadata consumed by the store and the query executor.
 *
 * Implementations return NOT_FOUND for missing databases, retention
 * policies and users. The executor only reads topology; user management is
 * delegated here unchanged.
 */
class MetaStore {
public:
    virtual ~MetaStore() = default;

    virtual core::Result<DatabaseInfo> Database(const std::string& name) = 0;
    virtual core::Result<std::vector<DatabaseInfo>> Databases() = 0;
    virtual core::Result<RetentionPolicyInfo> RetentionPolicy(const std::string& database,
                                                              const std::string& name) = 0;

    virtual core::Result<UserInfo> User(const std::string& name) = 0;
    virtual core::Result<UserInfo> Authenticate(const std::string& username,
                                                const std::string& password) = 0;
    virtual core::Result<bool> AdminUserExists() = 0;
    virtual core::Result<int> UserCount() = 0;

    virtual core::Result<void> CreateUser(const std::string& name, const std::string& password,
                                          bool admin) = 0;
    virtual core::Result<void> DropUser(const std::string& name) = 0;
};

} // namespace meta
} // namespace fluxdb
