#include "fluxdb/meta/memory_meta_store.h"
#include <openssl/sha.h>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace fluxdb {
namespace meta {

namespace {

template<typename T>
core::Result<T> NotFound(const std::string& what) {
    return core::Result<T>::error(what + " not found", core::Error::Code::NOT_FOUND);
}

} // namespace

MemoryMetaStore::MemoryMetaStore() : next_shard_group_id_(1) {}

core::Result<void> MemoryMetaStore::CreateDatabase(const std::string& name) {
    if (name.empty()) {
        return core::Result<void>::error("database name required", core::Error::Code::INVALID_ARGUMENT);
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (databases_.count(name) != 0) {
        return core::Result<void>::error("database " + name + " already exists",
                                         core::Error::Code::ALREADY_EXISTS);
    }
    DatabaseInfo info;
    info.name = name;
    databases_.emplace(name, std::move(info));
    return core::Result<void>();
}

core::Result<void> MemoryMetaStore::CreateRetentionPolicy(const std::string& database,
                                                          const RetentionPolicyInfo& policy,
                                                          bool make_default) {
    if (policy.name.empty()) {
        return core::Result<void>::error("retention policy name required", core::Error::Code::INVALID_ARGUMENT);
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = databases_.find(database);
    if (it == databases_.end()) {
        return NotFound<void>("database " + database);
    }
    for (const auto& rp : it->second.retention_policies) {
        if (rp.name == policy.name) {
            return core::Result<void>::error("retention policy " + policy.name + " already exists",
                                             core::Error::Code::ALREADY_EXISTS);
        }
    }
    it->second.retention_policies.push_back(policy);
    if (make_default || it->second.default_retention_policy.empty()) {
        it->second.default_retention_policy = policy.name;
    }
    return core::Result<void>();
}

core::Result<ShardGroupInfo> MemoryMetaStore::CreateShardGroup(const std::string& database,
                                                               const std::string& retention_policy,
                                                               core::Timestamp start_time,
                                                               core::Timestamp end_time,
                                                               const std::vector<core::ShardID>& shard_ids) {
    if (start_time >= end_time) {
        return core::Result<ShardGroupInfo>::error("shard group must cover a non-empty time range",
                                                   core::Error::Code::INVALID_ARGUMENT);
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = databases_.find(database);
    if (it == databases_.end()) {
        return NotFound<ShardGroupInfo>("database " + database);
    }
    for (auto& rp : it->second.retention_policies) {
        if (rp.name != retention_policy) {
            continue;
        }
        ShardGroupInfo group;
        group.id = next_shard_group_id_++;
        group.start_time = start_time;
        group.end_time = end_time;
        for (core::ShardID id : shard_ids) {
            group.shards.push_back(ShardInfo{id, {}});
        }
        rp.shard_groups.push_back(group);
        return core::Result<ShardGroupInfo>(std::move(group));
    }
    return NotFound<ShardGroupInfo>("retention policy " + retention_policy);
}

core::Result<void> MemoryMetaStore::SetPrivilege(const std::string& username, const std::string& database,
                                                 Privilege privilege) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = users_.find(username);
    if (it == users_.end()) {
        return NotFound<void>("user " + username);
    }
    it->second.privileges[database] = privilege;
    return core::Result<void>();
}

core::Result<DatabaseInfo> MemoryMetaStore::Database(const std::string& name) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = databases_.find(name);
    if (it == databases_.end()) {
        return NotFound<DatabaseInfo>("database " + name);
    }
    return core::Result<DatabaseInfo>(it->second);
}

core::Result<std::vector<DatabaseInfo>> MemoryMetaStore::Databases() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<DatabaseInfo> result;
    for (const auto& [name, info] : databases_) {
        result.push_back(info);
    }
    return core::Result<std::vector<DatabaseInfo>>(std::move(result));
}

core::Result<RetentionPolicyInfo> MemoryMetaStore::RetentionPolicy(const std::string& database,
                                                                   const std::string& name) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = databases_.find(database);
    if (it == databases_.end()) {
        return NotFound<RetentionPolicyInfo>("database " + database);
    }
    for (const auto& rp : it->second.retention_policies) {
        if (rp.name == name) {
            return core::Result<RetentionPolicyInfo>(rp);
        }
    }
    return NotFound<RetentionPolicyInfo>("retention policy " + name);
}

core::Result<UserInfo> MemoryMetaStore::User(const std::string& name) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = users_.find(name);
    if (it == users_.end()) {
        return NotFound<UserInfo>("user " + name);
    }
    return core::Result<UserInfo>(it->second);
}

core::Result<UserInfo> MemoryMetaStore::Authenticate(const std::string& username,
                                                     const std::string& password) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = users_.find(username);
    if (it == users_.end() || it->second.hash != HashPassword(password)) {
        // Same message for unknown users and bad passwords
        return core::Result<UserInfo>::error("authentication failed",
                                             core::Error::Code::AUTHORIZATION_DENIED);
    }
    return core::Result<UserInfo>(it->second);
}

core::Result<bool> MemoryMetaStore::AdminUserExists() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [name, user] : users_) {
        if (user.admin) {
            return core::Result<bool>(true);
        }
    }
    return core::Result<bool>(false);
}

core::Result<int> MemoryMetaStore::UserCount() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return core::Result<int>(static_cast<int>(users_.size()));
}

core::Result<void> MemoryMetaStore::CreateUser(const std::string& name, const std::string& password,
                                               bool admin) {
    if (name.empty()) {
        return core::Result<void>::error("username required", core::Error::Code::INVALID_ARGUMENT);
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (users_.count(name) != 0) {
        return core::Result<void>::error("user " + name + " already exists", core::Error::Code::ALREADY_EXISTS);
    }
    UserInfo user;
    user.name = name;
    user.hash = HashPassword(password);
    user.admin = admin;
    users_.emplace(name, std::move(user));
    return core::Result<void>();
}

core::Result<void> MemoryMetaStore::DropUser(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (users_.erase(name) == 0) {
        return NotFound<void>("user " + name);
    }
    return core::Result<void>();
}

std::string MemoryMetaStore::HashPassword(const std::string& password) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(password.c_str()), 
           password.length(), hash);
    
    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') 
           << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace meta
} // namespace fluxdb
