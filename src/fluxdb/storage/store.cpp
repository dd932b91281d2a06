#include "fluxdb/storage/store.h"
#include <filesystem>
#include <mutex>
#include "fluxdb/common/logger.h"

namespace fluxdb {
namespace storage {

namespace {

core::Result<void> ClosedError() {
    return core::Result<void>::error("store is closed", core::Error::Code::CLOSED);
}

// Shard directories are named by their decimal ID
bool ParseShardID(const std::string& name, core::ShardID& id) {
    if (name.empty() || name.size() > 20) {
        return false;
    }
    for (char c : name) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    try {
        id = std::stoull(name);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

} // namespace

Store::Store(std::string path, const core::StoreConfig& config)
    : path_(std::move(path)), config_(config), opened_(false) {}

Store::~Store() {
    auto result = Close();
    if (!result.ok()) {
        FLUXDB_ERROR("Store at {} failed to close cleanly: {}", path_, result.error());
    }
}

core::Result<void> Store::Open() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (opened_) {
        return core::Result<void>();
    }

    auto loaded = load_shards();
    if (!loaded.ok()) {
        // Leave nothing half-open behind
        for (auto& [id, shard] : shards_) {
            auto closed = shard->Close();
            if (!closed.ok()) {
                FLUXDB_WARN("Failed to close shard {} after open error: {}", id, closed.error());
            }
        }
        shards_.clear();
        return loaded;
    }

    opened_ = true;
    FLUXDB_INFO("Opened store at {} with {} shards", path_, shards_.size());
    return core::Result<void>();
}

core::Result<void> Store::load_shards() {
    namespace fs = std::filesystem;
    try {
        std::error_code ec;
        fs::create_directories(path_, ec);
        if (ec) {
            return core::Result<void>::error("failed to create store directory " + path_ + ": " + ec.message(),
                                             core::Error::Code::IO_FAILURE);
        }

        for (const auto& db_entry : fs::directory_iterator(path_)) {
            if (!db_entry.is_directory()) {
                continue;
            }
            std::string database = db_entry.path().filename().string();

            for (const auto& rp_entry : fs::directory_iterator(db_entry.path())) {
                if (!rp_entry.is_directory()) {
                    continue;
                }
                std::string retention_policy = rp_entry.path().filename().string();

                for (const auto& shard_entry : fs::directory_iterator(rp_entry.path())) {
                    core::ShardID id = 0;
                    if (!shard_entry.is_directory() ||
                        !ParseShardID(shard_entry.path().filename().string(), id)) {
                        continue;
                    }
                    if (shards_.count(id) != 0) {
                        return core::Result<void>::error(
                            "shard " + std::to_string(id) + " found in more than one location under " + path_,
                            core::Error::Code::IO_FAILURE);
                    }

                    auto shard = std::make_shared<Shard>(id, database, retention_policy,
                                                         shard_entry.path().string(), config_);
                    auto opened = shard->Open();
                    if (!opened.ok()) {
                        return core::Result<void>::error(
                            "failed to open shard " + std::to_string(id) + ": " + opened.error(),
                            core::Error::Code::IO_FAILURE);
                    }
                    shards_.emplace(id, std::move(shard));
                }
            }
        }
    } catch (const fs::filesystem_error& e) {
        return core::Result<void>::error(std::string("failed to read store directory: ") + e.what(),
                                         core::Error::Code::IO_FAILURE);
    }
    return core::Result<void>();
}

core::Result<void> Store::Close() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!opened_) {
        return core::Result<void>();
    }

    core::Result<void> result;
    for (auto& [id, shard] : shards_) {
        auto closed = shard->Close();
        if (!closed.ok()) {
            FLUXDB_ERROR("Failed to close shard {}: {}", id, closed.error());
            if (result.ok()) {
                result = closed;
            }
        }
    }
    shards_.clear();
    opened_ = false;
    FLUXDB_INFO("Closed store at {}", path_);
    return result;
}

core::Result<void> Store::CreateShard(const std::string& database,
                                      const std::string& retention_policy,
                                      core::ShardID shard_id) {
    if (database.empty() || retention_policy.empty()) {
        return core::Result<void>::error("database and retention policy are required",
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!opened_) {
        return ClosedError();
    }
    if (shards_.count(shard_id) != 0) {
        return core::Result<void>::error("shard " + std::to_string(shard_id) + " already exists",
                                         core::Error::Code::ALREADY_EXISTS);
    }

    auto shard = std::make_shared<Shard>(shard_id, database, retention_policy,
                                         shard_path(database, retention_policy, shard_id), config_);
    auto opened = shard->Open();
    if (!opened.ok()) {
        return opened;
    }
    shards_.emplace(shard_id, std::move(shard));
    FLUXDB_INFO("Created shard {} for {}.{}", shard_id, database, retention_policy);
    return core::Result<void>();
}

core::Result<void> Store::DeleteShard(core::ShardID shard_id) {
    std::shared_ptr<Shard> shard;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!opened_) {
            return ClosedError();
        }
        auto it = shards_.find(shard_id);
        if (it == shards_.end()) {
            return core::Result<void>::error("shard " + std::to_string(shard_id) + " not found",
                                             core::Error::Code::NOT_FOUND);
        }
        shard = it->second;
        shards_.erase(it);
    }

    auto closed = shard->Close();
    if (!closed.ok()) {
        FLUXDB_WARN("Shard {} did not close cleanly before deletion: {}", shard_id, closed.error());
    }

    std::error_code ec;
    std::filesystem::remove_all(shard->path(), ec);
    if (ec) {
        return core::Result<void>::error("failed to remove shard directory " + shard->path() + ": " + ec.message(),
                                         core::Error::Code::IO_FAILURE);
    }
    FLUXDB_INFO("Deleted shard {}", shard_id);
    return core::Result<void>();
}

core::Result<void> Store::WriteToShard(core::ShardID shard_id, const std::vector<core::Point>& points) {
    std::shared_ptr<Shard> shard;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (!opened_) {
            return ClosedError();
        }
        auto it = shards_.find(shard_id);
        if (it == shards_.end()) {
            return core::Result<void>::error("shard " + std::to_string(shard_id) + " not found",
                                             core::Error::Code::NOT_FOUND);
        }
        shard = it->second;
    }
    return shard->WritePoints(points);
}

std::shared_ptr<Shard> Store::GetShard(core::ShardID shard_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!opened_) {
        return nullptr;
    }
    auto it = shards_.find(shard_id);
    return it == shards_.end() ? nullptr : it->second;
}

std::vector<core::ShardID> Store::ShardIDs() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<core::ShardID> ids;
    ids.reserve(shards_.size());
    for (const auto& [id, shard] : shards_) {
        ids.push_back(id);
    }
    return ids;
}

bool Store::IsOpen() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return opened_;
}

std::string Store::shard_path(const std::string& database, const std::string& retention_policy,
                              core::ShardID shard_id) const {
    return (std::filesystem::path(path_) / database / retention_policy / std::to_string(shard_id)).string();
}

} // namespace storage
} // namespace fluxdb
