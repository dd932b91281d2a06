#include "fluxdb/query/executor.h"
#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>
#include "fluxdb/common/logger.h"
#include "fluxdb/core/error.h"
#include "fluxdb/query/authorizer.h"

namespace fluxdb {
namespace query {

namespace {

using RowsResult = core::Result<std::vector<Row>>;
using ShardList = std::vector<std::shared_ptr<storage::Shard>>;

RowsResult NoRows() {
    return RowsResult(std::vector<Row>());
}

// Adds values to out, skipping ones already present, keeping first-seen order
void AppendUnique(const std::vector<std::string>& values, std::vector<std::string>& out,
                  std::set<std::string>& seen) {
    for (const auto& v : values) {
        if (seen.insert(v).second) {
            out.push_back(v);
        }
    }
}

/**
 * Executes the statements of one query on the producer thread.
 *
 * Holds its own references to the store, metadata and channel so it never
 * touches the QueryExecutor that started it.
 */
class StatementRunner {
public:
    StatementRunner(std::shared_ptr<storage::Store> store,
                    std::shared_ptr<meta::MetaStore> meta_store,
                    core::QueryConfig config,
                    std::string database,
                    int chunk_size,
                    std::optional<meta::UserInfo> user,
                    std::shared_ptr<Channel<Result>> channel)
        : store_(std::move(store)),
          meta_store_(std::move(meta_store)),
          config_(config),
          database_(std::move(database)),
          chunk_size_(chunk_size),
          user_(std::move(user)),
          channel_(std::move(channel)) {}

    void Run(const Query& query) {
        for (size_t i = 0; i < query.statements.size(); ++i) {
            if (channel_->cancelled()) {
                FLUXDB_DEBUG("Query cancelled before statement {}", i);
                break;
            }
            if (!run_statement(i, query.statements[i].get())) {
                break;
            }
        }
        channel_->close();
    }

private:
    // Returns false once the consumer has gone away
    bool run_statement(size_t id, const Statement* statement) {
        if (!statement) {
            return channel_->send(Result::Error(id, "empty statement",
                                                core::Error::Code::INVALID_STATEMENT));
        }

        if (config_.auth_enabled) {
            auto auth = AuthorizeStatement(*meta_store_, user_ ? &*user_ : nullptr,
                                           *statement, database_);
            if (!auth.ok()) {
                return channel_->send(Result::Error(id, auth.error(), auth.code()));
            }
        }

        FLUXDB_DEBUG("Executing statement {}: {}", id, statement->String());

        RowsResult rows = NoRows();
        try {
            rows = dispatch(*statement);
        } catch (const std::exception& e) {
            FLUXDB_ERROR("Statement {} failed: {}", id, e.what());
            rows = RowsResult::error(e.what(), core::Error::Code::INTERNAL);
        }

        if (!rows.ok()) {
            FLUXDB_DEBUG("Statement {} failed with {}: {}", id, core::CodeName(rows.code()), rows.error());
            return channel_->send(Result::Error(id, rows.error(), rows.code()));
        }
        return emit(id, rows.take_value());
    }

    RowsResult dispatch(const Statement& statement) {
        switch (statement.type()) {
            case Statement::Type::SELECT:
                return execute_select(static_cast<const SelectStatement&>(statement));
            case Statement::Type::DROP_SERIES:
                return execute_drop_series(static_cast<const DropSeriesStatement&>(statement));
            case Statement::Type::SHOW_TAG_KEYS:
                return execute_show_tag_keys(static_cast<const ShowTagKeysStatement&>(statement));
            case Statement::Type::SHOW_TAG_VALUES:
                return execute_show_tag_values(static_cast<const ShowTagValuesStatement&>(statement));
            case Statement::Type::SHOW_MEASUREMENTS:
                return execute_show_measurements(static_cast<const ShowMeasurementsStatement&>(statement));
            case Statement::Type::SHOW_SERIES:
                return execute_show_series(static_cast<const ShowSeriesStatement&>(statement));
            case Statement::Type::SHOW_DATABASES:
                return execute_show_databases();
            case Statement::Type::CREATE_USER:
                return execute_create_user(static_cast<const CreateUserStatement&>(statement));
            case Statement::Type::DROP_USER:
                return execute_drop_user(static_cast<const DropUserStatement&>(statement));
        }
        return RowsResult::error("unsupported statement: " + statement.String(),
                                 core::Error::Code::INVALID_STATEMENT);
    }

    /**
     * Splits rows into Results of at most chunk_size_ values each and sends
     * them. Every chunk but the last is marked partial.
     */
    bool emit(size_t id, std::vector<Row> rows) {
        size_t total = 0;
        for (const auto& row : rows) {
            total += row.values.size();
        }

        if (chunk_size_ <= 0 || total <= static_cast<size_t>(chunk_size_)) {
            Result result;
            result.statement_id = id;
            result.series = std::move(rows);
            return channel_->send(std::move(result));
        }

        const size_t limit = static_cast<size_t>(chunk_size_);
        std::vector<Result> chunks;
        Result current;
        current.statement_id = id;
        size_t filled = 0;

        for (auto& row : rows) {
            if (row.values.empty()) {
                current.series.push_back(std::move(row));
                continue;
            }
            size_t offset = 0;
            while (offset < row.values.size()) {
                size_t take = std::min(limit - filled, row.values.size() - offset);
                Row part;
                part.name = row.name;
                part.tags = row.tags;
                part.columns = row.columns;
                part.values.assign(std::make_move_iterator(row.values.begin() + offset),
                                   std::make_move_iterator(row.values.begin() + offset + take));
                current.series.push_back(std::move(part));
                offset += take;
                filled += take;
                if (filled == limit) {
                    chunks.push_back(std::move(current));
                    current = Result();
                    current.statement_id = id;
                    filled = 0;
                }
            }
        }
        if (!current.series.empty()) {
            chunks.push_back(std::move(current));
        }

        for (size_t i = 0; i < chunks.size(); ++i) {
            chunks[i].partial = i + 1 < chunks.size();
            if (!channel_->send(std::move(chunks[i]))) {
                return false;
            }
        }
        return true;
    }

    core::Result<std::string> resolve_database(const std::string& name) const {
        if (!name.empty()) {
            return core::Result<std::string>(name);
        }
        if (database_.empty()) {
            return core::Result<std::string>::error("database name required",
                                                    core::Error::Code::INVALID_ARGUMENT);
        }
        return core::Result<std::string>(database_);
    }

    core::Result<void> check_store() const {
        if (!store_->IsOpen()) {
            return core::Result<void>::error("store is closed", core::Error::Code::CLOSED);
        }
        return core::Result<void>();
    }

    // Local shards of the given groups; shards this node does not hold are skipped
    ShardList local_shards(const std::vector<const meta::ShardGroupInfo*>& groups) const {
        ShardList shards;
        std::set<core::ShardID> seen;
        for (const auto* group : groups) {
            for (const auto& info : group->shards) {
                if (!seen.insert(info.id).second) {
                    continue;
                }
                auto shard = store_->GetShard(info.id);
                if (shard) {
                    shards.push_back(std::move(shard));
                } else {
                    FLUXDB_TRACE("Shard {} is not held locally, skipping", info.id);
                }
            }
        }
        return shards;
    }

    // Every local shard of every retention policy of database
    core::Result<ShardList> database_shards(const std::string& database) const {
        auto check = check_store();
        if (!check.ok()) {
            return core::Result<ShardList>::error_from(check);
        }
        auto db = meta_store_->Database(database);
        if (!db.ok()) {
            return core::Result<ShardList>::error_from(db);
        }
        std::vector<const meta::ShardGroupInfo*> groups;
        for (const auto& rp : db.value().retention_policies) {
            for (const auto& group : rp.shard_groups) {
                groups.push_back(&group);
            }
        }
        return core::Result<ShardList>(local_shards(groups));
    }

    RowsResult execute_select(const SelectStatement& stmt) {
        if (stmt.source.measurement.empty()) {
            return RowsResult::error("measurement required", core::Error::Code::INVALID_STATEMENT);
        }
        auto database = resolve_database(stmt.source.database);
        if (!database.ok()) {
            return RowsResult::error_from(database);
        }
        auto check = check_store();
        if (!check.ok()) {
            return RowsResult::error_from(check);
        }

        auto db = meta_store_->Database(database.value());
        if (!db.ok()) {
            return RowsResult::error_from(db);
        }
        std::string rp_name = stmt.source.retention_policy.empty()
            ? db.value().default_retention_policy : stmt.source.retention_policy;
        if (rp_name.empty()) {
            return RowsResult::error("default retention policy not set for: " + database.value(),
                                     core::Error::Code::NOT_FOUND);
        }
        auto rp = meta_store_->RetentionPolicy(database.value(), rp_name);
        if (!rp.ok()) {
            return RowsResult::error_from(rp);
        }

        storage::ScanOptions options;
        options.min_time = stmt.min_time.value_or(core::kMinTimestamp);
        options.max_time = stmt.max_time.value_or(core::kMaxTimestamp);
        options.tag_filters = stmt.tag_filters;

        // Without a time bound every group may hold matching data
        const bool bounded = stmt.min_time.has_value() || stmt.max_time.has_value();
        std::vector<const meta::ShardGroupInfo*> groups;
        for (const auto& group : rp.value().shard_groups) {
            if (!bounded || group.Overlaps(options.min_time, options.max_time)) {
                groups.push_back(&group);
            }
        }
        ShardList shards = local_shards(groups);

        const std::string& measurement = stmt.source.measurement;
        std::vector<std::string> fields;
        if (stmt.is_wildcard()) {
            std::set<std::string> seen;
            for (const auto& shard : shards) {
                auto keys = shard->FieldKeys(measurement);
                if (!keys.ok()) {
                    return RowsResult::error_from(keys);
                }
                AppendUnique(keys.value(), fields, seen);
            }
        } else {
            fields = stmt.fields;
        }
        if (fields.empty()) {
            return NoRows();
        }

        struct MergedSeries {
            core::Tags tags;
            std::map<core::Timestamp, core::Fields> records;
        };
        std::vector<MergedSeries> merged;
        std::unordered_map<std::string, size_t> positions;

        for (const auto& shard : shards) {
            auto scanned = shard->Scan(measurement, options);
            if (!scanned.ok()) {
                return RowsResult::error_from(scanned);
            }
            for (auto& data : scanned.value()) {
                std::string key = core::MakeSeriesKey(measurement, data.tags);
                auto it = positions.find(key);
                if (it == positions.end()) {
                    it = positions.emplace(key, merged.size()).first;
                    merged.push_back(MergedSeries{data.tags, {}});
                    if (config_.max_series_per_query > 0 &&
                        merged.size() > config_.max_series_per_query) {
                        return RowsResult::error(
                            "max-select-series limit exceeded: (" + std::to_string(merged.size()) +
                            "/" + std::to_string(config_.max_series_per_query) + ")",
                            core::Error::Code::RESOURCE_EXHAUSTED);
                    }
                }
                auto& target = merged[it->second].records;
                for (auto& record : data.records) {
                    auto& slot = target[record.time];
                    for (auto& field : record.fields) {
                        slot[field.first] = std::move(field.second);
                    }
                }
            }
        }

        std::vector<std::string> columns;
        columns.reserve(fields.size() + 1);
        columns.push_back("time");
        columns.insert(columns.end(), fields.begin(), fields.end());

        std::vector<Row> rows;
        for (auto& series : merged) {
            Row row;
            row.name = measurement;
            row.tags = series.tags;
            row.columns = columns;
            for (const auto& record : series.records) {
                std::vector<Value> values;
                values.reserve(columns.size());
                values.push_back(TimeValue{record.first});
                bool any = false;
                for (const auto& field : fields) {
                    auto it = record.second.find(field);
                    if (it == record.second.end()) {
                        values.push_back(std::monostate());
                    } else {
                        values.push_back(ToValue(it->second));
                        any = true;
                    }
                }
                if (!any) {
                    continue;
                }
                row.values.push_back(std::move(values));
                if (stmt.limit > 0 && row.values.size() >= stmt.limit) {
                    break;
                }
            }
            if (!row.values.empty()) {
                rows.push_back(std::move(row));
            }
        }
        return RowsResult(std::move(rows));
    }

    RowsResult execute_drop_series(const DropSeriesStatement& stmt) {
        if (stmt.source.measurement.empty()) {
            return RowsResult::error("measurement required", core::Error::Code::INVALID_STATEMENT);
        }
        auto database = resolve_database(stmt.source.database);
        if (!database.ok()) {
            return RowsResult::error_from(database);
        }
        auto shards = database_shards(database.value());
        if (!shards.ok()) {
            return RowsResult::error_from(shards);
        }
        for (const auto& shard : shards.value()) {
            auto dropped = shard->DropSeries(stmt.source.measurement);
            if (!dropped.ok()) {
                return RowsResult::error_from(dropped);
            }
        }
        return NoRows();
    }

    // Measurements a discovery statement covers: the named one, or every
    // measurement returned by list for any shard, sorted
    template<typename ListFn>
    core::Result<std::vector<std::string>> target_measurements(const std::optional<Source>& source,
                                                               const ShardList& shards,
                                                               ListFn list) const {
        if (source && !source->measurement.empty()) {
            return core::Result<std::vector<std::string>>(
                std::vector<std::string>{source->measurement});
        }
        std::set<std::string> names;
        for (const auto& shard : shards) {
            auto listed = list(*shard);
            if (!listed.ok()) {
                return core::Result<std::vector<std::string>>::error_from(listed);
            }
            names.insert(listed.value().begin(), listed.value().end());
        }
        return core::Result<std::vector<std::string>>(
            std::vector<std::string>(names.begin(), names.end()));
    }

    RowsResult execute_show_tag_keys(const ShowTagKeysStatement& stmt) {
        auto database = resolve_database(stmt.source ? stmt.source->database : std::string());
        if (!database.ok()) {
            return RowsResult::error_from(database);
        }
        auto shards = database_shards(database.value());
        if (!shards.ok()) {
            return RowsResult::error_from(shards);
        }
        // Tag keys come from the schema catalogue, so they outlive DROP SERIES
        auto measurements = target_measurements(stmt.source, shards.value(),
            [](const storage::Shard& shard) { return shard.SchemaMeasurements(); });
        if (!measurements.ok()) {
            return RowsResult::error_from(measurements);
        }

        std::vector<Row> rows;
        for (const auto& measurement : measurements.value()) {
            std::set<std::string> keys;
            for (const auto& shard : shards.value()) {
                auto listed = shard->TagKeys(measurement);
                if (!listed.ok()) {
                    return RowsResult::error_from(listed);
                }
                keys.insert(listed.value().begin(), listed.value().end());
            }
            if (keys.empty()) {
                continue;
            }
            Row row;
            row.name = measurement;
            row.columns = {"tagKey"};
            for (const auto& key : keys) {
                row.values.push_back({Value(key)});
            }
            rows.push_back(std::move(row));
        }
        return RowsResult(std::move(rows));
    }

    RowsResult execute_show_tag_values(const ShowTagValuesStatement& stmt) {
        if (stmt.key.empty()) {
            return RowsResult::error("tag key required", core::Error::Code::INVALID_STATEMENT);
        }
        auto database = resolve_database(stmt.source ? stmt.source->database : std::string());
        if (!database.ok()) {
            return RowsResult::error_from(database);
        }
        auto shards = database_shards(database.value());
        if (!shards.ok()) {
            return RowsResult::error_from(shards);
        }
        auto measurements = target_measurements(stmt.source, shards.value(),
            [](const storage::Shard& shard) { return shard.Measurements(); });
        if (!measurements.ok()) {
            return RowsResult::error_from(measurements);
        }

        std::vector<Row> rows;
        for (const auto& measurement : measurements.value()) {
            std::set<std::string> values;
            for (const auto& shard : shards.value()) {
                auto listed = shard->TagValues(measurement, stmt.key);
                if (!listed.ok()) {
                    return RowsResult::error_from(listed);
                }
                values.insert(listed.value().begin(), listed.value().end());
            }
            if (values.empty()) {
                continue;
            }
            Row row;
            row.name = measurement;
            row.columns = {"key", "value"};
            for (const auto& value : values) {
                row.values.push_back({Value(stmt.key), Value(value)});
            }
            rows.push_back(std::move(row));
        }
        return RowsResult(std::move(rows));
    }

    RowsResult execute_show_measurements(const ShowMeasurementsStatement& stmt) {
        auto database = resolve_database(stmt.database);
        if (!database.ok()) {
            return RowsResult::error_from(database);
        }
        auto shards = database_shards(database.value());
        if (!shards.ok()) {
            return RowsResult::error_from(shards);
        }
        auto measurements = target_measurements(std::nullopt, shards.value(),
            [](const storage::Shard& shard) { return shard.Measurements(); });
        if (!measurements.ok()) {
            return RowsResult::error_from(measurements);
        }
        if (measurements.value().empty()) {
            return NoRows();
        }

        Row row;
        row.name = "measurements";
        row.columns = {"name"};
        for (const auto& name : measurements.value()) {
            row.values.push_back({Value(name)});
        }
        std::vector<Row> rows;
        rows.push_back(std::move(row));
        return RowsResult(std::move(rows));
    }

    RowsResult execute_show_series(const ShowSeriesStatement& stmt) {
        auto database = resolve_database(stmt.source ? stmt.source->database : std::string());
        if (!database.ok()) {
            return RowsResult::error_from(database);
        }
        auto shards = database_shards(database.value());
        if (!shards.ok()) {
            return RowsResult::error_from(shards);
        }
        auto measurements = target_measurements(stmt.source, shards.value(),
            [](const storage::Shard& shard) { return shard.Measurements(); });
        if (!measurements.ok()) {
            return RowsResult::error_from(measurements);
        }

        std::vector<Row> rows;
        for (const auto& measurement : measurements.value()) {
            std::vector<std::pair<std::string, core::Tags>> series;
            std::set<std::string> seen;
            std::set<std::string> tag_keys;
            for (const auto& shard : shards.value()) {
                auto listed = shard->SeriesKeys(measurement);
                if (!listed.ok()) {
                    return RowsResult::error_from(listed);
                }
                for (auto& entry : listed.value()) {
                    if (!seen.insert(entry.first).second) {
                        continue;
                    }
                    for (const auto& tag : entry.second) {
                        tag_keys.insert(tag.first);
                    }
                    series.push_back(std::move(entry));
                }
            }
            if (series.empty()) {
                continue;
            }

            Row row;
            row.name = measurement;
            row.columns.push_back("_key");
            row.columns.insert(row.columns.end(), tag_keys.begin(), tag_keys.end());
            for (const auto& entry : series) {
                std::vector<Value> values;
                values.push_back(Value(entry.first));
                for (const auto& key : tag_keys) {
                    auto it = entry.second.find(key);
                    values.push_back(Value(it == entry.second.end() ? std::string() : it->second));
                }
                row.values.push_back(std::move(values));
            }
            rows.push_back(std::move(row));
        }
        return RowsResult(std::move(rows));
    }

    RowsResult execute_show_databases() {
        auto databases = meta_store_->Databases();
        if (!databases.ok()) {
            return RowsResult::error_from(databases);
        }
        Row row;
        row.name = "databases";
        row.columns = {"name"};
        for (const auto& db : databases.value()) {
            row.values.push_back({Value(db.name)});
        }
        std::vector<Row> rows;
        rows.push_back(std::move(row));
        return RowsResult(std::move(rows));
    }

    RowsResult execute_create_user(const CreateUserStatement& stmt) {
        auto created = meta_store_->CreateUser(stmt.name, stmt.password, stmt.admin);
        if (!created.ok()) {
            return RowsResult::error_from(created);
        }
        FLUXDB_INFO("Created user \"{}\" (admin: {})", stmt.name, stmt.admin);
        return NoRows();
    }

    RowsResult execute_drop_user(const DropUserStatement& stmt) {
        auto dropped = meta_store_->DropUser(stmt.name);
        if (!dropped.ok()) {
            return RowsResult::error_from(dropped);
        }
        FLUXDB_INFO("Dropped user \"{}\"", stmt.name);
        return NoRows();
    }

    std::shared_ptr<storage::Store> store_;
    std::shared_ptr<meta::MetaStore> meta_store_;
    core::QueryConfig config_;
    std::string database_;
    int chunk_size_;
    std::optional<meta::UserInfo> user_;
    std::shared_ptr<Channel<Result>> channel_;
};

} // namespace

QueryExecutor::QueryExecutor(std::shared_ptr<storage::Store> store, const core::QueryConfig& config)
    : config_(config), store_(std::move(store)) {}

void QueryExecutor::set_store(std::shared_ptr<storage::Store> store) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_ = std::move(store);
}

std::shared_ptr<storage::Store> QueryExecutor::store() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_;
}

void QueryExecutor::set_meta_store(std::shared_ptr<meta::MetaStore> meta_store) {
    std::lock_guard<std::mutex> lock(mutex_);
    meta_store_ = std::move(meta_store);
}

std::shared_ptr<meta::MetaStore> QueryExecutor::meta_store() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return meta_store_;
}

core::Result<void> QueryExecutor::Authorize(const meta::UserInfo* user, const Query& query,
                                            const std::string& database) const {
    auto meta = meta_store();
    if (!meta) {
        return core::Result<void>::error("meta store not set", core::Error::Code::INTERNAL);
    }
    for (const auto& statement : query.statements) {
        if (!statement) {
            return core::Result<void>::error("empty statement", core::Error::Code::INVALID_STATEMENT);
        }
        auto result = AuthorizeStatement(*meta, user, *statement, database);
        if (!result.ok()) {
            return result;
        }
    }
    return core::Result<void>();
}

core::Result<std::unique_ptr<ResultStream>> QueryExecutor::ExecuteQuery(
    std::shared_ptr<const Query> query, const std::string& database, int chunk_size,
    const meta::UserInfo* user) {
    using StreamResult = core::Result<std::unique_ptr<ResultStream>>;

    if (!query) {
        return StreamResult::error("query is required", core::Error::Code::INVALID_ARGUMENT);
    }

    std::shared_ptr<storage::Store> store;
    std::shared_ptr<meta::MetaStore> meta;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store = store_;
        meta = meta_store_;
    }
    if (!meta) {
        return StreamResult::error("meta store not set", core::Error::Code::INTERNAL);
    }
    if (!store) {
        return StreamResult::error("store not set", core::Error::Code::INTERNAL);
    }

    auto channel = std::make_shared<Channel<Result>>(config_.result_buffer_size);
    std::optional<meta::UserInfo> identity;
    if (user) {
        identity = *user;
    }

    StatementRunner runner(std::move(store), std::move(meta), config_, database, chunk_size,
                           std::move(identity), channel);

    std::thread producer;
    try {
        producer = std::thread([runner = std::move(runner), query]() mutable {
            runner.Run(*query);
        });
    } catch (const std::system_error& e) {
        FLUXDB_ERROR("Failed to start query thread: {}", e.what());
        return StreamResult::error(std::string("failed to start query: ") + e.what(),
                                   core::Error::Code::RESOURCE_EXHAUSTED);
    }

    return StreamResult(std::make_unique<ResultStream>(std::move(channel), std::move(producer)));
}

} // namespace query
} // namespace fluxdb
