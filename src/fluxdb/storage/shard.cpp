#include "fluxdb/storage/shard.h"
#include <mutex>
#include "fluxdb/common/logger.h"
#include "fluxdb/core/limits.h"
#include "fluxdb/storage/codec.h"

namespace fluxdb {
namespace storage {

namespace {

bool MatchesTags(const core::Tags& tags, const core::Tags& filters) {
    for (const auto& [key, value] : filters) {
        auto it = tags.find(key);
        // A missing tag compares equal to the empty string
        const std::string& actual = (it == tags.end()) ? std::string() : it->second;
        if (actual != value) {
            return false;
        }
    }
    return true;
}

// Splits a catalogue entry into records the decoder accepts; declare() merges them back
void AppendSchemaRecords(std::vector<std::vector<uint8_t>>& records, const std::string& measurement,
                         std::vector<std::string> tag_keys, std::vector<std::string> field_names) {
    // Entry type, measurement and the two list counts
    const size_t header = 1 + 4 + measurement.size() + 4 + 4;
    std::vector<std::string> keys;
    std::vector<std::string> names;
    size_t bytes = 0;

    auto finish = [&]() {
        records.push_back(EncodeEntry(LogEntry::Schema(measurement, std::move(keys), std::move(names))));
        keys.clear();
        names.clear();
        bytes = 0;
    };
    auto add = [&](std::vector<std::string>& list, std::string& value) {
        bool started = !keys.empty() || !names.empty();
        if (started && (list.size() >= core::kMaxCount ||
                        header + bytes + 4 + value.size() > core::kMaxFrameLength)) {
            finish();
        }
        bytes += 4 + value.size();
        list.push_back(std::move(value));
    };

    for (auto& key : tag_keys) {
        add(keys, key);
    }
    for (auto& name : field_names) {
        add(names, name);
    }
    finish();
}

} // namespace

Shard::Shard(core::ShardID id, std::string database, std::string retention_policy,
             std::string path, const core::StoreConfig& config)
    : id_(id),
      database_(std::move(database)),
      retention_policy_(std::move(retention_policy)),
      path_(std::move(path)),
      config_(config),
      opened_(false),
      index_(std::make_unique<Index>()) {}

Shard::~Shard() {
    auto result = Close();
    if (!result.ok()) {
        FLUXDB_ERROR("Shard {} failed to close cleanly: {}", id_, result.error());
    }
}

core::Result<void> Shard::Open() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (opened_) {
        return core::Result<void>();
    }

    try {
        auto wal = std::make_unique<WriteAheadLog>(path_, config_.max_segment_bytes);
        index_ = std::make_unique<Index>();
        catalog_ = SchemaCatalog();

        size_t entries = 0;
        auto replayed = wal->replay([this, &entries](const uint8_t* data, size_t size) {
            auto entry = DecodeEntry(data, size);
            if (!entry.ok()) {
                return core::Result<void>::error_from(entry);
            }
            apply(entry.value());
            entries++;
            return core::Result<void>();
        });
        if (!replayed.ok()) {
            FLUXDB_ERROR("Shard {} replay failed: {}", id_, replayed.error());
            index_ = std::make_unique<Index>();
            catalog_ = SchemaCatalog();
            return replayed;
        }

        auto opened = wal->open();
        if (!opened.ok()) {
            return opened;
        }
        wal_ = std::move(wal);
        opened_ = true;

        FLUXDB_INFO("Opened shard {} ({}.{}) at {}: {} log entries, {} series",
                    id_, database_, retention_policy_, path_, entries, index_->num_series());
        return core::Result<void>();
    } catch (const std::exception& e) {
        return core::Result<void>::error("failed to open shard " + std::to_string(id_) + ": " + e.what(),
                                         core::Error::Code::IO_FAILURE);
    }
}

core::Result<void> Shard::Close() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!opened_) {
        return core::Result<void>();
    }

    core::Result<void> result;
    try {
        if (config_.compact_on_close) {
            result = wal_->checkpoint(snapshot_records());
        } else {
            result = wal_->flush();
        }
    } catch (const std::exception& e) {
        result = core::Result<void>::error(std::string("failed to close shard: ") + e.what(),
                                           core::Error::Code::IO_FAILURE);
    }

    wal_->close();
    wal_.reset();
    index_ = std::make_unique<Index>();
    catalog_ = SchemaCatalog();
    opened_ = false;

    if (result.ok()) {
        FLUXDB_DEBUG("Closed shard {}", id_);
    }
    return result;
}

core::Result<void> Shard::WritePoints(const std::vector<core::Point>& points) {
    for (const auto& point : points) {
        auto valid = point.validate();
        if (!valid.ok()) {
            return valid;
        }
    }

    if (points.size() > core::kMaxCount) {
        return core::Result<void>::error("batch of " + std::to_string(points.size()) +
                                             " points exceeds " + std::to_string(core::kMaxCount),
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    // Encode outside the lock; the batch is logged as a single record
    std::vector<uint8_t> payload = EncodeEntry(LogEntry::WritePoints(points));
    if (payload.size() > core::kMaxFrameLength) {
        return core::Result<void>::error("batch encodes to " + std::to_string(payload.size()) +
                                             " bytes, limit is " + std::to_string(core::kMaxFrameLength),
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto open = check_open();
    if (!open.ok()) {
        return open;
    }
    if (points.empty()) {
        return core::Result<void>();
    }

    auto logged = wal_->append(payload, config_.flush_on_write);
    if (!logged.ok()) {
        FLUXDB_ERROR("Shard {} failed to log write of {} points: {}", id_, points.size(), logged.error());
        return logged;
    }

    for (const auto& point : points) {
        catalog_.observe(point);
        index_->get_or_create(point)->write(point.time(), point.fields());
    }
    FLUXDB_TRACE("Shard {} wrote {} points", id_, points.size());
    return core::Result<void>();
}

core::Result<std::vector<SeriesData>> Shard::Scan(const std::string& measurement,
                                                  const ScanOptions& options) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto open = check_open();
    if (!open.ok()) {
        return core::Result<std::vector<SeriesData>>::error_from(open);
    }

    std::vector<SeriesData> result;
    for (const Series* series : index_->series_for(measurement)) {
        if (!MatchesTags(series->tags(), options.tag_filters)) {
            continue;
        }
        auto records = series->read(options.min_time, options.max_time);
        if (records.empty()) {
            continue;
        }
        result.push_back(SeriesData{series->measurement(), series->tags(), std::move(records)});
    }
    return core::Result<std::vector<SeriesData>>(std::move(result));
}

core::Result<void> Shard::DropSeries(const std::string& measurement) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto open = check_open();
    if (!open.ok()) {
        return open;
    }
    if (!index_->has_measurement(measurement)) {
        return core::Result<void>();
    }

    auto logged = wal_->append(EncodeEntry(LogEntry::DropSeries(measurement)), config_.flush_on_write);
    if (!logged.ok()) {
        return logged;
    }
    size_t removed = index_->remove_measurement(measurement);
    FLUXDB_INFO("Shard {} dropped {} series of {}", id_, removed, measurement);
    return core::Result<void>();
}

core::Result<std::vector<std::string>> Shard::TagKeys(const std::string& measurement) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto open = check_open();
    if (!open.ok()) {
        return core::Result<std::vector<std::string>>::error_from(open);
    }
    return catalog_.tag_keys(measurement);
}

core::Result<std::vector<std::string>> Shard::FieldKeys(const std::string& measurement) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto open = check_open();
    if (!open.ok()) {
        return core::Result<std::vector<std::string>>::error_from(open);
    }
    return catalog_.field_names(measurement);
}

core::Result<std::vector<std::string>> Shard::TagValues(const std::string& measurement,
                                                        const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto open = check_open();
    if (!open.ok()) {
        return core::Result<std::vector<std::string>>::error_from(open);
    }
    return index_->tag_values(measurement, key);
}

core::Result<std::vector<std::string>> Shard::Measurements() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto open = check_open();
    if (!open.ok()) {
        return core::Result<std::vector<std::string>>::error_from(open);
    }
    return index_->measurements();
}

core::Result<std::vector<std::string>> Shard::SchemaMeasurements() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto open = check_open();
    if (!open.ok()) {
        return core::Result<std::vector<std::string>>::error_from(open);
    }
    return catalog_.measurements();
}

core::Result<std::vector<std::pair<std::string, core::Tags>>> Shard::SeriesKeys(
    const std::string& measurement) const {
    using KeyList = std::vector<std::pair<std::string, core::Tags>>;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto open = check_open();
    if (!open.ok()) {
        return core::Result<KeyList>::error_from(open);
    }
    KeyList keys;
    for (const Series* series : index_->series_for(measurement)) {
        keys.emplace_back(series->key(), series->tags());
    }
    return core::Result<KeyList>(std::move(keys));
}

size_t Shard::SeriesCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_->num_series();
}

bool Shard::IsOpen() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return opened_;
}

void Shard::apply(const LogEntry& entry) {
    switch (entry.type) {
        case EntryType::WRITE_POINTS:
            for (const auto& point : entry.points) {
                catalog_.observe(point);
                index_->get_or_create(point)->write(point.time(), point.fields());
            }
            break;
        case EntryType::DROP_SERIES:
            index_->remove_measurement(entry.measurement);
            break;
        case EntryType::SCHEMA:
            catalog_.declare(entry.measurement, entry.tag_keys, entry.field_names);
            break;
    }
}

core::Result<void> Shard::check_open() const {
    if (!opened_) {
        return core::Result<void>::error("shard " + std::to_string(id_) + " is closed",
                                         core::Error::Code::CLOSED);
    }
    return core::Result<void>();
}

std::vector<std::vector<uint8_t>> Shard::snapshot_records() const {
    std::vector<std::vector<uint8_t>> records;

    // Catalogue first so measurements without live series keep their schema
    for (const auto& measurement : catalog_.measurements()) {
        AppendSchemaRecords(records, measurement, catalog_.tag_keys(measurement),
                            catalog_.field_names(measurement));
    }

    for (const auto& measurement : index_->measurements()) {
        for (const Series* series : index_->series_for(measurement)) {
            std::vector<core::Point> points;
            for (auto& record : series->read(core::kMinTimestamp, core::kMaxTimestamp)) {
                points.emplace_back(series->measurement(), series->tags(),
                                    std::move(record.fields), record.time);
            }
            // Long series span several records so each stays replayable
            for (auto& batch : EncodePointBatches(points, core::kMaxCount, core::kMaxFrameLength)) {
                records.push_back(std::move(batch));
            }
        }
    }
    return records;
}

} // namespace storage
} // namespace fluxdb
