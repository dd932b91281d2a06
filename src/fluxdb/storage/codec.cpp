#include "fluxdb/storage/codec.h"
#include <cstring>
#include "fluxdb/core/limits.h"

namespace fluxdb {
namespace storage {

namespace {

enum class FieldType : uint8_t {
    FLOAT = 0,
    INTEGER = 1,
    STRING = 2,
    BOOLEAN = 3
};

// Bytes before the first point of a WRITE_POINTS payload
constexpr size_t kWritePointsHeader = 5;

void PutU8(std::vector<uint8_t>& out, uint8_t v) {
    out.push_back(v);
}

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

void PutU64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

void PutString(std::vector<uint8_t>& out, const std::string& s) {
    PutU32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

void PutStrings(std::vector<uint8_t>& out, const std::vector<std::string>& strings) {
    PutU32(out, static_cast<uint32_t>(strings.size()));
    for (const auto& s : strings) {
        PutString(out, s);
    }
}

void PutFieldValue(std::vector<uint8_t>& out, const core::FieldValue& value) {
    if (const auto* d = std::get_if<double>(&value)) {
        uint64_t bits;
        std::memcpy(&bits, d, sizeof(bits));
        PutU8(out, static_cast<uint8_t>(FieldType::FLOAT));
        PutU64(out, bits);
    } else if (const auto* i = std::get_if<int64_t>(&value)) {
        PutU8(out, static_cast<uint8_t>(FieldType::INTEGER));
        PutU64(out, static_cast<uint64_t>(*i));
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        PutU8(out, static_cast<uint8_t>(FieldType::STRING));
        PutString(out, *s);
    } else {
        PutU8(out, static_cast<uint8_t>(FieldType::BOOLEAN));
        PutU8(out, std::get<bool>(value) ? 1 : 0);
    }
}

void PutPoint(std::vector<uint8_t>& out, const core::Point& point) {
    PutString(out, point.name());
    PutU32(out, static_cast<uint32_t>(point.tags().size()));
    for (const auto& [key, value] : point.tags()) {
        PutString(out, key);
        PutString(out, value);
    }
    PutU32(out, static_cast<uint32_t>(point.fields().size()));
    for (const auto& [name, value] : point.fields()) {
        PutString(out, name);
        PutFieldValue(out, value);
    }
    PutU64(out, static_cast<uint64_t>(point.time()));
}

/**
 * Bounds-checked cursor over an encoded payload. Every read returns false
 * once the payload is exhausted; the first failure sticks.
 */
class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size), offset_(0) {}

    bool u8(uint8_t& v) {
        if (!need(1)) return false;
        v = data_[offset_++];
        return true;
    }

    bool u32(uint32_t& v) {
        if (!need(4)) return false;
        v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(data_[offset_++]) << (8 * i);
        }
        return true;
    }

    bool u64(uint64_t& v) {
        if (!need(8)) return false;
        v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(data_[offset_++]) << (8 * i);
        }
        return true;
    }

    bool str(std::string& s) {
        uint32_t len = 0;
        if (!u32(len) || len > core::kMaxStringLength || !need(len)) return false;
        s.assign(reinterpret_cast<const char*>(data_ + offset_), len);
        offset_ += len;
        return true;
    }

    bool count(uint32_t& n) {
        return u32(n) && n <= core::kMaxCount;
    }

    bool done() const { return offset_ == size_; }

private:
    bool need(size_t n) const { return size_ - offset_ >= n; }

    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};

bool ReadFieldValue(Reader& r, core::FieldValue& value) {
    uint8_t type = 0;
    if (!r.u8(type)) return false;
    switch (static_cast<FieldType>(type)) {
        case FieldType::FLOAT: {
            uint64_t bits = 0;
            if (!r.u64(bits)) return false;
            double d;
            std::memcpy(&d, &bits, sizeof(d));
            value = d;
            return true;
        }
        case FieldType::INTEGER: {
            uint64_t bits = 0;
            if (!r.u64(bits)) return false;
            value = static_cast<int64_t>(bits);
            return true;
        }
        case FieldType::STRING: {
            std::string s;
            if (!r.str(s)) return false;
            value = std::move(s);
            return true;
        }
        case FieldType::BOOLEAN: {
            uint8_t b = 0;
            if (!r.u8(b) || b > 1) return false;
            value = (b == 1);
            return true;
        }
    }
    return false;
}

bool ReadPoint(Reader& r, core::Point& point) {
    std::string name;
    uint32_t tag_count = 0;
    if (!r.str(name) || !r.count(tag_count)) return false;

    core::Tags tags;
    for (uint32_t i = 0; i < tag_count; ++i) {
        std::string key, value;
        if (!r.str(key) || !r.str(value)) return false;
        tags.emplace(std::move(key), std::move(value));
    }

    uint32_t field_count = 0;
    if (!r.count(field_count)) return false;
    core::Fields fields;
    for (uint32_t i = 0; i < field_count; ++i) {
        std::string field_name;
        core::FieldValue value;
        if (!r.str(field_name) || !ReadFieldValue(r, value)) return false;
        fields.emplace(std::move(field_name), std::move(value));
    }

    uint64_t time = 0;
    if (!r.u64(time)) return false;

    point = core::Point(std::move(name), std::move(tags), std::move(fields),
                        static_cast<core::Timestamp>(time));
    return true;
}

bool ReadStrings(Reader& r, std::vector<std::string>& out) {
    uint32_t n = 0;
    if (!r.count(n)) return false;
    out.clear();
    for (uint32_t i = 0; i < n; ++i) {
        std::string s;
        if (!r.str(s)) return false;
        out.push_back(std::move(s));
    }
    return true;
}

core::Result<LogEntry> Corrupt(const std::string& what) {
    return core::Result<LogEntry>::error("corrupt log entry: " + what, core::Error::Code::IO_FAILURE);
}

} // namespace

LogEntry LogEntry::WritePoints(std::vector<core::Point> points) {
    LogEntry entry;
    entry.type = EntryType::WRITE_POINTS;
    entry.points = std::move(points);
    return entry;
}

LogEntry LogEntry::DropSeries(const std::string& measurement) {
    LogEntry entry;
    entry.type = EntryType::DROP_SERIES;
    entry.measurement = measurement;
    return entry;
}

LogEntry LogEntry::Schema(const std::string& measurement,
                          std::vector<std::string> tag_keys,
                          std::vector<std::string> field_names) {
    LogEntry entry;
    entry.type = EntryType::SCHEMA;
    entry.measurement = measurement;
    entry.tag_keys = std::move(tag_keys);
    entry.field_names = std::move(field_names);
    return entry;
}

std::vector<uint8_t> EncodeEntry(const LogEntry& entry) {
    std::vector<uint8_t> out;
    PutU8(out, static_cast<uint8_t>(entry.type));

    switch (entry.type) {
        case EntryType::WRITE_POINTS:
            PutU32(out, static_cast<uint32_t>(entry.points.size()));
            for (const auto& point : entry.points) {
                PutPoint(out, point);
            }
            break;
        case EntryType::DROP_SERIES:
            PutString(out, entry.measurement);
            break;
        case EntryType::SCHEMA:
            PutString(out, entry.measurement);
            PutStrings(out, entry.tag_keys);
            PutStrings(out, entry.field_names);
            break;
    }
    return out;
}

std::vector<std::vector<uint8_t>> EncodePointBatches(const std::vector<core::Point>& points,
                                                     size_t max_points, size_t max_bytes) {
    std::vector<std::vector<uint8_t>> batches;
    std::vector<uint8_t> body;
    uint32_t count = 0;

    auto finish = [&]() {
        std::vector<uint8_t> out;
        out.reserve(kWritePointsHeader + body.size());
        PutU8(out, static_cast<uint8_t>(EntryType::WRITE_POINTS));
        PutU32(out, count);
        out.insert(out.end(), body.begin(), body.end());
        batches.push_back(std::move(out));
        body.clear();
        count = 0;
    };

    std::vector<uint8_t> encoded;
    for (const auto& point : points) {
        encoded.clear();
        PutPoint(encoded, point);
        if (count > 0 && (count >= max_points ||
                          kWritePointsHeader + body.size() + encoded.size() > max_bytes)) {
            finish();
        }
        body.insert(body.end(), encoded.begin(), encoded.end());
        count++;
    }
    if (count > 0) {
        finish();
    }
    return batches;
}

core::Result<LogEntry> DecodeEntry(const uint8_t* data, size_t size) {
    Reader r(data, size);
    uint8_t type = 0;
    if (!r.u8(type)) {
        return Corrupt("empty payload");
    }

    LogEntry entry;
    switch (static_cast<EntryType>(type)) {
        case EntryType::WRITE_POINTS: {
            entry.type = EntryType::WRITE_POINTS;
            uint32_t n = 0;
            if (!r.count(n)) return Corrupt("bad point count");
            entry.points.reserve(n);
            for (uint32_t i = 0; i < n; ++i) {
                core::Point point;
                if (!ReadPoint(r, point)) return Corrupt("bad point " + std::to_string(i));
                entry.points.push_back(std::move(point));
            }
            break;
        }
        case EntryType::DROP_SERIES:
            entry.type = EntryType::DROP_SERIES;
            if (!r.str(entry.measurement)) return Corrupt("bad measurement");
            break;
        case EntryType::SCHEMA:
            entry.type = EntryType::SCHEMA;
            if (!r.str(entry.measurement) ||
                !ReadStrings(r, entry.tag_keys) ||
                !ReadStrings(r, entry.field_names)) {
                return Corrupt("bad schema");
            }
            break;
        default:
            return Corrupt("unknown entry type " + std::to_string(type));
    }

    if (!r.done()) {
        return Corrupt("trailing bytes");
    }
    return core::Result<LogEntry>(std::move(entry));
}

} // namespace storage
} // namespace fluxdb
