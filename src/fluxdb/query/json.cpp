#include "fluxdb/query/json.h"
#include <cmath>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace fluxdb {
namespace query {

namespace {

using Allocator = rapidjson::Document::AllocatorType;

// Largest magnitude at which every integer is exactly representable as a double
constexpr double kMaxExactInteger = 9007199254740992.0;

rapidjson::Value StringValue(const std::string& s, Allocator& allocator) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator);
}

struct CellVisitor {
    Allocator& allocator;

    rapidjson::Value operator()(std::monostate) const {
        return rapidjson::Value(rapidjson::kNullType);
    }
    rapidjson::Value operator()(double v) const {
        rapidjson::Value out;
        if (!std::isfinite(v)) {
            out.SetNull();
        } else if (std::trunc(v) == v && std::fabs(v) <= kMaxExactInteger) {
            // Whole floats render without a fraction: 1 rather than 1.0
            out.SetInt64(static_cast<int64_t>(v));
        } else {
            out.SetDouble(v);
        }
        return out;
    }
    rapidjson::Value operator()(int64_t v) const {
        rapidjson::Value out;
        out.SetInt64(v);
        return out;
    }
    rapidjson::Value operator()(bool v) const {
        rapidjson::Value out;
        out.SetBool(v);
        return out;
    }
    rapidjson::Value operator()(const std::string& v) const {
        return StringValue(v, allocator);
    }
    rapidjson::Value operator()(const TimeValue& v) const {
        return StringValue(core::FormatRFC3339Nano(v.nanos), allocator);
    }
};

rapidjson::Value RowToValue(const Row& row, Allocator& allocator) {
    rapidjson::Value out(rapidjson::kObjectType);
    out.AddMember("name", StringValue(row.name, allocator).Move(), allocator);

    if (!row.tags.empty()) {
        rapidjson::Value tags(rapidjson::kObjectType);
        for (const auto& tag : row.tags) {
            tags.AddMember(StringValue(tag.first, allocator).Move(),
                           StringValue(tag.second, allocator).Move(),
                           allocator);
        }
        out.AddMember("tags", tags, allocator);
    }

    rapidjson::Value columns(rapidjson::kArrayType);
    for (const auto& column : row.columns) {
        columns.PushBack(StringValue(column, allocator).Move(), allocator);
    }
    out.AddMember("columns", columns, allocator);

    if (!row.values.empty()) {
        CellVisitor visitor{allocator};
        rapidjson::Value values(rapidjson::kArrayType);
        for (const auto& tuple : row.values) {
            rapidjson::Value cells(rapidjson::kArrayType);
            for (const auto& cell : tuple) {
                cells.PushBack(std::visit(visitor, cell).Move(), allocator);
            }
            values.PushBack(cells, allocator);
        }
        out.AddMember("values", values, allocator);
    }
    return out;
}

// Fills out, which must already be an object
void FillResult(rapidjson::Value& out, const Result& result, Allocator& allocator) {
    if (!result.ok()) {
        out.AddMember("error", StringValue(result.error, allocator).Move(), allocator);
        return;
    }
    if (!result.series.empty()) {
        rapidjson::Value series(rapidjson::kArrayType);
        for (const auto& row : result.series) {
            series.PushBack(RowToValue(row, allocator).Move(), allocator);
        }
        out.AddMember("series", series, allocator);
    }
    if (result.partial) {
        out.AddMember("partial", true, allocator);
    }
}

std::string Serialize(const rapidjson::Document& doc) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace

std::string MarshalResult(const Result& result) {
    rapidjson::Document doc;
    doc.SetObject();
    FillResult(doc, result, doc.GetAllocator());
    return Serialize(doc);
}

std::string MarshalResults(const std::vector<Result>& results) {
    rapidjson::Document doc;
    doc.SetArray();
    auto& allocator = doc.GetAllocator();
    for (const auto& result : results) {
        rapidjson::Value entry(rapidjson::kObjectType);
        FillResult(entry, result, allocator);
        doc.PushBack(entry, allocator);
    }
    return Serialize(doc);
}

} // namespace query
} // namespace fluxdb
