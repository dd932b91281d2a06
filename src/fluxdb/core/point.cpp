#include "fluxdb/core/point.h"
#include "fluxdb/core/error.h"
#include "fluxdb/core/limits.h"

namespace fluxdb {
namespace core {

namespace {

// Escapes the characters that delimit keys in a series key
void AppendEscaped(std::string& out, const std::string& in) {
    for (char c : in) {
        if (c == ',' || c == '=' || c == ' ' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
}

bool TooLong(const std::string& s) {
    return s.size() > kMaxStringLength;
}

Result<void> TooLarge(const std::string& what) {
    return Result<void>::error(what + " exceeds " + std::to_string(kMaxStringLength) + " bytes",
                               Error::Code::INVALID_ARGUMENT);
}

} // namespace

Point::Point(std::string name, Tags tags, Fields fields, Timestamp time)
    : name_(std::move(name)), tags_(std::move(tags)), fields_(std::move(fields)), time_(time) {}

void Point::add_tag(const std::string& key, const std::string& value) {
    if (key.empty()) {
        throw InvalidArgumentError("Tag key cannot be empty");
    }
    tags_[key] = value;
}

void Point::add_field(const std::string& name, FieldValue value) {
    if (name.empty()) {
        throw InvalidArgumentError("Field name cannot be empty");
    }
    fields_[name] = std::move(value);
}

std::string Point::series_key() const {
    return MakeSeriesKey(name_, tags_);
}

Result<void> Point::validate() const {
    if (name_.empty()) {
        return Result<void>::error("point has no measurement name", Error::Code::INVALID_ARGUMENT);
    }
    if (TooLong(name_)) {
        return TooLarge("measurement name");
    }
    if (fields_.empty()) {
        return Result<void>::error("point for " + name_ + " has no fields", Error::Code::INVALID_ARGUMENT);
    }
    if (tags_.size() > kMaxCount || fields_.size() > kMaxCount) {
        return Result<void>::error("point for " + name_ + " has too many tags or fields",
                                   Error::Code::INVALID_ARGUMENT);
    }
    for (const auto& [key, value] : tags_) {
        if (key.empty()) {
            return Result<void>::error("point for " + name_ + " has an empty tag key",
                                       Error::Code::INVALID_ARGUMENT);
        }
        if (TooLong(key) || TooLong(value)) {
            return TooLarge("tag of " + name_);
        }
    }
    for (const auto& [key, value] : fields_) {
        if (key.empty()) {
            return Result<void>::error("point for " + name_ + " has an empty field name",
                                       Error::Code::INVALID_ARGUMENT);
        }
        if (TooLong(key)) {
            return TooLarge("field name of " + name_);
        }
        const auto* s = std::get_if<std::string>(&value);
        if (s && TooLong(*s)) {
            return TooLarge("field " + key + " of " + name_);
        }
    }
    return Result<void>();
}

bool Point::operator==(const Point& other) const {
    return name_ == other.name_ && tags_ == other.tags_ &&
           fields_ == other.fields_ && time_ == other.time_;
}

bool Point::operator!=(const Point& other) const {
    return !(*this == other);
}

std::string MakeSeriesKey(const std::string& measurement, const Tags& tags) {
    std::string key;
    AppendEscaped(key, measurement);
    for (const auto& [name, value] : tags) {
        key.push_back(',');
        AppendEscaped(key, name);
        key.push_back('=');
        AppendEscaped(key, value);
    }
    return key;
}

} // namespace core
} // namespace fluxdb
