#include "fluxdb/query/result.h"

namespace fluxdb {
namespace query {

Value ToValue(const core::FieldValue& field) {
    return std::visit([](const auto& v) -> Value { return v; }, field);
}

bool Row::operator==(const Row& other) const {
    return name == other.name && tags == other.tags &&
           columns == other.columns && values == other.values;
}

Result Result::Error(size_t statement_id, const std::string& message, core::Error::Code code) {
    Result result;
    result.statement_id = statement_id;
    result.error = message;
    result.error_code = code;
    return result;
}

} // namespace query
} // namespace fluxdb
