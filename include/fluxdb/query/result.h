#ifndef FLUXDB_QUERY_RESULT_H_
#define FLUXDB_QUERY_RESULT_H_

#include <string>
#include <variant>
#include <vector>
#include "fluxdb/core/error.h"
#include "fluxdb/core/types.h"

namespace fluxdb {
namespace query {

/**
 * @brief A timestamp cell; serialized as RFC3339 with nanoseconds
 */
struct TimeValue {
    core::Timestamp nanos = 0;

    bool operator==(const TimeValue& other) const { return nanos == other.nanos; }
    bool operator!=(const TimeValue& other) const { return nanos != other.nanos; }
};

/**
 * @brief One cell of a result row; monostate renders as null
 */
using Value = std::variant<std::monostate, double, int64_t, bool, std::string, TimeValue>;

Value ToValue(const core::FieldValue& field);

/**
 * @brief Rows of one series (measurement + tag set)
 */
struct Row {
    std::string name;
    core::Tags tags;
    std::vector<std::string> columns;
    std::vector<std::vector<Value>> values;

    bool operator==(const Row& other) const;
};

/**
 * @brief Output of one statement, or one chunk of it.
 *
 * Chunks of the same statement share statement_id; every chunk but the
 * last has partial set.
 */
struct Result {
    size_t statement_id = 0;
    std::vector<Row> series;
    std::string error;
    core::Error::Code error_code = core::Error::Code::UNKNOWN;
    bool partial = false;

    bool ok() const { return error.empty(); }

    static Result Error(size_t statement_id, const std::string& message, core::Error::Code code);
};

} // namespace query
} // namespace fluxdb

#endif // FLUXDB_QUERY_RESULT_H_
