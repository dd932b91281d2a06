#ifndef FLUXDB_QUERY_JSON_H_
#define FLUXDB_QUERY_JSON_H_

#include <string>
#include <vector>
#include "fluxdb/query/result.h"

namespace fluxdb {
namespace query {

/**
 * @brief Renders one Result as a JSON object.
 *
 * Successful results render as {"series":[...]} ({} when there are no
 * rows), failures as {"error":"..."}. Non-final chunks carry
 * "partial":true. Within a row, "tags" and "values" are omitted when
 * empty; times render as RFC3339 with nanoseconds and missing values as
 * null.
 */
std::string MarshalResult(const Result& result);

// Renders results as a JSON array of MarshalResult objects
std::string MarshalResults(const std::vector<Result>& results);

} // namespace query
} // namespace fluxdb

#endif // FLUXDB_QUERY_JSON_H_
