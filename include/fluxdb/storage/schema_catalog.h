#ifndef FLUXDB_STORAGE_SCHEMA_CATALOG_H_
#define FLUXDB_STORAGE_SCHEMA_CATALOG_H_

#include <map>
#include <set>
#include <string>
#include <vector>
#include "fluxdb/core/point.h"

namespace fluxdb {
namespace storage {

/**
 * @brief Per-measurement tag keys and field names seen by a shard.
 *
 * Owned separately from series data: dropping series leaves the catalogue
 * untouched, so schema queries keep reporting a measurement's columns after
 * its rows are gone. Guarded by the owning shard's lock.
 */
class SchemaCatalog {
public:
    // Records the point's tag keys and field names
    void observe(const core::Point& point);

    // Merges a persisted catalogue entry
    void declare(const std::string& measurement,
                 const std::vector<std::string>& tag_keys,
                 const std::vector<std::string>& field_names);

    std::vector<std::string> measurements() const;

    // Sorted
    std::vector<std::string> tag_keys(const std::string& measurement) const;

    // In discovery order
    std::vector<std::string> field_names(const std::string& measurement) const;

private:
    struct MeasurementSchema {
        std::set<std::string> tag_keys;
        std::vector<std::string> field_names;
        std::set<std::string> field_set;
    };

    void add_field(MeasurementSchema& schema, const std::string& name);

    std::map<std::string, MeasurementSchema> schemas_;
};

} // namespace storage
} // namespace fluxdb

#endif // FLUXDB_STORAGE_SCHEMA_CATALOG_H_
