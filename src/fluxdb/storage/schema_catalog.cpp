#include "fluxdb/storage/schema_catalog.h"

namespace fluxdb {
namespace storage {

void SchemaCatalog::observe(const core::Point& point) {
    auto& schema = schemas_[point.name()];
    for (const auto& [key, value] : point.tags()) {
        schema.tag_keys.insert(key);
    }
    for (const auto& [name, value] : point.fields()) {
        add_field(schema, name);
    }
}

void SchemaCatalog::declare(const std::string& measurement,
                            const std::vector<std::string>& tag_keys,
                            const std::vector<std::string>& field_names) {
    auto& schema = schemas_[measurement];
    schema.tag_keys.insert(tag_keys.begin(), tag_keys.end());
    for (const auto& name : field_names) {
        add_field(schema, name);
    }
}

std::vector<std::string> SchemaCatalog::measurements() const {
    std::vector<std::string> names;
    names.reserve(schemas_.size());
    for (const auto& [name, schema] : schemas_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> SchemaCatalog::tag_keys(const std::string& measurement) const {
    auto it = schemas_.find(measurement);
    if (it == schemas_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.tag_keys.begin(), it->second.tag_keys.end());
}

std::vector<std::string> SchemaCatalog::field_names(const std::string& measurement) const {
    auto it = schemas_.find(measurement);
    if (it == schemas_.end()) {
        return {};
    }
    return it->second.field_names;
}

void SchemaCatalog::add_field(MeasurementSchema& schema, const std::string& name) {
    if (schema.field_set.insert(name).second) {
        schema.field_names.push_back(name);
    }
}

} // namespace storage
} // namespace fluxdb
