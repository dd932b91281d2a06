#ifndef FLUXDB_QUERY_AST_H_
#define FLUXDB_QUERY_AST_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "fluxdb/core/types.h"
#include "fluxdb/meta/meta_store.h"

namespace fluxdb {
namespace query {

/**
 * @brief A privilege a statement needs before it may run
 */
struct ExecutionPrivilege {
    bool admin = false;             // Requires an admin user
    std::string database;           // Empty = the query's default database
    meta::Privilege privilege = meta::Privilege::NO_PRIVILEGES;
};

// Base interface for all parsed statements
struct Statement {
    enum class Type {
        SELECT,
        DROP_SERIES,
        SHOW_TAG_KEYS,
        SHOW_TAG_VALUES,
        SHOW_MEASUREMENTS,
        SHOW_SERIES,
        SHOW_DATABASES,
        CREATE_USER,
        DROP_USER
    };

    virtual ~Statement() = default;
    virtual Type type() const = 0;
    virtual std::string String() const = 0;
    virtual std::vector<ExecutionPrivilege> RequiredPrivileges() const = 0;
};

// A measurement reference, optionally qualified: [db.][rp.]measurement
struct Source {
    std::string database;
    std::string retention_policy;
    std::string measurement;

    std::string String() const;
};

// SELECT <fields> FROM <source> [WHERE tag = 'v' AND time >= a AND time <= b] [LIMIT n]
struct SelectStatement : Statement {
    std::vector<std::string> fields;    // Empty or {"*"} selects every field
    Source source;
    core::Tags tag_filters;
    std::optional<core::Timestamp> min_time;
    std::optional<core::Timestamp> max_time;
    size_t limit = 0;                   // Rows per series, 0 = unlimited

    bool is_wildcard() const;

    Type type() const override { return Type::SELECT; }
    std::string String() const override;
    std::vector<ExecutionPrivilege> RequiredPrivileges() const override;
};

// DROP SERIES FROM <measurement>
struct DropSeriesStatement : Statement {
    Source source;

    Type type() const override { return Type::DROP_SERIES; }
    std::string String() const override;
    std::vector<ExecutionPrivilege> RequiredPrivileges() const override;
};

// SHOW TAG KEYS [FROM <measurement>]
struct ShowTagKeysStatement : Statement {
    std::optional<Source> source;

    Type type() const override { return Type::SHOW_TAG_KEYS; }
    std::string String() const override;
    std::vector<ExecutionPrivilege> RequiredPrivileges() const override;
};

// SHOW TAG VALUES [FROM <measurement>] WITH KEY = <key>
struct ShowTagValuesStatement : Statement {
    std::optional<Source> source;
    std::string key;

    Type type() const override { return Type::SHOW_TAG_VALUES; }
    std::string String() const override;
    std::vector<ExecutionPrivilege> RequiredPrivileges() const override;
};

// SHOW MEASUREMENTS
struct ShowMeasurementsStatement : Statement {
    std::string database;

    Type type() const override { return Type::SHOW_MEASUREMENTS; }
    std::string String() const override;
    std::vector<ExecutionPrivilege> RequiredPrivileges() const override;
};

// SHOW SERIES [FROM <measurement>]
struct ShowSeriesStatement : Statement {
    std::optional<Source> source;

    Type type() const override { return Type::SHOW_SERIES; }
    std::string String() const override;
    std::vector<ExecutionPrivilege> RequiredPrivileges() const override;
};

// SHOW DATABASES
struct ShowDatabasesStatement : Statement {
    Type type() const override { return Type::SHOW_DATABASES; }
    std::string String() const override;
    std::vector<ExecutionPrivilege> RequiredPrivileges() const override;
};

// CREATE USER <name> WITH PASSWORD '<password>' [WITH ALL PRIVILEGES]
struct CreateUserStatement : Statement {
    std::string name;
    std::string password;
    bool admin = false;

    Type type() const override { return Type::CREATE_USER; }
    std::string String() const override;
    std::vector<ExecutionPrivilege> RequiredPrivileges() const override;
};

// DROP USER <name>
struct DropUserStatement : Statement {
    std::string name;

    Type type() const override { return Type::DROP_USER; }
    std::string String() const override;
    std::vector<ExecutionPrivilege> RequiredPrivileges() const override;
};

/**
 * @brief An ordered list of parsed statements
 */
struct Query {
    std::vector<std::unique_ptr<Statement>> statements;

    std::string String() const;
};

} // namespace query
} // namespace fluxdb

#endif // FLUXDB_QUERY_AST_H_
