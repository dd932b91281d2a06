#include "fluxdb/query/ast.h"
#include <sstream>

namespace fluxdb {
namespace query {

namespace {

std::string QuoteString(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

ExecutionPrivilege On(const std::string& database, meta::Privilege privilege) {
    ExecutionPrivilege p;
    p.database = database;
    p.privilege = privilege;
    return p;
}

ExecutionPrivilege Admin() {
    ExecutionPrivilege p;
    p.admin = true;
    p.privilege = meta::Privilege::ALL;
    return p;
}

} // namespace

std::string Source::String() const {
    std::string out;
    if (!database.empty()) {
        out += database + ".";
        out += retention_policy + ".";
    } else if (!retention_policy.empty()) {
        out += retention_policy + ".";
    }
    return out + measurement;
}

bool SelectStatement::is_wildcard() const {
    if (fields.empty()) {
        return true;
    }
    for (const auto& field : fields) {
        if (field == "*") {
            return true;
        }
    }
    return false;
}

std::string SelectStatement::String() const {
    std::ostringstream oss;
    oss << "SELECT ";
    if (is_wildcard()) {
        oss << "*";
    } else {
        for (size_t i = 0; i < fields.size(); ++i) {
            oss << (i ? ", " : "") << fields[i];
        }
    }
    oss << " FROM " << source.String();

    std::vector<std::string> conditions;
    for (const auto& [key, value] : tag_filters) {
        conditions.push_back(key + " = " + QuoteString(value));
    }
    if (min_time) {
        conditions.push_back("time >= " + std::to_string(*min_time));
    }
    if (max_time) {
        conditions.push_back("time <= " + std::to_string(*max_time));
    }
    for (size_t i = 0; i < conditions.size(); ++i) {
        oss << (i ? " AND " : " WHERE ") << conditions[i];
    }
    if (limit > 0) {
        oss << " LIMIT " << limit;
    }
    return oss.str();
}

std::vector<ExecutionPrivilege> SelectStatement::RequiredPrivileges() const {
    return {On(source.database, meta::Privilege::READ)};
}

std::string DropSeriesStatement::String() const {
    return "DROP SERIES FROM " + source.String();
}

std::vector<ExecutionPrivilege> DropSeriesStatement::RequiredPrivileges() const {
    return {On(source.database, meta::Privilege::WRITE)};
}

std::string ShowTagKeysStatement::String() const {
    return source ? "SHOW TAG KEYS FROM " + source->String() : "SHOW TAG KEYS";
}

std::vector<ExecutionPrivilege> ShowTagKeysStatement::RequiredPrivileges() const {
    return {On(source ? source->database : std::string(), meta::Privilege::READ)};
}

std::string ShowTagValuesStatement::String() const {
    std::string out = "SHOW TAG VALUES";
    if (source) {
        out += " FROM " + source->String();
    }
    return out + " WITH KEY = " + key;
}

std::vector<ExecutionPrivilege> ShowTagValuesStatement::RequiredPrivileges() const {
    return {On(source ? source->database : std::string(), meta::Privilege::READ)};
}

std::string ShowMeasurementsStatement::String() const {
    return database.empty() ? "SHOW MEASUREMENTS" : "SHOW MEASUREMENTS ON " + database;
}

std::vector<ExecutionPrivilege> ShowMeasurementsStatement::RequiredPrivileges() const {
    return {On(database, meta::Privilege::READ)};
}

std::string ShowSeriesStatement::String() const {
    return source ? "SHOW SERIES FROM " + source->String() : "SHOW SERIES";
}

std::vector<ExecutionPrivilege> ShowSeriesStatement::RequiredPrivileges() const {
    return {On(source ? source->database : std::string(), meta::Privilege::READ)};
}

std::string ShowDatabasesStatement::String() const {
    return "SHOW DATABASES";
}

std::vector<ExecutionPrivilege> ShowDatabasesStatement::RequiredPrivileges() const {
    return {Admin()};
}

std::string CreateUserStatement::String() const {
    // Never render the password
    std::string out = "CREATE USER " + name + " WITH PASSWORD [REDACTED]";
    if (admin) {
        out += " WITH ALL PRIVILEGES";
    }
    return out;
}

std::vector<ExecutionPrivilege> CreateUserStatement::RequiredPrivileges() const {
    return {Admin()};
}

std::string DropUserStatement::String() const {
    return "DROP USER " + name;
}

std::vector<ExecutionPrivilege> DropUserStatement::RequiredPrivileges() const {
    return {Admin()};
}

std::string Query::String() const {
    std::string out;
    for (size_t i = 0; i < statements.size(); ++i) {
        if (i > 0) {
            out += "; ";
        }
        out += statements[i] ? statements[i]->String() : "<nil>";
    }
    return out;
}

} // namespace query
} // namespace fluxdb
