#include "fluxdb/query/authorizer.h"
#include "fluxdb/common/logger.h"

namespace fluxdb {
namespace query {

namespace {

core::Result<void> Deny(const meta::UserInfo* user, const Statement& statement,
                        const std::string& database, const std::string& reason) {
    std::string name = user ? user->name : std::string("anonymous");
    FLUXDB_WARN("unauthorized request | user: \"{}\" | statement: \"{}\" | database: \"{}\" | {}",
                name, statement.String(), database, reason);
    return core::Result<void>::error(
        name + " not authorized to execute '" + statement.String() + "': " + reason,
        core::Error::Code::AUTHORIZATION_DENIED);
}

bool IsBootstrapStatement(const Statement& statement) {
    if (statement.type() != Statement::Type::CREATE_USER) {
        return false;
    }
    return static_cast<const CreateUserStatement&>(statement).admin;
}

} // namespace

core::Result<void> AuthorizeStatement(meta::MetaStore& meta_store,
                                      const meta::UserInfo* user,
                                      const Statement& statement,
                                      const std::string& database) {
    auto count = meta_store.UserCount();
    if (!count.ok()) {
        return core::Result<void>::error("failed to count users: " + count.error(), count.code());
    }

    // Bootstrap: the first admin can be created without credentials
    if (count.value() == 0) {
        if (IsBootstrapStatement(statement)) {
            return core::Result<void>();
        }
        return Deny(user, statement, database, "create admin user first or disable authentication");
    }

    if (user == nullptr) {
        return Deny(user, statement, database, "no user provided");
    }

    if (user->admin) {
        return core::Result<void>();
    }

    for (const auto& required : statement.RequiredPrivileges()) {
        if (required.admin) {
            return Deny(user, statement, database, "requires admin privilege");
        }
        const std::string& db = required.database.empty() ? database : required.database;
        if (!user->Authorize(required.privilege, db)) {
            return Deny(user, statement, database,
                        std::string("requires ") + meta::PrivilegeName(required.privilege) + " on " + db);
        }
    }
    return core::Result<void>();
}

} // namespace query
} // namespace fluxdb
