#ifndef FLUXDB_QUERY_AUTHORIZER_H_
#define FLUXDB_QUERY_AUTHORIZER_H_

#include <string>
#include "fluxdb/core/result.h"
#include "fluxdb/meta/meta_store.h"
#include "fluxdb/query/ast.h"

namespace fluxdb {
namespace query {

/**
 * @brief Decides whether user may run statement against database.
 *
 * Rules, in order:
 *  - while no users exist, only CREATE USER ... WITH ALL PRIVILEGES is
 *    allowed, whoever the caller is;
 *  - otherwise a missing user is denied;
 *  - admins may run anything;
 *  - other users need every privilege the statement requires, and never
 *    pass a statement requiring admin.
 *
 * Denials fail with AUTHORIZATION_DENIED.
 *
 * @param user Caller identity, nullptr when none was supplied
 * @param database Default database for privileges that name none
 */
core::Result<void> AuthorizeStatement(meta::MetaStore& meta_store,
                                      const meta::UserInfo* user,
                                      const Statement& statement,
                                      const std::string& database);

} // namespace query
} // namespace fluxdb

#endif // FLUXDB_QUERY_AUTHORIZER_H_
