#ifndef FLUXDB_QUERY_EXECUTOR_H_
#define FLUXDB_QUERY_EXECUTOR_H_

#include <memory>
#include <mutex>
#include <string>
#include "fluxdb/core/config.h"
#include "fluxdb/core/result.h"
#include "fluxdb/meta/meta_store.h"
#include "fluxdb/query/ast.h"
#include "fluxdb/query/result_stream.h"
#include "fluxdb/storage/store.h"

namespace fluxdb {
namespace query {

/**
 * @brief Runs parsed queries against a Store and a MetaStore.
 *
 * The MetaStore is injected with set_meta_store() before use. Each
 * ExecuteQuery() call starts a producer thread that works through the
 * statements in order and streams one Result per statement (several when
 * chunked) into the returned ResultStream. A failing statement yields an
 * error Result and execution moves on to the next one.
 */
class QueryExecutor {
public:
    explicit QueryExecutor(std::shared_ptr<storage::Store> store,
                           const core::QueryConfig& config = core::QueryConfig::Default());

    void set_store(std::shared_ptr<storage::Store> store);
    std::shared_ptr<storage::Store> store() const;

    void set_meta_store(std::shared_ptr<meta::MetaStore> meta_store);
    std::shared_ptr<meta::MetaStore> meta_store() const;

    const core::QueryConfig& config() const { return config_; }

    /**
     * @brief Checks user may run every statement of query.
     * @param user Caller identity, nullptr when none was supplied
     */
    core::Result<void> Authorize(const meta::UserInfo* user, const Query& query,
                                 const std::string& database) const;

    /**
     * @brief Starts executing query.
     *
     * Fails synchronously only when the query is null or no MetaStore or
     * Store is set; every other failure is reported per statement on the
     * stream. Statements are authorized first when QueryConfig::auth_enabled
     * is set.
     *
     * @param database Default database for statements that name none
     * @param chunk_size Maximum rows per Result, <= 0 disables chunking
     * @param user Caller identity used for authorization
     */
    core::Result<std::unique_ptr<ResultStream>> ExecuteQuery(std::shared_ptr<const Query> query,
                                                             const std::string& database,
                                                             int chunk_size,
                                                             const meta::UserInfo* user = nullptr);

private:
    const core::QueryConfig config_;
    mutable std::mutex mutex_;  // Guards store_ and meta_store_ swaps
    std::shared_ptr<storage::Store> store_;
    std::shared_ptr<meta::MetaStore> meta_store_;
};

} // namespace query
} // namespace fluxdb

#endif // FLUXDB_QUERY_EXECUTOR_H_
