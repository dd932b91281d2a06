#ifndef FLUXDB_QUERY_RESULT_STREAM_H_
#define FLUXDB_QUERY_RESULT_STREAM_H_

#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include "fluxdb/query/channel.h"
#include "fluxdb/query/result.h"

namespace fluxdb {
namespace query {

/**
 * @brief Consumer side of a running query.
 *
 * Results arrive in statement order; Next() returning nullopt is the only
 * completion signal. Destroying the stream cancels the query and joins the
 * producer thread.
 */
class ResultStream {
public:
    ResultStream(std::shared_ptr<Channel<Result>> channel, std::thread producer);
    ~ResultStream();

    ResultStream(const ResultStream&) = delete;
    ResultStream& operator=(const ResultStream&) = delete;

    std::optional<Result> Next();

    // Drains the stream
    std::vector<Result> Collect();

    // Stops the producer; later Next() calls return nullopt
    void Cancel();

private:
    std::shared_ptr<Channel<Result>> channel_;
    std::thread producer_;
};

} // namespace query
} // namespace fluxdb

#endif // FLUXDB_QUERY_RESULT_STREAM_H_
