#include "fluxdb/query/result_stream.h"

namespace fluxdb {
namespace query {

ResultStream::ResultStream(std::shared_ptr<Channel<Result>> channel, std::thread producer)
    : channel_(std::move(channel)), producer_(std::move(producer)) {}

ResultStream::~ResultStream() {
    Cancel();
    if (producer_.joinable()) {
        producer_.join();
    }
}

std::optional<Result> ResultStream::Next() {
    return channel_->receive();
}

std::vector<Result> ResultStream::Collect() {
    std::vector<Result> results;
    while (auto result = Next()) {
        results.push_back(std::move(*result));
    }
    return results;
}

void ResultStream::Cancel() {
    channel_->cancel();
}

} // namespace query
} // namespace fluxdb
