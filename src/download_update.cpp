#include "fetchd/download_update.hpp"

#include "fetchd/json.hpp"
#include "fetchd/log.hpp"

#include <utility>

namespace fetchd {

UpdateBroadcaster::UpdateBroadcaster(std::vector<UpdateConsumerPtr> consumers) : consumers_(std::move(consumers)) {}

void UpdateBroadcaster::add(UpdateConsumerPtr consumer) {
    if (consumer) {
        consumers_.push_back(std::move(consumer));
    }
}

void UpdateBroadcaster::consume(const DownloadUpdate& update) {
    for (const auto& consumer : consumers_) {
        if (consumer) {
            consumer->consume(update);
        }
    }
}

void LoggingConsumer::consume(const DownloadUpdate& update) {
    logDebug("update {}", dumpJson(update));
}

} // namespace fetchd
