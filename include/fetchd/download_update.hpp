#pragma once

#include "download_id.hpp"
#include "download_state.hpp"

#include <memory>
#include <vector>

namespace fetchd {

// Event emitted for a download. Running transfers emit state changes; the
// manager emits registration, start and removal events.
struct DownloadUpdate {
    DownloadId id;
    DownloadState state;
    // Set when the download left the manager; consumers drop the identifier.
    bool removed{false};
};

// Anything that can consume updates from many concurrently running
// transfers. Implementations must be safe to call from several threads and
// must not block for long: they run on the transfer threads.
class UpdateConsumer {
public:
    virtual ~UpdateConsumer() = default;

    virtual void consume(const DownloadUpdate& update) = 0;
};

using UpdateConsumerPtr = std::shared_ptr<UpdateConsumer>;

// Forwards each update to every registered consumer, in registration order.
class UpdateBroadcaster final : public UpdateConsumer {
public:
    UpdateBroadcaster() = default;
    explicit UpdateBroadcaster(std::vector<UpdateConsumerPtr> consumers);

    // Not thread-safe with respect to consume(); wire consumers up before
    // handing the broadcaster to a manager.
    void add(UpdateConsumerPtr consumer);

    void consume(const DownloadUpdate& update) override;

private:
    std::vector<UpdateConsumerPtr> consumers_;
};

// Writes every update to the log at debug level.
class LoggingConsumer final : public UpdateConsumer {
public:
    void consume(const DownloadUpdate& update) override;
};

} // namespace fetchd
