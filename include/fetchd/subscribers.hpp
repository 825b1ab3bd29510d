#pragma once

#include "download_update.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace fetchd {

// A listener's bounded inbox. When full, the oldest update is dropped so a
// slow reader never holds up the transfers feeding it.
class Subscription {
public:
    Subscription(std::optional<DownloadId> filter, std::size_t capacity);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Blocks up to `timeout` for the next update. Returns nullopt on timeout
    // or once the subscription is closed and drained.
    std::optional<DownloadUpdate> next(std::chrono::milliseconds timeout);
    std::optional<DownloadUpdate> tryNext();

    // Stops delivery and wakes any reader blocked in next().
    void close();

    [[nodiscard]] bool isClosed() const;
    [[nodiscard]] std::uint64_t dropped() const;
    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] const std::optional<DownloadId>& filter() const noexcept { return filter_; }

private:
    friend class SubscriberRegistry;

    [[nodiscard]] bool accepts(const DownloadUpdate& update) const noexcept;
    // Never blocks on the reader.
    void push(const DownloadUpdate& update);

    const std::optional<DownloadId> filter_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<DownloadUpdate> queue_;
    std::uint64_t dropped_{0};
    bool closed_{false};
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

// Republishes updates to external listeners, e.g. a live progress push.
class SubscriberRegistry final : public UpdateConsumer {
public:
    static constexpr std::size_t kDefaultCapacity = 256;

    // `filter` limits delivery to a single download.
    [[nodiscard]] SubscriptionPtr subscribe(std::optional<DownloadId> filter = std::nullopt,
                                            std::size_t capacity = kDefaultCapacity);

    void consume(const DownloadUpdate& update) override;

    // Live subscriptions; closed or released ones are pruned lazily.
    [[nodiscard]] std::size_t subscriberCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Subscription>> subscribers_;
};

using SubscriberRegistryPtr = std::shared_ptr<SubscriberRegistry>;

} // namespace fetchd
