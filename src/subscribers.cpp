#include "fetchd/subscribers.hpp"

#include "fetchd/log.hpp"

#include <algorithm>
#include <utility>

namespace fetchd {

Subscription::Subscription(std::optional<DownloadId> filter, std::size_t capacity)
    : filter_(std::move(filter)), capacity_(std::max<std::size_t>(1, capacity)) {}

std::optional<DownloadUpdate> Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    DownloadUpdate update = std::move(queue_.front());
    queue_.pop_front();
    return update;
}

std::optional<DownloadUpdate> Subscription::tryNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    DownloadUpdate update = std::move(queue_.front());
    queue_.pop_front();
    return update;
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

bool Subscription::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::uint64_t Subscription::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

std::size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool Subscription::accepts(const DownloadUpdate& update) const noexcept {
    return !filter_ || *filter_ == update.id;
}

void Subscription::push(const DownloadUpdate& update) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(update);
    }
    ready_.notify_one();
}

SubscriptionPtr SubscriberRegistry::subscribe(std::optional<DownloadId> filter, std::size_t capacity) {
    auto subscription = std::make_shared<Subscription>(std::move(filter), capacity);
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
}

void SubscriberRegistry::consume(const DownloadUpdate& update) {
    // Deliver outside the registry lock so subscribe() never waits on a push.
    std::vector<SubscriptionPtr> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live.reserve(subscribers_.size());
        const auto before = subscribers_.size();
        subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                          [&live](const std::weak_ptr<Subscription>& weak) {
                                              auto subscription = weak.lock();
                                              if (!subscription || subscription->isClosed()) {
                                                  return true;
                                              }
                                              live.push_back(std::move(subscription));
                                              return false;
                                          }),
                           subscribers_.end());
        if (subscribers_.size() != before) {
            logDebug("pruned {} subscriber(s)", before - subscribers_.size());
        }
    }

    for (const auto& subscription : live) {
        if (subscription->accepts(update)) {
            subscription->push(update);
        }
    }
}

std::size_t SubscriberRegistry::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(subscribers_.begin(), subscribers_.end(), [](const std::weak_ptr<Subscription>& weak) {
            const auto subscription = weak.lock();
            return subscription && !subscription->isClosed();
        }));
}

} // namespace fetchd
