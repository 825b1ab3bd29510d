#include "fetchd/download_observer.hpp"

#include <mutex>
#include <utility>

namespace fetchd {

void DownloadObserver::consume(const DownloadUpdate& update) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (update.removed) {
        states_.erase(update.id);
        return;
    }
    states_.insert_or_assign(update.id, update.state);
}

void DownloadObserver::track(const DownloadId& id, DownloadState state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    states_.insert_or_assign(id, std::move(state));
}

void DownloadObserver::untrack(const DownloadId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    states_.erase(id);
}

std::optional<DownloadState> DownloadObserver::state(const DownloadId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = states_.find(id);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

DownloadObserver::StateMap DownloadObserver::stateAll() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return states_;
}

} // namespace fetchd
