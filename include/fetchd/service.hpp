#pragma once

#include "download_manager.hpp"
#include "download_observer.hpp"
#include "subscribers.hpp"

#include <memory>

namespace fetchd {

// A manager wired to an observer and a subscriber registry.
struct DownloadService {
    std::shared_ptr<DownloadObserver> observer;
    SubscriberRegistryPtr subscribers;
    std::unique_ptr<DownloadManager> manager;
};

// `log_updates` adds a LoggingConsumer behind the observer and subscribers.
[[nodiscard]] DownloadService makeDownloadService(bool log_updates = false);

} // namespace fetchd
