#include "fetchd/service.hpp"

#include <utility>

namespace fetchd {

DownloadService makeDownloadService(bool log_updates) {
    DownloadService service;
    service.observer = std::make_shared<DownloadObserver>();
    service.subscribers = std::make_shared<SubscriberRegistry>();

    auto broadcaster = std::make_shared<UpdateBroadcaster>();
    broadcaster->add(service.observer);
    broadcaster->add(service.subscribers);
    if (log_updates) {
        broadcaster->add(std::make_shared<LoggingConsumer>());
    }

    service.manager = std::make_unique<DownloadManager>(std::move(broadcaster));
    return service;
}

} // namespace fetchd
