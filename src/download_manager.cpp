#include "fetchd/download_manager.hpp"

#include "fetchd/log.hpp"

#include <filesystem>
#include <mutex>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace fetchd {

const char* entryStatusName(EntryStatus status) noexcept {
    switch (status) {
    case EntryStatus::Registered:
        return "registered";
    case EntryStatus::Running:
        return "running";
    case EntryStatus::Paused:
        return "paused";
    case EntryStatus::Completed:
        return "completed";
    case EntryStatus::Failed:
        return "failed";
    }
    return "unknown";
}

DownloadManager::DownloadManager(UpdateConsumerPtr consumer) : consumer_(std::move(consumer)) {}

DownloadManager::~DownloadManager() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& [id, entry] : registry_) {
        if (entry.task) {
            entry.task->cancel();
        }
    }
    for (auto& [id, entry] : registry_) {
        if (entry.task) {
            finish(id, entry, false);
        }
    }
}

DownloadId DownloadManager::add(HttpTransferPtr transfer) {
    if (!transfer) {
        throw Error(ErrorCode::InvalidArgument, "cannot add an empty transfer");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    DownloadId id = DownloadId::generate();
    while (registry_.count(id) != 0) {
        id = DownloadId::generate();
    }

    const auto bytes = transfer->bytesWritten();
    logInfo("registered {} as {}", transfer->url(), id);
    registry_.emplace(id, Entry{std::move(transfer), nullptr, EntryStatus::Registered});
    publish(id, state::Paused{bytes});
    return id;
}

void DownloadManager::start(const DownloadId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& entry = find(id);
    reapIfFinished(id, entry);
    startLocked(id, entry);
}

void DownloadManager::stop(const DownloadId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& entry = find(id);
    if (!entry.task) {
        throw Error(ErrorCode::DownloadNotRunning, fmt::format("download {} is not running", id));
    }

    if (entry.task->isFinished()) {
        // The run ended on its own; only a crash is worth reporting.
        finish(id, entry, true);
        throw Error(ErrorCode::DownloadNotRunning, fmt::format("download {} is not running", id));
    }

    entry.task->cancel();
    finish(id, entry, true);
}

void DownloadManager::resume(const DownloadId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& entry = find(id);
    reapIfFinished(id, entry);
    resumeLocked(id, entry);
}

void DownloadManager::remove(const DownloadId& id, bool remove_file) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& entry = find(id);
    reapIfFinished(id, entry);
    if (entry.task) {
        throw Error(ErrorCode::AlreadyRunning, fmt::format("download {} is running; stop it first", id));
    }

    const auto path = entry.transfer->filePath();
    registry_.erase(id);
    publish(id, state::Paused{0}, true);
    logInfo("removed {}", id);

    if (remove_file) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            throw Error(ErrorCode::IoError, fmt::format("cannot remove {}: {}", path.string(), ec.message()));
        }
    }
}

DownloadMetadata DownloadManager::metadata(const DownloadId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return find(id).transfer->metadata(id);
}

std::vector<DownloadMetadata> DownloadManager::metadataAll() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<DownloadMetadata> result;
    result.reserve(registry_.size());
    for (const auto& [id, entry] : registry_) {
        result.push_back(entry.transfer->metadata(id));
    }
    return result;
}

EntryStatus DownloadManager::status(const DownloadId& id) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto& entry = find(id);
        if (!entry.task || !entry.task->isFinished()) {
            return entry.status;
        }
    }

    // The task has ended; joining it needs the write lock. The entry may have
    // changed or gone in between, so look again.
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& entry = find(id);
    reapIfFinished(id, entry);
    return entry.status;
}

std::size_t DownloadManager::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return registry_.size();
}

std::vector<BatchOutcome> DownloadManager::startAll() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<BatchOutcome> outcomes;
    outcomes.reserve(registry_.size());

    for (auto& [id, entry] : registry_) {
        try {
            reapIfFinished(id, entry);
            if (entry.status == EntryStatus::Completed) {
                continue;
            }
            if (entry.task) {
                throw Error(ErrorCode::AlreadyRunning, fmt::format("download {} is already running", id));
            }
            spawn(id, entry, entry.transfer->bytesWritten());
            outcomes.push_back({id, std::nullopt});
        } catch (const Error& e) {
            logWarn("start of {} failed: {}", id, e.what());
            outcomes.push_back({id, e});
        }
    }
    return outcomes;
}

std::vector<BatchOutcome> DownloadManager::stopAll() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<BatchOutcome> outcomes;
    outcomes.reserve(registry_.size());

    // Runs that already ended on their own are not running, same as stop().
    std::unordered_set<DownloadId> ended;
    for (const auto& [id, entry] : registry_) {
        if (entry.task && entry.task->isFinished()) {
            ended.insert(id);
        }
    }

    // Signal everything first so the transfers wind down in parallel.
    for (auto& [id, entry] : registry_) {
        if (entry.task && ended.count(id) == 0) {
            entry.task->cancel();
        }
    }

    for (auto& [id, entry] : registry_) {
        try {
            if (!entry.task) {
                throw Error(ErrorCode::DownloadNotRunning, fmt::format("download {} is not running", id));
            }
            finish(id, entry, true);
            if (ended.count(id) != 0) {
                throw Error(ErrorCode::DownloadNotRunning, fmt::format("download {} is not running", id));
            }
            outcomes.push_back({id, std::nullopt});
        } catch (const Error& e) {
            outcomes.push_back({id, e});
        }
    }
    return outcomes;
}

DownloadManager::Entry& DownloadManager::find(const DownloadId& id) {
    const auto it = registry_.find(id);
    if (it == registry_.end()) {
        throw Error(ErrorCode::NotFound, fmt::format("no download with id {}", id));
    }
    return it->second;
}

const DownloadManager::Entry& DownloadManager::find(const DownloadId& id) const {
    const auto it = registry_.find(id);
    if (it == registry_.end()) {
        throw Error(ErrorCode::NotFound, fmt::format("no download with id {}", id));
    }
    return it->second;
}

void DownloadManager::spawn(const DownloadId& id, Entry& entry, std::uint64_t resume_offset) {
    // Published before the thread exists so it precedes every update the run emits.
    publish(id, state::Downloading{resume_offset, entry.transfer->totalSize()});

    auto emit = [consumer = consumer_, id](const DownloadState& state) {
        if (consumer) {
            consumer->consume(DownloadUpdate{id, state});
        }
    };

    try {
        entry.task = std::make_unique<TransferTask>(entry.transfer, resume_offset, std::move(emit));
    } catch (const std::system_error& e) {
        entry.status = EntryStatus::Failed;
        publish(id, state::Failed{fmt::format("cannot spawn transfer: {}", e.what())});
        throw Error(ErrorCode::TaskJoinError, fmt::format("cannot spawn transfer for {}: {}", id, e.what()));
    }

    entry.status = EntryStatus::Running;
    logInfo("{} {} from byte {}", resume_offset > 0 ? "resumed" : "started", id, resume_offset);
}

void DownloadManager::startLocked(const DownloadId& id, Entry& entry) {
    if (entry.task) {
        throw Error(ErrorCode::AlreadyRunning, fmt::format("download {} is already running", id));
    }
    spawn(id, entry, 0);
}

void DownloadManager::resumeLocked(const DownloadId& id, Entry& entry) {
    if (entry.task) {
        throw Error(ErrorCode::AlreadyRunning, fmt::format("download {} is already running", id));
    }
    if (entry.status == EntryStatus::Completed) {
        throw Error(ErrorCode::NotPaused, fmt::format("download {} is {}, not paused", id, entryStatusName(entry.status)));
    }
    spawn(id, entry, entry.transfer->bytesWritten());
}

void DownloadManager::reapIfFinished(const DownloadId& id, Entry& entry) {
    if (entry.task && entry.task->isFinished()) {
        finish(id, entry, false);
    }
}

void DownloadManager::finish(const DownloadId& id, Entry& entry, bool surface_crash) {
    const TaskOutcome outcome = entry.task->join();
    entry.task.reset();

    switch (outcome.kind) {
    case TaskOutcome::Kind::Completed:
        entry.status = EntryStatus::Completed;
        break;
    case TaskOutcome::Kind::Paused:
        entry.status = EntryStatus::Paused;
        break;
    case TaskOutcome::Kind::Failed:
        entry.status = EntryStatus::Failed;
        logWarn("download {} failed: {}", id, outcome.message);
        break;
    case TaskOutcome::Kind::Crashed:
        entry.status = EntryStatus::Failed;
        logError("transfer task for {} crashed: {}", id, outcome.message);
        if (surface_crash) {
            throw Error(ErrorCode::TaskJoinError, fmt::format("transfer task for {} crashed: {}", id, outcome.message));
        }
        break;
    }
}

void DownloadManager::publish(const DownloadId& id, DownloadState state, bool removed) const {
    if (consumer_) {
        consumer_->consume(DownloadUpdate{id, std::move(state), removed});
    }
}

} // namespace fetchd
