#pragma once

#include "download_id.hpp"
#include "download_update.hpp"
#include "error.hpp"
#include "http_transfer.hpp"
#include "transfer_task.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace fetchd {

enum class EntryStatus { Registered, Running, Paused, Completed, Failed };

[[nodiscard]] const char* entryStatusName(EntryStatus status) noexcept;

// Per-identifier result of startAll()/stopAll().
struct BatchOutcome {
    DownloadId id;
    std::optional<Error> error;
};

// Owns every registered download and the task running it, if any.
//
// All operations are thread-safe. One reader/writer lock covers the whole
// registry: mutating operations take it exclusively, queries share it. Lock
// acquisition is unbounded; ErrorCode::LockAcquisition is reserved for a
// bounded wait that does not exist yet.
//
// Operations throw fetchd::Error. Failures inside a spawned transfer are
// reported through the update consumer only.
class DownloadManager {
public:
    explicit DownloadManager(UpdateConsumerPtr consumer = nullptr);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    DownloadId add(HttpTransferPtr transfer);

    // Downloads from byte zero. Returns once the task is spawned.
    void start(const DownloadId& id);
    // Cancels the running task and waits for it to flush and exit.
    void stop(const DownloadId& id);
    // Continues a paused or failed download from the bytes already on disk.
    void resume(const DownloadId& id);
    // Refuses while running. The entry is gone even if removing the file fails.
    void remove(const DownloadId& id, bool remove_file);

    [[nodiscard]] DownloadMetadata metadata(const DownloadId& id) const;
    [[nodiscard]] std::vector<DownloadMetadata> metadataAll() const;
    // Read-only while the task runs; takes the write lock only to join a
    // task that has already ended.
    [[nodiscard]] EntryStatus status(const DownloadId& id);
    [[nodiscard]] std::size_t size() const;

    std::vector<BatchOutcome> startAll();
    std::vector<BatchOutcome> stopAll();

private:
    struct Entry {
        HttpTransferPtr transfer;
        std::unique_ptr<TransferTask> task;
        EntryStatus status{EntryStatus::Registered};
    };

    using Registry = std::unordered_map<DownloadId, Entry>;

    Entry& find(const DownloadId& id);
    const Entry& find(const DownloadId& id) const;

    void spawn(const DownloadId& id, Entry& entry, std::uint64_t resume_offset);
    void startLocked(const DownloadId& id, Entry& entry);
    void resumeLocked(const DownloadId& id, Entry& entry);
    // Joins a task whose thread already returned. Caller holds the write lock.
    void reapIfFinished(const DownloadId& id, Entry& entry);
    // Joins the task and records how the run ended. Throws TaskJoinError if
    // `surface_crash` is set and the task crashed.
    void finish(const DownloadId& id, Entry& entry, bool surface_crash);

    void publish(const DownloadId& id, DownloadState state, bool removed = false) const;

    UpdateConsumerPtr consumer_;
    mutable std::shared_mutex mutex_;
    Registry registry_;
};

} // namespace fetchd
