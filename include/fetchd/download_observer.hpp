#pragma once

#include "download_update.hpp"

#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace fetchd {

// Keeps the last known state of every download it has seen.
//
// Each run emits its updates from a single thread and the manager never
// overlaps two runs of the same download, so applying updates under one short
// lock preserves per-download emission order.
class DownloadObserver final : public UpdateConsumer {
public:
    using StateMap = std::unordered_map<DownloadId, DownloadState>;

    void consume(const DownloadUpdate& update) override;

    // Seeds or overwrites the state of `id`.
    void track(const DownloadId& id, DownloadState state);
    void untrack(const DownloadId& id);

    [[nodiscard]] std::optional<DownloadState> state(const DownloadId& id) const;
    [[nodiscard]] StateMap stateAll() const;

private:
    mutable std::shared_mutex mutex_;
    StateMap states_;
};

} // namespace fetchd
