#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace fetchd {

namespace state {

struct Paused {
    std::uint64_t bytes_downloaded{0};

    friend bool operator==(const Paused& a, const Paused& b) { return a.bytes_downloaded == b.bytes_downloaded; }
    friend bool operator!=(const Paused& a, const Paused& b) { return !(a == b); }
};

struct Downloading {
    std::uint64_t bytes_downloaded{0};
    std::optional<std::uint64_t> total_size;

    friend bool operator==(const Downloading& a, const Downloading& b) {
        return a.bytes_downloaded == b.bytes_downloaded && a.total_size == b.total_size;
    }
    friend bool operator!=(const Downloading& a, const Downloading& b) { return !(a == b); }
};

struct Completed {
    std::uint64_t total_bytes{0};

    friend bool operator==(const Completed& a, const Completed& b) { return a.total_bytes == b.total_bytes; }
    friend bool operator!=(const Completed& a, const Completed& b) { return !(a == b); }
};

struct Failed {
    std::string reason;

    friend bool operator==(const Failed& a, const Failed& b) { return a.reason == b.reason; }
    friend bool operator!=(const Failed& a, const Failed& b) { return !(a == b); }
};

} // namespace state

using DownloadState = std::variant<state::Paused, state::Downloading, state::Completed, state::Failed>;

// Helper for exhaustive std::visit over DownloadState.
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Bytes known to be on disk for the given state.
[[nodiscard]] std::uint64_t bytesDownloaded(const DownloadState& state) noexcept;

[[nodiscard]] const char* stateName(const DownloadState& state) noexcept;

} // namespace fetchd
