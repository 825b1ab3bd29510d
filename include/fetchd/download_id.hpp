#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace fetchd {

// Opaque identifier assigned by the manager when a transfer is registered.
class DownloadId {
public:
    DownloadId() = default;
    explicit DownloadId(std::string value) : value_(std::move(value)) {}

    // Random UUID v4 string.
    [[nodiscard]] static DownloadId generate();

    [[nodiscard]] const std::string& str() const noexcept { return value_; }
    [[nodiscard]] bool empty() const noexcept { return value_.empty(); }

    friend bool operator==(const DownloadId& lhs, const DownloadId& rhs) noexcept {
        return lhs.value_ == rhs.value_;
    }
    friend bool operator!=(const DownloadId& lhs, const DownloadId& rhs) noexcept {
        return !(lhs == rhs);
    }
    friend bool operator<(const DownloadId& lhs, const DownloadId& rhs) noexcept {
        return lhs.value_ < rhs.value_;
    }

private:
    std::string value_;
};

} // namespace fetchd

template <>
struct std::hash<fetchd::DownloadId> {
    std::size_t operator()(const fetchd::DownloadId& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};

template <>
struct fmt::formatter<fetchd::DownloadId> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const fetchd::DownloadId& id, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(id.str(), ctx);
    }
};
