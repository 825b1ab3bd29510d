#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace fetchd {

enum class ErrorCode {
    NotFound,
    AlreadyRunning,
    DownloadNotRunning,
    NotPaused,
    TransferError,
    TaskJoinError,
    // Reserved for a bounded-wait registry lock. Registry locking is unbounded
    // today, so nothing produces this code yet.
    LockAcquisition,
    InvalidArgument,
    IoError,
};

// Stable snake_case name, safe to hand to API clients.
[[nodiscard]] std::string_view errorCodeName(ErrorCode code) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace fetchd
