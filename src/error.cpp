#include "fetchd/error.hpp"

namespace fetchd {

std::string_view errorCodeName(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::NotFound:
        return "not_found";
    case ErrorCode::AlreadyRunning:
        return "already_running";
    case ErrorCode::DownloadNotRunning:
        return "download_not_running";
    case ErrorCode::NotPaused:
        return "not_paused";
    case ErrorCode::TransferError:
        return "transfer_error";
    case ErrorCode::TaskJoinError:
        return "task_join_error";
    case ErrorCode::LockAcquisition:
        return "lock_acquisition";
    case ErrorCode::InvalidArgument:
        return "invalid_argument";
    case ErrorCode::IoError:
        return "io_error";
    }
    return "unknown";
}

Error::Error(ErrorCode code, const std::string& message) : std::runtime_error(message), code_(code) {}

} // namespace fetchd
