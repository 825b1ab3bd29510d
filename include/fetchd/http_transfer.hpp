#pragma once

#include "cancel_token.hpp"
#include "download_id.hpp"
#include "download_state.hpp"
#include "http_client.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace fetchd {

struct TransferOptions {
    // Minimum spacing between two Downloading updates. The file is flushed
    // right before each one.
    std::chrono::milliseconds progress_interval{250};
    std::size_t buffer_size{64 * 1024};
};

// Serializable description of a registered download.
struct DownloadMetadata {
    DownloadId id;
    std::string url;
    std::string file_path;
    std::optional<std::uint64_t> size_hint;
};

// Result of a HEAD request against the download's url.
struct ProbeResult {
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
};

// One resumable HTTP download into a single destination file.
//
// run() is meant to be called from one task at a time; all accessors are
// safe to call concurrently with a running transfer.
class HttpTransfer {
public:
    using Emit = std::function<void(const DownloadState&)>;

    // Validates the arguments and prepares the destination path. Performs no
    // network I/O. Throws Error{InvalidArgument} on bad input.
    [[nodiscard]] static std::shared_ptr<HttpTransfer> create(const std::string& url,
                                                              const std::filesystem::path& destination_dir,
                                                              const std::string& file_name, HttpClientPtr client,
                                                              std::optional<std::uint64_t> resume_offset = std::nullopt,
                                                              TransferOptions options = {});

    ~HttpTransfer();

    HttpTransfer(const HttpTransfer&) = delete;
    HttpTransfer& operator=(const HttpTransfer&) = delete;

    // Downloads the resource, starting at resume_offset when it is non-zero.
    //
    // Emits Downloading updates at most every progress_interval, then exactly
    // one of Paused (cancelled), Completed or Failed. Returns the byte count
    // on disk for Paused and Completed; throws Error{TransferError} after
    // emitting Failed.
    std::uint64_t run(const CancelToken& cancel, std::uint64_t resume_offset, const Emit& emit);

    // HEAD request; records Content-Length as the size hint when present.
    ProbeResult probe();

    [[nodiscard]] const std::string& url() const noexcept;
    [[nodiscard]] const std::filesystem::path& filePath() const noexcept;
    [[nodiscard]] std::optional<std::uint64_t> totalSize() const;
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept;
    [[nodiscard]] bool isComplete() const noexcept;
    [[nodiscard]] DownloadMetadata metadata(const DownloadId& id) const;

private:
    class Impl;

    explicit HttpTransfer(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

using HttpTransferPtr = std::shared_ptr<HttpTransfer>;

} // namespace fetchd
