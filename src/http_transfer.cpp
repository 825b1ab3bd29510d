#include "fetchd/http_transfer.hpp"

#include "fetchd/error.hpp"
#include "fetchd/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <exception>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

#include <curl/curl.h>
#include <unistd.h>

namespace fetchd {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

struct ContentRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::optional<std::uint64_t> total;
};

bool startsWithNoCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<std::uint64_t> parseNumber(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (const char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

// "bytes <start>-<end>/<total|*>"
std::optional<ContentRange> parseContentRange(std::string_view value) {
    value = trim(value);
    if (!startsWithNoCase(value, "bytes ")) {
        return std::nullopt;
    }
    value.remove_prefix(6);

    const auto dash = value.find('-');
    const auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    const auto start = parseNumber(trim(value.substr(0, dash)));
    const auto end = parseNumber(trim(value.substr(dash + 1, slash - dash - 1)));
    if (!start || !end) {
        return std::nullopt;
    }

    ContentRange range{*start, *end, std::nullopt};
    const auto total = trim(value.substr(slash + 1));
    if (total != "*") {
        range.total = parseNumber(total);
    }
    return range;
}

// "bytes */<total>", sent with 416 Range Not Satisfiable.
std::optional<std::uint64_t> parseUnsatisfiedRange(std::string_view value) {
    value = trim(value);
    if (!startsWithNoCase(value, "bytes ")) {
        return std::nullopt;
    }
    value = trim(value.substr(6));
    if (value.substr(0, 2) != "*/") {
        return std::nullopt;
    }
    return parseNumber(trim(value.substr(2)));
}

void validateUrl(const std::string& url) {
    detail::CurlUrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        throw std::runtime_error("Failed to allocate curl url handle");
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        throw Error(ErrorCode::InvalidArgument, fmt::format("invalid url '{}'", url));
    }

    char* scheme = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_SCHEME, &scheme, 0) != CURLUE_OK || !scheme) {
        throw Error(ErrorCode::InvalidArgument, fmt::format("url '{}' has no scheme", url));
    }
    const std::string scheme_str{scheme};
    curl_free(scheme);

    if (scheme_str != "http" && scheme_str != "https") {
        throw Error(ErrorCode::InvalidArgument, fmt::format("unsupported scheme '{}' in '{}'", scheme_str, url));
    }
}

void validateFileName(const std::string& file_name) {
    if (file_name.empty() || file_name == "." || file_name == "..") {
        throw Error(ErrorCode::InvalidArgument, fmt::format("invalid file name '{}'", file_name));
    }
    if (file_name.find('/') != std::string::npos || file_name.find('\0') != std::string::npos) {
        throw Error(ErrorCode::InvalidArgument, fmt::format("file name '{}' must not contain a path", file_name));
    }
}

} // namespace

class HttpTransfer::Impl {
public:
    Impl(std::string url, std::filesystem::path file_path, HttpClientPtr client, std::uint64_t bytes_written,
         TransferOptions options)
        : url_(std::move(url)),
          file_path_(std::move(file_path)),
          client_(std::move(client)),
          options_(options),
          bytes_written_(bytes_written) {}

    std::uint64_t run(const CancelToken& cancel, std::uint64_t resume_offset, const Emit& emit) {
        std::unique_lock<std::mutex> run_lock(run_mutex_, std::try_to_lock);
        if (!run_lock.owns_lock()) {
            throw Error(ErrorCode::AlreadyRunning, fmt::format("{} is already transferring", file_path_.string()));
        }

        complete_.store(false);
        RunContext ctx{this, &cancel, &emit};
        ctx.written = resume_offset;

        ctx.file = openDestination(ctx, resume_offset);
        ctx.offset = resume_offset;
        ctx.written = resume_offset;
        bytes_written_.store(resume_offset);

        auto curl = client_->newHandle();
        char error_buffer[CURL_ERROR_SIZE] = {0};
        ctx.curl = curl.get();

        curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::xferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

        std::string range;
        if (resume_offset > 0) {
            range = fmt::format("{}-", resume_offset);
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }

        logDebug("GET {} into {} from byte {}", url_, file_path_.string(), resume_offset);
        const CURLcode res = curl_easy_perform(curl.get());

        // Whatever happened, the bytes handed to fwrite are made visible on
        // disk before the count is published.
        const bool flushed = std::fflush(ctx.file.get()) == 0;

        if (ctx.exception) {
            bytes_written_.store(flushed ? ctx.written : bytes_written_.load());
            std::rethrow_exception(ctx.exception);
        }
        if (!flushed) {
            fail(ctx, fmt::format("failed to flush {}", file_path_.string()));
        }
        if (!ctx.failure.empty()) {
            if (ctx.mismatch) {
                resetToZero(ctx);
            }
            fail(ctx, ctx.failure);
        }

        if (res == CURLE_ABORTED_BY_CALLBACK && cancel.isCancelled()) {
            return pause(ctx);
        }

        if (res == CURLE_HTTP_RETURNED_ERROR) {
            long code = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
            if (code == 416 && resume_offset > 0 && endsAt(ctx, resume_offset)) {
                // Nothing left to fetch.
                return complete(ctx);
            }
            fail(ctx, fmt::format("server answered HTTP {}", code));
        }

        if (res != CURLE_OK) {
            const std::string message = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
            fail(ctx, fmt::format("curl error: {}", message));
        }

        if (!ctx.validated && !validateResponse(ctx)) {
            resetToZero(ctx);
            fail(ctx, ctx.failure);
        }

        const auto total = totalSize();
        if (total && ctx.written != *total) {
            fail(ctx, fmt::format("download incomplete: {} of {} bytes", ctx.written, *total));
        }

        return complete(ctx);
    }

    ProbeResult probe() {
        ProbeResult result;
        auto curl = client_->newHandle();

        curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

        std::string headers;
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION,
                         +[](char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
                             auto* out = static_cast<std::string*>(userdata);
                             if (!out) {
                                 return 0;
                             }
                             out->append(ptr, size * nmemb);
                             return size * nmemb;
                         });
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throw Error(ErrorCode::TransferError,
                        fmt::format("HEAD {} failed: {}", url_, curl_easy_strerror(res)));
        }

        curl_off_t length = -1;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        if (length >= 0) {
            result.content_length = static_cast<std::uint64_t>(length);
            std::lock_guard<std::mutex> lock(state_mutex_);
            total_size_ = result.content_length;
        }

        std::string_view rest{headers};
        while (!rest.empty()) {
            const auto eol = rest.find('\n');
            const auto line = trim(rest.substr(0, eol));
            if (startsWithNoCase(line, "accept-ranges:") &&
                trim(line.substr(14)).find("bytes") != std::string_view::npos) {
                result.accepts_ranges = true;
            }
            if (eol == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(eol + 1);
        }

        return result;
    }

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return file_path_; }

    [[nodiscard]] std::optional<std::uint64_t> totalSize() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return total_size_;
    }

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytes_written_.load(); }
    [[nodiscard]] bool isComplete() const noexcept { return complete_.load(); }

private:
    struct RunContext {
        Impl* owner{nullptr};
        const CancelToken* cancel{nullptr};
        const Emit* emit{nullptr};
        CURL* curl{nullptr};
        FilePtr file;

        std::uint64_t offset{0};
        // Bytes in the destination file, including ones not flushed yet.
        std::uint64_t written{0};
        std::chrono::steady_clock::time_point last_report;

        std::string content_range;
        bool validated{false};
        bool mismatch{false};
        std::string failure;
        std::exception_ptr exception;
    };

    FilePtr openDestination(RunContext& ctx, std::uint64_t& resume_offset) {
        if (resume_offset == 0) {
            FilePtr file{std::fopen(file_path_.c_str(), "wb")};
            if (!file) {
                fail(ctx, fmt::format("cannot create {}", file_path_.string()));
            }
            return file;
        }

        std::error_code ec;
        const auto on_disk = std::filesystem::file_size(file_path_, ec);
        if (ec) {
            fail(ctx, fmt::format("cannot resume {}: {}", file_path_.string(), ec.message()));
        }
        if (on_disk < resume_offset) {
            logWarn("{} holds {} bytes, resuming from there instead of {}", file_path_.string(), on_disk,
                    resume_offset);
            resume_offset = on_disk;
        }

        FilePtr file{std::fopen(file_path_.c_str(), "r+b")};
        if (!file) {
            fail(ctx, fmt::format("cannot open {}", file_path_.string()));
        }
        // Drop anything past the last reported byte so the range lines up.
        if (ftruncate(fileno(file.get()), static_cast<off_t>(resume_offset)) == -1 ||
            fseeko(file.get(), static_cast<off_t>(resume_offset), SEEK_SET) != 0) {
            fail(ctx, fmt::format("cannot position {} at byte {}", file_path_.string(), resume_offset));
        }
        return file;
    }

    bool validateResponse(RunContext& ctx) {
        long code = 0;
        curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &code);
        curl_off_t length = -1;
        curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

        std::optional<std::uint64_t> total;
        if (ctx.offset > 0) {
            const auto range = code == 206 ? parseContentRange(ctx.content_range) : std::nullopt;
            if (!range || range->start != ctx.offset) {
                ctx.mismatch = true;
                ctx.failure = code == 206
                                  ? fmt::format("resume mismatch: asked for byte {}, got range '{}'", ctx.offset,
                                                ctx.content_range)
                                  : fmt::format("resume mismatch: asked for byte {}, server answered HTTP {}",
                                                ctx.offset, code);
                return false;
            }
            if (range->total) {
                total = range->total;
            } else if (length >= 0) {
                total = ctx.offset + static_cast<std::uint64_t>(length);
            }
        } else if (code == 206) {
            const auto range = parseContentRange(ctx.content_range);
            total = range ? range->total : std::nullopt;
        } else if (length >= 0) {
            total = static_cast<std::uint64_t>(length);
        }

        if (total) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            total_size_ = total;
        }
        ctx.validated = true;
        ctx.last_report = std::chrono::steady_clock::now();
        (*ctx.emit)(state::Downloading{ctx.written, total});
        return true;
    }

    // Flushes and publishes progress when the report interval has elapsed.
    bool maybeReport(RunContext& ctx) {
        const auto now = std::chrono::steady_clock::now();
        if (now - ctx.last_report < options_.progress_interval) {
            return true;
        }
        if (std::fflush(ctx.file.get()) != 0) {
            ctx.failure = fmt::format("failed to flush {}", file_path_.string());
            return false;
        }
        bytes_written_.store(ctx.written);
        ctx.last_report = now;
        (*ctx.emit)(state::Downloading{ctx.written, totalSize()});
        return true;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<RunContext*>(userdata);
        if (!ctx || !ctx->owner) {
            return 0;
        }

        Impl& self = *ctx->owner;
        const size_t total = size * nmemb;
        try {
            if (!ctx->validated && !self.validateResponse(*ctx)) {
                return 0;
            }

            const size_t written = std::fwrite(ptr, 1, total, ctx->file.get());
            ctx->written += written;
            if (written != total) {
                ctx->failure = fmt::format("failed to write {}", self.file_path_.string());
                return written;
            }

            if (!self.maybeReport(*ctx)) {
                return 0;
            }
        } catch (...) {
            // Exceptions must not unwind through libcurl; rethrown after perform.
            ctx->exception = std::current_exception();
            return 0;
        }
        return total;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ctx = static_cast<RunContext*>(userdata);
        const size_t total = size * nitems;
        const std::string_view line{buffer, total};

        if (startsWithNoCase(line, "HTTP/")) {
            // A new response (e.g. after a redirect) starts over.
            ctx->content_range.clear();
        } else if (startsWithNoCase(line, "content-range:")) {
            ctx->content_range = std::string{trim(line.substr(14))};
        }
        return total;
    }

    static int xferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const auto* ctx = static_cast<RunContext*>(clientp);
        return ctx->cancel->isCancelled() ? 1 : 0;
    }

    // Whether the resource is known to end exactly at `offset`. An unknown
    // total is taken from the 416 Content-Range, or else from a HEAD request.
    bool endsAt(const RunContext& ctx, std::uint64_t offset) {
        auto total = totalSize();
        if (!total) {
            total = parseUnsatisfiedRange(ctx.content_range);
        }
        if (!total) {
            try {
                total = probe().content_length;
            } catch (const Error& e) {
                logWarn("could not size {}: {}", url_, e.what());
            }
        }
        return total && *total == offset;
    }

    std::uint64_t pause(RunContext& ctx) {
        bytes_written_.store(ctx.written);
        ctx.file.reset();
        logInfo("paused {} at byte {}", file_path_.string(), ctx.written);
        (*ctx.emit)(state::Paused{ctx.written});
        return ctx.written;
    }

    std::uint64_t complete(RunContext& ctx) {
        bytes_written_.store(ctx.written);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            total_size_ = ctx.written;
        }
        complete_.store(true);
        ctx.file.reset();
        logInfo("completed {} ({} bytes)", file_path_.string(), ctx.written);
        (*ctx.emit)(state::Completed{ctx.written});
        return ctx.written;
    }

    // The server cannot continue where we stopped; the next run starts over.
    void resetToZero(RunContext& ctx) {
        if (ctx.file) {
            if (ftruncate(fileno(ctx.file.get()), 0) == -1) {
                logWarn("cannot truncate {}", file_path_.string());
            }
        }
        ctx.written = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            total_size_.reset();
        }
    }

    [[noreturn]] void fail(RunContext& ctx, const std::string& reason) {
        bytes_written_.store(ctx.written);
        ctx.file.reset();
        logError("{} failed: {}", url_, reason);
        (*ctx.emit)(state::Failed{reason});
        throw Error(ErrorCode::TransferError, reason);
    }

    const std::string url_;
    const std::filesystem::path file_path_;
    const HttpClientPtr client_;
    const TransferOptions options_;

    std::mutex run_mutex_;
    mutable std::mutex state_mutex_;
    std::optional<std::uint64_t> total_size_;
    std::atomic<std::uint64_t> bytes_written_{0};
    std::atomic<bool> complete_{false};
};

std::shared_ptr<HttpTransfer> HttpTransfer::create(const std::string& url, const std::filesystem::path& destination_dir,
                                                   const std::string& file_name, HttpClientPtr client,
                                                   std::optional<std::uint64_t> resume_offset,
                                                   TransferOptions options) {
    if (!client) {
        throw Error(ErrorCode::InvalidArgument, "http client is required");
    }
    validateUrl(url);
    validateFileName(file_name);

    std::error_code ec;
    if (!std::filesystem::is_directory(destination_dir, ec)) {
        throw Error(ErrorCode::InvalidArgument,
                    fmt::format("destination '{}' is not a directory", destination_dir.string()));
    }

    auto file_path = destination_dir / file_name;
    std::uint64_t offset = resume_offset.value_or(0);
    if (offset > 0) {
        const auto on_disk = std::filesystem::file_size(file_path, ec);
        if (ec || on_disk < offset) {
            throw Error(ErrorCode::InvalidArgument,
                        fmt::format("cannot resume {} at byte {}: only {} bytes on disk", file_path.string(), offset,
                                    ec ? 0 : on_disk));
        }
    }

    return std::shared_ptr<HttpTransfer>(
        new HttpTransfer(std::make_unique<Impl>(url, std::move(file_path), std::move(client), offset, options)));
}

HttpTransfer::HttpTransfer(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

HttpTransfer::~HttpTransfer() = default;

std::uint64_t HttpTransfer::run(const CancelToken& cancel, std::uint64_t resume_offset, const Emit& emit) {
    return impl_->run(cancel, resume_offset, emit);
}

ProbeResult HttpTransfer::probe() { return impl_->probe(); }

const std::string& HttpTransfer::url() const noexcept { return impl_->url(); }

const std::filesystem::path& HttpTransfer::filePath() const noexcept { return impl_->filePath(); }

std::optional<std::uint64_t> HttpTransfer::totalSize() const { return impl_->totalSize(); }

std::uint64_t HttpTransfer::bytesWritten() const noexcept { return impl_->bytesWritten(); }

bool HttpTransfer::isComplete() const noexcept { return impl_->isComplete(); }

DownloadMetadata HttpTransfer::metadata(const DownloadId& id) const {
    return {id, impl_->url(), impl_->filePath().string(), impl_->totalSize()};
}

} // namespace fetchd
