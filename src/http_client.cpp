#include "fetchd/http_client.hpp"

#include <array>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace fetchd {

class HttpClient::Impl {
public:
    Impl() : share_(curl_share_init(), &curl_share_cleanup) {
        if (!share_) {
            throw std::runtime_error("Failed to allocate curl share handle");
        }
        curl_share_setopt(share_.get(), CURLSHOPT_LOCKFUNC, &Impl::lock);
        curl_share_setopt(share_.get(), CURLSHOPT_UNLOCKFUNC, &Impl::unlock);
        curl_share_setopt(share_.get(), CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    }

    [[nodiscard]] CURLSH* share() const noexcept { return share_.get(); }

private:
    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<Impl*>(userptr)->mutexFor(data).lock();
    }

    static void unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<Impl*>(userptr)->mutexFor(data).unlock();
    }

    std::mutex& mutexFor(curl_lock_data data) {
        const auto index = static_cast<std::size_t>(data);
        return mutexes_[index < mutexes_.size() ? index : 0];
    }

    std::unique_ptr<CURLSH, decltype(&curl_share_cleanup)> share_;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> mutexes_;
};

HttpClient::HttpClient(ClientOptions options) : options_(std::move(options)) {
    detail::ensureCurlInitialized();
    impl_ = std::make_unique<Impl>();
}

// Every easy handle created from this client must be gone before the share
// handle is cleaned up; transfers keep the client alive through HttpClientPtr.
HttpClient::~HttpClient() = default;

detail::CurlHandle HttpClient::newHandle() const {
    auto curl = detail::makeCurlHandle();
    CURL* handle = curl.get();

    curl_easy_setopt(handle, CURLOPT_SHARE, impl_->share());
    curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, options_.max_redirects);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, options_.low_speed_limit);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.low_speed_time.count()));
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    return curl;
}

} // namespace fetchd
