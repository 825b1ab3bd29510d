#pragma once

#include "detail/curl_utils.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace fetchd {

struct ClientOptions {
    std::string user_agent{"fetchd/1.0"};
    std::chrono::seconds connect_timeout{15};
    // A transfer slower than low_speed_limit bytes/s for low_speed_time is
    // treated as a dead connection.
    long low_speed_limit{1};
    std::chrono::seconds low_speed_time{60};
    long max_redirects{10};
    bool verify_tls{true};
};

// Reusable HTTP client shared by many transfers. Owns a libcurl share handle
// so concurrent transfers reuse DNS results and TLS sessions.
class HttpClient {
public:
    explicit HttpClient(ClientOptions options = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Returns a fresh easy handle with the client-wide options applied.
    // The handle must be used by a single thread at a time.
    [[nodiscard]] detail::CurlHandle newHandle() const;

    [[nodiscard]] const ClientOptions& options() const noexcept { return options_; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    ClientOptions options_;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

} // namespace fetchd
