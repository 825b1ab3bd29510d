#pragma once

#include <memory>

#include <curl/curl.h>

namespace fetchd::detail {

// Runs curl_global_init exactly once per process and registers the matching
// cleanup at exit. Throws std::runtime_error if libcurl cannot initialise.
void ensureCurlInitialized();

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

[[nodiscard]] CurlHandle makeCurlHandle();

} // namespace fetchd::detail
