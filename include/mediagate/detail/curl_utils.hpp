#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

namespace mediagate::detail {

// curl_global_init once per process, cleaned up at exit.
void ensureCurlInitialized();

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Throws DownloadError if libcurl cannot allocate a handle.
[[nodiscard]] CurlHandle makeCurlHandle();

// Translates a failed transfer into the error taxonomy:
// connection-level failures are NetworkError, HTTP 429 RateLimitError,
// HTTP 5xx ServerError, 403/404/410 ContentError, the rest DownloadError.
[[noreturn]] void throwCurlError(CURLcode code, long http_status, const std::string& url);

} // namespace mediagate::detail
