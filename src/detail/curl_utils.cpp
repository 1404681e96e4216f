#include "mediagate/detail/curl_utils.hpp"

#include "mediagate/errors.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

namespace mediagate::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw DownloadError("Failed to allocate curl handle");
    }
    return curl;
}

void throwCurlError(CURLcode code, long http_status, const std::string& url) {
    if (code == CURLE_HTTP_RETURNED_ERROR || http_status >= 400) {
        const std::string message = fmt::format("HTTP {} from {}", http_status, url);
        if (http_status == 429) {
            throw RateLimitError(message);
        }
        if (http_status >= 500) {
            throw ServerError(message);
        }
        if (http_status == 403 || http_status == 404 || http_status == 410) {
            throw ContentError(fmt::format("content unavailable: {}", message));
        }
        throw DownloadError(message);
    }

    const std::string message = fmt::format("curl error: {} ({})", curl_easy_strerror(code), url);
    switch (code) {
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_PARTIAL_FILE:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_SSL_CONNECT_ERROR:
        throw NetworkError(message);
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
        throw ExtractionError(fmt::format("unsupported or invalid URL: {}", url));
    default:
        throw DownloadError(message);
    }
}

} // namespace mediagate::detail
