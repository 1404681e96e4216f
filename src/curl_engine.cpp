#include "mediagate/curl_engine.hpp"

#include "mediagate/detail/curl_utils.hpp"
#include "mediagate/errors.hpp"
#include "mediagate/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace mediagate {

namespace {

// Last path segment of the URL without query or fragment.
std::string filenameFromUrl(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    const auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        const auto slash = path.find('/', scheme + 3);
        path = (slash == std::string::npos) ? std::string{} : path.substr(slash);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    std::string name = path.substr(path.find_last_of('/') + 1);

    name.erase(std::remove_if(name.begin(), name.end(),
                              [](unsigned char c) { return c == '\\' || c == ':' || std::iscntrl(c); }),
               name.end());
    if (name.empty() || name == "." || name == "..") {
        return "download";
    }
    return name;
}

} // namespace

class CurlEngine::Impl {
public:
    explicit Impl(CurlEngineOptions options) : options_(std::move(options)) {
        detail::ensureCurlInitialized();
    }

    MediaInfo probe(const std::string& url) const {
        auto curl = detail::makeCurlHandle();
        applyCommonOptions(curl.get(), url);
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);

        std::string headers;
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION,
            +[](char* ptr, size_t size, size_t nmemb, std::string* out) -> size_t {
                if (!out) {
                    return 0;
                }
                out->append(ptr, size * nmemb);
                return size * nmemb;
            });
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

        const CURLcode res = curl_easy_perform(curl.get());
        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (res != CURLE_OK) {
            detail::throwCurlError(res, code, url);
        }
        if (code >= 400) {
            detail::throwCurlError(CURLE_HTTP_RETURNED_ERROR, code, url);
        }

        MediaInfo info;
        char* effective = nullptr;
        curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective);
        info.title = filenameFromUrl(effective ? std::string{effective} : url);

        char* content_type = nullptr;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
        info.content_type = content_type ? content_type : "application/octet-stream";

        curl_off_t length = -1;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        // -1 when the server sent no Content-Length
        if (length >= 0) {
            info.content_length = static_cast<std::uint64_t>(length);
        }

        std::string lowered = headers;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        info.supports_range = lowered.find("accept-ranges: bytes") != std::string::npos;
        return info;
    }

    std::filesystem::path download(const DownloadRequest& request,
                                   const std::filesystem::path& work_dir,
                                   const EngineHooks& hooks) const {
        if (request.audio_only) {
            throw DownloadError("audio extraction is not supported by the curl engine");
        }

        const auto destination = work_dir / filenameFromUrl(request.url);
        std::unique_ptr<FILE, FileDeleter> file{std::fopen(destination.c_str(), "wb")};
        if (!file) {
            throw DownloadError(fmt::format("Cannot create destination file {}", destination.string()));
        }

        auto curl = detail::makeCurlHandle();
        TransferContext ctx;
        ctx.curl = curl.get();
        ctx.file = file.get();
        ctx.hooks = &hooks;
        ctx.filename = destination.filename().string();

        applyCommonOptions(curl.get(), request.url);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

        const CURLcode res = curl_easy_perform(curl.get());
        if (ctx.hook_error) {
            std::rethrow_exception(ctx.hook_error);
        }
        if (res != CURLE_OK) {
            long code = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
            detail::throwCurlError(res, code, request.url);
        }
        if (ctx.write_failed) {
            throw DownloadError(fmt::format("Failed to write output file {}", destination.string()));
        }
        if (std::fflush(file.get()) != 0) {
            throw DownloadError(fmt::format("Failed to flush output file {}", destination.string()));
        }
        file.reset();

        if (hooks.on_progress) {
            TransferProgress finished;
            finished.phase = TransferProgress::Phase::Finished;
            finished.filename = ctx.filename;
            finished.downloaded_bytes = static_cast<std::uint64_t>(ctx.written);
            finished.total_bytes = finished.downloaded_bytes;
            hooks.on_progress(finished);
        }
        return destination;
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct TransferContext {
        CURL* curl{nullptr};
        FILE* file{nullptr};
        const EngineHooks* hooks{nullptr};
        std::string filename;
        curl_off_t written{0};
        curl_off_t last_reported{-1};
        bool write_failed{false};
        std::exception_ptr hook_error;
    };

    void applyCommonOptions(CURL* curl, const std::string& url) const {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options_.max_redirects);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.socket_timeout.count()));
        // abort when the transfer stalls below 1 byte/s for socket_timeout
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.socket_timeout.count()));
        if (!options_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx || !ctx->file) {
            return 0;
        }

        const size_t total = size * nmemb;
        const size_t written = std::fwrite(ptr, 1, total, ctx->file);
        if (written != total) {
            ctx->write_failed = true;
        }
        ctx->written += static_cast<curl_off_t>(written);
        return written;
    }

    // Hook exceptions cannot cross libcurl's C frames: park them, abort the
    // transfer, rethrow after curl_easy_perform returns.
    static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
        auto* ctx = static_cast<TransferContext*>(clientp);
        if (!ctx || !ctx->hooks || !ctx->hooks->on_progress) {
            return 0;
        }
        if (dlnow == ctx->last_reported) {
            return 0;
        }
        ctx->last_reported = dlnow;

        TransferProgress progress;
        progress.phase = TransferProgress::Phase::Downloading;
        progress.filename = ctx->filename;
        progress.downloaded_bytes = static_cast<std::uint64_t>(dlnow);
        if (dltotal > 0) {
            progress.total_bytes = static_cast<std::uint64_t>(dltotal);
        }

        curl_off_t speed = 0;
        if (curl_easy_getinfo(ctx->curl, CURLINFO_SPEED_DOWNLOAD_T, &speed) == CURLE_OK && speed > 0) {
            progress.speed = static_cast<double>(speed);
            if (dltotal > dlnow) {
                progress.eta = static_cast<std::int64_t>((dltotal - dlnow) / speed);
            }
        }

        try {
            ctx->hooks->on_progress(progress);
        } catch (...) {
            ctx->hook_error = std::current_exception();
            return 1;
        }
        return 0;
    }

    CurlEngineOptions options_;
};

CurlEngine::CurlEngine(CurlEngineOptions options) : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlEngine::~CurlEngine() = default;

MediaInfo CurlEngine::probe(const std::string& url) { return impl_->probe(url); }

std::filesystem::path CurlEngine::download(const DownloadRequest& request,
                                           const std::filesystem::path& work_dir,
                                           const EngineHooks& hooks) {
    return impl_->download(request, work_dir, hooks);
}

} // namespace mediagate
