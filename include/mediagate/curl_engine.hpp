#pragma once

#include "engine.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace mediagate {

struct CurlEngineOptions {
    // Connect timeout and stall limit. This is what finally stops a worker
    // whose caller has already timed out.
    std::chrono::seconds socket_timeout{30};
    std::string user_agent;
    long max_redirects{10};
};

// Direct-URL engine on libcurl: one GET per download, progress from the
// transfer callback. No format selection or transcoding.
class CurlEngine final : public Engine {
public:
    explicit CurlEngine(CurlEngineOptions options = {});
    ~CurlEngine() override;

    [[nodiscard]] MediaInfo probe(const std::string& url) override;
    std::filesystem::path download(const DownloadRequest& request,
                                   const std::filesystem::path& work_dir,
                                   const EngineHooks& hooks) override;
    [[nodiscard]] std::string name() const override { return "curl"; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mediagate
