#pragma once

#include "progress.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mediagate {

struct DownloadRequest {
    std::string url;
    std::string format_id{"best"};
    bool audio_only{false};
};

struct MediaInfo {
    std::string title;
    std::string content_type;
    std::optional<std::uint64_t> content_length;
    std::optional<double> duration;
    std::string uploader;
    bool supports_range{false};
};

// Callbacks an engine invokes from inside its blocking call. A hook may throw
// (Cancelled in particular); the engine must let that exception escape
// download() so the call unwinds.
struct EngineHooks {
    std::function<void(const TransferProgress&)> on_progress;
    std::function<void(const PostProcessStatus&)> on_postprocess;
};

// Blocking, non-preemptible media engine. Failures are reported as
// TransientError or PermanentError subclasses; any other exception is
// treated as permanent.
class Engine {
public:
    virtual ~Engine() = default;

    [[nodiscard]] virtual MediaInfo probe(const std::string& url) = 0;

    // Writes the result into `work_dir` and returns the produced file, or an
    // empty path when the caller should look for it in `work_dir`.
    virtual std::filesystem::path download(const DownloadRequest& request,
                                           const std::filesystem::path& work_dir,
                                           const EngineHooks& hooks) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

using EnginePtr = std::shared_ptr<Engine>;

} // namespace mediagate
