#pragma once

#include "admission_gate.hpp"
#include "bounded_executor.hpp"
#include "config.hpp"
#include "download_store.hpp"
#include "engine.hpp"
#include "metrics.hpp"
#include "orphan_sweeper.hpp"
#include "progress_stream.hpp"

#include <memory>
#include <optional>
#include <string>

namespace mediagate {

// Owns every shared component and wires them together. Nothing is created
// lazily: once the constructor returns the service is ready, and start()
// only launches the background sweeper.
class DownloadService {
public:
    // Throws ConfigError.
    DownloadService(Config config, EnginePtr engine);
    ~DownloadService();

    DownloadService(const DownloadService&) = delete;
    DownloadService& operator=(const DownloadService&) = delete;

    void start();

    // Stops the sweeper, drops every stored record and joins the pool.
    // Idempotent.
    void shutdown();

    // Throws CapacityExceeded, Timeout, or the engine's error.
    [[nodiscard]] MediaInfo probe(const std::string& url);

    // Request/response download. The returned record stays in the store
    // until taken by id.
    CompletedDownloadRecord download(const DownloadRequest& request);

    // Throws CapacityExceeded or TempDirError.
    [[nodiscard]] std::unique_ptr<ProgressStream> openProgressStream(const DownloadRequest& request);

    [[nodiscard]] std::optional<CompletedDownloadRecord> take(const std::string& id);

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] AdmissionGate& gate() noexcept { return *gate_; }
    [[nodiscard]] CompletedDownloadStore& store() noexcept { return *store_; }
    [[nodiscard]] Metrics& metrics() noexcept { return *metrics_; }
    [[nodiscard]] BoundedExecutor& executor() noexcept { return *executor_; }
    [[nodiscard]] OrphanSweeper& sweeper() noexcept { return *sweeper_; }

private:
    Config config_;
    EnginePtr engine_;
    std::shared_ptr<Metrics> metrics_;
    std::shared_ptr<AdmissionGate> gate_;
    std::shared_ptr<CompletedDownloadStore> store_;
    std::unique_ptr<BoundedExecutor> executor_;
    std::unique_ptr<OrphanSweeper> sweeper_;
    bool stopped_{false};
};

} // namespace mediagate
