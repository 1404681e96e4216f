#pragma once

#include "mediagate/engine.hpp"
#include "mediagate/errors.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mediagate::testing {

struct FakeStep {
    std::uint64_t downloaded{0};
    std::optional<std::uint64_t> total;
    std::chrono::milliseconds delay{0};
};

// Scriptable engine. Configure the public fields before handing it out.
//
// With `block` set, download() parks after its steps until release() is
// called. A cooperative engine keeps poking on_postprocess while parked, which
// is how a real engine notices cancellation at its callback points.
class FakeEngine : public Engine {
public:
    std::vector<FakeStep> steps;
    std::string output_name{"clip.mp4"};
    std::string payload{"fake media payload"};
    bool report_path{true};
    bool write_file{true};
    bool postprocess{false};
    bool block{false};
    bool cooperative{true};
    std::exception_ptr failure;
    MediaInfo info;
    std::chrono::milliseconds probe_delay{0};

    std::atomic<int> probes{0};
    std::atomic<int> started{0};
    std::atomic<int> finished{0};

    MediaInfo probe(const std::string& url) override {
        ++probes;
        if (probe_delay.count() > 0) {
            std::this_thread::sleep_for(probe_delay);
        }
        if (failure) {
            std::rethrow_exception(failure);
        }
        MediaInfo result = info;
        if (result.title.empty()) {
            result.title = url;
        }
        return result;
    }

    std::filesystem::path download(const DownloadRequest&,
                                   const std::filesystem::path& work_dir,
                                   const EngineHooks& hooks) override {
        ++started;
        for (const auto& step : steps) {
            if (step.delay.count() > 0) {
                std::this_thread::sleep_for(step.delay);
            }
            if (hooks.on_progress) {
                TransferProgress progress;
                progress.filename = output_name;
                progress.downloaded_bytes = step.downloaded;
                progress.total_bytes = step.total;
                hooks.on_progress(progress);
            }
        }

        if (block) {
            waitUntilReleased(hooks);
        }
        if (failure) {
            std::rethrow_exception(failure);
        }

        const auto output = work_dir / output_name;
        if (write_file) {
            std::ofstream out(output, std::ios::binary);
            out << payload;
        }
        if (hooks.on_progress) {
            TransferProgress done;
            done.phase = TransferProgress::Phase::Finished;
            done.filename = output_name;
            done.downloaded_bytes = payload.size();
            done.total_bytes = payload.size();
            hooks.on_progress(done);
        }
        if (postprocess && hooks.on_postprocess) {
            hooks.on_postprocess(PostProcessStatus{PostProcessStatus::Phase::Started, "FFmpegExtractAudio"});
            hooks.on_postprocess(PostProcessStatus{PostProcessStatus::Phase::Finished, "FFmpegExtractAudio"});
        }

        ++finished;
        return report_path ? output : std::filesystem::path{};
    }

    [[nodiscard]] std::string name() const override { return "fake"; }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        released_cv_.notify_all();
    }

    // Polls until `count` downloads have entered the engine.
    bool waitStarted(int count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) const {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (started.load() < count) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }

private:
    void waitUntilReleased(const EngineHooks& hooks) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!released_) {
            released_cv_.wait_for(lock, std::chrono::milliseconds(10));
            if (cooperative && hooks.on_postprocess) {
                lock.unlock();
                hooks.on_postprocess(PostProcessStatus{PostProcessStatus::Phase::Processing, "wait"});
                lock.lock();
            }
        }
    }

    std::mutex mutex_;
    std::condition_variable released_cv_;
    bool released_{false};
};

} // namespace mediagate::testing
