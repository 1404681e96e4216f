#pragma once

#include "download_service.hpp"
#include "engine.hpp"
#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mediagate {

struct TaskState {
    std::string url;
    std::string filename;
    std::string status{"queued"};
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};
    std::string message;
    std::filesystem::path saved_to;
    bool running{false};
    bool has_error{false};
};

// Console front end over progress streams. One consumer thread per URL
// drains its stream while the calling thread redraws a panel; finished files
// are taken from the store and copied into the download directory.
class DownloadManager {
public:
    DownloadManager(DownloadService& service, std::filesystem::path download_dir, std::ostream& out);

    void addTask(DownloadRequest request);

    // Blocks until every task has ended. Returns the number of failed tasks.
    std::size_t start();

    [[nodiscard]] std::vector<TaskState> results() const;
    void printErrors(std::ostream& err) const;

private:
    struct Task {
        DownloadRequest request;
        mutable std::mutex mutex;
        TaskState state;

        [[nodiscard]] TaskState snapshot() const {
            std::lock_guard<std::mutex> lock(mutex);
            return state;
        }
    };

    void runTask(Task& task);
    std::unique_ptr<ProgressStream> openWithBackoff(const DownloadRequest& request);
    void apply(Task& task, const ProgressEvent& event);
    std::filesystem::path deliver(const CompleteEvent& complete);

    static constexpr int kPanelWidth = 50;

    void renderProgressLoop();
    std::string buildProgressPanel() const;
    static std::string formatTaskLine(const TaskState& state);
    static std::string transferText(const TaskState& state);
    bool hasActiveTasks() const;
    void repaint(const std::string& panel);

    DownloadService& service_;
    std::filesystem::path download_dir_;
    std::ostream& out_;
    std::vector<std::unique_ptr<Task>> tasks_;
    std::vector<std::thread> threads_;
    std::size_t drawn_lines_{0};
};

} // namespace mediagate
