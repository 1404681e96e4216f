#include "mediagate/download_manager.hpp"

#include "mediagate/completed_file.hpp"
#include "mediagate/errors.hpp"
#include "mediagate/log.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iterator>
#include <ostream>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace mediagate {

DownloadManager::DownloadManager(DownloadService& service, std::filesystem::path download_dir, std::ostream& out)
    : service_(service), download_dir_(std::move(download_dir)), out_(out) {}

void DownloadManager::addTask(DownloadRequest request) {
    auto task = std::make_unique<Task>();
    task->state.url = request.url;
    task->request = std::move(request);
    tasks_.push_back(std::move(task));
}

std::size_t DownloadManager::start() {
    for (auto& task : tasks_) {
        std::lock_guard<std::mutex> lock(task->mutex);
        task->state.running = true;
    }

    threads_.reserve(tasks_.size());
    for (auto& task : tasks_) {
        threads_.emplace_back([this, raw = task.get()]() { runTask(*raw); });
    }

    renderProgressLoop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    const auto states = results();
    return static_cast<std::size_t>(
        std::count_if(states.begin(), states.end(), [](const TaskState& s) { return s.has_error; }));
}

std::vector<TaskState> DownloadManager::results() const {
    std::vector<TaskState> states;
    states.reserve(tasks_.size());
    for (const auto& task : tasks_) {
        states.push_back(task->snapshot());
    }
    return states;
}

void DownloadManager::printErrors(std::ostream& err) const {
    for (const auto& state : results()) {
        if (state.has_error) {
            err << fmt::format("{}: {}\n", state.url, state.message);
        }
    }
}

void DownloadManager::runTask(Task& task) {
    try {
        auto stream = openWithBackoff(task.request);
        while (auto event = stream->next()) {
            apply(task, *event);
        }
        stream->close();
    } catch (const std::exception& ex) {
        logger()->error("task for {} failed: {}", task.request.url, ex.what());
        std::lock_guard<std::mutex> lock(task.mutex);
        task.state.status = "error";
        task.state.has_error = true;
        task.state.message = ex.what();
    }

    std::lock_guard<std::mutex> lock(task.mutex);
    task.state.running = false;
}

std::unique_ptr<ProgressStream> DownloadManager::openWithBackoff(const DownloadRequest& request) {
    const Config& config = service_.config();
    for (int attempt = 0;; ++attempt) {
        try {
            return service_.openProgressStream(request);
        } catch (const CapacityExceeded& ex) {
            if (attempt >= config.max_retries) {
                throw;
            }
            const auto delay = backoffDelay(attempt, config.retry_base_delay, config.retry_max_delay);
            service_.metrics().recordRetry("stream", attempt + 1, delay, ex.what());
            std::this_thread::sleep_for(delay);
        }
    }
}

void DownloadManager::apply(Task& task, const ProgressEvent& event) {
    if (const auto* downloading = std::get_if<DownloadingEvent>(&event)) {
        std::lock_guard<std::mutex> lock(task.mutex);
        task.state.status = "downloading";
        task.state.downloaded_bytes = downloading->downloaded;
        task.state.total_bytes = downloading->total;
    } else if (const auto* processing = std::get_if<ProcessingEvent>(&event)) {
        std::lock_guard<std::mutex> lock(task.mutex);
        task.state.status = "processing";
        task.state.message = processing->message;
    } else if (const auto* complete = std::get_if<CompleteEvent>(&event)) {
        {
            std::lock_guard<std::mutex> lock(task.mutex);
            task.state.filename = complete->filename;
            task.state.status = "saving";
        }
        const auto saved = deliver(*complete);
        std::lock_guard<std::mutex> lock(task.mutex);
        task.state.status = "done";
        task.state.saved_to = saved;
        task.state.downloaded_bytes = complete->size;
        task.state.total_bytes = complete->size;
        task.state.message.clear();
    } else if (const auto* error = std::get_if<ErrorEvent>(&event)) {
        std::lock_guard<std::mutex> lock(task.mutex);
        task.state.status = "error";
        task.state.has_error = true;
        task.state.message = fmt::format("{} ({})", error->message, errorKindName(error->kind));
    }
}

std::filesystem::path DownloadManager::deliver(const CompleteEvent& complete) {
    auto record = service_.take(complete.id);
    if (!record) {
        throw DownloadError("download not found or expired");
    }

    const Config& config = service_.config();
    if (!validateRecordPaths(*record, config.temp_root, config.temp_prefix)) {
        logger()->error("refusing to read {}: outside the temp root", record->file_path.string());
        throw DownloadError("download not found or expired");
    }

    const auto destination = download_dir_ / record->filename;
    CompletedFile file(std::move(*record), config.chunk_size);
    file.copyTo(destination);
    return destination;
}

void DownloadManager::renderProgressLoop() {
    while (true) {
        // Sampled before drawing so the last frame shows every final state.
        const bool active = hasActiveTasks();
        repaint(buildProgressPanel());

        if (!active) {
            break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    out_ << std::flush;
}

std::string DownloadManager::buildProgressPanel() const {
    std::vector<TaskState> states = results();

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    std::size_t done = 0;
    std::size_t failed = 0;
    std::string body;
    for (const auto& state : states) {
        body += formatTaskLine(state);
        body.push_back('\n');
        total_all += state.total_bytes;
        downloaded_all += state.downloaded_bytes;
        done += state.status == "done" ? 1 : 0;
        failed += state.has_error ? 1 : 0;
    }

    const std::string overall =
        total_all > 0 ? fmt::format("{}%", downloaded_all * 100 / total_all) : std::string{"N/A"};
    return fmt::format("{0:=<{1}}\n"
                       "mediagate ({2} tasks, {3}/{4} slots in use)\n"
                       "{5:-<{1}}\n"
                       "{6}"
                       "{5:-<{1}}\n"
                       "Overall: {7}  done {8}, failed {9}\n",
                       "", kPanelWidth, states.size(), service_.gate().outstanding(), service_.gate().capacity(), "",
                       body, overall, done, failed);
}

std::string DownloadManager::formatTaskLine(const TaskState& state) {
    std::string display_name = state.filename;
    if (display_name.empty()) {
        const auto query = state.url.find_first_of("?#");
        display_name = std::filesystem::path{state.url.substr(0, query)}.filename().string();
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    std::string line;
    if (state.total_bytes > 0) {
        const double ratio =
            std::min(1.0, static_cast<double>(state.downloaded_bytes) / static_cast<double>(state.total_bytes));
        constexpr int bar_width = 30;
        const int filled = static_cast<int>(ratio * bar_width);

        std::string bar;
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < filled) ? u8"█" : u8"░";
        }
        line = fmt::format("{:<20} [{}] {:>3}% ({})", display_name, bar, static_cast<int>(ratio * 100.0),
                           transferText(state));
    } else if (state.status == "queued") {
        line = fmt::format("{:<20} [Waiting for a slot...]", display_name);
    } else {
        line = fmt::format("{:<20} [{}]", display_name, state.status);
    }

    if (state.has_error) {
        line += fmt::format("  ❌ {}", state.message);
    } else if (state.status == "processing") {
        line += fmt::format("  {}", state.message);
    } else if (state.status == "done") {
        line += "  ✅ Done";
    }
    return line;
}

// "<downloaded>/<total>" in binary units.
std::string DownloadManager::transferText(const TaskState& state) {
    static constexpr const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    auto human = [](std::uint64_t bytes) {
        double value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
            value /= 1024.0;
            ++unit;
        }
        return unit == 0 ? fmt::format("{} B", bytes) : fmt::format("{:.1f} {}", value, kUnits[unit]);
    };
    return fmt::format("{}/{}", human(state.downloaded_bytes), human(state.total_bytes));
}

bool DownloadManager::hasActiveTasks() const {
    return std::any_of(tasks_.begin(), tasks_.end(), [](const auto& task) { return task->snapshot().running; });
}

// Moves the cursor back over the previous frame and clears it before drawing.
void DownloadManager::repaint(const std::string& panel) {
    if (drawn_lines_ > 0) {
        out_ << fmt::format("\033[{}F\033[J", drawn_lines_);
    }
    out_ << panel;
    drawn_lines_ = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
}

} // namespace mediagate
