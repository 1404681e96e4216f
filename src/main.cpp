#include "mediagate/completed_file.hpp"
#include "mediagate/config.hpp"
#include "mediagate/curl_engine.hpp"
#include "mediagate/download_manager.hpp"
#include "mediagate/download_service.hpp"
#include "mediagate/errors.hpp"
#include "mediagate/log.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [-d <directory>] [-c <concurrency>] [--direct] [--info] <url> [<url> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>    Set download directory (default: current directory)\n"
              << "  -c <concurrency>  Maximum concurrent downloads (default: MEDIAGATE_MAX_CONCURRENT_OPS or 6)\n"
              << "  --direct          Download without progress, retrying transient failures\n"
              << "  --info            Print what the server reports about each URL\n"
              << "  -h, --help        Show this message" << std::endl;
}

// Retries transient failures with exponential back-off.
template <typename F>
auto withRetries(mediagate::DownloadService& service, const std::string& operation, F&& call) {
    const auto& config = service.config();
    for (int attempt = 0;; ++attempt) {
        try {
            return call();
        } catch (const mediagate::TransientError& ex) {
            if (attempt >= config.max_retries) {
                throw;
            }
            const auto delay = mediagate::backoffDelay(attempt, config.retry_base_delay, config.retry_max_delay);
            service.metrics().recordRetry(operation, attempt + 1, delay, ex.what());
            std::this_thread::sleep_for(delay);
        }
    }
}

int runInfo(mediagate::DownloadService& service, const std::vector<std::string>& urls) {
    int failures = 0;
    for (const auto& url : urls) {
        try {
            const auto info = withRetries(service, "probe", [&] { return service.probe(url); });
            std::cout << fmt::format("{}\n  title: {}\n  type: {}\n  size: {}\n  ranges: {}\n", url, info.title,
                                     info.content_type.empty() ? "unknown" : info.content_type,
                                     info.content_length ? std::to_string(*info.content_length) : "unknown",
                                     info.supports_range ? "yes" : "no");
        } catch (const std::exception& ex) {
            std::cerr << fmt::format("{}: {}\n", url, ex.what());
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}

int runDirect(mediagate::DownloadService& service,
              const std::vector<std::string>& urls,
              const std::filesystem::path& download_dir) {
    int failures = 0;
    for (const auto& url : urls) {
        try {
            mediagate::DownloadRequest request;
            request.url = url;
            const auto completed = withRetries(service, "download", [&] { return service.download(request); });

            auto record = service.take(completed.id);
            if (!record || !mediagate::validateRecordPaths(*record, service.config().temp_root,
                                                           service.config().temp_prefix)) {
                throw mediagate::DownloadError("download not found or expired");
            }
            const auto destination = download_dir / record->filename;
            mediagate::CompletedFile file(std::move(*record), service.config().chunk_size);
            const auto written = file.copyTo(destination);
            std::cout << fmt::format("{} -> {} ({} bytes)\n", url, destination.string(), written);
        } catch (const std::exception& ex) {
            std::cerr << fmt::format("{}: {}\n", url, ex.what());
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto config = mediagate::Config::fromEnvironment();
        std::filesystem::path download_dir = std::filesystem::current_path();
        bool direct = false;
        bool info_only = false;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-d") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }

                download_dir = argv[arg_index + 1];
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: " + download_dir.string() + " - " +
                                             ec.message());
                }
                arg_index += 2;
            } else if (option == "-c") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }

                int concurrency = 0;
                try {
                    concurrency = std::stoi(argv[arg_index + 1]);
                } catch (const std::exception&) {
                    throw std::runtime_error("Invalid concurrency: " + std::string(argv[arg_index + 1]));
                }
                if (concurrency <= 0 || concurrency > 64) {
                    throw std::runtime_error("Concurrency must be between 1 and 64.");
                }

                config.max_concurrent_operations = static_cast<std::size_t>(concurrency);
                if (config.worker_threads <= config.max_concurrent_operations) {
                    config.worker_threads = config.max_concurrent_operations + 2;
                }
                arg_index += 2;
            } else if (option == "--direct") {
                direct = true;
                ++arg_index;
            } else if (option == "--info") {
                info_only = true;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (arg_index >= argc) {
            printUsage(argv[0]);
            return 1;
        }
        const std::vector<std::string> urls(argv + arg_index, argv + argc);

        mediagate::CurlEngineOptions engine_options;
        engine_options.socket_timeout = config.engine_socket_timeout;
        engine_options.user_agent = config.user_agent;

        mediagate::DownloadService service(config, std::make_shared<mediagate::CurlEngine>(engine_options));
        service.start();

        int status = 0;
        if (info_only) {
            status = runInfo(service, urls);
        } else if (direct) {
            status = runDirect(service, urls, download_dir);
        } else {
            mediagate::DownloadManager manager(service, download_dir, std::cout);
            for (const auto& url : urls) {
                mediagate::DownloadRequest request;
                request.url = url;
                manager.addTask(std::move(request));
            }

            const auto failed = manager.start();
            manager.printErrors(std::cerr);
            status = failed == 0 ? 0 : 1;
        }

        service.shutdown();
        return status;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
