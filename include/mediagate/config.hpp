#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mediagate {

// Every deadline is coordinated the same way: the request/response timeouts
// sit above engine_socket_timeout, which is what eventually stops a worker
// whose caller already gave up.
struct Config {
    std::size_t max_concurrent_operations{6};
    std::size_t worker_threads{8};
    std::chrono::milliseconds admission_wait{100};

    std::chrono::seconds info_timeout{90};
    std::chrono::seconds download_timeout{300};
    std::chrono::seconds stream_timeout{600};
    std::chrono::seconds engine_socket_timeout{30};

    std::chrono::seconds download_expiry{300};
    std::size_t max_completed_downloads{100};

    std::chrono::seconds orphan_age{3600};
    std::chrono::seconds sweep_interval{60};
    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds cancel_join_timeout{2000};
    std::chrono::milliseconds sweeper_join_timeout{5000};

    std::filesystem::path temp_root{std::filesystem::temp_directory_path()};
    std::string temp_prefix{"mediagate_"};

    std::uint64_t max_file_size{2ULL * 1024 * 1024 * 1024};
    std::size_t chunk_size{8192};

    int max_retries{3};
    double retry_base_delay{1.0};
    double retry_max_delay{10.0};

    std::string user_agent{
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/131.0.0.0 Safari/537.36"};

    bool metrics_enabled{true};
    std::string log_level{"info"};

    // Defaults overridden by MEDIAGATE_* environment variables. Malformed
    // values are logged and ignored.
    [[nodiscard]] static Config fromEnvironment();

    // Throws ConfigError.
    void validate() const;
};

} // namespace mediagate
