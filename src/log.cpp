#include "mediagate/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace mediagate {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(flag, [] {
        instance = spdlog::get("mediagate");
        if (!instance) {
            instance = spdlog::stderr_color_mt("mediagate");
        }
        instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
    });
    return instance;
}

void setLogLevel(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        logger()->warn("unknown log level '{}', keeping {}", level,
                       spdlog::level::to_string_view(logger()->level()));
        return;
    }
    logger()->set_level(parsed);
}

} // namespace mediagate
