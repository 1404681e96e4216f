#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace mediagate {

// Process-wide "mediagate" logger on stderr.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names ("trace" ... "off"); unknown names keep the
// current level.
void setLogLevel(const std::string& level);

} // namespace mediagate
