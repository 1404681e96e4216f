#pragma once

#include "progress.hpp"

#include <string>

#include <json/value.h>

namespace mediagate {

// {"status": "<name>", ...fields}
[[nodiscard]] Json::Value toJson(const ProgressEvent& event);

// Compact single-line JSON.
[[nodiscard]] std::string toJsonString(const ProgressEvent& event);

// "data: <json>\n\n"
[[nodiscard]] std::string toSseFrame(const ProgressEvent& event);

} // namespace mediagate
