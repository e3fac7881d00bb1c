#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "dcomp/common/diagnostic.hpp"

namespace dcomp::logging {

inline constexpr const char* kLoggerName = "dcomp";

// Process-wide logger. Writes to stderr so stdout stays free for command
// output. Created on first use with level info.
auto Logger() -> std::shared_ptr<spdlog::logger>;

// Accepts trace, debug, info, warn/warning, error/err, critical and off.
auto ParseLevel(std::string_view name) -> Result<spdlog::level::level_enum>;

void SetLevel(spdlog::level::level_enum level);

}  // namespace dcomp::logging
