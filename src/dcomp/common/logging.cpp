#include "dcomp/common/logging.hpp"

#include <expected>
#include <format>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "dcomp/common/diagnostic.hpp"

namespace dcomp::logging {

auto Logger() -> std::shared_ptr<spdlog::logger> {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_pattern("[dcomp][%H:%M:%S][%^%l%$] %v");
    created->set_level(spdlog::level::info);
    return created;
  }();
  return logger;
}

auto ParseLevel(std::string_view name) -> Result<spdlog::level::level_enum> {
  // from_str maps unknown names to off, so only trust off when it was asked
  // for.
  auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off && name != "off") {
    return std::unexpected(
        Diagnostic::Error(std::format("unknown log level '{}'", name))
            .WithNote(
                "expected one of: trace, debug, info, warn, error, critical, "
                "off"));
  }
  return level;
}

void SetLevel(spdlog::level::level_enum level) {
  Logger()->set_level(level);
}

}  // namespace dcomp::logging
