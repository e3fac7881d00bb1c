#include "dcomp/config/agent_config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>
#include <vector>

#include <toml++/toml.hpp>

#include "dcomp/common/diagnostic.hpp"
#include "dcomp/common/logging.hpp"

namespace dcomp::config {

namespace fs = std::filesystem;

namespace {

auto HostName() -> std::string {
  std::array<char, 256> buffer{};
  if (gethostname(buffer.data(), buffer.size() - 1) != 0) {
    logging::Logger()->warn("gethostname failed, using 'localhost'");
    return "localhost";
  }
  return buffer.data();
}

auto ScalarToString(const toml::node& node) -> std::optional<std::string> {
  if (auto str = node.value_exact<std::string>()) {
    return *str;
  }
  if (auto integer = node.value_exact<int64_t>()) {
    return std::to_string(*integer);
  }
  if (auto boolean = node.value_exact<bool>()) {
    return *boolean ? "true" : "false";
  }
  if (auto floating = node.value_exact<double>()) {
    return std::format("{}", *floating);
  }
  return std::nullopt;
}

// Flatten nested tables into dotted keys.
auto FlattenTable(
    const toml::table& table, const std::string& prefix,
    const fs::path& config_path,
    absl::flat_hash_map<std::string, std::string>& out) -> Result<void> {
  for (const auto& [key, node] : table) {
    std::string full_key =
        prefix.empty() ? std::string(key.str())
                       : std::format("{}.{}", prefix, key.str());

    if (const auto* sub_table = node.as_table()) {
      auto nested = FlattenTable(*sub_table, full_key, config_path, out);
      if (!nested) {
        return nested;
      }
      continue;
    }

    auto value = ScalarToString(node);
    if (!value) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "{}: unsupported value for '{}'", config_path.string(),
                  full_key))
              .WithNote("values must be strings, numbers or booleans"));
    }
    out.insert_or_assign(std::move(full_key), std::move(*value));
  }
  return {};
}

}  // namespace

auto AgentConfig::Get(std::string_view key) const
    -> std::optional<std::string> {
  // 1. File or in-memory settings.
  if (auto it = properties_.find(key); it != properties_.end()) {
    return it->second;
  }
  // 2. Environment.
  std::string env_key = EnvironmentKey(key);
  if (const char* env_value = std::getenv(env_key.c_str())) {
    return std::string(env_value);
  }
  return std::nullopt;
}

auto AgentConfig::Get(std::string_view key, std::string_view fallback) const
    -> std::string {
  auto value = Get(key);
  return value ? *value : std::string(fallback);
}

void AgentConfig::Set(std::string key, std::string value) {
  properties_.insert_or_assign(std::move(key), std::move(value));
}

auto AgentConfig::AgentName() const -> std::string {
  if (auto name = Get(kAgentNameKey)) {
    return *name;
  }
  return HostName();
}

auto AgentConfig::LogLevel() const -> std::string {
  return Get(kLogLevelKey, kDefaultLogLevel);
}

auto AgentConfig::DrushCommand() const -> std::string {
  return Get(kDrushCommandKey, kDefaultDrushCommand);
}

auto AgentConfig::DrushSite() const -> std::string {
  return Get(kDrushSiteKey, kDefaultDrushSite);
}

auto AgentConfig::ExecTimeout() const -> Result<std::chrono::milliseconds> {
  auto value = Get(kExecTimeoutKey);
  if (!value) {
    return kDefaultExecTimeout;
  }

  int64_t millis = 0;
  const char* first = value->data();
  const char* last = first + value->size();
  auto [ptr, ec] = std::from_chars(first, last, millis);
  if (ec != std::errc() || ptr != last || millis <= 0) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "invalid value '{}' for '{}'", *value, kExecTimeoutKey))
            .WithNote("expected a positive number of milliseconds"));
  }
  return std::chrono::milliseconds(millis);
}

auto AgentConfig::Keys() const -> std::vector<std::string> {
  std::vector<std::string> keys;
  keys.reserve(properties_.size());
  for (const auto& [key, value] : properties_) {
    keys.push_back(key);
  }
  std::ranges::sort(keys);
  return keys;
}

auto EnvironmentKey(std::string_view key) -> std::string {
  std::string result = "DCOMP_";
  result.reserve(result.size() + key.size());
  for (char c : key) {
    if (c == '.' || c == '-') {
      result.push_back('_');
    } else {
      result.push_back(
          static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
  }
  return result;
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<AgentConfig> {
  AgentConfig config;
  config.source_path_ = config_path;

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}: {}", config_path.string(), e.what())));
  }

  auto flattened = FlattenTable(tbl, "", config_path, config.properties_);
  if (!flattened) {
    return std::unexpected(std::move(flattened.error()));
  }
  return config;
}

auto LoadAgentConfig(const std::optional<fs::path>& explicit_path)
    -> Result<AgentConfig> {
  std::optional<fs::path> config_path = explicit_path;
  if (!config_path) {
    if (const char* env_path = std::getenv(kConfigFileEnv)) {
      config_path = fs::path(env_path);
    }
  }

  if (config_path) {
    if (!fs::exists(*config_path)) {
      AgentConfig defaults;
      defaults.warnings_.push_back(
          Diagnostic::Warning(
              std::format(
                  "cannot find config file '{}'", config_path->string()))
              .WithNote("using default settings"));
      return defaults;
    }
  } else {
    config_path = FindConfig();
    if (!config_path) {
      logging::Logger()->debug("no {} found, using defaults", kConfigFileName);
      return AgentConfig{};
    }
  }

  auto config = LoadConfig(*config_path);
  if (config) {
    logging::Logger()->info(
        "using configuration in '{}'", config_path->string());
  }
  return config;
}

}  // namespace dcomp::config
