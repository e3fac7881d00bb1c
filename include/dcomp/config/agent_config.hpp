#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "dcomp/common/diagnostic.hpp"

namespace dcomp::config {

inline constexpr std::string_view kConfigFileName = "dcomp.toml";
inline constexpr const char* kConfigFileEnv = "DCOMP_CONFIG_FILE";

inline constexpr std::string_view kAgentNameKey = "agent.name";
inline constexpr std::string_view kLogLevelKey = "log.level";
inline constexpr std::string_view kDefaultLogLevel = "info";

inline constexpr std::string_view kDrushCommandKey = "drush.command";
inline constexpr std::string_view kDefaultDrushCommand = "drush";
inline constexpr std::string_view kDrushSiteKey = "drush.site";
inline constexpr std::string_view kDefaultDrushSite = "@self";
inline constexpr std::string_view kExecTimeoutKey = "exec.timeout";
inline constexpr std::chrono::milliseconds kDefaultExecTimeout{120000};

// Settings of the agent process. Values come from dcomp.toml, flattened into
// dotted keys ([agent] name = "x" is "agent.name"), with the environment as
// fallback for keys the file does not set.
class AgentConfig {
 public:
  // File value, else DCOMP_<KEY> from the environment, else nullopt.
  [[nodiscard]] auto Get(std::string_view key) const
      -> std::optional<std::string>;
  [[nodiscard]] auto Get(std::string_view key, std::string_view fallback) const
      -> std::string;

  void Set(std::string key, std::string value);

  // agent.name, or the host name when unset.
  [[nodiscard]] auto AgentName() const -> std::string;

  // log.level, or "info" when unset.
  [[nodiscard]] auto LogLevel() const -> std::string;

  // Drush executable and site alias used for Drupal commands.
  [[nodiscard]] auto DrushCommand() const -> std::string;
  [[nodiscard]] auto DrushSite() const -> std::string;

  // exec.timeout in milliseconds; error when it is not a positive integer.
  [[nodiscard]] auto ExecTimeout() const -> Result<std::chrono::milliseconds>;

  // File the settings were read from; nullopt when running on defaults.
  [[nodiscard]] auto SourcePath() const
      -> const std::optional<std::filesystem::path>& {
    return source_path_;
  }

  // Keys set by the file or by Set, sorted.
  [[nodiscard]] auto Keys() const -> std::vector<std::string>;

  // Non-fatal problems found while choosing the configuration file.
  [[nodiscard]] auto Warnings() const -> const std::vector<Diagnostic>& {
    return warnings_;
  }

 private:
  friend auto LoadConfig(const std::filesystem::path& config_path)
      -> Result<AgentConfig>;
  friend auto LoadAgentConfig(
      const std::optional<std::filesystem::path>& explicit_path)
      -> Result<AgentConfig>;

  absl::flat_hash_map<std::string, std::string> properties_;
  std::optional<std::filesystem::path> source_path_;
  std::vector<Diagnostic> warnings_;
};

// Environment variable consulted for a key: agent.name -> DCOMP_AGENT_NAME.
auto EnvironmentKey(std::string_view key) -> std::string;

// Search for dcomp.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse a dcomp.toml file.
// Returns error Diagnostic on parse errors or unsupported values.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<AgentConfig>;

// Pick the configuration file: explicit_path, then $DCOMP_CONFIG_FILE, then
// FindConfig(). A chosen file that does not exist is recorded in Warnings()
// and the defaults are used.
auto LoadAgentConfig(
    const std::optional<std::filesystem::path>& explicit_path = std::nullopt)
    -> Result<AgentConfig>;

}  // namespace dcomp::config
