#include "commands.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "argparse/argparse.hpp"
#include "dcomp/config/agent_config.hpp"
#include "dcomp/identifier/registry.hpp"
#include "print.hpp"

namespace dcomp::driver {

namespace {

auto SourceLabel(const RegistryEntry& entry) -> const char* {
  return entry.declared ? "declared" : "type name";
}

void PrintJson(const std::vector<RegistryEntry>& entries) {
  nlohmann::json result = nlohmann::json::array();
  for (const auto& entry : entries) {
    result.push_back(
        {
            {"identifier", entry.identifier},
            {"type", entry.type_name},
            {"qualified_type", entry.qualified_type_name},
            {"declared", entry.declared},
        });
  }
  std::cout << result.dump(2) << "\n";
}

void PrintTable(const std::vector<RegistryEntry>& entries) {
  size_t id_width = std::string("IDENTIFIER").size();
  size_t type_width = std::string("TYPE").size();
  for (const auto& entry : entries) {
    id_width = std::max(id_width, entry.identifier.size());
    type_width = std::max(type_width, entry.qualified_type_name.size());
  }

  fmt::print(
      "{:<{}}  {:<{}}  {}\n", "IDENTIFIER", id_width, "TYPE", type_width,
      "SOURCE");
  for (const auto& entry : entries) {
    fmt::print(
        "{:<{}}  {:<{}}  {}\n", entry.identifier, id_width,
        entry.qualified_type_name, type_width, SourceLabel(entry));
  }
}

}  // namespace

void ListCommand::Configure(argparse::ArgumentParser& cmd) {
  cmd.add_description("List registered identifiers");
  cmd.add_argument("--json")
      .default_value(false)
      .implicit_value(true)
      .help("Print entries as a JSON array");
}

auto ListCommand::Run(
    const argparse::ArgumentParser& cmd, const CommandContext& ctx) -> int {
  auto entries = ctx.registry.Entries();
  if (cmd.get<bool>("--json")) {
    PrintJson(entries);
  } else {
    PrintTable(entries);
  }
  return 0;
}

void WhichCommand::Configure(argparse::ArgumentParser& cmd) {
  cmd.add_description("Show the type registered under an identifier");
  cmd.add_argument("identifier").help("Identifier to look up");
}

auto WhichCommand::Run(
    const argparse::ArgumentParser& cmd, const CommandContext& ctx) -> int {
  auto identifier = cmd.get<std::string>("identifier");
  const auto* entry = ctx.registry.FindByIdentifier(identifier);
  if (entry == nullptr) {
    PrintError(
        std::format("no type registered under identifier '{}'", identifier));
    return 1;
  }
  std::cout << entry->qualified_type_name << "\n";
  return 0;
}

void ConfigCommand::Configure(argparse::ArgumentParser& cmd) {
  cmd.add_description("Show agent configuration");
  cmd.add_argument("key").nargs(0, 1).help(
      "Print only this key (e.g. agent.name)");
}

auto ConfigCommand::Run(
    const argparse::ArgumentParser& cmd, const CommandContext& ctx) -> int {
  const auto& config = ctx.config;

  auto timeout = config.ExecTimeout();
  if (!timeout) {
    PrintDiagnostic(timeout.error());
    return 1;
  }

  // Keys that always have a value, with their defaults applied.
  const std::vector<std::pair<std::string_view, std::string>> settings = {
      {config::kAgentNameKey, config.AgentName()},
      {config::kLogLevelKey, config.LogLevel()},
      {config::kDrushCommandKey, config.DrushCommand()},
      {config::kDrushSiteKey, config.DrushSite()},
      {config::kExecTimeoutKey, std::to_string(timeout->count())},
  };

  if (auto key = cmd.present<std::string>("key")) {
    auto it = std::ranges::find(
        settings, std::string_view(*key),
        &std::pair<std::string_view, std::string>::first);
    std::optional<std::string> value =
        it != settings.end() ? std::optional(it->second) : config.Get(*key);
    if (!value) {
      PrintError(std::format("configuration key '{}' is not set", *key));
      return 1;
    }
    std::cout << *value << "\n";
    return 0;
  }

  for (const auto& [key, value] : settings) {
    std::cout << std::format("{} = {}\n", key, value);
  }
  for (const auto& key : config.Keys()) {
    auto is_setting = std::ranges::any_of(
        settings, [&](const auto& setting) { return setting.first == key; });
    if (is_setting) {
      continue;
    }
    std::cout << std::format("{} = {}\n", key, *config.Get(key));
  }
  const auto& source = config.SourcePath();
  std::cout << std::format(
      "config.file = {}\n", source ? source->string() : "(defaults)");
  return 0;
}

}  // namespace dcomp::driver
