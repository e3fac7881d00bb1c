#pragma once

#include <argparse/argparse.hpp>

#include "dcomp/config/agent_config.hpp"
#include "dcomp/identifier/identifier.hpp"
#include "dcomp/identifier/registry.hpp"

namespace dcomp::driver {

struct CommandContext {
  const IdentifierRegistry& registry;
  const config::AgentConfig& config;
};

// Each subcommand is a class whose subcommand name is its identifier.

class ListCommand {
 public:
  static void Configure(argparse::ArgumentParser& cmd);
  static auto Run(
      const argparse::ArgumentParser& cmd, const CommandContext& ctx) -> int;
};

class WhichCommand {
 public:
  static void Configure(argparse::ArgumentParser& cmd);
  static auto Run(
      const argparse::ArgumentParser& cmd, const CommandContext& ctx) -> int;
};

class ConfigCommand {
 public:
  static void Configure(argparse::ArgumentParser& cmd);
  static auto Run(
      const argparse::ArgumentParser& cmd, const CommandContext& ctx) -> int;
};

}  // namespace dcomp::driver

DCOMP_IDENTIFIER(dcomp::driver::ListCommand, "list");
DCOMP_IDENTIFIER(dcomp::driver::WhichCommand, "which");
DCOMP_IDENTIFIER(dcomp::driver::ConfigCommand, "config");
