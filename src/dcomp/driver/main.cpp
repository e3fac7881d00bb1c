#include <argparse/argparse.hpp>
#include <exception>
#include <expected>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "commands.hpp"
#include "dcomp/common/diagnostic.hpp"
#include "dcomp/common/logging.hpp"
#include "dcomp/config/agent_config.hpp"
#include "dcomp/identifier/registry.hpp"
#include "dcomp/identifier/resolver.hpp"
#include "print.hpp"

namespace {

auto BuildRegistry() -> dcomp::Result<dcomp::IdentifierRegistry> {
  using dcomp::driver::ConfigCommand;
  using dcomp::driver::ListCommand;
  using dcomp::driver::WhichCommand;

  dcomp::IdentifierRegistry registry;
  if (auto result = registry.Register<ListCommand>(); !result) {
    return std::unexpected(std::move(result.error()));
  }
  if (auto result = registry.Register<WhichCommand>(); !result) {
    return std::unexpected(std::move(result.error()));
  }
  if (auto result = registry.Register<ConfigCommand>(); !result) {
    return std::unexpected(std::move(result.error()));
  }
  return registry;
}

// -v wins over log.level from the configuration.
auto ApplyLogLevel(const dcomp::config::AgentConfig& config, bool verbose)
    -> bool {
  if (verbose) {
    dcomp::logging::SetLevel(spdlog::level::debug);
    return true;
  }
  auto level = dcomp::logging::ParseLevel(config.LogLevel());
  if (!level) {
    dcomp::driver::PrintDiagnostic(level.error());
    return false;
  }
  dcomp::logging::SetLevel(*level);
  return true;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  using dcomp::ResolveIdentifier;
  using dcomp::driver::ConfigCommand;
  using dcomp::driver::ListCommand;
  using dcomp::driver::WhichCommand;

  // -v is --verbose here, so keep only the default --help.
  argparse::ArgumentParser program(
      "dcomp", "0.1.0", argparse::default_arguments::help);
  program.add_description(
      "Inspect Druplet and AsyncCommand identifiers of a computing agent");
  program.add_argument("--config")
      .help("Configuration file (default: dcomp.toml in cwd or parents)")
      .metavar("path");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug logging");

  const std::string list_name = ResolveIdentifier<ListCommand>();
  argparse::ArgumentParser list_cmd(list_name);
  ListCommand::Configure(list_cmd);

  const std::string which_name = ResolveIdentifier<WhichCommand>();
  argparse::ArgumentParser which_cmd(which_name);
  WhichCommand::Configure(which_cmd);

  const std::string config_name = ResolveIdentifier<ConfigCommand>();
  argparse::ArgumentParser config_cmd(config_name);
  ConfigCommand::Configure(config_cmd);

  program.add_subparser(list_cmd);
  program.add_subparser(which_cmd);
  program.add_subparser(config_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    dcomp::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  bool verbose = program.get<bool>("--verbose");
  if (verbose) {
    dcomp::logging::SetLevel(spdlog::level::debug);
  }

  std::optional<std::filesystem::path> config_path;
  if (auto path = program.present("--config")) {
    config_path = *path;
  }
  auto config = dcomp::config::LoadAgentConfig(config_path);
  if (!config) {
    dcomp::driver::PrintDiagnostic(config.error());
    return 1;
  }
  for (const auto& warning : config->Warnings()) {
    dcomp::driver::PrintDiagnostic(warning);
  }
  if (!ApplyLogLevel(*config, verbose)) {
    return 1;
  }

  auto registry = BuildRegistry();
  if (!registry) {
    dcomp::driver::PrintDiagnostic(registry.error());
    return 1;
  }

  dcomp::driver::CommandContext ctx{.registry = *registry, .config = *config};

  if (program.is_subcommand_used(list_name)) {
    return ListCommand::Run(list_cmd, ctx);
  }
  if (program.is_subcommand_used(which_name)) {
    return WhichCommand::Run(which_cmd, ctx);
  }
  if (program.is_subcommand_used(config_name)) {
    return ConfigCommand::Run(config_cmd, ctx);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
