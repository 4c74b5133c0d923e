#include <argparse/argparse.hpp>
#include <exception>
#include <expected>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "config.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

// --config wins over the flatrec.toml search.
auto LoadOptionalConfig(const argparse::ArgumentParser& program)
    -> flatrec::Result<std::optional<flatrec::driver::ToolConfig>> {
  std::optional<fs::path> config_path;
  if (auto path = program.present<std::string>("--config")) {
    config_path = fs::path(*path);
  } else {
    config_path = flatrec::driver::FindConfig();
  }
  if (!config_path) {
    return std::nullopt;
  }
  auto config = flatrec::driver::LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(config.error());
  }
  spdlog::debug("using config {}", config_path->string());
  return std::optional(std::move(*config));
}

void ConfigureLogging(
    const argparse::ArgumentParser& program,
    const std::optional<flatrec::driver::ToolConfig>& config) {
  auto level = spdlog::level::warn;
  if (config && config->log_level) {
    level = *config->log_level;
  }
  if (program.get<bool>("--verbose")) {
    level = spdlog::level::debug;
  } else if (program.get<bool>("--quiet")) {
    level = spdlog::level::err;
  }
  // stdout carries records; logs go to stderr.
  spdlog::set_default_logger(spdlog::stderr_color_mt("flatrec"));
  spdlog::set_pattern("%n: %^%l%$: %v");
  spdlog::set_level(level);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("flatrec", "0.1.0");
  program.add_description(
      "Convert between fixed-width text records and JSON objects");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("--config")
      .metavar("file")
      .help("Configuration file (default: nearest flatrec.toml)");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log debug output");
  program.add_argument("-q", "--quiet")
      .default_value(false)
      .implicit_value(true)
      .help("Only log errors");

  // Subcommand: parse
  argparse::ArgumentParser parse_cmd("parse");
  parse_cmd.add_description(
      "Read fixed-width lines and write one JSON object per line");
  flatrec::driver::AddLayoutFlags(parse_cmd);
  parse_cmd.add_argument("--strict")
      .default_value(false)
      .implicit_value(true)
      .help("Stop at the first line that does not fit the layout");
  parse_cmd.add_argument("file").nargs(0, 1).help(
      "Input file (reads stdin if omitted)");

  // Subcommand: format
  argparse::ArgumentParser format_cmd("format");
  format_cmd.add_description(
      "Read one JSON object per line and write fixed-width lines");
  flatrec::driver::AddLayoutFlags(format_cmd);
  format_cmd.add_argument("file").nargs(0, 1).help(
      "Input file (reads stdin if omitted)");

  // Subcommand: describe
  argparse::ArgumentParser describe_cmd("describe");
  describe_cmd.add_description("Print the resolved layout");
  flatrec::driver::AddLayoutFlags(describe_cmd);

  program.add_subparser(parse_cmd);
  program.add_subparser(format_cmd);
  program.add_subparser(describe_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    flatrec::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before looking for the config file
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      flatrec::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  auto config = LoadOptionalConfig(program);
  if (!config) {
    flatrec::driver::PrintDiagnostic(config.error());
    return 1;
  }
  ConfigureLogging(program, *config);

  if (program.is_subcommand_used("parse")) {
    return flatrec::driver::ParseCommand(parse_cmd, *config);
  }

  if (program.is_subcommand_used("format")) {
    return flatrec::driver::FormatCommand(format_cmd, *config);
  }

  if (program.is_subcommand_used("describe")) {
    return flatrec::driver::DescribeCommand(describe_cmd, *config);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
