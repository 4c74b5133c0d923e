#include "config.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <spdlog/common.h>
#include <toml++/toml.hpp>

#include "flatrec/common/alignment.hpp"
#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/common/utf8.hpp"

namespace flatrec::driver {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kConfigFileName = "flatrec.toml";

auto ParseLogLevel(std::string_view s) -> Result<spdlog::level::level_enum> {
  if (s == "trace") return spdlog::level::trace;
  if (s == "debug") return spdlog::level::debug;
  if (s == "info") return spdlog::level::info;
  if (s == "warn") return spdlog::level::warn;
  if (s == "error") return spdlog::level::err;
  if (s == "off") return spdlog::level::off;
  return std::unexpected(
      Diagnostic::HostError(
          fmt::format(
              "unknown log level '{}', use trace, debug, info, warn, error "
              "or off",
              s)));
}

// Prefix a value error with the file and key it came from.
auto InFile(const fs::path& path, std::string_view key, const Diagnostic& diag)
    -> Diagnostic {
  return Diagnostic::HostError(
      fmt::format("{}: '{}': {}", path.string(), key, diag.Message()));
}

// A key that is present must hold a string; absent keys yield nullopt.
auto ReadString(
    toml::node_view<toml::node> node, const fs::path& path,
    std::string_view key) -> Result<std::optional<std::string>> {
  if (!node) {
    return std::nullopt;
  }
  if (!node.is_string()) {
    return std::unexpected(
        InFile(path, key, Diagnostic::HostError("expected a string value")));
  }
  return node.value<std::string>();
}

// A section that is present must be a table.
auto CheckSection(
    toml::node_view<toml::node> node, const fs::path& path,
    std::string_view name) -> Result<void> {
  if (node && !node.is_table()) {
    return std::unexpected(
        InFile(path, name, Diagnostic::HostError("expected a table")));
  }
  return {};
}

}  // namespace

auto ParseOnError(std::string_view s) -> Result<OnError> {
  if (s == "skip") return OnError::kSkip;
  if (s == "abort") return OnError::kAbort;
  return std::unexpected(
      Diagnostic::HostError(
          fmt::format("unknown error policy '{}', use 'skip' or 'abort'", s)));
}

auto ParsePadding(std::string_view text) -> Result<char32_t> {
  if (text.empty() || common::CountScalars(text) != 1) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "padding must be exactly one character, got '{}'", text)));
  }
  return common::DecodeScalar(text, 0).value;
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

auto LoadConfig(const fs::path& config_path) -> Result<ToolConfig> {
  ToolConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  for (std::string_view section : {"defaults", "input", "log"}) {
    auto checked = CheckSection(tbl[section], config_path, section);
    if (!checked) {
      return std::unexpected(checked.error());
    }
  }

  // [defaults] section (optional)
  auto alignment = ReadString(
      tbl["defaults"]["alignment"], config_path, "defaults.alignment");
  if (!alignment) {
    return std::unexpected(alignment.error());
  }
  if (*alignment) {
    auto parsed = ParseAlignment(**alignment);
    if (!parsed) {
      return std::unexpected(
          InFile(config_path, "defaults.alignment", parsed.error()));
    }
    config.alignment = *parsed;
  }

  auto padding =
      ReadString(tbl["defaults"]["padding"], config_path, "defaults.padding");
  if (!padding) {
    return std::unexpected(padding.error());
  }
  if (*padding) {
    auto parsed = ParsePadding(**padding);
    if (!parsed) {
      return std::unexpected(
          InFile(config_path, "defaults.padding", parsed.error()));
    }
    config.padding = *parsed;
  }

  // [input] section (optional)
  auto on_error =
      ReadString(tbl["input"]["on_error"], config_path, "input.on_error");
  if (!on_error) {
    return std::unexpected(on_error.error());
  }
  if (*on_error) {
    auto parsed = ParseOnError(**on_error);
    if (!parsed) {
      return std::unexpected(
          InFile(config_path, "input.on_error", parsed.error()));
    }
    config.on_error = *parsed;
  }

  // [log] section (optional)
  auto level = ReadString(tbl["log"]["level"], config_path, "log.level");
  if (!level) {
    return std::unexpected(level.error());
  }
  if (*level) {
    auto parsed = ParseLogLevel(**level);
    if (!parsed) {
      return std::unexpected(InFile(config_path, "log.level", parsed.error()));
    }
    config.log_level = *parsed;
  }

  return config;
}

}  // namespace flatrec::driver
