#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include <spdlog/common.h>

#include "flatrec/common/alignment.hpp"
#include "flatrec/common/diagnostic/diagnostic.hpp"

namespace flatrec::driver {

// What `parse` does with a line that does not fit the layout.
enum class OnError : uint8_t { kSkip, kAbort };

auto ParseOnError(std::string_view s) -> Result<OnError>;

// Contents of flatrec.toml. Every value is optional; unset values fall back
// to command-line flags and then to built-in defaults.
struct ToolConfig {
  std::optional<Alignment> alignment;
  std::optional<char32_t> padding;
  std::optional<OnError> on_error;
  std::optional<spdlog::level::level_enum> log_level;

  // Directory where flatrec.toml was found
  std::filesystem::path root_dir;
};

// Search for flatrec.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse flatrec.toml.
// Returns error Diagnostic on parse errors or invalid values.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ToolConfig>;

// Parse a padding argument that must be exactly one scalar.
auto ParsePadding(std::string_view text) -> Result<char32_t>;

}  // namespace flatrec::driver
