#pragma once

#include <argparse/argparse.hpp>
#include <optional>

#include "config.hpp"

namespace flatrec::driver {

// Add --field, --align and --pad to a subcommand.
void AddLayoutFlags(argparse::ArgumentParser& cmd);

auto ParseCommand(
    const argparse::ArgumentParser& cmd, const std::optional<ToolConfig>& config)
    -> int;
auto FormatCommand(
    const argparse::ArgumentParser& cmd, const std::optional<ToolConfig>& config)
    -> int;
auto DescribeCommand(
    const argparse::ArgumentParser& cmd, const std::optional<ToolConfig>& config)
    -> int;

}  // namespace flatrec::driver
