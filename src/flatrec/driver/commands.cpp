#include "commands.hpp"

#include <argparse/argparse.hpp>
#include <cstddef>
#include <expected>
#include <fstream>
#include <iostream>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "declaration.hpp"
#include "flatrec/common/alignment.hpp"
#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/io/record_reader.hpp"
#include "flatrec/io/record_writer.hpp"
#include "flatrec/layout/field.hpp"
#include "flatrec/layout/layout.hpp"
#include "print.hpp"

namespace flatrec::driver {

namespace {

using nlohmann::json;

// Merge --align/--pad with the config file; flags win.
auto ResolveDefaults(
    const argparse::ArgumentParser& cmd, const std::optional<ToolConfig>& config)
    -> Result<LayoutDefaults> {
  LayoutDefaults defaults;
  if (config) {
    defaults.alignment = config->alignment.value_or(defaults.alignment);
    defaults.padding = config->padding.value_or(defaults.padding);
  }
  if (auto align = cmd.present<std::string>("--align")) {
    auto parsed = ParseAlignment(*align);
    if (!parsed) return std::unexpected(parsed.error());
    defaults.alignment = *parsed;
  }
  if (auto pad = cmd.present<std::string>("--pad")) {
    auto parsed = ParsePadding(*pad);
    if (!parsed) return std::unexpected(parsed.error());
    defaults.padding = *parsed;
  }
  return defaults;
}

auto PrepareLayout(
    const argparse::ArgumentParser& cmd, const std::optional<ToolConfig>& config)
    -> Result<Layout> {
  auto defaults = ResolveDefaults(cmd, config);
  if (!defaults) return std::unexpected(defaults.error());

  std::vector<std::string> declarations;
  if (auto fields = cmd.present<std::vector<std::string>>("--field")) {
    declarations = *fields;
  }
  return BuildLayout(declarations, *defaults);
}

// Run `body` over the input file argument, or stdin when none is given.
template <typename Body>
auto WithInput(const argparse::ArgumentParser& cmd, Body body) -> int {
  if (auto path = cmd.present<std::string>("file")) {
    auto in = io::OpenInput(*path);
    if (!in) {
      PrintDiagnostic(in.error());
      return 1;
    }
    return body(*in);
  }
  return body(std::cin);
}

auto ToJson(const Record& record) -> std::string {
  json obj = json::object();
  for (const auto& [name, value] : record) {
    obj[name] = value;
  }
  return obj.dump(-1, ' ', false, json::error_handler_t::replace);
}

auto FromJson(const std::string& line, std::size_t line_number)
    -> Result<Record> {
  json obj = json::parse(line, nullptr, false);
  if (obj.is_discarded() || !obj.is_object()) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("line {}: expected a JSON object", line_number)));
  }
  Record record;
  for (const auto& item : obj.items()) {
    // Non-string values are written as their JSON text.
    const auto& value = item.value();
    record.emplace(
        item.key(),
        value.is_string() ? value.get<std::string>() : value.dump());
  }
  return record;
}

}  // namespace

void AddLayoutFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("-F", "--field")
      .append()
      .metavar("NAME:SPAN[:ALIGN[:PAD]]")
      .help(
          "Field declaration (repeatable). SPAN is W, @START, @START+W or "
          "START-END; an empty NAME declares a spacer");
  cmd.add_argument("--align").help("Default alignment: left or right");
  cmd.add_argument("--pad").help("Default padding character");
}

auto ParseCommand(
    const argparse::ArgumentParser& cmd, const std::optional<ToolConfig>& config)
    -> int {
  auto layout = PrepareLayout(cmd, config);
  if (!layout) {
    PrintDiagnostic(layout.error());
    return 1;
  }

  OnError on_error = OnError::kSkip;
  if (config && config->on_error) {
    on_error = *config->on_error;
  }
  if (cmd.get<bool>("--strict")) {
    on_error = OnError::kAbort;
  }

  return WithInput(cmd, [&](std::istream& in) -> int {
    io::RecordReader reader(in, *layout);
    std::size_t skipped = 0;
    while (auto record = reader.Next()) {
      if (!*record) {
        auto msg = fmt::format(
            "line {}: {}", reader.LineNumber(), record->error().Message());
        if (on_error == OnError::kAbort) {
          PrintError(msg);
          return 1;
        }
        spdlog::warn("skipping {}", msg);
        ++skipped;
        continue;
      }
      std::cout << ToJson(**record) << '\n';
    }
    if (reader.Error()) {
      PrintDiagnostic(*reader.Error());
      return 1;
    }
    if (skipped > 0) {
      PrintWarning(
          fmt::format(
              "skipped {} record{} shorter than {} characters", skipped,
              skipped == 1 ? "" : "s", layout->TotalWidth()));
    }
    return 0;
  });
}

auto FormatCommand(
    const argparse::ArgumentParser& cmd, const std::optional<ToolConfig>& config)
    -> int {
  auto layout = PrepareLayout(cmd, config);
  if (!layout) {
    PrintDiagnostic(layout.error());
    return 1;
  }

  return WithInput(cmd, [&](std::istream& in) -> int {
    io::RecordWriter writer(std::cout, *layout);
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
      ++line_number;
      if (line.empty()) {
        continue;
      }
      auto record = FromJson(line, line_number);
      if (!record) {
        PrintDiagnostic(record.error());
        return 1;
      }
      auto written = writer.Write(*record);
      if (!written) {
        PrintDiagnostic(written.error());
        return 1;
      }
    }
    spdlog::debug("formatted {} records", writer.Count());
    return 0;
  });
}

auto DescribeCommand(
    const argparse::ArgumentParser& cmd, const std::optional<ToolConfig>& config)
    -> int {
  auto layout = PrepareLayout(cmd, config);
  if (!layout) {
    PrintDiagnostic(layout.error());
    return 1;
  }
  std::cout << layout->Describe();
  return 0;
}

}  // namespace flatrec::driver
