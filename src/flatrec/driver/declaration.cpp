#include "declaration.hpp"

#include <charconv>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "config.hpp"
#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/layout/layout.hpp"
#include "flatrec/layout/layout_builder.hpp"

namespace flatrec::driver {

namespace {

auto ParseNumber(std::string_view text, std::string_view what)
    -> Result<std::size_t> {
  std::size_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("invalid {} '{}', expected a number", what, text)));
  }
  return value;
}

auto ParseSpan(std::string_view span, FieldDeclaration& decl) -> Result<void> {
  if (span.starts_with('@')) {
    span.remove_prefix(1);
    auto plus = span.find('+');
    auto start = ParseNumber(span.substr(0, plus), "start");
    if (!start) return std::unexpected(start.error());
    decl.start = *start;
    if (plus != std::string_view::npos) {
      auto width = ParseNumber(span.substr(plus + 1), "width");
      if (!width) return std::unexpected(width.error());
      decl.width = *width;
    }
    return {};
  }

  auto dash = span.find('-');
  if (dash != std::string_view::npos) {
    auto start = ParseNumber(span.substr(0, dash), "range start");
    if (!start) return std::unexpected(start.error());
    auto end = ParseNumber(span.substr(dash + 1), "range end");
    if (!end) return std::unexpected(end.error());
    decl.start = *start;
    decl.end = *end;
    return {};
  }

  auto width = ParseNumber(span, "width");
  if (!width) return std::unexpected(width.error());
  decl.width = *width;
  return {};
}

}  // namespace

auto ParseFieldDeclaration(std::string_view text)
    -> Result<FieldDeclaration> {
  FieldDeclaration decl;

  auto name_end = text.find(':');
  if (name_end == std::string_view::npos) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "invalid field '{}', expected NAME:SPAN[:ALIGN[:PAD]]",
                text)));
  }
  if (name_end > 0) {
    decl.name = std::string(text.substr(0, name_end));
  }

  std::string_view rest = text.substr(name_end + 1);
  auto span_end = rest.find(':');
  auto span = ParseSpan(rest.substr(0, span_end), decl);
  if (!span) {
    return std::unexpected(
        std::move(span.error())
            .WithNote(fmt::format("in field declaration '{}'", text)));
  }
  if (span_end == std::string_view::npos) {
    return decl;
  }

  rest = rest.substr(span_end + 1);
  auto align_end = rest.find(':');
  auto align = rest.substr(0, align_end);
  if (!align.empty()) {
    decl.alignment = std::string(align);
  }
  if (align_end == std::string_view::npos) {
    return decl;
  }

  auto padding = ParsePadding(rest.substr(align_end + 1));
  if (!padding) {
    return std::unexpected(
        std::move(padding.error())
            .WithNote(fmt::format("in field declaration '{}'", text)));
  }
  decl.padding = *padding;
  return decl;
}

void AddDeclaration(LayoutBuilder& builder, const FieldDeclaration& decl) {
  auto field = decl.name ? builder.AddField(*decl.name) : builder.AddSpacer();
  if (decl.end) {
    field.Range(decl.start.value_or(0), *decl.end);
  } else {
    if (decl.start) field.Position(*decl.start);
    if (decl.width) field.Width(*decl.width);
  }
  if (decl.alignment) field.Align(std::string_view(*decl.alignment));
  if (decl.padding) field.Padding(*decl.padding);
  field.Append();
}

auto BuildLayout(
    const std::vector<std::string>& declarations,
    const LayoutDefaults& defaults) -> Result<Layout> {
  if (declarations.empty()) {
    return std::unexpected(
        Diagnostic::HostError("no fields declared, use --field NAME:SPAN"));
  }

  LayoutBuilder builder;
  builder.DefaultAlignment(defaults.alignment);
  builder.DefaultPadding(defaults.padding);
  for (const auto& text : declarations) {
    auto decl = ParseFieldDeclaration(text);
    if (!decl) {
      return std::unexpected(decl.error());
    }
    AddDeclaration(builder, *decl);
  }
  return builder.Build();
}

}  // namespace flatrec::driver
