#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "flatrec/common/alignment.hpp"
#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/layout/layout.hpp"
#include "flatrec/layout/layout_builder.hpp"

namespace flatrec::driver {

// One `--field` argument: NAME:SPAN[:ALIGN[:PAD]]
//
// SPAN is one of
//   W      width only
//   @S     start only; width comes from the next field's start
//   @S+W   start and width
//   S-E    half-open range [S, E)
// An empty NAME declares a spacer. An empty ALIGN keeps the default. PAD is
// the rest of the argument and must be a single character, so ':' itself can
// be used as padding.
struct FieldDeclaration {
  std::optional<std::string> name;
  std::optional<std::size_t> start;
  std::optional<std::size_t> width;
  std::optional<std::size_t> end;
  std::optional<std::string> alignment;
  std::optional<char32_t> padding;
};

auto ParseFieldDeclaration(std::string_view text) -> Result<FieldDeclaration>;

// Append a parsed declaration to `builder`.
void AddDeclaration(LayoutBuilder& builder, const FieldDeclaration& decl);

struct LayoutDefaults {
  Alignment alignment = Alignment::kLeft;
  char32_t padding = U' ';
};

// Parse every declaration and resolve them into a layout.
auto BuildLayout(
    const std::vector<std::string>& declarations,
    const LayoutDefaults& defaults) -> Result<Layout>;

}  // namespace flatrec::driver
