#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "flatrec/common/alignment.hpp"

namespace flatrec {

// Half-open column span [start, end), in scalars.
struct ColumnRange {
  std::size_t start = 0;
  std::size_t end = 0;

  [[nodiscard]] auto Width() const -> std::size_t {
    return end - start;
  }
  [[nodiscard]] auto Contains(std::size_t column) const -> bool {
    return column >= start && column < end;
  }

  auto operator==(const ColumnRange&) const -> bool = default;
};

// A field declaration as accumulated by LayoutBuilder. Any of start and width
// may be missing until the layout is resolved. A spec without a name is a
// spacer.
struct FieldSpec {
  std::optional<std::string> name;
  std::optional<std::size_t> start;
  std::optional<std::size_t> width;
  Alignment alignment = Alignment::kLeft;
  char32_t padding = U' ';

  [[nodiscard]] auto IsSpacer() const -> bool {
    return !name.has_value();
  }

  auto operator==(const FieldSpec&) const -> bool = default;
};

// A resolved field. Produced only by LayoutBuilder::Build.
struct Field {
  std::size_t index = 0;
  std::optional<std::string> name;
  std::size_t start = 0;
  std::size_t width = 0;
  Alignment alignment = Alignment::kLeft;
  char32_t padding = U' ';

  [[nodiscard]] auto Range() const -> ColumnRange {
    return {.start = start, .end = start + width};
  }
  [[nodiscard]] auto End() const -> std::size_t {
    return start + width;
  }
  [[nodiscard]] auto IsSpacer() const -> bool {
    return !name.has_value();
  }

  auto operator==(const Field&) const -> bool = default;
};

// Field name to text value. Spacers never contribute keys.
using Record = std::unordered_map<std::string, std::string>;

}  // namespace flatrec
