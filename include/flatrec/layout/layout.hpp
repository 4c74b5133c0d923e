#pragma once

#include <concepts>
#include <cstddef>
#include <expected>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/common/string_codec.hpp"
#include "flatrec/common/utf8.hpp"
#include "flatrec/layout/field.hpp"

namespace flatrec {

class LayoutBuilder;

// Resolved, immutable record layout. Fields are ordered by start column and
// never overlap. Parse and Format only read the layout, so a single instance
// can serve any number of callers concurrently.
class Layout {
 public:
  Layout() = default;

  [[nodiscard]] auto Fields() const -> std::span<const Field> {
    return fields_;
  }
  [[nodiscard]] auto TotalWidth() const -> std::size_t {
    return total_width_;
  }
  [[nodiscard]] auto Size() const -> std::size_t {
    return fields_.size();
  }
  [[nodiscard]] auto Empty() const -> bool {
    return fields_.empty();
  }
  // Character written into columns no field covers.
  [[nodiscard]] auto GapPadding() const -> char32_t {
    return gap_padding_;
  }

  // First field carrying `name`, or nullptr.
  [[nodiscard]] auto FindField(std::string_view name) const -> const Field*;

  // Split a UTF-8 line into a record. Fails with kInsufficientBuffer when the
  // line has fewer scalars than TotalWidth(); scalars past it are ignored.
  // When two fields share a name the first one wins.
  [[nodiscard]] auto Parse(std::string_view line) const -> Result<Record>;
  [[nodiscard]] auto Parse(std::u32string_view line) const -> Result<Record>;

  // Parse a range of char32_t scalars. The length of a sized range is
  // checked up front; an unsized range cannot be checked without reading
  // ahead, so it fails with an undefined available length.
  template <std::ranges::input_range R>
    requires std::same_as<std::ranges::range_value_t<R>, char32_t>
  [[nodiscard]] auto ParseScalars(R&& scalars) const -> Result<Record>;

  // Parse, throwing DiagnosticException on failure.
  auto ParseOrThrow(std::string_view line) const -> Record;

  // Render a record as exactly TotalWidth() scalars. Missing values render
  // as padding; values longer than their field are truncated.
  [[nodiscard]] auto Format(const Record& record) const -> std::string;

  // Human-readable table of the resolved fields.
  [[nodiscard]] auto Describe() const -> std::string;

 private:
  friend class LayoutBuilder;

  Layout(std::vector<Field> fields, std::size_t total_width,
         char32_t gap_padding)
      : fields_(std::move(fields)),
        total_width_(total_width),
        gap_padding_(gap_padding) {
  }

  static void InsertValue(
      Record& record, const Field& field, std::string_view slot);

  std::vector<Field> fields_;
  std::size_t total_width_ = 0;
  char32_t gap_padding_ = U' ';
};

template <std::ranges::input_range R>
  requires std::same_as<std::ranges::range_value_t<R>, char32_t>
auto Layout::ParseScalars(R&& scalars) const -> Result<Record> {
  if constexpr (std::ranges::sized_range<R>) {
    auto available = static_cast<std::size_t>(std::ranges::size(scalars));
    if (available < total_width_) {
      return std::unexpected(
          Diagnostic::InsufficientBuffer(total_width_, available));
    }
  } else {
    if (total_width_ > 0) {
      return std::unexpected(
          Diagnostic::InsufficientBuffer(total_width_, std::nullopt));
    }
  }

  Record record;
  auto it = std::ranges::begin(scalars);
  std::size_t column = 0;
  std::string slot;
  for (const auto& field : fields_) {
    for (; column < field.start; ++column) {
      ++it;
    }
    slot.clear();
    for (std::size_t i = 0; i < field.width; ++i, ++column, ++it) {
      if (!field.IsSpacer()) {
        common::AppendScalar(slot, static_cast<char32_t>(*it));
      }
    }
    if (!field.IsSpacer()) {
      InsertValue(record, field, slot);
    }
  }
  return record;
}

}  // namespace flatrec
