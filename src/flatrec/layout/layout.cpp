#include "flatrec/layout/layout.hpp"

#include <algorithm>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "flatrec/common/alignment.hpp"
#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/common/string_codec.hpp"
#include "flatrec/common/utf8.hpp"
#include "flatrec/layout/field.hpp"

namespace flatrec {

namespace {

const std::string kEmptyValue;

auto DisplayPadding(char32_t padding) -> std::string {
  return fmt::format("'{}'", common::EncodeScalar(padding));
}

}  // namespace

auto Layout::FindField(std::string_view name) const -> const Field* {
  auto it = std::ranges::find_if(fields_, [&](const Field& field) {
    return field.name.has_value() && *field.name == name;
  });
  return it == fields_.end() ? nullptr : &*it;
}

void Layout::InsertValue(
    Record& record, const Field& field, std::string_view slot) {
  // emplace keeps an existing entry: the first field with a name wins.
  record.emplace(
      *field.name,
      std::string(common::StripPadding(slot, field.alignment, field.padding)));
}

auto Layout::Parse(std::string_view line) const -> Result<Record> {
  auto available = common::CountScalars(line);
  if (available < total_width_) {
    return std::unexpected(
        Diagnostic::InsufficientBuffer(total_width_, available));
  }

  Record record;
  record.reserve(fields_.size());
  std::size_t column = 0;
  std::size_t offset = 0;
  for (const auto& field : fields_) {
    // Skip uncovered columns before this field.
    std::string_view rest = line.substr(offset);
    offset += common::ScalarOffset(rest, field.start - column);

    rest = line.substr(offset);
    std::size_t slot_bytes = common::ScalarOffset(rest, field.width);
    if (!field.IsSpacer()) {
      InsertValue(record, field, rest.substr(0, slot_bytes));
    }
    offset += slot_bytes;
    column = field.End();
  }
  return record;
}

auto Layout::Parse(std::u32string_view line) const -> Result<Record> {
  return ParseScalars(line);
}

auto Layout::ParseOrThrow(std::string_view line) const -> Record {
  auto result = Parse(line);
  if (!result) {
    throw DiagnosticException(std::move(result.error()));
  }
  return std::move(*result);
}

auto Layout::Format(const Record& record) const -> std::string {
  std::string out;
  out.reserve(total_width_);
  std::size_t column = 0;
  for (const auto& field : fields_) {
    common::AppendScalars(out, gap_padding_, field.start - column);

    const std::string* value = &kEmptyValue;
    if (field.name) {
      if (auto it = record.find(*field.name); it != record.end()) {
        value = &it->second;
      }
    }
    common::AppendFixedWidth(
        out, *value, field.width, field.alignment, field.padding);
    column = field.End();
  }
  return out;
}

auto Layout::Describe() const -> std::string {
  std::size_t name_width = 4;
  for (const auto& field : fields_) {
    if (field.name) {
      name_width = std::max(name_width, common::CountScalars(*field.name));
    }
  }

  std::string out = fmt::format(
      "{:>3}  {:<{}}  {:>5}  {:>5}  {:>5}  {:<5}  {}\n", "#", "name",
      name_width, "start", "end", "width", "align", "pad");
  for (const auto& field : fields_) {
    std::string name = field.name ? *field.name : "-";
    // Pad by scalar count so non-ASCII names line up.
    std::string padded_name = common::Pad(
        name, name_width, Alignment::kLeft, U' ');
    out += fmt::format(
        "{:>3}  {}  {:>5}  {:>5}  {:>5}  {:<5}  {}\n", field.index,
        padded_name, field.start, field.End(), field.width,
        ToString(field.alignment), DisplayPadding(field.padding));
  }
  out += fmt::format("total width: {}\n", total_width_);
  return out;
}

}  // namespace flatrec
