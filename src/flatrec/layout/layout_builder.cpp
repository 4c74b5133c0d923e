#include "flatrec/layout/layout_builder.hpp"

#include <cstddef>
#include <expected>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "flatrec/common/alignment.hpp"
#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/layout/field.hpp"
#include "flatrec/layout/layout.hpp"

namespace flatrec {

namespace {

// "field 'name'" or "spacer"
auto Target(const FieldSpec& spec) -> std::string {
  if (spec.name) {
    return fmt::format("field '{}'", *spec.name);
  }
  return "spacer";
}

// "field 'name' (#3)" or "spacer (#3)"
auto Describe(const FieldSpec& spec, std::size_t index) -> std::string {
  return fmt::format("{} (#{})", Target(spec), index);
}

}  // namespace

// FieldBuilder

auto FieldBuilder::Width(std::size_t width) -> FieldBuilder& {
  spec_.width = width;
  return *this;
}

auto FieldBuilder::Position(std::size_t start) -> FieldBuilder& {
  spec_.start = start;
  return *this;
}

auto FieldBuilder::Range(std::size_t start, std::size_t end) -> FieldBuilder& {
  if (end < start) {
    error_ = Diagnostic::InvalidWidth(
        fmt::format(
            "range {}..{} of {} ends before it starts", start, end,
            Target(spec_)));
    return *this;
  }
  spec_.start = start;
  spec_.width = end - start;
  return *this;
}

auto FieldBuilder::Align(Alignment alignment) -> FieldBuilder& {
  spec_.alignment = alignment;
  return *this;
}

auto FieldBuilder::Align(std::string_view token) -> FieldBuilder& {
  auto parsed = ParseAlignment(token);
  if (!parsed) {
    auto msg = fmt::format(
        "{} for {}, keeping '{}'", parsed.error().Message(), Target(spec_),
        ToString(spec_.alignment));
    spdlog::warn("{}", msg);
    layout_.sink_.Warning(std::move(msg));
    return *this;
  }
  spec_.alignment = *parsed;
  return *this;
}

auto FieldBuilder::Padding(char32_t padding) -> FieldBuilder& {
  spec_.padding = padding;
  return *this;
}

auto FieldBuilder::Append() -> LayoutBuilder& {
  if (error_) {
    layout_.Defer(std::move(*error_));
    return layout_;
  }
  return layout_.Append(std::move(spec_));
}

auto FieldBuilder::Insert(std::size_t index) -> LayoutBuilder& {
  if (error_) {
    layout_.Defer(std::move(*error_));
    return layout_;
  }
  return layout_.Insert(index, std::move(spec_));
}

// LayoutBuilder

auto LayoutBuilder::DefaultAlignment(Alignment alignment) -> LayoutBuilder& {
  default_alignment_ = alignment;
  return *this;
}

auto LayoutBuilder::DefaultAlignment(std::string_view token)
    -> LayoutBuilder& {
  auto parsed = ParseAlignment(token);
  if (!parsed) {
    Defer(
        std::move(parsed.error())
            .WithNote("while setting the default alignment"));
    return *this;
  }
  default_alignment_ = *parsed;
  return *this;
}

auto LayoutBuilder::DefaultPadding(char32_t padding) -> LayoutBuilder& {
  default_padding_ = padding;
  return *this;
}

auto LayoutBuilder::AddField(std::string name) -> FieldBuilder {
  return NewField(std::move(name));
}

auto LayoutBuilder::AddSpacer() -> FieldBuilder {
  return NewField(std::nullopt);
}

auto LayoutBuilder::AddSpacer(std::size_t start, std::size_t end)
    -> FieldBuilder {
  auto field = NewField(std::nullopt);
  field.Range(start, end);
  return field;
}

auto LayoutBuilder::NewField(std::optional<std::string> name) -> FieldBuilder {
  FieldSpec spec = Defaults();
  spec.name = std::move(name);
  return FieldBuilder(*this, std::move(spec));
}

auto LayoutBuilder::Append(FieldSpec spec) -> LayoutBuilder& {
  specs_.push_back(std::move(spec));
  return *this;
}

auto LayoutBuilder::Insert(std::size_t index, FieldSpec spec)
    -> LayoutBuilder& {
  if (index > specs_.size()) {
    Defer(
        Diagnostic::InvalidInsert(
            fmt::format(
                "cannot insert {} at index {}, only {} declared",
                Target(spec), index, specs_.size())));
    return *this;
  }
  specs_.insert(
      specs_.begin() + static_cast<std::ptrdiff_t>(index), std::move(spec));
  return *this;
}

void LayoutBuilder::Defer(Diagnostic diag) {
  if (!deferred_error_) {
    deferred_error_ = std::move(diag);
  }
}

auto LayoutBuilder::Build() const -> Result<Layout> {
  if (deferred_error_) {
    return std::unexpected(*deferred_error_);
  }

  std::vector<FieldSpec> resolved;
  resolved.reserve(specs_.size());
  std::size_t position = 0;

  for (std::size_t index = 0; index < specs_.size(); ++index) {
    FieldSpec current = specs_[index];
    FieldSpec* previous = resolved.empty() ? nullptr : &resolved.back();

    if (current.start) {
      if (*current.start < position) {
        return std::unexpected(
            Diagnostic::Ordering(
                index, fmt::format(
                           "{} starts at column {}, before column {} where "
                           "the previous field ends",
                           Describe(current, index), *current.start,
                           position)));
      }
      position = *current.start;

      // Close an open previous field over the gap up to this start. Resolved
      // fields always carry a start.
      if (previous != nullptr && !previous->width) {
        previous->width = position - *previous->start;
        if (*previous->width == 0) {
          return std::unexpected(
              Diagnostic::InvalidWidth(
                  index - 1,
                  fmt::format(
                      "{} is empty: the next field starts at the same "
                      "column {}",
                      Describe(*previous, index - 1), position)));
        }
      }
    } else {
      if (previous != nullptr && !previous->width) {
        return std::unexpected(
            Diagnostic::MissingSpecification(
                index - 1,
                fmt::format(
                    "{} has no width and {} gives no start to infer it from",
                    Describe(*previous, index - 1),
                    Describe(current, index))));
      }
      current.start = position;
    }

    if (current.width) {
      if (*current.width == 0) {
        return std::unexpected(
            Diagnostic::InvalidWidth(
                index,
                fmt::format("{} has zero width", Describe(current, index))));
      }
      if (*current.width >
          std::numeric_limits<std::size_t>::max() - position) {
        return std::unexpected(
            Diagnostic::InvalidWidth(
                index, fmt::format(
                           "{} at column {} with width {} extends past the "
                           "largest column",
                           Describe(current, index), position,
                           *current.width)));
      }
      position += *current.width;
    }

    resolved.push_back(std::move(current));
  }

  if (!resolved.empty() && !resolved.back().width) {
    std::size_t last = resolved.size() - 1;
    return std::unexpected(
        Diagnostic::MissingSpecification(
            last, fmt::format(
                      "{} has no width and no later field closes it",
                      Describe(resolved.back(), last))));
  }

  std::vector<Field> fields;
  fields.reserve(resolved.size());
  for (std::size_t index = 0; index < resolved.size(); ++index) {
    auto& spec = resolved[index];
    fields.push_back(
        Field{
            .index = index,
            .name = std::move(spec.name),
            .start = *spec.start,
            .width = *spec.width,
            .alignment = spec.alignment,
            .padding = spec.padding,
        });
  }

  spdlog::debug(
      "resolved layout: {} fields, total width {}", fields.size(), position);
  return Layout(std::move(fields), position, default_padding_);
}

}  // namespace flatrec
