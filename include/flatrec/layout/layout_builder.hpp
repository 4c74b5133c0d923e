#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "flatrec/common/alignment.hpp"
#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/common/diagnostic/diagnostic_sink.hpp"
#include "flatrec/layout/field.hpp"
#include "flatrec/layout/layout.hpp"

namespace flatrec {

class LayoutBuilder;

// Declares a single field, then hands it back to its LayoutBuilder with
// Append() or Insert(). Obtained from LayoutBuilder::AddField/AddSpacer and
// only valid while that builder is alive.
class FieldBuilder {
 public:
  auto Width(std::size_t width) -> FieldBuilder&;
  auto Position(std::size_t start) -> FieldBuilder&;
  // Half-open [start, end); sets both start and width.
  auto Range(std::size_t start, std::size_t end) -> FieldBuilder&;
  auto Align(Alignment alignment) -> FieldBuilder&;
  // Unrecognized tokens keep the current alignment and report a warning.
  auto Align(std::string_view token) -> FieldBuilder&;
  auto Padding(char32_t padding) -> FieldBuilder&;

  auto Append() -> LayoutBuilder&;
  auto Insert(std::size_t index) -> LayoutBuilder&;

  [[nodiscard]] auto Spec() const -> const FieldSpec& {
    return spec_;
  }

 private:
  friend class LayoutBuilder;

  FieldBuilder(LayoutBuilder& layout, FieldSpec spec)
      : layout_(layout), spec_(std::move(spec)) {
  }

  LayoutBuilder& layout_;
  FieldSpec spec_;
  std::optional<Diagnostic> error_;
};

// Accumulates field declarations and resolves them into a Layout.
//
// Declarations are resolved in order with a running column cursor. A field
// without a start begins at the cursor; a field with a width advances it. A
// field may leave its width open when the next declaration gives an explicit
// start: the gap between the two starts becomes the open field's width.
//
// Usage:
//   LayoutBuilder builder;
//   builder.AddField("id").Width(6).Append()
//       .AddSpacer(6, 8).Append()
//       .AddField("amount").Range(8, 20).Align(Alignment::kRight)
//       .Padding('0').Append();
//   auto layout = builder.Build();
class LayoutBuilder {
 public:
  LayoutBuilder() = default;

  // Defaults apply to fields declared after the call.
  auto DefaultAlignment(Alignment alignment) -> LayoutBuilder&;
  // Unrecognized tokens make Build() fail with kInvalidAlignment.
  auto DefaultAlignment(std::string_view token) -> LayoutBuilder&;
  auto DefaultPadding(char32_t padding) -> LayoutBuilder&;

  [[nodiscard]] auto AddField(std::string name) -> FieldBuilder;
  [[nodiscard]] auto AddSpacer() -> FieldBuilder;
  [[nodiscard]] auto AddSpacer(std::size_t start, std::size_t end)
      -> FieldBuilder;

  auto Append(FieldSpec spec) -> LayoutBuilder&;
  // Insert before declaration `index`. An index past the end is reported by
  // Build() as kInvalidInsert.
  auto Insert(std::size_t index, FieldSpec spec) -> LayoutBuilder&;

  [[nodiscard]] auto Specs() const -> std::span<const FieldSpec> {
    return specs_;
  }
  [[nodiscard]] auto Defaults() const -> FieldSpec {
    return FieldSpec{
        .name = std::nullopt,
        .start = std::nullopt,
        .width = std::nullopt,
        .alignment = default_alignment_,
        .padding = default_padding_};
  }
  // Warnings reported while declaring fields.
  [[nodiscard]] auto Diagnostics() const -> const DiagnosticSink& {
    return sink_;
  }

  // Resolve the declarations. Fails with kOrdering, kMissingSpecification,
  // kInvalidWidth, kInvalidInsert or kInvalidAlignment; no partial layout is
  // produced.
  [[nodiscard]] auto Build() const -> Result<Layout>;

 private:
  friend class FieldBuilder;

  auto NewField(std::optional<std::string> name) -> FieldBuilder;
  void Defer(Diagnostic diag);

  std::vector<FieldSpec> specs_;
  Alignment default_alignment_ = Alignment::kLeft;
  char32_t default_padding_ = U' ';
  DiagnosticSink sink_;
  // First error found while declaring; reported by Build().
  std::optional<Diagnostic> deferred_error_;
};

}  // namespace flatrec
