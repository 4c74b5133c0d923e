#include "flatrec/common/diagnostic/diagnostic.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace flatrec {

auto Diagnostic::InsufficientBuffer(
    std::size_t required, std::optional<std::size_t> available)
    -> Diagnostic {
  std::string msg =
      available ? fmt::format(
                      "Insufficient buffer size, required {} only {} available",
                      required, *available)
                : fmt::format("Undefined buffer size, required {}", required);
  auto diag = Make(DiagKind::kInsufficientBuffer, std::nullopt, std::move(msg));
  diag.extent = BufferExtent{.required = required, .available = available};
  return diag;
}

auto DiagKindName(DiagKind kind) -> std::string_view {
  switch (kind) {
    case DiagKind::kInsufficientBuffer:
      return "insufficient_buffer";
    case DiagKind::kOrdering:
      return "ordering";
    case DiagKind::kMissingSpecification:
      return "missing_specification";
    case DiagKind::kInvalidWidth:
      return "invalid_width";
    case DiagKind::kInvalidInsert:
      return "invalid_insert";
    case DiagKind::kInvalidAlignment:
      return "invalid_alignment";
    case DiagKind::kHostError:
      return "host_error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "unknown";
}

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string out = fmt::format(
      "{}: {}", diag.IsError() ? "error" : DiagKindName(diag.Kind()),
      diag.Message());
  for (const auto& note : diag.notes) {
    out += fmt::format("\n  note: {}", note.message);
  }
  return out;
}

}  // namespace flatrec
