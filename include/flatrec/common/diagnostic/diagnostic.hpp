#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flatrec {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kInsufficientBuffer,    // Record shorter than the layout's total width
  kOrdering,              // Field start precedes the resolved cursor
  kMissingSpecification,  // Width neither declared nor inferable
  kInvalidWidth,          // Zero or reversed field span
  kInvalidInsert,         // Insert index past the end of the declarations
  kInvalidAlignment,      // Unrecognized alignment token
  kHostError,             // I/O, configuration, malformed external input
  kWarning,               // Non-fatal
  kNote,                  // Auxiliary message
};

// Scalar counts carried by kInsufficientBuffer. `available` is nullopt when
// the input's length could not be determined before reading.
struct BufferExtent {
  std::size_t required = 0;
  std::optional<std::size_t> available;

  auto operator==(const BufferExtent&) const -> bool = default;
};

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;
  // Declaration index of the offending field, for layout errors.
  std::optional<std::size_t> field_index;
  // has_value() iff primary.kind == kInsufficientBuffer
  std::optional<BufferExtent> extent;

  auto operator==(const Diagnostic&) const -> bool = default;

  [[nodiscard]] auto Kind() const -> DiagKind {
    return primary.kind;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return primary.message;
  }
  [[nodiscard]] auto IsError() const -> bool {
    return primary.kind != DiagKind::kWarning &&
           primary.kind != DiagKind::kNote;
  }

  // Factory: record too short for the layout
  static auto InsufficientBuffer(
      std::size_t required, std::optional<std::size_t> available)
      -> Diagnostic;

  // Factory: explicit start moves the cursor backward
  static auto Ordering(std::size_t field_index, std::string msg)
      -> Diagnostic {
    return Make(DiagKind::kOrdering, field_index, std::move(msg));
  }

  // Factory: width cannot be determined
  static auto MissingSpecification(std::size_t field_index, std::string msg)
      -> Diagnostic {
    return Make(DiagKind::kMissingSpecification, field_index, std::move(msg));
  }

  static auto InvalidWidth(std::size_t field_index, std::string msg)
      -> Diagnostic {
    return Make(DiagKind::kInvalidWidth, field_index, std::move(msg));
  }

  static auto InvalidWidth(std::string msg) -> Diagnostic {
    return Make(DiagKind::kInvalidWidth, std::nullopt, std::move(msg));
  }

  static auto InvalidInsert(std::string msg) -> Diagnostic {
    return Make(DiagKind::kInvalidInsert, std::nullopt, std::move(msg));
  }

  static auto InvalidAlignment(std::string msg) -> Diagnostic {
    return Make(DiagKind::kInvalidAlignment, std::nullopt, std::move(msg));
  }

  // Factory: host error (I/O, configuration, command line)
  static auto HostError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kHostError, std::nullopt, std::move(msg));
  }

  static auto Warning(std::string msg) -> Diagnostic {
    return Make(DiagKind::kWarning, std::nullopt, std::move(msg));
  }

  // Add a note
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
        });
    return std::move(*this);
  }

 private:
  static auto Make(
      DiagKind kind, std::optional<std::size_t> field_index, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = kind, .message = std::move(msg)},
        .notes = {},
        .field_index = field_index,
        .extent = std::nullopt,
    };
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

// Stable snake_case name of a kind, e.g. "insufficient_buffer".
auto DiagKindName(DiagKind kind) -> std::string_view;

// Plain-text rendering: "<kind>: <message>" followed by one line per note.
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

}  // namespace flatrec
