#pragma once

#include <string>
#include <utility>
#include <vector>

#include "flatrec/common/diagnostic/diagnostic.hpp"

namespace flatrec {

// Collects diagnostics while a layout is being declared. Not thread-safe.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.IsError()) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Warning(std::string msg) {
    Report(Diagnostic::Warning(std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  void Clear() {
    diagnostics_.clear();
    has_errors_ = false;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace flatrec
