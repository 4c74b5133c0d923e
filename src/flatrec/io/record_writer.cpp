#include "flatrec/io/record_writer.hpp"

#include <expected>
#include <ostream>

#include <fmt/core.h>

#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/layout/field.hpp"

namespace flatrec::io {

auto RecordWriter::Write(const Record& record) -> Result<void> {
  output_ << layout_.Format(record) << '\n';
  if (!output_) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("write failed at record {}", count_ + 1)));
  }
  ++count_;
  return {};
}

}  // namespace flatrec::io
