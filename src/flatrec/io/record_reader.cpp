#include "flatrec/io/record_reader.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/layout/field.hpp"

namespace flatrec::io {

auto RecordReader::Next() -> std::optional<Result<Record>> {
  if (done_) {
    return std::nullopt;
  }
  if (!std::getline(input_, line_)) {
    done_ = true;
    if (input_.bad()) {
      error_ = Diagnostic::HostError(
          fmt::format("read failed after line {}", line_number_));
    }
    return std::nullopt;
  }
  ++line_number_;
  if (!line_.empty() && line_.back() == '\r') {
    line_.pop_back();
  }

  auto record = layout_.Parse(line_);
  if (!record) {
    spdlog::debug("line {}: {}", line_number_, record.error().Message());
  }
  return record;
}

auto OpenInput(const std::filesystem::path& path) -> Result<std::ifstream> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot open input file '{}'", path.string())));
  }
  return in;
}

}  // namespace flatrec::io
