#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <iterator>
#include <optional>
#include <string>

#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/layout/field.hpp"
#include "flatrec/layout/layout.hpp"

namespace flatrec::io {

// Reads one record per line from a stream. Lines end at '\n'; a trailing
// '\r' is dropped. Each line is parsed independently, so a short line yields
// an error for that line only and reading continues.
//
// The sequence is finite and single-pass: once Next() returns nullopt it
// keeps doing so.
class RecordReader {
 public:
  class Iterator;

  // Both `input` and `layout` must outlive the reader.
  RecordReader(std::istream& input, const Layout& layout)
      : input_(input), layout_(layout) {
  }

  // Next record, or nullopt at end of input or after a read failure (see
  // Error()).
  [[nodiscard]] auto Next() -> std::optional<Result<Record>>;

  // 1-based number of the line last returned by Next(); 0 before the first.
  [[nodiscard]] auto LineNumber() const -> std::size_t {
    return line_number_;
  }

  // Set when reading stopped because the stream failed rather than ended.
  [[nodiscard]] auto Error() const -> const std::optional<Diagnostic>& {
    return error_;
  }

  auto begin() -> Iterator;
  static auto end() -> std::default_sentinel_t {
    return std::default_sentinel;
  }

 private:
  std::istream& input_;
  const Layout& layout_;
  std::string line_;
  std::size_t line_number_ = 0;
  bool done_ = false;
  std::optional<Diagnostic> error_;
};

class RecordReader::Iterator {
 public:
  using iterator_category = std::input_iterator_tag;
  using value_type = Result<Record>;
  using difference_type = std::ptrdiff_t;

  Iterator() = default;
  explicit Iterator(RecordReader* reader) : reader_(reader) {
    ++*this;
  }

  auto operator*() const -> const value_type& {
    return *current_;
  }
  auto operator->() const -> const value_type* {
    return &*current_;
  }
  auto operator++() -> Iterator& {
    current_ = reader_->Next();
    return *this;
  }
  void operator++(int) {
    ++*this;
  }

  friend auto operator==(const Iterator& it, std::default_sentinel_t)
      -> bool {
    return !it.current_.has_value();
  }

 private:
  RecordReader* reader_ = nullptr;
  std::optional<value_type> current_;
};

inline auto RecordReader::begin() -> Iterator {
  return Iterator(this);
}

// Open a file for reading records. Fails with kHostError naming the path.
auto OpenInput(const std::filesystem::path& path) -> Result<std::ifstream>;

}  // namespace flatrec::io
