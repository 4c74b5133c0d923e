#pragma once

#include <cstddef>
#include <ostream>

#include "flatrec/common/diagnostic/diagnostic.hpp"
#include "flatrec/layout/field.hpp"
#include "flatrec/layout/layout.hpp"

namespace flatrec::io {

// Writes one formatted record per line.
class RecordWriter {
 public:
  // Both `output` and `layout` must outlive the writer.
  RecordWriter(std::ostream& output, const Layout& layout)
      : output_(output), layout_(layout) {
  }

  // Fails with kHostError when the stream rejects the write.
  auto Write(const Record& record) -> Result<void>;

  [[nodiscard]] auto Count() const -> std::size_t {
    return count_;
  }

 private:
  std::ostream& output_;
  const Layout& layout_;
  std::size_t count_ = 0;
};

}  // namespace flatrec::io
