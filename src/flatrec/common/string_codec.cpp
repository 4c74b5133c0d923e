#include "flatrec/common/string_codec.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "flatrec/common/alignment.hpp"
#include "flatrec/common/utf8.hpp"

namespace flatrec::common {

namespace {

// Variants taking the scalar length of `s`, so FixedWidth counts only once.
auto TruncateKnown(std::string_view s, std::size_t width, std::size_t length)
    -> std::string_view {
  if (length <= width) {
    return s;
  }
  return s.substr(0, ScalarOffset(s, width));
}

void AppendPadded(
    std::string& out, std::string_view s, std::size_t width,
    Alignment alignment, char32_t padding, std::size_t length) {
  std::size_t missing = length < width ? width - length : 0;
  switch (alignment) {
    case Alignment::kLeft:
      out += s;
      AppendScalars(out, padding, missing);
      break;
    case Alignment::kRight:
      AppendScalars(out, padding, missing);
      out += s;
      break;
  }
}

}  // namespace

auto Truncate(std::string_view s, std::size_t width) -> std::string_view {
  // Byte length bounds the scalar count from above.
  if (s.size() <= width) {
    return s;
  }
  return TruncateKnown(s, width, CountScalars(s));
}

auto Pad(
    std::string_view s, std::size_t width, Alignment alignment,
    char32_t padding) -> std::string {
  std::string out;
  out.reserve(width > s.size() ? width : s.size());
  AppendPadded(out, s, width, alignment, padding, CountScalars(s));
  return out;
}

auto FixedWidth(
    std::string_view s, std::size_t width, Alignment alignment,
    char32_t padding) -> std::string {
  std::string out;
  AppendFixedWidth(out, s, width, alignment, padding);
  return out;
}

void AppendFixedWidth(
    std::string& out, std::string_view s, std::size_t width,
    Alignment alignment, char32_t padding) {
  auto length = CountScalars(s);
  if (length > width) {
    out += TruncateKnown(s, width, length);
  } else if (length < width) {
    AppendPadded(out, s, width, alignment, padding, length);
  } else {
    out += s;
  }
}

auto StripPadding(std::string_view s, Alignment alignment, char32_t padding)
    -> std::string_view {
  // UTF-8 is self-synchronizing: an encoded scalar never matches the tail or
  // head of a different scalar, so comparing encodings is exact.
  auto encoded = EncodeScalar(padding);
  switch (alignment) {
    case Alignment::kLeft:
      while (s.ends_with(encoded)) {
        s.remove_suffix(encoded.size());
      }
      break;
    case Alignment::kRight:
      while (s.starts_with(encoded)) {
        s.remove_prefix(encoded.size());
      }
      break;
  }
  return s;
}

}  // namespace flatrec::common
