#include "flatrec/common/utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace flatrec::common {

namespace {

auto IsContinuation(unsigned char byte) -> bool {
  return (byte & 0xC0U) == 0x80U;
}

constexpr DecodedScalar kMalformed{.value = kReplacementCharacter, .length = 1};

}  // namespace

auto DecodeScalar(std::string_view s, std::size_t offset) -> DecodedScalar {
  auto lead = static_cast<unsigned char>(s[offset]);
  if (lead < 0x80U) {
    return {.value = lead, .length = 1};
  }

  std::size_t length = 0;
  char32_t value = 0;
  if (lead >= 0xC2U && lead <= 0xDFU) {
    length = 2;
    value = lead & 0x1FU;
  } else if (lead >= 0xE0U && lead <= 0xEFU) {
    length = 3;
    value = lead & 0x0FU;
  } else if (lead >= 0xF0U && lead <= 0xF4U) {
    length = 4;
    value = lead & 0x07U;
  } else {
    return kMalformed;
  }

  if (offset + length > s.size()) {
    return kMalformed;
  }
  for (std::size_t i = 1; i < length; ++i) {
    auto byte = static_cast<unsigned char>(s[offset + i]);
    if (!IsContinuation(byte)) {
      return kMalformed;
    }
    value = (value << 6U) | (byte & 0x3FU);
  }

  // Reject overlong forms, surrogates and values past U+10FFFF.
  if ((length == 3 && value < 0x800U) || (length == 4 && value < 0x10000U) ||
      !IsScalarValue(value)) {
    return kMalformed;
  }
  return {.value = value, .length = length};
}

auto CountScalars(std::string_view s) -> std::size_t {
  std::size_t count = 0;
  std::size_t offset = 0;
  while (offset < s.size()) {
    // ASCII fast path
    if (static_cast<unsigned char>(s[offset]) < 0x80U) {
      ++offset;
    } else {
      offset += DecodeScalar(s, offset).length;
    }
    ++count;
  }
  return count;
}

auto ScalarOffset(std::string_view s, std::size_t n) -> std::size_t {
  std::size_t offset = 0;
  for (std::size_t i = 0; i < n && offset < s.size(); ++i) {
    offset += DecodeScalar(s, offset).length;
  }
  return offset;
}

auto IsScalarValue(char32_t c) -> bool {
  return c <= 0x10FFFFU && (c < 0xD800U || c > 0xDFFFU);
}

void AppendScalar(std::string& out, char32_t c) {
  if (!IsScalarValue(c)) {
    c = kReplacementCharacter;
  }
  auto value = static_cast<uint32_t>(c);
  if (value < 0x80U) {
    out.push_back(static_cast<char>(value));
  } else if (value < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (value >> 6U)));
    out.push_back(static_cast<char>(0x80U | (value & 0x3FU)));
  } else if (value < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (value >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((value >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (value & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (value >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((value >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((value >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (value & 0x3FU)));
  }
}

void AppendScalars(std::string& out, char32_t c, std::size_t count) {
  if (count == 0) {
    return;
  }
  auto encoded = EncodeScalar(c);
  if (encoded.size() == 1) {
    out.append(count, encoded.front());
    return;
  }
  out.reserve(out.size() + (encoded.size() * count));
  for (std::size_t i = 0; i < count; ++i) {
    out += encoded;
  }
}

auto EncodeScalar(char32_t c) -> std::string {
  std::string out;
  AppendScalar(out, c);
  return out;
}

auto ToUtf32(std::string_view s) -> std::u32string {
  std::u32string out;
  out.reserve(s.size());
  std::size_t offset = 0;
  while (offset < s.size()) {
    auto decoded = DecodeScalar(s, offset);
    out.push_back(decoded.value);
    offset += decoded.length;
  }
  return out;
}

auto ToUtf8(std::u32string_view s) -> std::string {
  std::string out;
  out.reserve(s.size());
  for (char32_t c : s) {
    AppendScalar(out, c);
  }
  return out;
}

}  // namespace flatrec::common
