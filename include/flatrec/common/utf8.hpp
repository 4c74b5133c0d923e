#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace flatrec::common {

inline constexpr char32_t kReplacementCharacter = U'\uFFFD';

struct DecodedScalar {
  char32_t value = 0;
  std::size_t length = 0;  // Bytes consumed, always >= 1
};

// Decode the scalar starting at byte `offset`. Malformed or truncated
// sequences decode as U+FFFD consuming a single byte, so every byte of the
// input belongs to exactly one scalar.
// Precondition: offset < s.size().
auto DecodeScalar(std::string_view s, std::size_t offset) -> DecodedScalar;

// Number of scalars in `s`, counted the way DecodeScalar walks it.
auto CountScalars(std::string_view s) -> std::size_t;

// Byte offset of scalar `n`, or s.size() when `s` has n or fewer scalars.
auto ScalarOffset(std::string_view s, std::size_t n) -> std::size_t;

// True for code points that may be encoded (excludes surrogates and values
// above U+10FFFF).
auto IsScalarValue(char32_t c) -> bool;

// Append the UTF-8 encoding of `c`; non-scalar values append U+FFFD.
void AppendScalar(std::string& out, char32_t c);

// Append `count` copies of `c`.
void AppendScalars(std::string& out, char32_t c, std::size_t count);

auto EncodeScalar(char32_t c) -> std::string;

auto ToUtf32(std::string_view s) -> std::u32string;
auto ToUtf8(std::u32string_view s) -> std::string;

}  // namespace flatrec::common
