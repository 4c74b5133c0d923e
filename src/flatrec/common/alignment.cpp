#include "flatrec/common/alignment.hpp"

#include <algorithm>
#include <cctype>
#include <expected>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace flatrec {

namespace {

auto Trim(std::string_view s) -> std::string_view {
  constexpr std::string_view kWhitespace = " \t\r\n\f\v";
  auto begin = s.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = s.find_last_not_of(kWhitespace);
  return s.substr(begin, end - begin + 1);
}

auto ToLower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace

auto ParseAlignment(std::string_view token) -> Result<Alignment> {
  auto normalized = ToLower(Trim(token));
  if (normalized == "left") return Alignment::kLeft;
  if (normalized == "right") return Alignment::kRight;
  return std::unexpected(
      Diagnostic::InvalidAlignment(
          fmt::format(
              "unknown alignment '{}', use 'left' or 'right'", token)));
}

auto ToString(Alignment alignment) -> std::string_view {
  switch (alignment) {
    case Alignment::kLeft:
      return "left";
    case Alignment::kRight:
      return "right";
  }
  return "left";
}

}  // namespace flatrec
