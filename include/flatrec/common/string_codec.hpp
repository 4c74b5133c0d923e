#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "flatrec/common/alignment.hpp"

// Fixed-width text primitives. All widths and lengths are counted in Unicode
// scalar values over UTF-8 storage, never in bytes.
namespace flatrec::common {

// First `width` scalars of `s`, or `s` itself when it is not longer.
// Returns a view into `s`; never allocates.
auto Truncate(std::string_view s, std::size_t width) -> std::string_view;

// `s` extended to `width` scalars with `padding`, appended for kLeft and
// prepended for kRight. Values already `width` or longer are returned as-is.
auto Pad(
    std::string_view s, std::size_t width, Alignment alignment,
    char32_t padding) -> std::string;

// Truncate, pad or pass through so the result is exactly `width` scalars.
auto FixedWidth(
    std::string_view s, std::size_t width, Alignment alignment,
    char32_t padding) -> std::string;

// Same as FixedWidth, appending to `out` instead of returning a new string.
void AppendFixedWidth(
    std::string& out, std::string_view s, std::size_t width,
    Alignment alignment, char32_t padding);

// Inverse of Pad: drop the maximal trailing (kLeft) or leading (kRight) run
// of `padding`. Value content equal to the padding character on that side is
// removed as well; the format cannot tell the two apart.
auto StripPadding(std::string_view s, Alignment alignment, char32_t padding)
    -> std::string_view;

}  // namespace flatrec::common
