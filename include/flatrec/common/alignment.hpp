#pragma once

#include <cstdint>
#include <string_view>

#include "flatrec/common/diagnostic/diagnostic.hpp"

namespace flatrec {

// Which side of a field's value absorbs padding. kLeft keeps the value at the
// start of the slot (padding on the right); kRight pads on the left.
enum class Alignment : uint8_t { kLeft, kRight };

// Parse "left" / "right", case-insensitive, surrounding whitespace ignored.
// Returns kInvalidAlignment for anything else.
auto ParseAlignment(std::string_view token) -> Result<Alignment>;

auto ToString(Alignment alignment) -> std::string_view;

}  // namespace flatrec
