#pragma once
#include <cstdint>

namespace pd {

// Where the anchor x sits relative to the measured text run.
enum class HAlign : std::uint8_t { Left, Center, Right };

// Where the anchor y sits relative to the text box (ascent + descent).
enum class VAlign : std::uint8_t { Top, Center, Bottom };

} // namespace pd
