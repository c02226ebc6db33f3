#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace bitmate {

// Doubles as an index into per-side tables: White = 0, Black = 1.
enum class Colour : std::uint8_t { White = 0, Black = 1 };

constexpr Colour operator!(Colour colour) {
  return colour == Colour::White ? Colour::Black : Colour::White;
}

// The FEN side-to-move letter.
constexpr char to_char(Colour colour) {
  return colour == Colour::White ? 'w' : 'b';
}

constexpr std::string_view to_string(Colour colour) {
  return colour == Colour::White ? "white" : "black";
}

inline std::ostream& operator<<(std::ostream& os, Colour colour) {
  return os << to_string(colour);
}

} // namespace bitmate
