#include "bitmate/display.hpp"

#include <cstdint>
#include <sstream>

namespace bitmate {

void print_board(std::ostream& os, const Position& pos) {
  for (int rank = 7; rank >= 0; --rank) {
    os << rank + 1;
    for (int file = 0; file < 8; ++file) {
      const Square square = Square::from_file_and_rank(static_cast<std::uint8_t>(file),
                                                       static_cast<std::uint8_t>(rank));
      const auto piece = pos.piece_at(square);
      os << ' ' << (piece.has_value() ? to_char(*piece) : '.');
    }
    os << '\n';
  }

  os << "  a b c d e f g h\n"
     << "\nTurn: " << pos.colour_to_move()
     << "\nFen: " << pos.to_fen() << '\n';
}

std::string board_to_string(const Position& pos) {
  std::ostringstream oss;
  print_board(oss, pos);
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Position& pos) {
  print_board(os, pos);
  return os;
}

} // namespace bitmate
