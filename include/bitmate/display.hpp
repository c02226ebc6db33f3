#pragma once

#include <ostream>
#include <string>

#include "bitmate/position.hpp"

namespace bitmate {

// ASCII diagram, rank 8 at the top:
//
//   8 r n b q k b n r
//   7 p p p p p p p p
//   6 . . . . . . . .
//   ...
//     a b c d e f g h
//
// followed by the side to move and the FEN.
void print_board(std::ostream& os, const Position& pos);
std::string board_to_string(const Position& pos);

std::ostream& operator<<(std::ostream& os, const Position& pos);

} // namespace bitmate
