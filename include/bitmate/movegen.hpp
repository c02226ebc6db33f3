#pragma once

#include <optional>
#include <vector>

#include "bitmate/board.hpp"
#include "bitmate/colour.hpp"
#include "bitmate/square.hpp"

namespace bitmate {

using SquareList = std::vector<Square>;

// One direction to walk from an origin: `step` is added to the square index
// `length` times. The length is worked out from the origin's file and rank so
// that the walk stops at the edge instead of wrapping.
struct Ray {
  int step;
  int length;
};

// Walks `ray` from `from`, appending squares to `out` until the edge, the
// first own piece (excluded) or the first enemy piece (included).
void ray_scan(const Board& board, Colour mover, Square from, Ray ray, SquareList& out);

// Pseudo-legal destinations per piece kind. The piece's colour is passed
// explicitly so these also work on squares that hold something else.
SquareList rook_moves(const Board& board, Square from, Colour mover);
SquareList bishop_moves(const Board& board, Square from, Colour mover);
SquareList queen_moves(const Board& board, Square from, Colour mover);
SquareList king_moves(const Board& board, Square from, Colour mover);
SquareList knight_moves(const Board& board, Square from, Colour mover);
SquareList pawn_moves(const Board& board, Square from, Colour mover);

// Destinations for whatever stands on `from`, or nullopt if it is empty.
// Moves that leave the mover's own king in check are included.
std::optional<SquareList> possible_moves(const Board& board, Square from);

} // namespace bitmate
