// =============================================================================
// POSITION FACADE
// =============================================================================
//
// A Position is the one object a session holds on to: the twelve occupancy
// masks plus side to move, castling rights and en passant square. It owns
// them by value, so copying a Position gives a fully independent game.
//
// Move generation and move application live elsewhere as free functions that
// borrow the board for a single call (movegen.cpp, mutator.cpp); this file
// only forwards to them.
//
// =============================================================================

#include "bitmate/position.hpp"

#include <utility>

#include "bitmate/mutator.hpp"

namespace bitmate {

Position::Position(Board board, PositionMetadata metadata)
    : board_(std::move(board)), metadata_(std::move(metadata)) {}

std::optional<SquareList> Position::possible_moves(Square square) const {
  return bitmate::possible_moves(board_, square);
}

void Position::apply_move(Square from, Square to) {
  bitmate::apply_move(board_, metadata_, from, to);
}

} // namespace bitmate
