#pragma once

#include "bitmate/board.hpp"
#include "bitmate/metadata.hpp"
#include "bitmate/square.hpp"

namespace bitmate {

// Validates and plays `from` -> `to`, updating placement, side to move,
// castling rights and the en passant square. Throws IllegalMoveError (leaving
// both arguments untouched) if `from` is empty, holds a piece of the side not
// to move, or `to` is not among possible_moves(board, from).
void apply_move(Board& board, PositionMetadata& metadata, Square from, Square to);

} // namespace bitmate
