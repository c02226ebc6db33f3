#pragma once

// =============================================================================
// MATERIAL EVALUATION
// =============================================================================
// Scores are in centipawns (a pawn = 100). Positive favours white.
//
// Traditional piece values:
//   Pawn   = 100
//   Knight = 300
//   Bishop = 350
//   Rook   = 500
//   Queen  = 900
//   King   = 0   (always present, never counted)
// =============================================================================

#include <array>
#include <cstddef>

#include "bitmate/board.hpp"
#include "bitmate/colour.hpp"
#include "bitmate/piece.hpp"

namespace bitmate {

inline constexpr std::array<int, 12> PIECE_VALUES = {
    100, 300, 350, 500, 900, 0, // White: P, N, B, R, Q, K
    100, 300, 350, 500, 900, 0  // Black: P, N, B, R, Q, K
};

[[nodiscard]] constexpr int piece_value(Piece piece) noexcept {
  return PIECE_VALUES[static_cast<std::size_t>(piece)];
}

[[nodiscard]] int eval_material(Colour colour, const Board& board) noexcept;

// White material minus black material.
[[nodiscard]] int evaluate(const Board& board) noexcept;

} // namespace bitmate
