#include "bitmate/eval.hpp"

namespace bitmate {

int eval_material(Colour colour, const Board& board) noexcept {
  int score = 0;
  for (const auto piece : pieces_for(colour)) {
    score += static_cast<int>(board.count_pieces(piece)) * piece_value(piece);
  }
  return score;
}

int evaluate(const Board& board) noexcept {
  return eval_material(Colour::White, board) - eval_material(Colour::Black, board);
}

} // namespace bitmate
