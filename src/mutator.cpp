// =============================================================================
// MOVE APPLICATION
// =============================================================================
//
// Playing a move touches more than the two squares involved:
//
//   - Placement: the origin is cleared, anything on the destination is
//     captured, the moving piece lands on the destination.
//   - Side to move flips.
//   - En passant square: set to the skipped square right after a double pawn
//     push, cleared after every other move.
//   - Castling rights: lost for good once a king leaves e1/e8 or a move
//     starts or ends on a rook corner (a1, h1, a8, h8).
//
// All validation happens before the first write, so a rejected move leaves
// the position exactly as it was.
//
// =============================================================================

#include "bitmate/mutator.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

#include "bitmate/errors.hpp"
#include "bitmate/movegen.hpp"
#include "bitmate/piece.hpp"

namespace bitmate {

void apply_move(Board& board, PositionMetadata& metadata, Square from, Square to) {
  const auto piece = board.piece_at(from);
  if (!piece.has_value()) {
    throw IllegalMoveError(IllegalMoveReason::NoPieceAtSource, "no piece on " + from.to_string());
  }

  if (colour(*piece) != metadata.turn) {
    std::ostringstream oss;
    oss << "piece on " << from << " is " << colour(*piece) << " but it is " << metadata.turn
        << " to move";
    throw IllegalMoveError(IllegalMoveReason::WrongSideToMove, oss.str());
  }

  const auto targets = possible_moves(board, from);
  if (!targets.has_value() || std::find(targets->begin(), targets->end(), to) == targets->end()) {
    throw IllegalMoveError(IllegalMoveReason::IllegalTarget,
                           "illegal move " + from.to_string() + ":" + to.to_string());
  }

  // put_piece clears every mask on `to` first, which removes a captured piece.
  board.remove_piece(from);
  board.put_piece(*piece, to);

  metadata.en_passant = std::nullopt;
  if (is_pawn(*piece) && from.rank_diff(to) == 2) {
    metadata.en_passant = Square::from_file_and_rank(
        from.file(), static_cast<std::uint8_t>((from.rank() + to.rank()) / 2));
  }

  metadata.castling_rights.revoke_for_square(from);
  metadata.castling_rights.revoke_for_square(to);

  metadata.turn = !metadata.turn;
}

} // namespace bitmate
