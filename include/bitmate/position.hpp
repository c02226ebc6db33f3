#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "bitmate/board.hpp"
#include "bitmate/castling.hpp"
#include "bitmate/colour.hpp"
#include "bitmate/metadata.hpp"
#include "bitmate/move.hpp"
#include "bitmate/movegen.hpp"
#include "bitmate/square.hpp"

namespace bitmate {

// Position facade: owns the board and its metadata for one session. Copy it
// to hand an independent position to another caller; nothing inside is
// shared or locked.
class Position {
public:
  Position() = default;
  Position(Board board, PositionMetadata metadata);

  // Parse a FEN string into a Position, throwing ParseError on error.
  static Position from_fen(std::string_view fen);

  static Position startpos() { return from_fen(START_POS_FEN); }

  // Serialise back to FEN. The move counters are always written as "0 1".
  std::string to_fen() const;

  [[nodiscard]] const Board& board() const noexcept { return board_; }
  [[nodiscard]] const PositionMetadata& metadata() const noexcept { return metadata_; }

  [[nodiscard]] Colour colour_to_move() const noexcept { return metadata_.turn; }
  [[nodiscard]] CastlingRights castling_rights() const noexcept {
    return metadata_.castling_rights;
  }
  [[nodiscard]] std::optional<Square> en_passant_square() const noexcept {
    return metadata_.en_passant;
  }

  [[nodiscard]] std::optional<Piece> piece_at(Square square) const noexcept {
    return board_.piece_at(square);
  }

  [[nodiscard]] std::optional<SquareList> possible_moves(Square square) const;

  // Throws IllegalMoveError; the position is unchanged when it does.
  void apply_move(Square from, Square to);
  void apply_move(const Move& mv) { apply_move(mv.from, mv.to); }

  inline static constexpr std::string_view START_POS_FEN =
      "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

  friend bool operator==(const Position& lhs, const Position& rhs) = default;

private:
  Board board_{};
  PositionMetadata metadata_{};
};

// Helper used by FEN output and tests.
std::string castling_rights_to_fen(CastlingRights rights);

} // namespace bitmate
