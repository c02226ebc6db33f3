#pragma once

// =============================================================================
// BOARD REPRESENTATION: Twelve Occupancy Masks
// =============================================================================
//
// The board is nothing but one bitboard per piece kind and colour:
//
//   pieces_[WP] = all white pawns, pieces_[WN] = all white knights, ...
//
// Every other question is derived from those twelve numbers:
//
//   - "Where are the white pieces?" -> OR of the six white masks
//   - "What is on e4?"              -> test bit e4 in each of the twelve masks
//
// The second query touches a fixed twelve masks, so it is still O(1), and
// there is no separate mailbox to keep in sync. put_piece() always clears the
// target square across all masks first, which is what keeps the masks
// pairwise disjoint: a square never holds more than one piece.
//
// =============================================================================

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "bitmate/bitboard.hpp"
#include "bitmate/colour.hpp"
#include "bitmate/piece.hpp"
#include "bitmate/square.hpp"

namespace bitmate {

class Board {
public:
  [[nodiscard]] static constexpr Board empty() noexcept { return Board{}; }

  [[nodiscard]] Bitboard pieces(Piece piece) const noexcept { return pieces_[piece_index(piece)]; }

  [[nodiscard]] std::uint32_t count_pieces(Piece piece) const noexcept {
    return static_cast<std::uint32_t>(count(pieces(piece)));
  }

  [[nodiscard]] std::optional<Piece> piece_at(Square square) const noexcept {
    if ((occupancy() & square) == 0) {
      return std::nullopt;
    }
    for (const auto piece : all_pieces()) {
      if ((pieces_[piece_index(piece)] & square) != 0) {
        return piece;
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] bool has_piece_at(Square square) const noexcept {
    return (occupancy() & square) != 0;
  }

  [[nodiscard]] Bitboard occupancy(Colour colour) const noexcept {
    Bitboard result = EMPTY;
    for (const auto piece : pieces_for(colour)) {
      result |= pieces_[piece_index(piece)];
    }
    return result;
  }

  [[nodiscard]] Bitboard occupancy() const noexcept {
    Bitboard result = EMPTY;
    for (const auto mask : pieces_) {
      result |= mask;
    }
    return result;
  }

  void put_piece(Piece piece, Square square) noexcept {
    remove_piece(square);
    pieces_[piece_index(piece)] |= square;
  }

  void remove_piece(Square square) noexcept {
    for (auto& mask : pieces_) {
      mask &= ~Bitboard(square);
    }
  }

  friend bool operator==(const Board& lhs, const Board& rhs) = default;

private:
  static constexpr std::size_t piece_index(Piece piece) noexcept {
    return static_cast<std::size_t>(piece);
  }

  std::array<Bitboard, 12> pieces_{};
};

} // namespace bitmate
