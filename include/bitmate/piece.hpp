#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "bitmate/colour.hpp"
#include "bitmate/errors.hpp"

namespace bitmate {

enum class PieceKind : std::uint8_t { Pawn, Knight, Bishop, Rook, Queen, King };

/// Chess pieces enumeration.
/// Naming convention: [Colour][Piece]
/// Colours: W = White, B = Black
/// Pieces: P = Pawn, N = Knight (N to avoid confusion with King),
///         B = Bishop, R = Rook, Q = Queen, K = King
///
/// The order matches PieceKind within each colour, so kind() and colour()
/// are plain arithmetic on the underlying value.
enum class Piece : int {
  WP, // White Pawn
  WN, // White Knight
  WB, // White Bishop
  WR, // White Rook
  WQ, // White Queen
  WK, // White King
  BP, // Black Pawn
  BN, // Black Knight
  BB, // Black Bishop
  BR, // Black Rook
  BQ, // Black Queen
  BK, // Black King
};

inline constexpr std::array<Piece, 12> ALL_PIECES = {
    Piece::WP, Piece::WN, Piece::WB, Piece::WR, Piece::WQ, Piece::WK,
    Piece::BP, Piece::BN, Piece::BB, Piece::BR, Piece::BQ, Piece::BK,
};

inline constexpr std::array<std::array<Piece, 6>, 2> PIECES_BY_COLOUR = {{
    {Piece::WP, Piece::WN, Piece::WB, Piece::WR, Piece::WQ, Piece::WK},
    {Piece::BP, Piece::BN, Piece::BB, Piece::BR, Piece::BQ, Piece::BK},
}};

constexpr const std::array<Piece, 12>& all_pieces() {
  return ALL_PIECES;
}

constexpr const std::array<Piece, 6>& pieces_for(Colour colour) {
  return PIECES_BY_COLOUR[static_cast<std::size_t>(colour)];
}

constexpr Piece make_piece(PieceKind kind, Colour colour) {
  return static_cast<Piece>(static_cast<int>(colour) * 6 + static_cast<int>(kind));
}

constexpr PieceKind kind(Piece piece) {
  return static_cast<PieceKind>(static_cast<int>(piece) % 6);
}

constexpr Colour colour(Piece piece) {
  return static_cast<int>(piece) <= static_cast<int>(Piece::WK) ? Colour::White : Colour::Black;
}

constexpr bool is_pawn(Piece piece) {
  return kind(piece) == PieceKind::Pawn;
}

constexpr char to_char(Piece piece) {
  switch (piece) {
  case Piece::WP:
    return 'P';
  case Piece::WN:
    return 'N';
  case Piece::WB:
    return 'B';
  case Piece::WR:
    return 'R';
  case Piece::WQ:
    return 'Q';
  case Piece::WK:
    return 'K';
  case Piece::BP:
    return 'p';
  case Piece::BN:
    return 'n';
  case Piece::BB:
    return 'b';
  case Piece::BR:
    return 'r';
  case Piece::BQ:
    return 'q';
  case Piece::BK:
    return 'k';
  }
  return '?';
}

/// FEN glyph to piece: upper case is white, lower case is black.
constexpr std::optional<Piece> piece_from_char(char glyph) {
  for (const auto piece : ALL_PIECES) {
    if (to_char(piece) == glyph) {
      return piece;
    }
  }
  return std::nullopt;
}

/// Like piece_from_char(), but throws UnsupportedPieceError for anything that
/// is not one of "PNBRQKpnbrqk".
inline Piece parse_piece(char glyph) {
  const auto piece = piece_from_char(glyph);
  if (!piece.has_value()) {
    throw UnsupportedPieceError(glyph);
  }
  return *piece;
}

inline std::string to_string(Piece piece) {
  return std::string(1, to_char(piece));
}

inline std::ostream& operator<<(std::ostream& os, Piece piece) {
  os << to_char(piece);
  return os;
}

} // namespace bitmate
