// =============================================================================
// MOVE GENERATION: Pseudo-Legal Destinations per Square
// =============================================================================
//
// Given a board and an occupied square, list every square the piece there
// could move to under its movement rules, ignoring whether the move would
// leave its own king in check. Three techniques cover all six pieces:
//
// 1. RAY SCANS (rook, bishop, queen)
//    A sliding piece walks one direction at a time. The walk stops on the
//    first own piece (not included) or the first enemy piece (included, it is
//    a capture). Each ray's length is computed from the origin's file and rank
//    BEFORE walking, so stepping by +7 from the a-file can never land on the
//    h-file of the next rank.
//
// 2. EDGE-AWARE OFFSETS (knight, king)
//    Jumping pieces have a fixed list of index offsets. An offset is dropped
//    when the origin sits too close to the edge it points at; the survivors
//    are then checked against own occupancy.
//
// 3. PAWN RULES
//    Pushes need an empty square (two empty squares for the double push from
//    the starting rank), captures need an enemy piece on the diagonal.
//
// The order of the returned squares is fixed per piece kind and pinned by
// the tests, so callers can rely on it.
//
// =============================================================================

#include "bitmate/movegen.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>

#include "bitmate/bitboard.hpp"
#include "bitmate/piece.hpp"

namespace bitmate {

namespace {

// An index offset together with the file and rank change it is meant to
// produce. The deltas are what the edge checks look at.
struct Jump {
  int step;
  int file_delta;
  int rank_delta;
};

// =============================================================================
// KNIGHT JUMPS
// =============================================================================
// An "L": two squares one way, one square perpendicular.
//
//   +6  = up 1, left 2      +10 = up 1, right 2
//   +15 = up 2, left 1      +17 = up 2, right 1
//   -6  = down 1, right 2   -10 = down 1, left 2
//   -15 = down 2, right 1   -17 = down 2, left 1
//
// On an edge file (or rank) every jump towards that edge wraps, so all of
// them go. One file (or rank) in from the edge, only the jumps that move two
// files (or ranks) that way wrap.
// =============================================================================
constexpr std::array<Jump, 8> KNIGHT_JUMPS = {{
    {6, -2, 1},
    {10, 2, 1},
    {15, -1, 2},
    {17, 1, 2},
    {-6, 2, -1},
    {-10, -2, -1},
    {-15, 1, -2},
    {-17, -1, -2},
}};

// One square in each direction, in the order the destinations are listed.
constexpr std::array<Jump, 8> KING_STEPS = {{
    {-1, -1, 0},
    {1, 1, 0},
    {-7, 1, -1},
    {7, -1, 1},
    {-8, 0, -1},
    {8, 0, 1},
    {-9, -1, -1},
    {9, 1, 1},
}};

constexpr std::array<Bitboard, 2> PAWN_START_RANKS = {RANK_MASKS[1], RANK_MASKS[6]};

constexpr int forward(Colour colour) {
  return colour == Colour::White ? 1 : -1;
}

// True if `delta` moves off the board from `coordinate` (a file or a rank).
constexpr bool crosses_edge(int coordinate, int delta) {
  if (delta < 0) {
    return coordinate < -delta;
  }
  return coordinate + delta > 7;
}

bool jump_wraps(const Jump& jump, Square from) {
  return crosses_edge(from.file(), jump.file_delta) || crosses_edge(from.rank(), jump.rank_delta);
}

// Shared tail for knight and king: drop wrapping offsets, bound to the board,
// drop squares holding one of our own pieces.
template <std::size_t N>
SquareList jump_moves(const Board& board, Square from, Colour mover,
                      const std::array<Jump, N>& jumps) {
  SquareList result;
  const Bitboard own = board.occupancy(mover);

  for (const auto& jump : jumps) {
    if (jump_wraps(jump, from)) {
      continue;
    }

    const auto target = Square::try_from_index(static_cast<int>(from.index()) + jump.step);
    if (!target.has_value() || (own & *target) != 0) {
      continue;
    }

    result.push_back(*target);
  }

  return result;
}

void scan_rays(const Board& board, Colour mover, Square from, std::initializer_list<Ray> rays,
               SquareList& out) {
  for (const auto ray : rays) {
    ray_scan(board, mover, from, ray, out);
  }
}

} // namespace

void ray_scan(const Board& board, Colour mover, Square from, Ray ray, SquareList& out) {
  const Bitboard own = board.occupancy(mover);
  const Bitboard enemy = board.occupancy(!mover);

  int index = from.index();
  for (int i = 0; i < ray.length; ++i) {
    index += ray.step;

    const auto square = Square::try_from_index(index);
    if (!square.has_value() || (own & *square) != 0) {
      return;
    }

    out.push_back(*square);

    if ((enemy & *square) != 0) {
      return;
    }
  }
}

// =============================================================================
// SLIDING PIECES
// =============================================================================
// The ray lengths are the number of squares between the origin and the edge
// in that direction. For diagonals that is the smaller of the two distances:
// a bishop on b6 can go NW only once (one file left), even though two ranks
// remain above it.
// =============================================================================

SquareList rook_moves(const Board& board, Square from, Colour mover) {
  const int file = from.file();
  const int rank = from.rank();

  SquareList result;
  scan_rays(board, mover, from,
            {
                Ray{-1, file},     // left, towards the a-file
                Ray{1, 7 - file},  // right
                Ray{8, 7 - rank},  // up
                Ray{-8, rank},     // down
            },
            result);
  return result;
}

SquareList bishop_moves(const Board& board, Square from, Colour mover) {
  const int file = from.file();
  const int rank = from.rank();

  SquareList result;
  scan_rays(board, mover, from,
            {
                Ray{7, std::min(file, 7 - rank)},      // NW
                Ray{-9, std::min(file, rank)},         // SW
                Ray{9, std::min(7 - file, 7 - rank)},  // NE
                Ray{-7, std::min(7 - file, rank)},     // SE
            },
            result);
  return result;
}

SquareList queen_moves(const Board& board, Square from, Colour mover) {
  SquareList result = rook_moves(board, from, mover);
  const SquareList diagonals = bishop_moves(board, from, mover);
  result.insert(result.end(), diagonals.begin(), diagonals.end());
  return result;
}

// No check-safety here: a king may step next to the enemy king.
SquareList king_moves(const Board& board, Square from, Colour mover) {
  return jump_moves(board, from, mover, KING_STEPS);
}

SquareList knight_moves(const Board& board, Square from, Colour mover) {
  return jump_moves(board, from, mover, KNIGHT_JUMPS);
}

// =============================================================================
// PAWNS
// =============================================================================
// Order: single push, double push, capture towards the a-file, capture
// towards the h-file. A pawn on its last rank (only reachable through FEN)
// has nowhere to go. En passant captures are not generated.
// =============================================================================

SquareList pawn_moves(const Board& board, Square from, Colour mover) {
  SquareList result;
  const int dir = forward(mover);
  const Bitboard occupied = board.occupancy();
  const Bitboard enemy = board.occupancy(!mover);

  if (const auto single = from.offset(0, dir); single.has_value() && (occupied & *single) == 0) {
    result.push_back(*single);

    if ((PAWN_START_RANKS[static_cast<std::size_t>(mover)] & from) != 0) {
      if (const auto dbl = from.offset(0, 2 * dir); dbl.has_value() && (occupied & *dbl) == 0) {
        result.push_back(*dbl);
      }
    }
  }

  for (const int file_delta : {-1, 1}) {
    if (const auto target = from.offset(file_delta, dir);
        target.has_value() && (enemy & *target) != 0) {
      result.push_back(*target);
    }
  }

  return result;
}

std::optional<SquareList> possible_moves(const Board& board, Square from) {
  const auto piece = board.piece_at(from);
  if (!piece.has_value()) {
    return std::nullopt;
  }

  const Colour mover = colour(*piece);

  switch (kind(*piece)) {
  case PieceKind::Pawn:
    return pawn_moves(board, from, mover);
  case PieceKind::Knight:
    return knight_moves(board, from, mover);
  case PieceKind::Bishop:
    return bishop_moves(board, from, mover);
  case PieceKind::Rook:
    return rook_moves(board, from, mover);
  case PieceKind::Queen:
    return queen_moves(board, from, mover);
  case PieceKind::King:
    return king_moves(board, from, mover);
  }

  return std::nullopt;
}

} // namespace bitmate
