#pragma once

// =============================================================================
// BITBOARDS
// =============================================================================
//
// A bitboard is a 64-bit integer where each bit stands for one square:
//
//   - Bit 0 = a1, bit 7 = h1, bit 8 = a2, ..., bit 63 = h8
//   - file = index % 8, rank = index / 8
//
// Twelve of these (one per piece kind and colour) describe a whole board.
// Occupancy questions ("is anything on e4?", "where are the white pieces?")
// become a single AND or OR across those masks.
//
// Move generation in this engine walks squares one at a time rather than
// shifting whole masks, but the masks below are still how edges are named:
// a square on FILE_A has nothing to its left, a square on RANK_8 has nothing
// above it.
//
// =============================================================================

#include <bit>
#include <cstdint>

namespace bitmate {

// bit 0 = A1, bit 1 = B1, ..., bit 7 = H1, bit 8 = A2, ..., bit 63 = H8.
using Bitboard = std::uint64_t;

inline constexpr Bitboard EMPTY = 0;

inline constexpr Bitboard FILE_MASKS[8] = {
    0x0101'0101'0101'0101ull, // File A
    0x0202'0202'0202'0202ull, // File B
    0x0404'0404'0404'0404ull, // File C
    0x0808'0808'0808'0808ull, // File D
    0x1010'1010'1010'1010ull, // File E
    0x2020'2020'2020'2020ull, // File F
    0x4040'4040'4040'4040ull, // File G
    0x8080'8080'8080'8080ull, // File H
};

inline constexpr Bitboard RANK_MASKS[8] = {
    0x0000'0000'0000'00FFull, // Rank 1
    0x0000'0000'0000'FF00ull, // Rank 2
    0x0000'0000'00FF'0000ull, // Rank 3
    0x0000'0000'FF00'0000ull, // Rank 4
    0x0000'00FF'0000'0000ull, // Rank 5
    0x0000'FF00'0000'0000ull, // Rank 6
    0x00FF'0000'0000'0000ull, // Rank 7
    0xFF00'0000'0000'0000ull, // Rank 8
};

inline constexpr Bitboard FILE_A = FILE_MASKS[0];
inline constexpr Bitboard FILE_H = FILE_MASKS[7];
inline constexpr Bitboard RANK_1 = RANK_MASKS[0];
inline constexpr Bitboard RANK_8 = RANK_MASKS[7];

[[nodiscard]] constexpr int count(Bitboard bitboard) noexcept {
  return std::popcount(bitboard);
}

} // namespace bitmate
