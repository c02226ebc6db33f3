#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>

#include "bitmate/colour.hpp"
#include "bitmate/square.hpp"

namespace bitmate {

// Bit values match the order the FEN field lists them in: K, Q, k, q.
enum class CastlingRight : std::uint8_t {
  WhiteKing = 1,
  WhiteQueen = 2,
  BlackKing = 4,
  BlackQueen = 8,
};

inline constexpr std::array<CastlingRight, 4> ALL_CASTLING_RIGHTS = {
    CastlingRight::WhiteKing,
    CastlingRight::WhiteQueen,
    CastlingRight::BlackKing,
    CastlingRight::BlackQueen,
};

[[nodiscard]] constexpr char to_char(CastlingRight right) {
  switch (right) {
  case CastlingRight::WhiteKing:
    return 'K';
  case CastlingRight::WhiteQueen:
    return 'Q';
  case CastlingRight::BlackKing:
    return 'k';
  case CastlingRight::BlackQueen:
    return 'q';
  }
  return '?';
}

[[nodiscard]] constexpr std::optional<CastlingRight> castling_right_from_char(char c) {
  for (const auto right : ALL_CASTLING_RIGHTS) {
    if (to_char(right) == c) {
      return right;
    }
  }
  return std::nullopt;
}

namespace detail {

// Rights lost when a move starts or ends on each square, as a mask.
// Only a1, e1, h1, a8, e8 and h8 cost anything.
constexpr std::array<std::uint8_t, 64> make_revocation_table() {
  std::array<std::uint8_t, 64> table{};
  const auto bits = [](std::initializer_list<CastlingRight> rights) {
    std::uint8_t mask = 0;
    for (const auto right : rights) {
      mask |= static_cast<std::uint8_t>(right);
    }
    return mask;
  };

  table[0] = bits({CastlingRight::WhiteQueen});
  table[4] = bits({CastlingRight::WhiteKing, CastlingRight::WhiteQueen});
  table[7] = bits({CastlingRight::WhiteKing});
  table[56] = bits({CastlingRight::BlackQueen});
  table[60] = bits({CastlingRight::BlackKing, CastlingRight::BlackQueen});
  table[63] = bits({CastlingRight::BlackKing});
  return table;
}

inline constexpr std::array<std::uint8_t, 64> REVOCATION_TABLE = make_revocation_table();

} // namespace detail

// Four independent flags. Rights are only ever granted by FEN and only ever
// taken away by moves; castling itself is not executed by this engine.
class CastlingRights {
public:
  constexpr CastlingRights() = default;

  static constexpr CastlingRights none() { return CastlingRights(0); }
  static constexpr CastlingRights all() { return CastlingRights(0b1111); }

  static constexpr CastlingRights from(std::initializer_list<CastlingRight> rights) {
    auto result = CastlingRights::none();
    for (auto right : rights) {
      result.add(right);
    }
    return result;
  }

  constexpr bool has(CastlingRight right) const {
    return (mask_ & static_cast<std::uint8_t>(right)) != 0;
  }

  constexpr bool empty() const { return mask_ == 0; }

  constexpr void add(CastlingRight right) { mask_ |= static_cast<std::uint8_t>(right); }

  constexpr void remove(CastlingRight right) {
    mask_ &= static_cast<std::uint8_t>(~static_cast<std::uint8_t>(right));
  }

  constexpr void remove_for_colour(Colour colour) {
    if (colour == Colour::White) {
      remove(CastlingRight::WhiteKing);
      remove(CastlingRight::WhiteQueen);
    } else {
      remove(CastlingRight::BlackKing);
      remove(CastlingRight::BlackQueen);
    }
  }

  // Called with both squares of every move.
  constexpr void revoke_for_square(Square square) {
    mask_ &= static_cast<std::uint8_t>(~detail::REVOCATION_TABLE[square.index()]);
  }

  constexpr std::uint8_t value() const { return mask_; }

  friend constexpr bool operator==(CastlingRights lhs, CastlingRights rhs) = default;

  friend constexpr bool operator&(CastlingRights lhs, CastlingRight rhs) { return lhs.has(rhs); }

private:
  explicit constexpr CastlingRights(std::uint8_t mask) : mask_{mask} {}

  std::uint8_t mask_{0};
};

} // namespace bitmate
