#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "bitmate/bitboard.hpp"

namespace bitmate {

// A board square, a1 = 0 through h8 = 63. A Square is always on the board:
// the only ways to build one from untrusted numbers are try_from_index(),
// parse() and offset(), all of which refuse anything off the edge.
class Square {
public:
  constexpr Square() noexcept : index_(0) {}

  /// Precondition: index < 64.
  [[nodiscard]] static constexpr Square from_index(std::uint8_t index) noexcept {
    return Square(index);
  }

  [[nodiscard]] static constexpr std::optional<Square> try_from_index(int index) noexcept {
    if (index < 0 || index > 63) {
      return std::nullopt;
    }
    return Square(static_cast<std::uint8_t>(index));
  }

  /// Precondition: file < 8 and rank < 8.
  [[nodiscard]] static constexpr Square from_file_and_rank(std::uint8_t file,
                                                           std::uint8_t rank) noexcept {
    return Square(static_cast<std::uint8_t>((rank << 3) | file));
  }

  [[nodiscard]] constexpr std::uint8_t index() const noexcept { return index_; }

  /// Returns a bitboard with only this square's bit set.
  [[nodiscard]] constexpr Bitboard to_bitboard() const noexcept { return Bitboard{1} << index_; }

  constexpr operator Bitboard() const noexcept { return Bitboard{1} << index_; }

  [[nodiscard]] constexpr std::uint8_t file() const noexcept {
    return static_cast<std::uint8_t>(index_ & 7u);
  }

  [[nodiscard]] constexpr std::uint8_t rank() const noexcept {
    return static_cast<std::uint8_t>(index_ >> 3);
  }

  [[nodiscard]] constexpr std::uint8_t file_diff(Square other) const noexcept {
    return static_cast<std::uint8_t>(file() > other.file() ? file() - other.file()
                                                           : other.file() - file());
  }

  [[nodiscard]] constexpr std::uint8_t rank_diff(Square other) const noexcept {
    return static_cast<std::uint8_t>(rank() > other.rank() ? rank() - other.rank()
                                                           : other.rank() - rank());
  }

  /// The square `file_delta` files and `rank_delta` ranks away, or nullopt if
  /// that would leave the board. Never wraps from the h-file to the a-file.
  [[nodiscard]] constexpr std::optional<Square> offset(int file_delta,
                                                       int rank_delta) const noexcept {
    const int file_to = static_cast<int>(file()) + file_delta;
    const int rank_to = static_cast<int>(rank()) + rank_delta;
    if (file_to < 0 || file_to > 7 || rank_to < 0 || rank_to > 7) {
      return std::nullopt;
    }
    return from_file_and_rank(static_cast<std::uint8_t>(file_to),
                              static_cast<std::uint8_t>(rank_to));
  }

  /// The square reached by rotating the board 180 degrees (a1 <-> h8).
  [[nodiscard]] constexpr Square rotated() const noexcept {
    return Square(static_cast<std::uint8_t>(63 - index_));
  }

  [[nodiscard]] std::string to_string() const {
    const char file_char = static_cast<char>('a' + file());
    const char rank_char = static_cast<char>('1' + rank());
    return std::string{file_char, rank_char};
  }

  /// Parses algebraic coordinates such as "e4". The file letter may be upper
  /// or lower case.
  [[nodiscard]] static std::optional<Square> parse(std::string_view algebraic) noexcept {
    if (algebraic.size() != 2) {
      return std::nullopt;
    }

    char file_char = algebraic[0];
    const char rank_char = algebraic[1];

    if (file_char >= 'A' && file_char <= 'H') {
      file_char = static_cast<char>(file_char - 'A' + 'a');
    }

    if (file_char < 'a' || file_char > 'h' || rank_char < '1' || rank_char > '8') {
      return std::nullopt;
    }

    const std::uint8_t file = static_cast<std::uint8_t>(file_char - 'a');
    const std::uint8_t rank = static_cast<std::uint8_t>(rank_char - '1');
    return from_file_and_rank(file, rank);
  }

  friend constexpr bool operator==(Square lhs, Square rhs) noexcept {
    return lhs.index_ == rhs.index_;
  }
  friend constexpr bool operator!=(Square lhs, Square rhs) noexcept { return !(lhs == rhs); }
  friend constexpr bool operator<(Square lhs, Square rhs) noexcept {
    return lhs.index_ < rhs.index_;
  }

private:
  explicit constexpr Square(std::uint8_t index) noexcept : index_(index) {}

  std::uint8_t index_;
};

inline std::ostream& operator<<(std::ostream& os, Square square) {
  return os << square.to_string();
}

} // namespace bitmate
