#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "bitmate/square.hpp"

namespace bitmate {

// A move is just an origin and a destination. What kind of move it is
// (push, capture, double push) is read off the board when it is applied.
struct Move {
  Square from{};
  Square to{};

  /// Parses the "from:to" coordinate form used on the command line, for
  /// example "e2:e4" or "E2:E4".
  [[nodiscard]] static std::optional<Move> parse(std::string_view str) noexcept {
    const auto colon = str.find(':');
    if (colon == std::string_view::npos) {
      return std::nullopt;
    }

    const auto from = Square::parse(str.substr(0, colon));
    const auto to = Square::parse(str.substr(colon + 1));
    if (!from.has_value() || !to.has_value()) {
      return std::nullopt;
    }

    return Move{*from, *to};
  }

  [[nodiscard]] std::string to_string() const { return from.to_string() + ":" + to.to_string(); }

  friend constexpr bool operator==(const Move& lhs, const Move& rhs) noexcept {
    return lhs.from == rhs.from && lhs.to == rhs.to;
  }

  friend constexpr bool operator!=(const Move& lhs, const Move& rhs) noexcept {
    return !(lhs == rhs);
  }
};

inline std::ostream& operator<<(std::ostream& os, const Move& mv) {
  return os << mv.to_string();
}

} // namespace bitmate
