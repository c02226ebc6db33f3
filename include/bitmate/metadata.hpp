#pragma once

#include <optional>

#include "bitmate/castling.hpp"
#include "bitmate/colour.hpp"
#include "bitmate/square.hpp"

namespace bitmate {

// Everything about a position that is not piece placement. The FEN move
// counters are not kept.
struct PositionMetadata {
  Colour turn{Colour::White};
  CastlingRights castling_rights{CastlingRights::none()};
  std::optional<Square> en_passant{};

  friend bool operator==(const PositionMetadata& lhs, const PositionMetadata& rhs) = default;
};

} // namespace bitmate
