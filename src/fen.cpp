#include "bitmate/position.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "bitmate/errors.hpp"
#include "bitmate/piece.hpp"

namespace bitmate {
namespace {

[[nodiscard]] ParseError make_error(const std::string& msg) {
  return ParseError(msg);
}

bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::vector<std::string_view> split_fields(std::string_view fen) {
  std::vector<std::string_view> parts;
  parts.reserve(6);

  std::size_t pos = 0;
  while (pos < fen.size()) {
    while (pos < fen.size() && std::isspace(static_cast<unsigned char>(fen[pos])) != 0) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < fen.size() && std::isspace(static_cast<unsigned char>(fen[pos])) == 0) {
      ++pos;
    }
    if (pos > start) {
      parts.emplace_back(fen.substr(start, pos - start));
    }
  }

  return parts;
}

Colour parse_colour_to_move(std::string_view colour) {
  if (colour == "w") {
    return Colour::White;
  }
  if (colour == "b") {
    return Colour::Black;
  }
  throw make_error("invalid colour to move '" + std::string(colour) + "'");
}

CastlingRights parse_castling_rights(std::string_view str) {
  if (str == "-") {
    return CastlingRights::none();
  }

  CastlingRights rights = CastlingRights::none();
  for (const char c : str) {
    const auto right = castling_right_from_char(c);
    if (!right.has_value()) {
      throw make_error("invalid castling rights '" + std::string(str) + "'");
    }
    if (rights.has(*right)) {
      throw make_error("duplicate castling right '" + std::string(1, c) + "'");
    }
    rights.add(*right);
  }
  return rights;
}

std::optional<Square> parse_en_passant_square(std::string_view square) {
  if (square == "-") {
    return std::nullopt;
  }

  // FEN writes files in lower case; Square::parse would also take "E3".
  const auto parsed = Square::parse(square);
  if (!parsed.has_value() || std::isupper(static_cast<unsigned char>(square[0])) != 0) {
    throw make_error("invalid en passant square '" + std::string(square) + "'");
  }

  return parsed;
}

void parse_move_counter(std::string_view str, const char* name) {
  if (str.empty() || !std::all_of(str.begin(), str.end(), is_digit)) {
    throw make_error(std::string("invalid ") + name + " '" + std::string(str) + "'");
  }
}

// One rank of the placement field, a-file first. Pieces go onto `rank`.
void parse_rank(std::string_view row, std::uint8_t rank, Board& board) {
  int file = 0;
  bool previous_was_digit = false;

  for (const char c : row) {
    if (is_digit(c)) {
      if (previous_was_digit) {
        throw make_error("rank " + std::to_string(rank + 1) + " has consecutive digits");
      }
      if (c < '1' || c > '8') {
        throw make_error("invalid empty square count '" + std::string(1, c) + "'");
      }
      previous_was_digit = true;
      file += c - '0';
      continue;
    }

    previous_was_digit = false;
    const Piece piece = parse_piece(c);

    if (file < 8) {
      board.put_piece(piece, Square::from_file_and_rank(static_cast<std::uint8_t>(file), rank));
    }
    ++file;
  }

  if (file != 8) {
    std::ostringstream oss;
    oss << "rank " << rank + 1 << " must contain 8 squares, got " << file;
    throw make_error(oss.str());
  }
}

Board parse_board(std::string_view str) {
  const auto row_count = static_cast<std::size_t>(std::count(str.begin(), str.end(), '/')) + 1U;
  if (row_count != 8) {
    std::ostringstream oss;
    oss << "board must contain 8 rows, got " << row_count;
    throw make_error(oss.str());
  }

  Board board = Board::empty();

  // Rows are listed from rank 8 down to rank 1.
  std::size_t start = 0;
  for (int rank = 7; rank >= 0; --rank) {
    const auto slash = str.find('/', start);
    const auto row = str.substr(start, slash == std::string_view::npos ? str.npos : slash - start);
    parse_rank(row, static_cast<std::uint8_t>(rank), board);
    start = slash + 1;
  }

  return board;
}

std::string board_to_fen(const Board& board) {
  std::string output;
  output.reserve(64 + 7); // pieces plus slashes

  for (int rank = 7; rank >= 0; --rank) {
    std::uint8_t empty_run = 0;

    for (int file = 0; file < 8; ++file) {
      const Square square = Square::from_file_and_rank(static_cast<std::uint8_t>(file),
                                                       static_cast<std::uint8_t>(rank));

      if (const auto piece = board.piece_at(square); piece.has_value()) {
        if (empty_run > 0) {
          output.push_back(static_cast<char>('0' + empty_run));
          empty_run = 0;
        }
        output.push_back(to_char(*piece));
      } else {
        ++empty_run;
      }
    }

    if (empty_run > 0) {
      output.push_back(static_cast<char>('0' + empty_run));
    }

    if (rank > 0) {
      output.push_back('/');
    }
  }

  return output;
}

} // namespace

Position Position::from_fen(std::string_view fen) {
  const auto parts = split_fields(fen);

  constexpr std::size_t NUM_PARTS = 6;
  if (parts.size() != NUM_PARTS) {
    std::ostringstream oss;
    oss << "FEN must contain " << NUM_PARTS << " parts, got " << parts.size();
    throw make_error(oss.str());
  }

  Board board = parse_board(parts[0]);

  PositionMetadata metadata;
  metadata.turn = parse_colour_to_move(parts[1]);
  metadata.castling_rights = parse_castling_rights(parts[2]);
  metadata.en_passant = parse_en_passant_square(parts[3]);

  parse_move_counter(parts[4], "half-move clock");
  parse_move_counter(parts[5], "full-move number");

  return Position{board, metadata};
}

std::string Position::to_fen() const {
  const std::string en_passant_fen =
      metadata_.en_passant.has_value() ? metadata_.en_passant->to_string() : "-";

  std::ostringstream oss;
  oss << board_to_fen(board_) << ' ' << to_char(metadata_.turn) << ' '
      << castling_rights_to_fen(metadata_.castling_rights) << ' ' << en_passant_fen << " 0 1";
  return oss.str();
}

std::string castling_rights_to_fen(CastlingRights rights) {
  if (rights.empty()) {
    return "-";
  }

  std::string output;
  for (const auto right : ALL_CASTLING_RIGHTS) {
    if (rights & right) {
      output.push_back(to_char(right));
    }
  }
  return output;
}

} // namespace bitmate
