#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "bitmate/move.hpp"
#include "bitmate/movegen.hpp"
#include "bitmate/square.hpp"

namespace bitmate::cli {

// Parsed command line. Every run is single-shot: load the FEN, optionally
// play one move, then print whatever was asked for.
struct Options {
  std::string fen;
  std::optional<Move> move{};
  bool show{false};
  bool evaluate{false};
  std::optional<Square> get_moves{};
  bool help{false};
  bool version{false};
};

// Parses argv (without the program name). Accepts "--flag value",
// "--flag=value" and the short forms. Throws ParseError on unknown flags,
// missing values, malformed squares/moves or a missing --fen.
[[nodiscard]] Options parse_args(const std::vector<std::string>& args);

// "e3 e4", or an empty string for no destinations.
[[nodiscard]] std::string format_squares(const SquareList& squares);

void print_usage(std::ostream& os);

// Runs the command line. Results go to `out`, "error: ..." to `err`.
// Returns the process exit status: 0 on success, 1 on any error.
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace bitmate::cli
