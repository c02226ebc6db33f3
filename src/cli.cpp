#include "bitmate/cli.hpp"

#include <cstddef>
#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "bitmate/about.hpp"
#include "bitmate/display.hpp"
#include "bitmate/errors.hpp"
#include "bitmate/eval.hpp"
#include "bitmate/position.hpp"

namespace bitmate::cli {

namespace {

enum class Flag { Fen, Move, Show, Evaluate, GetMoves, Help, Version };

struct FlagSpec {
  std::string_view long_name;
  std::string_view short_name;
  Flag flag;
  bool takes_value;
};

constexpr FlagSpec FLAGS[] = {
    {"--fen", "-f", Flag::Fen, true},
    {"--move", "-m", Flag::Move, true},
    {"--show", "-s", Flag::Show, false},
    {"--evaluate", "-e", Flag::Evaluate, false},
    {"--get-moves", "-g", Flag::GetMoves, true},
    {"--help", "-h", Flag::Help, false},
    {"--version", "-V", Flag::Version, false},
};

const FlagSpec& find_flag(std::string_view name) {
  for (const auto& spec : FLAGS) {
    if (name == spec.long_name || name == spec.short_name) {
      return spec;
    }
  }
  throw ParseError("unknown argument '" + std::string(name) + "'");
}

Square parse_square_arg(const std::string& value) {
  const auto square = Square::parse(value);
  if (!square.has_value()) {
    throw ParseError("invalid square '" + value + "'");
  }
  return *square;
}

Move parse_move_arg(const std::string& value) {
  const auto mv = Move::parse(value);
  if (!mv.has_value()) {
    throw ParseError("invalid move '" + value + "', expected from:to such as e2:e4");
  }
  return *mv;
}

} // namespace

Options parse_args(const std::vector<std::string>& args) {
  Options options;
  bool has_fen = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view arg = args[i];
    std::optional<std::string> inline_value;

    if (arg.starts_with("--")) {
      if (const auto eq = arg.find('='); eq != std::string_view::npos) {
        inline_value = std::string(arg.substr(eq + 1));
        arg = arg.substr(0, eq);
      }
    }

    const FlagSpec& spec = find_flag(arg);

    std::string value;
    if (spec.takes_value) {
      if (inline_value.has_value()) {
        value = *inline_value;
      } else if (i + 1 < args.size()) {
        value = args[++i];
      } else {
        throw ParseError("missing value for '" + std::string(spec.long_name) + "'");
      }
    } else if (inline_value.has_value()) {
      throw ParseError("'" + std::string(spec.long_name) + "' does not take a value");
    }

    switch (spec.flag) {
    case Flag::Fen:
      options.fen = value;
      has_fen = true;
      break;
    case Flag::Move:
      options.move = parse_move_arg(value);
      break;
    case Flag::Show:
      options.show = true;
      break;
    case Flag::Evaluate:
      options.evaluate = true;
      break;
    case Flag::GetMoves:
      options.get_moves = parse_square_arg(value);
      break;
    case Flag::Help:
      options.help = true;
      break;
    case Flag::Version:
      options.version = true;
      break;
    }
  }

  if (!has_fen && !options.help && !options.version) {
    throw ParseError("missing required argument '--fen'");
  }

  return options;
}

std::string format_squares(const SquareList& squares) {
  std::string out;
  for (const auto square : squares) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += square.to_string();
  }
  return out;
}

void print_usage(std::ostream& os) {
  print_about(os);
  os << "\nUsage: bitmate --fen <FEN> [options]\n"
     << "\nOptions:\n"
     << "  -f, --fen <FEN>           position to load (required)\n"
     << "  -m, --move <from:to>      play a move first, e.g. e2:e4\n"
     << "  -s, --show                print the board\n"
     << "  -e, --evaluate            print the material balance (positive favours white)\n"
     << "  -g, --get-moves <square>  list destinations for the piece on <square>\n"
     << "  -h, --help                show this message\n"
     << "  -V, --version             show the version\n";
}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  try {
    const Options options = parse_args(args);

    if (options.help) {
      print_usage(out);
      return 0;
    }
    if (options.version) {
      print_about(out);
      return 0;
    }

    Position pos = Position::from_fen(options.fen);

    if (options.move.has_value()) {
      pos.apply_move(*options.move);
    }

    if (options.show) {
      print_board(out, pos);
    }

    if (options.evaluate) {
      out << evaluate(pos.board()) << '\n';
    }

    if (options.get_moves.has_value()) {
      const auto moves = pos.possible_moves(*options.get_moves);
      out << (moves.has_value() ? format_squares(*moves) : std::string{}) << '\n';
    }

    return 0;
  } catch (const std::exception& ex) {
    err << "error: " << ex.what() << '\n';
    return 1;
  }
}

} // namespace bitmate::cli
