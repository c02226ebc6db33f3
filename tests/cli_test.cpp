#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "bitmate/about.hpp"
#include "bitmate/cli.hpp"
#include "bitmate/errors.hpp"
#include "bitmate/position.hpp"

using namespace bitmate;

namespace {

const std::string START_FEN{Position::START_POS_FEN};

struct RunResult {
  int status;
  std::string out;
  std::string err;
};

RunResult run_cli(const std::vector<std::string>& args) {
  std::ostringstream out;
  std::ostringstream err;
  const int status = cli::run(args, out, err);
  return {status, out.str(), err.str()};
}

} // namespace

// Argument parsing ------------------------------------------------------------

TEST(CliArgs, LongAndShortFormsAreEquivalent) {
  const auto long_form = cli::parse_args({"--fen", START_FEN, "--move", "e2:e4", "--show",
                                          "--evaluate", "--get-moves", "d7"});
  const auto short_form =
      cli::parse_args({"-f", START_FEN, "-m", "e2:e4", "-s", "-e", "-g", "d7"});

  for (const auto& options : {long_form, short_form}) {
    EXPECT_EQ(options.fen, START_FEN);
    EXPECT_EQ(options.move, Move::parse("e2:e4"));
    EXPECT_TRUE(options.show);
    EXPECT_TRUE(options.evaluate);
    EXPECT_EQ(options.get_moves, Square::parse("d7"));
    EXPECT_FALSE(options.help);
  }
}

TEST(CliArgs, InlineValues) {
  const auto options = cli::parse_args({"--fen=" + START_FEN, "--get-moves=e2"});

  EXPECT_EQ(options.fen, START_FEN);
  EXPECT_EQ(options.get_moves, Square::parse("e2"));
  EXPECT_FALSE(options.move.has_value());
}

TEST(CliArgs, FenIsRequiredUnlessAskingForHelp) {
  EXPECT_THROW((void)cli::parse_args({"--show"}), ParseError);
  EXPECT_TRUE(cli::parse_args({"--help"}).help);
  EXPECT_TRUE(cli::parse_args({"-V"}).version);
}

TEST(CliArgs, RejectsMalformedInput) {
  EXPECT_THROW((void)cli::parse_args({"--fen", START_FEN, "--bogus"}), ParseError);
  EXPECT_THROW((void)cli::parse_args({"--fen"}), ParseError);
  EXPECT_THROW((void)cli::parse_args({"--fen", START_FEN, "--move", "e2e4"}), ParseError);
  EXPECT_THROW((void)cli::parse_args({"--fen", START_FEN, "--get-moves", "z9"}), ParseError);
  EXPECT_THROW((void)cli::parse_args({"--fen", START_FEN, "--show=yes"}), ParseError);
}

TEST(CliArgs, FormatSquares) {
  EXPECT_EQ(cli::format_squares({}), "");
  EXPECT_EQ(cli::format_squares({*Square::parse("e3"), *Square::parse("e4")}), "e3 e4");
}

// Running ---------------------------------------------------------------------

TEST(CliRun, GetMovesForAPawn) {
  const auto result = run_cli({"--fen", START_FEN, "--get-moves", "e2"});

  EXPECT_EQ(result.status, 0);
  EXPECT_EQ(result.out, "e3 e4\n");
  EXPECT_EQ(result.err, "");
}

TEST(CliRun, GetMovesOnAnEmptySquarePrintsAnEmptyLine) {
  const auto result = run_cli({"--fen", START_FEN, "--get-moves", "e4"});

  EXPECT_EQ(result.status, 0);
  EXPECT_EQ(result.out, "\n");
}

TEST(CliRun, MoveIsPlayedBeforeQueryingMoves) {
  const auto result = run_cli({"--fen", START_FEN, "--move", "e2:e4", "--get-moves", "e4"});

  EXPECT_EQ(result.status, 0);
  EXPECT_EQ(result.out, "e5\n");
}

TEST(CliRun, Evaluate) {
  EXPECT_EQ(run_cli({"--fen", START_FEN, "--evaluate"}).out, "0\n");
  EXPECT_EQ(run_cli({"-f", "4k3/8/8/8/8/8/8/3QK3 w - - 0 1", "-e"}).out, "900\n");
}

TEST(CliRun, ShowPrintsTheBoardAfterTheMove) {
  const auto result = run_cli({"--fen", START_FEN, "--move", "g1:f3", "--show"});

  EXPECT_EQ(result.status, 0);
  EXPECT_NE(result.out.find("3 . . . . . N . .\n"), std::string::npos);
  EXPECT_NE(result.out.find("Turn: black\n"), std::string::npos);
}

TEST(CliRun, OutputOrderIsShowThenEvaluateThenMoves) {
  const auto result = run_cli({"-g", "b1", "-e", "-s", "-f", START_FEN});

  const auto board_at = result.out.find("8 r n b q k b n r");
  const auto eval_at = result.out.find("\n0\n");
  const auto moves_at = result.out.find("a3 c3\n");

  ASSERT_NE(board_at, std::string::npos);
  ASSERT_NE(eval_at, std::string::npos);
  ASSERT_NE(moves_at, std::string::npos);
  EXPECT_LT(board_at, eval_at);
  EXPECT_LT(eval_at, moves_at);
}

TEST(CliRun, IllegalMoveIsAnError) {
  const auto result = run_cli({"--fen", START_FEN, "--move", "e2:e5"});

  EXPECT_EQ(result.status, 1);
  EXPECT_EQ(result.out, "");
  EXPECT_EQ(result.err, "error: illegal move e2:e5\n");
}

TEST(CliRun, BadFenIsAnError) {
  const auto result = run_cli({"--fen", "8/8/8 w - - 0 1"});

  EXPECT_EQ(result.status, 1);
  EXPECT_EQ(result.err, "error: board must contain 8 rows, got 3\n");
}

TEST(CliRun, UnknownArgumentIsAnError) {
  const auto result = run_cli({"--fen", START_FEN, "--depth", "3"});

  EXPECT_EQ(result.status, 1);
  EXPECT_EQ(result.err, "error: unknown argument '--depth'\n");
}

TEST(CliRun, HelpAndVersion) {
  const auto help = run_cli({"--help"});
  EXPECT_EQ(help.status, 0);
  EXPECT_EQ(help.out.rfind(about_message(), 0), 0U);
  EXPECT_NE(help.out.find("--get-moves"), std::string::npos);

  const auto version = run_cli({"--version"});
  EXPECT_EQ(version.status, 0);
  EXPECT_EQ(version.out, about_message() + "\n");
}
