#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>

#include "bitmate/errors.hpp"
#include "bitmate/mutator.hpp"
#include "bitmate/piece.hpp"
#include "bitmate/position.hpp"
#include "bitmate/square.hpp"

using namespace bitmate;

namespace {

Position parse_fen(std::string_view fen) {
  return Position::from_fen(fen);
}

Square sq(std::string_view algebraic) {
  return *Square::parse(algebraic);
}

void expect_illegal(Position pos, Square from, Square to, IllegalMoveReason reason) {
  const Position before = pos;
  try {
    pos.apply_move(from, to);
    FAIL() << "Expected IllegalMoveError for " << from << ":" << to;
  } catch (const IllegalMoveError& err) {
    EXPECT_EQ(err.reason(), reason) << err.what();
  }
  EXPECT_EQ(pos, before);
}

} // namespace

TEST(Position, DefaultIsAnEmptyBoardWithWhiteToMove) {
  const Position pos;

  EXPECT_EQ(pos.board().occupancy(), 0U);
  EXPECT_EQ(pos.colour_to_move(), Colour::White);
  EXPECT_EQ(pos.to_fen(), "8/8/8/8/8/8/8/8 w - - 0 1");
}

TEST(Position, MoveAPiece) {
  Position pos = parse_fen("8/8/8/8/8/8/8/5R2 w - - 0 1");

  pos.apply_move(sq("f1"), sq("f4"));

  EXPECT_EQ(pos.piece_at(sq("f4")), Piece::WR);
  EXPECT_EQ(pos.piece_at(sq("f1")), std::nullopt);
  EXPECT_EQ(pos.colour_to_move(), Colour::Black);
}

TEST(Position, DoublePushFromTheStartingPosition) {
  Position pos = Position::startpos();

  pos.apply_move(Square::from_index(12), Square::from_index(28));

  EXPECT_EQ(pos.piece_at(Square::from_index(28)), Piece::WP);
  EXPECT_EQ(pos.possible_moves(Square::from_index(12)), std::nullopt);
  EXPECT_EQ(pos.en_passant_square(), Square::from_index(20));
  EXPECT_EQ(pos.to_fen(), "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
}

TEST(Position, EnPassantSquareOnlyLastsOnePly) {
  Position pos = Position::startpos();

  pos.apply_move(sq("e2"), sq("e4"));
  pos.apply_move(sq("d7"), sq("d5"));
  EXPECT_EQ(pos.en_passant_square(), sq("d6"));

  pos.apply_move(sq("g1"), sq("f3"));
  EXPECT_EQ(pos.en_passant_square(), std::nullopt);

  pos.apply_move(sq("h7"), sq("h6"));
  EXPECT_EQ(pos.en_passant_square(), std::nullopt);
}

TEST(Position, CaptureRemovesTheEnemyPiece) {
  Position pos = parse_fen("4k3/8/8/3p4/4P3/8/8/4K3 w - - 0 1");

  pos.apply_move(sq("e4"), sq("d5"));

  EXPECT_EQ(pos.piece_at(sq("d5")), Piece::WP);
  EXPECT_EQ(pos.board().count_pieces(Piece::BP), 0U);
  EXPECT_EQ(pos.board().occupancy(Colour::Black), Bitboard(sq("e8")));
  EXPECT_EQ(pos.to_fen(), "4k3/8/8/3P4/8/8/8/4K3 b - - 0 1");
}

TEST(Position, SliderCapturesAcrossTheBoard) {
  Position pos = parse_fen("q3k3/8/8/8/8/8/8/Q3K3 w - - 0 1");

  pos.apply_move(sq("a1"), sq("a8"));

  EXPECT_EQ(pos.piece_at(sq("a8")), Piece::WQ);
  EXPECT_EQ(pos.board().count_pieces(Piece::BQ), 0U);
}

TEST(Position, RejectMoveFromAnEmptySquare) {
  expect_illegal(Position::startpos(), sq("e4"), sq("e5"), IllegalMoveReason::NoPieceAtSource);
}

TEST(Position, RejectMoveOutOfTurn) {
  expect_illegal(Position::startpos(), sq("e7"), sq("e5"), IllegalMoveReason::WrongSideToMove);
}

TEST(Position, RejectDestinationOutsideTheGeneratedSet) {
  expect_illegal(Position::startpos(), sq("e2"), sq("e5"), IllegalMoveReason::IllegalTarget);
  expect_illegal(Position::startpos(), sq("a1"), sq("a3"), IllegalMoveReason::IllegalTarget);
  expect_illegal(Position::startpos(), sq("e2"), sq("e2"), IllegalMoveReason::IllegalTarget);
}

TEST(Position, IllegalMoveMessagesNameTheSquares) {
  Position pos = Position::startpos();

  try {
    pos.apply_move(sq("e2"), sq("e5"));
    FAIL() << "Expected IllegalMoveError";
  } catch (const IllegalMoveError& err) {
    EXPECT_STREQ(err.what(), "illegal move e2:e5");
  }

  try {
    pos.apply_move(sq("e7"), sq("e5"));
    FAIL() << "Expected IllegalMoveError";
  } catch (const IllegalMoveError& err) {
    EXPECT_STREQ(err.what(), "piece on e7 is black but it is white to move");
  }
}

TEST(Position, PromotionIsNotAutomatic) {
  Position pos = parse_fen("4k3/P7/8/8/8/8/8/4K3 w - - 0 1");

  pos.apply_move(sq("a7"), sq("a8"));

  EXPECT_EQ(pos.piece_at(sq("a8")), Piece::WP);
}

// Castling rights -------------------------------------------------------------

TEST(Position, RookMoveRevokesItsSide) {
  Position pos = parse_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");

  pos.apply_move(sq("a1"), sq("a2"));

  EXPECT_EQ(pos.castling_rights(), CastlingRights::from({CastlingRight::WhiteKing,
                                                         CastlingRight::BlackKing,
                                                         CastlingRight::BlackQueen}));
}

TEST(Position, KingMoveRevokesBothSides) {
  Position pos = parse_fen("r3k2r/8/8/8/8/8/8/R3K2R b KQkq - 0 1");

  pos.apply_move(sq("e8"), sq("d8"));

  EXPECT_EQ(pos.castling_rights(),
            CastlingRights::from({CastlingRight::WhiteKing, CastlingRight::WhiteQueen}));
}

TEST(Position, CapturingARookOnItsCornerRevokesTheOpponentsRight) {
  Position pos = parse_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");

  pos.apply_move(sq("h1"), sq("h8"));

  EXPECT_EQ(pos.castling_rights(),
            CastlingRights::from({CastlingRight::WhiteQueen, CastlingRight::BlackQueen}));
  EXPECT_EQ(pos.to_fen(), "r3k2R/8/8/8/8/8/8/R3K3 b Qq - 0 1");
}

TEST(Position, UnrelatedMovesKeepCastlingRights) {
  Position pos = Position::startpos();

  pos.apply_move(sq("g1"), sq("f3"));
  pos.apply_move(sq("b8"), sq("c6"));

  EXPECT_EQ(pos.castling_rights(), CastlingRights::all());
}

// Invariants ------------------------------------------------------------------

TEST(Position, EveryGeneratedMoveLeavesOnlyTheMovedPieceOnTheTarget) {
  const Position start = parse_fen(
      "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");

  for (int i = 0; i < 64; ++i) {
    const Square from = Square::from_index(static_cast<std::uint8_t>(i));
    const auto piece = start.piece_at(from);
    if (!piece.has_value() || colour(*piece) != Colour::White) {
      continue;
    }

    const auto targets = start.possible_moves(from);
    ASSERT_TRUE(targets.has_value());

    for (const auto to : *targets) {
      Position pos = start;
      const bool capture = start.piece_at(to).has_value();

      pos.apply_move(from, to);

      EXPECT_EQ(pos.piece_at(to), piece) << from << ":" << to;
      EXPECT_EQ(pos.piece_at(from), std::nullopt) << from << ":" << to;
      EXPECT_EQ(count(pos.board().occupancy()),
                count(start.board().occupancy()) - (capture ? 1 : 0));
      EXPECT_EQ(pos.board().occupancy(Colour::White) & pos.board().occupancy(Colour::Black), 0U);
      EXPECT_EQ(pos.colour_to_move(), Colour::Black);
    }
  }
}

TEST(Position, CopiesAreIndependent) {
  const Position original = Position::startpos();
  Position copy = original;

  copy.apply_move(sq("e2"), sq("e4"));

  EXPECT_EQ(original.to_fen(), std::string(Position::START_POS_FEN));
  EXPECT_NE(copy, original);
}

TEST(Mutator, WorksDirectlyOnBoardAndMetadata) {
  auto board = Board::empty();
  board.put_piece(Piece::BN, sq("g8"));
  PositionMetadata metadata{Colour::Black, CastlingRights::none(), sq("e3")};

  apply_move(board, metadata, sq("g8"), sq("f6"));

  EXPECT_EQ(board.piece_at(sq("f6")), Piece::BN);
  EXPECT_EQ(metadata.turn, Colour::White);
  EXPECT_EQ(metadata.en_passant, std::nullopt);
}
