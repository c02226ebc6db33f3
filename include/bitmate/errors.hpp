#pragma once

#include <stdexcept>
#include <string>

namespace bitmate {

// Base for every error the library throws. Callers that only want a message
// can catch this (or std::runtime_error) and print what().
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed FEN field or coordinate.
class ParseError : public Error {
public:
  using Error::Error;
};

// A glyph that names no piece. Inside a FEN placement field this is also a
// ParseError.
class UnsupportedPieceError : public ParseError {
public:
  explicit UnsupportedPieceError(char glyph)
      : ParseError(std::string("invalid piece '") + glyph + "'"), glyph_(glyph) {}

  [[nodiscard]] char glyph() const noexcept { return glyph_; }

private:
  char glyph_;
};

enum class IllegalMoveReason {
  NoPieceAtSource,
  WrongSideToMove,
  IllegalTarget,
};

class IllegalMoveError : public Error {
public:
  IllegalMoveError(IllegalMoveReason reason, const std::string& message)
      : Error(message), reason_(reason) {}

  [[nodiscard]] IllegalMoveReason reason() const noexcept { return reason_; }

private:
  IllegalMoveReason reason_;
};

} // namespace bitmate
