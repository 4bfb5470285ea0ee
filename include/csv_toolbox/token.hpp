#pragma once
#include "csv_toolbox/text_position.hpp"
#include <string>

namespace ctb {

enum class TokenKind { Field, FieldDelimiter, RecordDelimiter };

const char* to_string(TokenKind kind);

struct Token {
  TokenKind kind = TokenKind::Field;
  std::string value;   // decoded text; empty for delimiters
  Location location;
};

inline bool operator==(const Position& a, const Position& b) {
  return a.line == b.line && a.column == b.column && a.offset == b.offset;
}
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }

inline bool operator==(const Token& a, const Token& b) {
  return a.kind == b.kind && a.value == b.value &&
         a.location.start == b.location.start && a.location.end == b.location.end &&
         a.location.row == b.location.row;
}
inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }

}
