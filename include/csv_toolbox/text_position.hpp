#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ctb {

struct Position {
  std::uint64_t line   = 1;
  std::uint64_t column = 1; // code points, 1-based
  std::uint64_t offset = 0; // bytes from the start of the document
};

struct Location {
  Position start;
  Position end;
  std::uint64_t row = 1;    // logical row, 1-based
};

// Advances line/column/offset one byte at a time, so positions do not depend on
// how the input was chunked. CR, LF and CRLF each count as one line break.
class PositionTracker {
public:
  void advance(char ch) noexcept {
    const auto c = static_cast<unsigned char>(ch);
    ++pos_.offset;
    if (c == '\n') {
      if (!after_cr_) ++pos_.line;
      pos_.column = 1;
      after_cr_ = false;
      return;
    }
    after_cr_ = false;
    if (c == '\r') {
      ++pos_.line;
      pos_.column = 1;
      after_cr_ = true;
      return;
    }
    if ((c & 0xC0) != 0x80) ++pos_.column; // skip UTF-8 continuation bytes
  }

  const Position& position() const noexcept { return pos_; }
  void reset() noexcept { pos_ = Position{}; after_cr_ = false; }

private:
  Position pos_;
  bool after_cr_ = false;
};

// Position of byte `offset` in `text`. Linear; meant for error reporting only.
inline Position position_at(std::string_view text, std::size_t offset) {
  PositionTracker t;
  if (offset > text.size()) offset = text.size();
  for (std::size_t i = 0; i < offset; ++i) t.advance(text[i]);
  return t.position();
}

std::string to_string(const Position& p);

}
