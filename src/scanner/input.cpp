#include "csv_toolbox/input.hpp"

namespace ctb {

const char* to_string(InputShape s) {
  switch (s) {
    case InputShape::BufferedBytes:  return "buffered-bytes";
    case InputShape::BufferedString: return "buffered-string";
    case InputShape::ByteStream:     return "byte-stream";
    case InputShape::StringStream:   return "string-stream";
  }
  return "buffered-string";
}

ParseInput ParseInput::from_string(std::string text) {
  ParseInput in;
  in.shape = InputShape::BufferedString;
  in.buffer = std::move(text);
  return in;
}

ParseInput ParseInput::from_bytes(std::string bytes, std::string charset) {
  ParseInput in;
  in.shape = InputShape::BufferedBytes;
  in.buffer = std::move(bytes);
  in.charset = std::move(charset);
  return in;
}

ParseInput ParseInput::from_string_stream(std::shared_ptr<ChunkSource> src) {
  ParseInput in;
  in.shape = InputShape::StringStream;
  in.stream = std::move(src);
  return in;
}

ParseInput ParseInput::from_byte_stream(std::shared_ptr<ChunkSource> src, std::string charset) {
  ParseInput in;
  in.shape = InputShape::ByteStream;
  in.stream = std::move(src);
  in.charset = std::move(charset);
  return in;
}

TextReader::TextReader(ParseInput& input) : in_(input), decoder_(input.effective_charset()) {
  if (!decoder_.ok()) err_ = decoder_.error();
}

bool TextReader::next(std::string_view& out) {
  if (done_ || failed()) return false;
  const bool utf8 = !in_.is_bytes() || is_utf8_charset(in_.charset);

  if (!in_.is_stream()) {
    done_ = true;
    if (utf8) {
      out = in_.buffer;
      return true;
    }
    text_.clear();
    if (!decoder_.decode(in_.buffer, true, text_)) { err_ = decoder_.error(); return false; }
    out = text_;
    return true;
  }

  if (!in_.stream) {
    err_ = make_error(ErrorCode::InvalidOption, "stream input without a chunk source");
    return false;
  }
  if (!in_.stream->next(raw_)) {
    done_ = true;
    if (!in_.stream->error().ok()) { err_ = in_.stream->error(); return false; }
    if (utf8) return false;
    text_.clear();
    if (!decoder_.decode(std::string_view(), true, text_)) { err_ = decoder_.error(); return false; }
    if (text_.empty()) return false;
    out = text_;
    return true;
  }
  if (utf8) {
    out = raw_;
    return true;
  }
  text_.clear();
  if (!decoder_.decode(raw_, false, text_)) { err_ = decoder_.error(); return false; }
  out = text_;
  return true;
}

bool TextReader::read_all(std::string& out) {
  out.clear();
  std::string_view piece;
  while (next(piece)) out.append(piece.data(), piece.size());
  return !failed();
}

bool TextReader::view_all(std::string_view& out) {
  if (!in_.is_stream() && (!in_.is_bytes() || is_utf8_charset(in_.charset))) {
    done_ = true;
    out = in_.buffer;
    return true;
  }
  std::string all;
  if (!read_all(all)) return false;
  text_.swap(all);
  out = text_;
  return true;
}

}
