#pragma once
#include "csv_toolbox/chunk_source.hpp"
#include "csv_toolbox/decoder.hpp"
#include "csv_toolbox/error.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace ctb {

enum class InputShape { BufferedBytes, BufferedString, ByteStream, StringStream };

const char* to_string(InputShape s);

struct ParseInput {
  InputShape shape = InputShape::BufferedString;
  std::string buffer;                   // buffered shapes
  std::shared_ptr<ChunkSource> stream;  // stream shapes
  std::string charset = "utf-8";        // byte shapes; string shapes are UTF-8

  static ParseInput from_string(std::string text);
  static ParseInput from_bytes(std::string bytes, std::string charset = "utf-8");
  static ParseInput from_string_stream(std::shared_ptr<ChunkSource> src);
  static ParseInput from_byte_stream(std::shared_ptr<ChunkSource> src, std::string charset = "utf-8");

  bool is_stream() const noexcept {
    return shape == InputShape::ByteStream || shape == InputShape::StringStream;
  }
  bool is_bytes() const noexcept {
    return shape == InputShape::BufferedBytes || shape == InputShape::ByteStream;
  }
  // Charset that decides backend eligibility.
  std::string effective_charset() const { return is_bytes() ? charset : std::string("utf-8"); }
};

// Hands out UTF-8 text for any input shape. Buffered UTF-8 is returned as a
// view of the input buffer without copying.
class TextReader {
public:
  explicit TextReader(ParseInput& input);

  bool next(std::string_view& out);
  bool read_all(std::string& out);
  // Whole document as one view; copies only when decoding or draining a stream.
  bool view_all(std::string_view& out);

  bool failed() const noexcept { return !err_.ok(); }
  const Error& error() const noexcept { return err_; }

private:
  ParseInput& in_;
  Decoder decoder_;
  std::string raw_;
  std::string text_;
  bool done_ = false;
  Error err_;
};

}
