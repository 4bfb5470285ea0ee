#pragma once
#include "csv_toolbox/error.hpp"
#include <string>
#include <string_view>

namespace ctb {

// "UTF-8", "utf_8", "utf8bom" ... all count as UTF-8.
bool is_utf8_charset(std::string_view label);
bool is_supported_charset(std::string_view label);

// Converts bytes in a declared charset to UTF-8 with simdutf, carrying partial
// code units across chunk boundaries. Lone surrogates decode to U+FFFD.
class Decoder {
public:
  explicit Decoder(std::string charset);

  bool ok() const noexcept { return err_.ok(); }
  const Error& error() const noexcept { return err_; }
  const std::string& charset() const noexcept { return charset_; }

  // Appends the decoded text of `bytes` to `out`.
  bool decode(std::string_view bytes, bool final_chunk, std::string& out);

private:
  enum class Kind { Utf8, Latin1, Utf16LE, Utf16BE };

  bool decode_utf16(std::string_view bytes, bool final_chunk, std::string& out);
  bool decode_latin1(std::string_view bytes, std::string& out);

  std::string charset_;
  Kind kind_ = Kind::Utf8;
  std::string carry_;      // odd trailing byte, or a high surrogate awaiting its pair
  Error err_;
};

}
