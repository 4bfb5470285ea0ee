#pragma once
#include "csv_toolbox/cancellation.hpp"
#include "csv_toolbox/error.hpp"
#include "csv_toolbox/token.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace ctb {

constexpr std::size_t kDefaultMaxBufferSize = 10 * 1024 * 1024; // 10 MiB per field

struct LexerConfig {
  std::string delimiter = ",";
  std::string quotation = "\"";
  std::size_t max_buffer_size = kDefaultMaxBufferSize; // unterminated-quote guard
  std::string source;                                  // label for messages
  CancellationToken cancel;                            // checked at row boundaries
};

// Delimiter and quotation: one character (UTF-8 code point) each, distinct, not CR/LF.
bool validate_lexer_config(const LexerConfig& cfg, Error* err_out = nullptr);

// Shared by every backend so failures read the same regardless of which one ran.
Error make_unexpected_eof_error(const Position& at, std::uint64_t row, const std::string& source);
Error make_field_size_error(std::size_t limit, const Position& field_start, std::uint64_t row,
                            const std::string& source);

// Streaming CSV tokenizer. Chunks may be split anywhere (inside a field, a
// quote escape, a CRLF or a UTF-8 sequence); the token stream is the same as
// for the unsplit document.
class CsvLexer {
public:
  // Return false to stop lexing; feed()/finish() then return false with no error set.
  using TokenCallback = std::function<bool(const Token&)>;

  explicit CsvLexer(LexerConfig cfg);
  ~CsvLexer();
  CsvLexer(const CsvLexer&) = delete;
  CsvLexer& operator=(const CsvLexer&) = delete;

  // False when the config did not validate; error() says why.
  bool ok() const;

  bool feed(std::string_view chunk, const TokenCallback& on_token);
  bool feed(std::string_view chunk, bool final_chunk, const TokenCallback& on_token);
  // Flushes the pending field and resets for a new document.
  bool finish(const TokenCallback& on_token);

  const Error& error() const;
  std::uint64_t rows() const;      // record delimiters emitted so far
  Position position() const;       // cursor, after the last consumed byte

private:
  struct Impl; Impl* p_;
};

}
