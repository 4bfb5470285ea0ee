#pragma once
#include "csv_toolbox/text_position.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace ctb {

enum class ErrorCode {
  None,
  InvalidOption,        // bad configuration, raised before any input is read
  ParseError,           // malformed content
  ColumnCountMismatch,  // strict column policy violation
  BufferLimitExceeded,  // field size / field count / input size guards
  Cancelled,            // cooperative cancellation, message carries the reason
  BackendUnavailable,   // recoverable; drives fallback
  Io,                   // chunk source or file failure
};

const char* to_string(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;
  std::optional<Position> position;
  std::uint64_t row = 0;   // 0 when not row scoped
  std::string source;      // optional input label

  bool ok() const noexcept { return code == ErrorCode::None; }

  // "<Code>: <message> (line L, column C) at row R in '<source>'"
  std::string to_string() const;
};

Error make_error(ErrorCode code, std::string message);

// Only BackendUnavailable lets the runner try the next candidate.
inline bool is_recoverable(ErrorCode code) { return code == ErrorCode::BackendUnavailable; }

inline bool set_error(Error* err_out, Error e) {
  if (err_out) *err_out = std::move(e);
  return false;
}

}
