#include "csv_toolbox/error.hpp"
#include "csv_toolbox/token.hpp"
#include <sstream>

namespace ctb {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:                return "None";
    case ErrorCode::InvalidOption:       return "InvalidOption";
    case ErrorCode::ParseError:          return "ParseError";
    case ErrorCode::ColumnCountMismatch: return "ColumnCountMismatch";
    case ErrorCode::BufferLimitExceeded: return "BufferLimitExceeded";
    case ErrorCode::Cancelled:           return "Cancelled";
    case ErrorCode::BackendUnavailable:  return "BackendUnavailable";
    case ErrorCode::Io:                  return "Io";
  }
  return "Unknown";
}

const char* to_string(TokenKind kind) {
  switch (kind) {
    case TokenKind::Field:           return "Field";
    case TokenKind::FieldDelimiter:  return "FieldDelimiter";
    case TokenKind::RecordDelimiter: return "RecordDelimiter";
  }
  return "Unknown";
}

std::string to_string(const Position& p) {
  std::ostringstream o;
  o << "line " << p.line << ", column " << p.column << ", offset " << p.offset;
  return o.str();
}

Error make_error(ErrorCode code, std::string message) {
  Error e;
  e.code = code;
  e.message = std::move(message);
  return e;
}

std::string Error::to_string() const {
  std::ostringstream o;
  o << ctb::to_string(code) << ": " << message;
  if (position) o << " (" << ctb::to_string(*position) << ")";
  if (row) o << " at row " << row;
  if (!source.empty()) o << " in '" << source << "'";
  return o.str();
}

}
