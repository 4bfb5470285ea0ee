#include "csv_toolbox/csv_lexer.hpp"
#include <utility>

namespace ctb {

namespace {

constexpr std::string_view kBom = "\xEF\xBB\xBF";

// One well-formed UTF-8 code point, nothing more.
bool is_single_code_point(const std::string& s) {
  if (s.empty()) return false;
  const auto lead = static_cast<unsigned char>(s[0]);
  std::size_t len = 0;
  if (lead < 0x80) len = 1;
  else if (lead >= 0xC2 && lead <= 0xDF) len = 2;
  else if (lead >= 0xE0 && lead <= 0xEF) len = 3;
  else if (lead >= 0xF0 && lead <= 0xF4) len = 4;
  if (len == 0 || s.size() != len) return false;
  for (std::size_t i = 1; i < len; ++i)
    if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) return false;
  return true;
}

enum class Sym { Data, Delimiter, Quotation, Cr, Lf };

Error option_error(std::string msg) { return make_error(ErrorCode::InvalidOption, std::move(msg)); }

}

bool validate_lexer_config(const LexerConfig& cfg, Error* err_out) {
  if (cfg.delimiter.empty()) return set_error(err_out, option_error("delimiter must not be empty"));
  if (cfg.quotation.empty()) return set_error(err_out, option_error("quotation must not be empty"));
  if (!is_single_code_point(cfg.delimiter))
    return set_error(err_out, option_error("delimiter must be a single character"));
  if (!is_single_code_point(cfg.quotation))
    return set_error(err_out, option_error("quotation must be a single character"));
  if (cfg.delimiter == cfg.quotation)
    return set_error(err_out, option_error("delimiter must not be the same as quotation"));
  for (const std::string* s : {&cfg.delimiter, &cfg.quotation}) {
    if ((*s)[0] == '\r' || (*s)[0] == '\n')
      return set_error(err_out, option_error("delimiter and quotation must not be CR or LF"));
  }
  if (cfg.max_buffer_size == 0)
    return set_error(err_out, option_error("max_buffer_size must be at least 1"));
  return true;
}

Error make_unexpected_eof_error(const Position& at, std::uint64_t row, const std::string& source) {
  Error e = make_error(ErrorCode::ParseError, "Unexpected EOF while parsing quoted field");
  e.position = at;
  e.row = row;
  e.source = source;
  return e;
}

Error make_field_size_error(std::size_t limit, const Position& field_start, std::uint64_t row,
                            const std::string& source) {
  Error e = make_error(ErrorCode::BufferLimitExceeded,
                       "Field size exceeded maximum allowed size of " + std::to_string(limit) + " bytes");
  e.position = field_start;
  e.row = row;
  e.source = source;
  return e;
}

enum class State { FieldStart, Unquoted, Quoted, QuoteSeen };

struct CsvLexer::Impl {
  LexerConfig cfg;
  Error err;
  bool valid = true;

  State state = State::FieldStart;
  std::string field;
  PositionTracker cursor;
  Position field_start;
  Position cr_start;          // start of a CR whose LF may arrive in the next chunk
  bool cr_pending = false;
  bool row_empty = true;      // nothing consumed since the last record delimiter
  std::uint64_t row = 1;
  std::uint64_t rows_emitted = 0;
  bool bom_checked = false;
  std::string head;           // leading bytes held until the BOM question is settled
  std::string carry;          // a delimiter or quotation cut by the chunk boundary

  void reset_document() {
    state = State::FieldStart;
    field.clear();
    cursor.reset();
    field_start = Position{};
    cr_pending = false;
    row_empty = true;
    row = 1;
    bom_checked = false;
    head.clear();
    carry.clear();
  }

  bool fail(Error e) {
    err = std::move(e);
    return false;
  }

  bool check_cancel() {
    if (!cfg.cancel.cancelled()) return true;
    return fail(make_cancelled_error(cfg.cancel, row, cfg.source));
  }

  void advance(std::string_view bytes) {
    for (char ch : bytes) cursor.advance(ch);
  }

  bool emit(TokenKind kind, std::string value, const Position& start, const TokenCallback& cb) {
    Token t;
    t.kind = kind;
    t.value = std::move(value);
    t.location.start = start;
    t.location.end = cursor.position();
    t.location.row = row;
    return cb(t);
  }

  bool emit_field(const TokenCallback& cb) {
    std::string value;
    value.swap(field);
    return emit(TokenKind::Field, std::move(value), field_start, cb);
  }

  bool append(std::string_view bytes) {
    field.append(bytes.data(), bytes.size());
    advance(bytes);
    row_empty = false;
    if (field.size() > cfg.max_buffer_size)
      return fail(make_field_size_error(cfg.max_buffer_size, field_start, row, cfg.source));
    return true;
  }

  bool on_delimiter(std::string_view bytes, const TokenCallback& cb) {
    if (!emit_field(cb)) return false;
    const Position start = cursor.position();
    advance(bytes);
    if (!emit(TokenKind::FieldDelimiter, std::string(), start, cb)) return false;
    field_start = cursor.position();
    state = State::FieldStart;
    row_empty = false;
    return true;
  }

  bool end_record(const Position& start, const TokenCallback& cb) {
    cr_pending = false;
    if (!emit(TokenKind::RecordDelimiter, std::string(), start, cb)) return false;
    ++row;
    ++rows_emitted;
    row_empty = true;
    state = State::FieldStart;
    field_start = cursor.position();
    return check_cancel();
  }

  bool on_terminator(char ch, const TokenCallback& cb) {
    if (!row_empty && !emit_field(cb)) return false;
    const Position start = cursor.position();
    cursor.advance(ch);
    if (ch == '\r') {
      cr_start = start;
      cr_pending = true;
      state = State::FieldStart;
      return true;
    }
    return end_record(start, cb);
  }

  bool step(Sym sym, std::string_view bytes, const TokenCallback& cb) {
    if (cr_pending) {
      if (sym == Sym::Lf) {
        cursor.advance('\n');
        return end_record(cr_start, cb);
      }
      if (!end_record(cr_start, cb)) return false;
    }
    switch (state) {
      case State::FieldStart:
        if (sym == Sym::Quotation) {
          advance(bytes);
          row_empty = false;
          state = State::Quoted;
          return true;
        }
        [[fallthrough]];
      case State::Unquoted:
        // a quotation past the field start is ordinary data
        if (sym == Sym::Delimiter) return on_delimiter(bytes, cb);
        if (sym == Sym::Cr || sym == Sym::Lf) return on_terminator(bytes[0], cb);
        state = State::Unquoted;
        return append(bytes);
      case State::Quoted:
        if (sym == Sym::Quotation) {
          advance(bytes);
          state = State::QuoteSeen;
          return true;
        }
        return append(bytes);
      case State::QuoteSeen:
        if (sym == Sym::Quotation) {     // doubled quotation: one literal
          state = State::Quoted;
          return append(bytes);
        }
        if (sym == Sym::Delimiter) return on_delimiter(bytes, cb);
        if (sym == Sym::Cr || sym == Sym::Lf) return on_terminator(bytes[0], cb);
        state = State::Unquoted;
        return append(bytes);
    }
    return true;
  }

  static bool starts(std::string_view data, std::size_t i, const std::string& sym) {
    return data.compare(i, sym.size(), sym) == 0;
  }

  static bool cut_short(std::string_view rest, const std::string& sym) {
    return rest.size() < sym.size() && sym.compare(0, rest.size(), rest) == 0;
  }

  // `at_end`: no more bytes will follow, so a partial delimiter or quotation is data.
  bool scan(std::string_view data, bool at_end, const TokenCallback& cb) {
    std::string joined;
    if (!carry.empty()) {
      joined.swap(carry);
      joined.append(data.data(), data.size());
      data = joined;
    }
    const std::string& delim = cfg.delimiter;
    const std::string& quote = cfg.quotation;
    const std::size_t n = data.size();
    std::size_t i = 0;
    while (i < n) {
      const char ch = data[i];
      Sym sym = Sym::Data;
      std::size_t len = 1;
      if (ch == '\n') {
        sym = Sym::Lf;
      } else if (ch == '\r') {
        sym = Sym::Cr;
      } else if (ch == delim[0] || ch == quote[0]) {
        if (starts(data, i, delim)) {
          sym = Sym::Delimiter;
          len = delim.size();
        } else if (starts(data, i, quote)) {
          sym = Sym::Quotation;
          len = quote.size();
        } else if (!at_end && (cut_short(data.substr(i), delim) || cut_short(data.substr(i), quote))) {
          carry.assign(data.data() + i, n - i);
          return true;
        }
      }
      if (!step(sym, data.substr(i, len), cb)) return false;
      i += len;
    }
    return true;
  }

  bool consume(std::string_view chunk, const TokenCallback& cb) {
    if (bom_checked) return scan(chunk, false, cb);
    head.append(chunk.data(), chunk.size());
    if (head.size() < kBom.size() && kBom.compare(0, head.size(), head) == 0) return true;
    return flush_head(cb);
  }

  bool flush_head(const TokenCallback& cb) {
    bom_checked = true;
    std::string h;
    h.swap(head);
    std::string_view view(h);
    if (view.substr(0, kBom.size()) == kBom) view.remove_prefix(kBom.size());
    return scan(view, false, cb);
  }
};

CsvLexer::CsvLexer(LexerConfig cfg) : p_(new Impl{}) {
  p_->cfg = std::move(cfg);
  p_->valid = validate_lexer_config(p_->cfg, &p_->err);
}

CsvLexer::~CsvLexer() { delete p_; }

bool CsvLexer::ok() const { return p_->valid; }

bool CsvLexer::feed(std::string_view chunk, const TokenCallback& on_token) {
  if (!p_->valid || !p_->err.ok()) return false;
  if (!p_->check_cancel()) return false;
  return p_->consume(chunk, on_token);
}

bool CsvLexer::feed(std::string_view chunk, bool final_chunk, const TokenCallback& on_token) {
  if (!feed(chunk, on_token)) return false;
  return final_chunk ? finish(on_token) : true;
}

bool CsvLexer::finish(const TokenCallback& on_token) {
  Impl& s = *p_;
  if (!s.valid || !s.err.ok()) return false;
  if (!s.check_cancel()) return false;
  if (!s.bom_checked && !s.flush_head(on_token)) return false;
  if (!s.carry.empty() && !s.scan(std::string_view(), true, on_token)) return false;
  if (s.cr_pending && !s.end_record(s.cr_start, on_token)) return false;
  if (s.state == State::Quoted)
    return s.fail(make_unexpected_eof_error(s.cursor.position(), s.row, s.cfg.source));
  if (!s.row_empty && !s.emit_field(on_token)) return false;
  s.reset_document();
  return true;
}

const Error& CsvLexer::error() const { return p_->err; }
std::uint64_t CsvLexer::rows() const { return p_->rows_emitted; }
Position CsvLexer::position() const { return p_->cursor.position(); }

}
