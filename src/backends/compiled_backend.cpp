#include "csv_toolbox/backends.hpp"
#include "csv_toolbox/csv_lexer.hpp"
#include "csv_toolbox/decoder.hpp"

namespace ctb {

namespace {

constexpr std::string_view kBom = "\xEF\xBB\xBF";

Error unavailable(std::string why) {
  return make_error(ErrorCode::BackendUnavailable, "compiled backend: " + std::move(why));
}

// Whole-buffer scanner: jumps between special bytes with find / find_first_of
// instead of stepping a state machine per byte.
class BufferScanner {
public:
  BufferScanner(std::string_view text, const ParseOptions& options, TokenPipeline& pipeline)
      : text_(text), opts_(options), pipeline_(pipeline),
        delim_(options.delimiter), quote_(options.quotation) {
    stops_[0] = delim_[0];
    stops_[1] = '\r';
    stops_[2] = '\n';
  }

  bool run() {
    const std::size_t n = text_.size();
    std::size_t pos = 0;
    bool row_empty = true;

    while (pos < n) {
      const std::size_t start = pos;
      std::string value;

      if (at(pos, quote_)) {
        pos += quote_.size();
        for (;;) {
          const std::size_t j = text_.find(quote_, pos);
          if (j == std::string_view::npos) {
            value.append(text_.substr(pos));
            if (value.size() > opts_.max_buffer_size) return field_too_large(start);
            err_ = make_unexpected_eof_error(position_at(text_, n), row_, opts_.source);
            return false;
          }
          value.append(text_.substr(pos, j - pos));
          pos = j + quote_.size();
          if (!at(pos, quote_)) break;
          value.append(quote_);
          pos += quote_.size();
          if (value.size() > opts_.max_buffer_size) return field_too_large(start);
        }
      }

      // unquoted text, or whatever follows a closing quotation, runs to the next separator
      const std::size_t stop = next_separator(pos);
      const std::size_t field_end = stop == std::string_view::npos ? n : stop;
      value.append(text_.substr(pos, field_end - pos));
      if (value.size() > opts_.max_buffer_size) return field_too_large(start);

      const bool consumed = field_end > start;
      if (stop == std::string_view::npos) {
        if ((consumed || !row_empty) && !emit(TokenKind::Field, std::move(value), start, n)) return false;
        return true;
      }

      if (text_[stop] != '\r' && text_[stop] != '\n') {
        const std::size_t after = stop + delim_.size();
        if (!emit(TokenKind::Field, std::move(value), start, stop)) return false;
        if (!emit(TokenKind::FieldDelimiter, std::string(), stop, after)) return false;
        pos = after;
        row_empty = false;
        if (pos == n) return emit(TokenKind::Field, std::string(), n, n);  // trailing delimiter
        continue;
      }

      if ((consumed || !row_empty) && !emit(TokenKind::Field, std::move(value), start, stop)) return false;
      std::size_t end = stop + 1;
      if (text_[stop] == '\r' && end < n && text_[end] == '\n') ++end;
      if (!emit(TokenKind::RecordDelimiter, std::string(), stop, end)) return false;
      ++row_;
      row_empty = true;
      pos = end;
      if (opts_.cancel.cancelled()) {
        err_ = make_cancelled_error(opts_.cancel, row_, opts_.source);
        return false;
      }
    }
    return true;
  }

  const Error& error() const { return err_.ok() ? pipeline_.error() : err_; }

private:
  bool at(std::size_t pos, const std::string& sym) const {
    return text_.compare(pos, sym.size(), sym) == 0;
  }

  // Next delimiter, CR or LF at or after `pos`.
  std::size_t next_separator(std::size_t pos) const {
    const std::string_view stops(stops_, 3);
    for (;;) {
      const std::size_t j = text_.find_first_of(stops, pos);
      if (j == std::string_view::npos || text_[j] == '\r' || text_[j] == '\n' || at(j, delim_)) return j;
      pos = j + 1;
    }
  }

  bool field_too_large(std::size_t start) {
    err_ = make_field_size_error(opts_.max_buffer_size, position_at(text_, start), row_, opts_.source);
    return false;
  }

  bool emit(TokenKind kind, std::string value, std::size_t start, std::size_t end) {
    Token t;
    t.kind = kind;
    t.value = std::move(value);
    t.location.start.offset = start;
    t.location.end.offset = end;
    t.location.row = row_;
    return pipeline_.push(t);
  }

  std::string_view text_;
  const ParseOptions& opts_;
  TokenPipeline& pipeline_;
  std::string delim_;
  std::string quote_;
  char stops_[3];
  std::uint64_t row_ = 1;
  Error err_;
};

}

bool run_compiled(ParseInput& input, const ParseOptions& options,
                  const std::optional<AcceleratedTuning>&, ExecutionSink& sink, Error* err_out) {
  if (options.output == OutputShape::Array)
    return set_error(err_out, unavailable("array output is not supported"));
  if (input.is_stream())
    return set_error(err_out, unavailable("requires buffered input"));
  if (!is_utf8_charset(input.effective_charset()))
    return set_error(err_out, unavailable("requires UTF-8 input, got " + input.charset));
  if (!validate_lexer_config(options.lexer_config(), err_out)) return false;
  if (options.cancel.cancelled())
    return set_error(err_out, make_cancelled_error(options.cancel, 1, options.source));

  TokenPipeline pipeline(options, sink);
  if (!pipeline.ok()) return set_error(err_out, pipeline.error());

  std::string_view text = input.buffer;
  if (text.substr(0, kBom.size()) == kBom) text.remove_prefix(kBom.size());

  BufferScanner scanner(text, options, pipeline);
  if (!scanner.run()) return set_error(err_out, scanner.error());
  if (!pipeline.finish()) return set_error(err_out, pipeline.error());
  return true;
}

}
