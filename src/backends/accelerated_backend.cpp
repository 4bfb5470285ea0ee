#include "csv_toolbox/backends.hpp"
#include "csv_toolbox/csv_lexer.hpp"
#include "csv_toolbox/decoder.hpp"
#include "csv_toolbox/separator_indexer.hpp"

namespace ctb {

namespace {

constexpr std::string_view kBom = "\xEF\xBB\xBF";

// Replays the separator index as the token stream the lexer would produce.
class IndexWalker {
public:
  IndexWalker(std::string_view text, const ParseOptions& options, TokenPipeline& pipeline)
      : text_(text), opts_(options), pipeline_(pipeline),
        delim_(options.delimiter), quote_(options.quotation) {}

  bool walk(const std::vector<Separator>& seps, bool ends_in_quotes) {
    std::size_t field_start = 0;
    bool row_empty = true;
    for (std::size_t k = 0; k < seps.size(); ++k) {
      const Separator& s = seps[k];
      const std::size_t at = static_cast<std::size_t>(s.offset);
      if (s.kind == delim_[0]) {
        if (!field(field_start, at)) return false;
        if (!emit(TokenKind::FieldDelimiter, std::string(), at, at + delim_.size())) return false;
        field_start = at + delim_.size();
        row_empty = false;
        continue;
      }
      if ((at > field_start || !row_empty) && !field(field_start, at)) return false;
      std::size_t end = at + 1;
      if (s.kind == '\r' && k + 1 < seps.size() && seps[k + 1].kind == '\n' && seps[k + 1].offset == at + 1) {
        ++k;
        ++end;
      }
      if (!emit(TokenKind::RecordDelimiter, std::string(), at, end)) return false;
      ++row_;
      row_empty = true;
      field_start = end;
      if (opts_.cancel.cancelled()) {
        err_ = make_cancelled_error(opts_.cancel, row_, opts_.source);
        return false;
      }
    }

    const std::size_t n = text_.size();
    if (ends_in_quotes) {
      std::string tail = unescape_field(text_.substr(field_start), quote_);
      if (tail.size() > opts_.max_buffer_size) return field_too_large(field_start);
      err_ = make_unexpected_eof_error(position_at(text_, n), row_, opts_.source);
      return false;
    }
    if (n > field_start || !row_empty) return field(field_start, n);
    return true;
  }

  const Error& error() const { return err_.ok() ? pipeline_.error() : err_; }

private:
  bool field(std::size_t start, std::size_t end) {
    std::string value = unescape_field(text_.substr(start, end - start), quote_);
    if (value.size() > opts_.max_buffer_size) return field_too_large(start);
    return emit(TokenKind::Field, std::move(value), start, end);
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
  std::uint64_t row_ = 1;
  Error err_;
};

}

bool run_accelerated(ParseInput& input, const ParseOptions& options,
                     const std::optional<AcceleratedTuning>& tuning, ExecutionSink& sink, Error* err_out) {
  if (!is_utf8_charset(input.effective_charset()))
    return set_error(err_out, make_error(ErrorCode::BackendUnavailable,
                                         "accelerated backend: requires UTF-8 input, got " + input.charset));
  if (!validate_lexer_config(options.lexer_config(), err_out)) return false;
  if (options.cancel.cancelled())
    return set_error(err_out, make_cancelled_error(options.cancel, 1, options.source));

  TokenPipeline pipeline(options, sink);
  if (!pipeline.ok()) return set_error(err_out, pipeline.error());

  TextReader reader(input);
  std::string_view text;
  if (!reader.view_all(text)) return set_error(err_out, reader.error());
  if (text.substr(0, kBom.size()) == kBom) text.remove_prefix(kBom.size());

  SeparatorIndexer::Config cfg;
  cfg.delimiter = options.delimiter;
  cfg.quote = options.quotation;
  cfg.tuning = tuning ? *tuning : AcceleratedTuning{};
  SeparatorIndexer indexer(cfg);

  std::vector<Separator> seps;
  bool ends_in_quotes = false;
  if (!indexer.index(text, seps, &ends_in_quotes, err_out)) return false;

  IndexWalker walker(text, options, pipeline);
  if (!walker.walk(seps, ends_in_quotes)) return set_error(err_out, walker.error());
  if (!pipeline.finish()) return set_error(err_out, pipeline.error());
  return true;
}

}
