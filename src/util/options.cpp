#include "csv_toolbox/options.hpp"

namespace ctb {

LexerConfig ParseOptions::lexer_config() const {
  LexerConfig c;
  c.delimiter = delimiter;
  c.quotation = quotation;
  c.max_buffer_size = max_buffer_size;
  c.source = source;
  c.cancel = cancel;
  return c;
}

AssemblerConfig ParseOptions::assembler_config() const {
  AssemblerConfig c;
  c.header = header;
  c.policy = column_count_policy;
  c.output = output;
  c.include_header = include_header;
  c.skip_empty_lines = skip_empty_lines;
  c.max_field_count = max_field_count;
  c.source = source;
  return c;
}

bool validate_parse_options(const ParseOptions& opts, Error* err_out) {
  if (!validate_lexer_config(opts.lexer_config(), err_out)) return false;
  if (!validate_assembler_config(opts.assembler_config(), err_out)) return false;
  if (opts.lexer_backpressure_interval == 0 || opts.assembler_backpressure_interval == 0)
    return set_error(err_out, make_error(ErrorCode::InvalidOption, "backpressure intervals must be at least 1"));
  if (opts.channel_capacity == 0)
    return set_error(err_out, make_error(ErrorCode::InvalidOption, "channel_capacity must be at least 1"));
  if (opts.max_binary_size == 0)
    return set_error(err_out, make_error(ErrorCode::InvalidOption, "max_binary_size must be at least 1"));
  return true;
}

}
