#include "csv_toolbox/backends.hpp"
#include "csv_toolbox/csv_lexer.hpp"

namespace ctb {

bool run_plain(ParseInput& input, const ParseOptions& options,
               const std::optional<AcceleratedTuning>&, ExecutionSink& sink, Error* err_out) {
  CsvLexer lexer(options.lexer_config());
  if (!lexer.ok()) return set_error(err_out, lexer.error());
  TokenPipeline pipeline(options, sink);
  if (!pipeline.ok()) return set_error(err_out, pipeline.error());
  TextReader reader(input);
  if (reader.failed()) return set_error(err_out, reader.error());

  auto on_token = [&](const Token& t) { return pipeline.push(t); };
  // The lexer stops without an error of its own when the assembler refuses a token.
  auto stopped = [&]() {
    return set_error(err_out, pipeline.error().ok() ? lexer.error() : pipeline.error());
  };

  std::string_view chunk;
  while (reader.next(chunk)) {
    if (!lexer.feed(chunk, on_token)) return stopped();
  }
  if (reader.failed()) return set_error(err_out, reader.error());
  if (!lexer.finish(on_token)) return stopped();
  if (!pipeline.finish()) return set_error(err_out, pipeline.error());
  return true;
}

}
