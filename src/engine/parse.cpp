#include "csv_toolbox/parse.hpp"
#include "csv_toolbox/capabilities.hpp"
#include "csv_toolbox/decoder.hpp"
#include "csv_toolbox/execution_plan.hpp"

namespace ctb {

bool validate_request(const ParseInput& input, const ParseOptions& options, const EngineConfig& engine,
                      Error* err_out) {
  if (!validate_parse_options(options, err_out)) return false;
  if (!validate_engine_config(engine, err_out)) return false;
  if (input.is_bytes() && !is_supported_charset(input.charset))
    return set_error(err_out, make_error(ErrorCode::InvalidOption, "Unsupported charset: " + input.charset));
  if (input.is_stream() && !input.stream)
    return set_error(err_out, make_error(ErrorCode::InvalidOption, "stream input without a chunk source"));
  if (input.shape == InputShape::BufferedBytes && input.buffer.size() > options.max_binary_size) {
    Error e = make_error(ErrorCode::BufferLimitExceeded,
                         "Binary size (" + std::to_string(input.buffer.size()) +
                         " bytes) exceeded maximum allowed size of " +
                         std::to_string(options.max_binary_size) + " bytes");
    e.source = options.source;
    return set_error(err_out, e);
  }
  return true;
}

bool parse(ParseInput input, const ParseOptions& options, const EngineConfig& engine,
           const RecordCallback& on_record, Error* err_out, RunReport* report) {
  if (!validate_request(input, options, engine, err_out)) return false;

  ResolverContext ctx;
  ctx.input = input.shape;
  ctx.output = options.output;
  ctx.charset = input.effective_charset();
  ctx.engine = engine;
  ctx.capabilities = EnvironmentCapabilities::get();
  const ExecutionPlan plan = resolve_execution_plan(ctx);

  StrategyRunner runner;
  return runner.execute(std::move(input), options, engine, plan, on_record, err_out, report);
}

bool parse_all(ParseInput input, const ParseOptions& options, const EngineConfig& engine,
               std::vector<Record>& out, Error* err_out, RunReport* report) {
  out.clear();
  return parse(std::move(input), options, engine, [&out](Record&& r) { out.push_back(std::move(r)); },
               err_out, report);
}

bool parse_string(std::string text, const ParseOptions& options, std::vector<Record>& out, Error* err_out) {
  out.clear();
  ParseInput input = ParseInput::from_string(std::move(text));
  if (!validate_request(input, options, EngineConfig{}, err_out)) return false;
  ExecutionSink sink;
  sink.emit = [&out](Record&& r) { out.push_back(std::move(r)); };
  return run_plain(input, options, std::nullopt, sink, err_out);
}

}
