#pragma once
#include "csv_toolbox/error.hpp"
#include "csv_toolbox/execution_plan.hpp"
#include "csv_toolbox/input.hpp"
#include "csv_toolbox/options.hpp"
#include "csv_toolbox/record.hpp"
#include "csv_toolbox/record_assembler.hpp"
#include "csv_toolbox/record_channel.hpp"
#include "csv_toolbox/token.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ctb {

// Where a backend sends its records, plus the backpressure checkpoints of the
// lexing and assembly stages.
struct ExecutionSink {
  RecordCallback emit;
  BackpressureGate lexing;    // ticked per token
  BackpressureGate assembly;  // ticked per record

  void record(Record&& r) {
    emit(std::move(r));
    assembly.tick();
  }
};

// Token -> record half shared by every backend, so record semantics cannot
// drift between them.
class TokenPipeline {
public:
  TokenPipeline(const ParseOptions& options, ExecutionSink& sink);

  bool ok() const { return asm_.ok(); }
  bool push(const Token& t);
  bool finish();
  const Error& error() const { return asm_.error(); }

private:
  RecordAssembler asm_;
  ExecutionSink& sink_;
  RecordCallback emit_;
};

using BackendExecutor = std::function<bool(ParseInput& input, const ParseOptions& options,
                                           const std::optional<AcceleratedTuning>& tuning,
                                           ExecutionSink& sink, Error* err_out)>;

bool run_plain(ParseInput& input, const ParseOptions& options,
               const std::optional<AcceleratedTuning>& tuning, ExecutionSink& sink, Error* err_out);
// Buffered UTF-8 input and object output only; anything else is BackendUnavailable.
bool run_compiled(ParseInput& input, const ParseOptions& options,
                  const std::optional<AcceleratedTuning>& tuning, ExecutionSink& sink, Error* err_out);
// UTF-8 only. Streams are drained into memory first.
bool run_accelerated(ParseInput& input, const ParseOptions& options,
                     const std::optional<AcceleratedTuning>& tuning, ExecutionSink& sink, Error* err_out);

// Value of a raw field slice as the lexer reads it: quoting only when the slice
// opens with the quotation, doubled quotations collapsed, anything after the
// closing quotation kept verbatim.
std::string unescape_field(std::string_view raw, std::string_view quote);

struct ExecutorTable {
  BackendExecutor plain;
  BackendExecutor compiled;
  BackendExecutor accelerated;

  static ExecutorTable defaults();
  const BackendExecutor& get(Backend b) const;
};

}
