#pragma once
#include "csv_toolbox/backends.hpp"
#include "csv_toolbox/engine_config.hpp"
#include "csv_toolbox/error.hpp"
#include "csv_toolbox/execution_plan.hpp"
#include "csv_toolbox/input.hpp"
#include "csv_toolbox/options.hpp"
#include "csv_toolbox/record.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ctb {

struct RunReport {
  Backend backend = Backend::Plain;       // candidate that ran last
  Context context = Context::InProcess;
  std::uint64_t records = 0;
  std::uint64_t attempts = 0;
  std::vector<FallbackInfo> fallbacks;
};

// "accelerated@in-process"
std::string describe_candidate(Backend b, Context c);

// Structural fit of a pair for an input shape: compiled never runs on streams,
// accelerated runs on streams only in-process, worker-message needs a buffer
// and worker-stream-transfer needs a stream.
bool is_viable(Context c, Backend b, InputShape shape);

// Walks contexts (outer) and backends (inner) of a plan until one candidate
// succeeds. Only BackendUnavailable failures before the first record fall back.
class StrategyRunner {
public:
  explicit StrategyRunner(ExecutorTable executors = ExecutorTable::defaults());

  // on_record runs on the calling thread, in source order. Records delivered
  // before a failure stay delivered.
  bool execute(ParseInput input, const ParseOptions& options, const EngineConfig& engine,
               const ExecutionPlan& plan, const RecordCallback& on_record,
               Error* err_out = nullptr, RunReport* report = nullptr);

private:
  struct Candidate {
    Context context;
    Backend backend;
  };

  bool attempt(const Candidate& c, ParseInput& input, const ParseOptions& options,
               const EngineConfig& engine, const ExecutionPlan& plan,
               const RecordCallback& deliver, Error& err);

  ExecutorTable executors_;
};

}
