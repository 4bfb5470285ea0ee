#pragma once
#include "csv_toolbox/error.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace ctb {

class WorkerPool;

enum class OptimizationHint { Speed, Consistency, Balanced, Responsive };
enum class WorkerStrategy { Default, MessageStreaming, StreamTransfer };

const char* to_string(OptimizationHint h);
const char* to_string(WorkerStrategy s);
bool parse_hint(std::string_view s, OptimizationHint* out);
bool parse_worker_strategy(std::string_view s, WorkerStrategy* out);

// Reported when a candidate strategy could not run and the next one is tried.
struct FallbackInfo {
  std::string requested;  // e.g. "accelerated@in-process"
  std::string actual;     // the candidate tried next
  std::string reason;
};

using FallbackCallback = std::function<void(const FallbackInfo&)>;

struct EngineConfig {
  bool worker      = false;  // allow worker contexts
  bool compiled    = false;  // allow the compiled backend
  bool accelerated = false;  // allow the accelerated backend
  WorkerStrategy worker_strategy = WorkerStrategy::Default;
  bool strict = false;       // stream-transfer only: surface failures instead of falling back
  OptimizationHint hint = OptimizationHint::Balanced;

  WorkerPool* worker_pool = nullptr; // not owned; a one-worker pool is made per call when null
  std::string worker_endpoint;       // workers are only reused for the same endpoint
  FallbackCallback on_fallback;
};

bool validate_engine_config(const EngineConfig& cfg, Error* err_out = nullptr);

// "worker + compiled (stream-transfer, strict)"
std::string describe(const EngineConfig& cfg);

namespace presets {
EngineConfig main_thread();
EngineConfig worker();
EngineConfig worker_stream_transfer();
EngineConfig compiled();
EngineConfig worker_compiled();
EngineConfig accelerated();
EngineConfig fastest();
EngineConfig balanced();
EngineConfig responsive();
}

// Looks a preset up by name ("main-thread", "worker-compiled", ...).
bool engine_preset(std::string_view name, EngineConfig* out);

}
