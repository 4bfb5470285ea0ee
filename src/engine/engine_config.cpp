#include "csv_toolbox/engine_config.hpp"
#include <vector>

namespace ctb {

const char* to_string(OptimizationHint h) {
  switch (h) {
    case OptimizationHint::Speed:       return "speed";
    case OptimizationHint::Consistency: return "consistency";
    case OptimizationHint::Balanced:    return "balanced";
    case OptimizationHint::Responsive:  return "responsive";
  }
  return "balanced";
}

const char* to_string(WorkerStrategy s) {
  switch (s) {
    case WorkerStrategy::Default:          return "default";
    case WorkerStrategy::MessageStreaming: return "message-streaming";
    case WorkerStrategy::StreamTransfer:   return "stream-transfer";
  }
  return "default";
}

bool parse_hint(std::string_view s, OptimizationHint* out) {
  if (s == "speed")            *out = OptimizationHint::Speed;
  else if (s == "consistency") *out = OptimizationHint::Consistency;
  else if (s == "balanced")    *out = OptimizationHint::Balanced;
  else if (s == "responsive")  *out = OptimizationHint::Responsive;
  else return false;
  return true;
}

bool parse_worker_strategy(std::string_view s, WorkerStrategy* out) {
  if (s == "default")                *out = WorkerStrategy::Default;
  else if (s == "message-streaming") *out = WorkerStrategy::MessageStreaming;
  else if (s == "stream-transfer")   *out = WorkerStrategy::StreamTransfer;
  else return false;
  return true;
}

bool validate_engine_config(const EngineConfig& cfg, Error* err_out) {
  if (cfg.worker_strategy != WorkerStrategy::Default && !cfg.worker)
    return set_error(err_out, make_error(ErrorCode::InvalidOption,
                                         "worker_strategy requires worker execution to be enabled"));
  if (cfg.strict && cfg.worker_strategy != WorkerStrategy::StreamTransfer)
    return set_error(err_out, make_error(ErrorCode::InvalidOption,
                                         "strict mode requires the stream-transfer worker strategy"));
  return true;
}

std::string describe(const EngineConfig& cfg) {
  std::vector<std::string> parts;
  if (cfg.worker) parts.push_back("worker");
  if (cfg.compiled) parts.push_back("compiled");
  if (cfg.accelerated) parts.push_back("accelerated");
  std::string s;
  if (parts.empty()) s = "main-thread";
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) s += " + ";
    s += parts[i];
  }
  if (cfg.worker_strategy != WorkerStrategy::Default || cfg.strict) {
    s += " (";
    s += to_string(cfg.worker_strategy);
    if (cfg.strict) s += ", strict";
    s += ")";
  }
  return s;
}

namespace presets {

EngineConfig main_thread() { return EngineConfig{}; }

EngineConfig worker() {
  EngineConfig c;
  c.worker = true;
  return c;
}

EngineConfig worker_stream_transfer() {
  EngineConfig c = worker();
  c.worker_strategy = WorkerStrategy::StreamTransfer;
  return c;
}

EngineConfig compiled() {
  EngineConfig c;
  c.compiled = true;
  return c;
}

EngineConfig worker_compiled() {
  EngineConfig c = worker();
  c.compiled = true;
  return c;
}

EngineConfig accelerated() {
  EngineConfig c;
  c.accelerated = true;
  c.hint = OptimizationHint::Speed;
  return c;
}

EngineConfig fastest() {
  EngineConfig c;
  c.worker = true;
  c.compiled = true;
  c.accelerated = true;
  c.hint = OptimizationHint::Speed;
  return c;
}

EngineConfig balanced() {
  EngineConfig c = worker_compiled();
  c.hint = OptimizationHint::Balanced;
  return c;
}

EngineConfig responsive() {
  EngineConfig c = worker();
  c.hint = OptimizationHint::Responsive;
  return c;
}

}

bool engine_preset(std::string_view name, EngineConfig* out) {
  if (name == "main-thread")                 *out = presets::main_thread();
  else if (name == "worker")                 *out = presets::worker();
  else if (name == "worker-stream-transfer") *out = presets::worker_stream_transfer();
  else if (name == "compiled")               *out = presets::compiled();
  else if (name == "worker-compiled")        *out = presets::worker_compiled();
  else if (name == "accelerated")            *out = presets::accelerated();
  else if (name == "fastest")                *out = presets::fastest();
  else if (name == "balanced")               *out = presets::balanced();
  else if (name == "responsive")             *out = presets::responsive();
  else return false;
  return true;
}

}
