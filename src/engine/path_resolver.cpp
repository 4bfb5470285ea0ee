#include "csv_toolbox/execution_plan.hpp"
#include "csv_toolbox/decoder.hpp"
#include <algorithm>

namespace ctb {

const char* to_string(Backend b) {
  switch (b) {
    case Backend::Plain:       return "plain";
    case Backend::Compiled:    return "compiled";
    case Backend::Accelerated: return "accelerated";
  }
  return "plain";
}

const char* to_string(Context c) {
  switch (c) {
    case Context::InProcess:            return "in-process";
    case Context::WorkerMessage:        return "worker-message";
    case Context::WorkerStreamTransfer: return "worker-stream-transfer";
  }
  return "in-process";
}

const char* to_string(DevicePreference d) {
  return d == DevicePreference::HighPerformance ? "high-performance" : "low-power";
}

std::vector<Backend> backend_order(OptimizationHint hint) {
  switch (hint) {
    case OptimizationHint::Speed:
      return {Backend::Accelerated, Backend::Plain, Backend::Compiled};
    case OptimizationHint::Consistency:
      return {Backend::Compiled, Backend::Plain, Backend::Accelerated};
    case OptimizationHint::Responsive:
      return {Backend::Plain, Backend::Compiled, Backend::Accelerated};
    case OptimizationHint::Balanced:
      break;
  }
  return {Backend::Plain, Backend::Accelerated, Backend::Compiled};
}

std::vector<Context> context_order(OptimizationHint hint) {
  switch (hint) {
    case OptimizationHint::Speed:
    case OptimizationHint::Consistency:
      return {Context::InProcess, Context::WorkerStreamTransfer, Context::WorkerMessage};
    case OptimizationHint::Balanced:
    case OptimizationHint::Responsive:
      break;
  }
  return {Context::WorkerStreamTransfer, Context::WorkerMessage, Context::InProcess};
}

AcceleratedTuning tuning_for(OptimizationHint hint) {
  AcceleratedTuning t;
  switch (hint) {
    case OptimizationHint::Speed:
      t.workgroup_size = 256;
      t.device = DevicePreference::HighPerformance;
      break;
    case OptimizationHint::Consistency:
      t.workgroup_size = 64;
      t.device = DevicePreference::LowPower;
      break;
    case OptimizationHint::Balanced:
    case OptimizationHint::Responsive:
      t.workgroup_size = 128;
      t.device = DevicePreference::LowPower;
      break;
  }
  return t;
}

namespace {

bool is_stream(InputShape s) { return s == InputShape::ByteStream || s == InputShape::StringStream; }

bool backend_allowed(Backend b, const ResolverContext& ctx, bool utf8) {
  switch (b) {
    case Backend::Plain:
      return true;
    case Backend::Compiled:
      return ctx.engine.compiled && ctx.capabilities.compiled && utf8 &&
             ctx.output != OutputShape::Array;
    case Backend::Accelerated:
      return ctx.engine.accelerated && ctx.capabilities.accelerated && utf8;
  }
  return false;
}

bool context_allowed(Context c, const ResolverContext& ctx) {
  const bool workers = ctx.engine.worker && ctx.capabilities.worker;
  switch (c) {
    case Context::InProcess:
      return true;
    case Context::WorkerMessage:
      return workers && !is_stream(ctx.input);
    case Context::WorkerStreamTransfer:
      return workers && is_stream(ctx.input) && ctx.capabilities.transferable_streams &&
             ctx.engine.worker_strategy != WorkerStrategy::MessageStreaming;
  }
  return false;
}

}

ExecutionPlan resolve_execution_plan(const ResolverContext& ctx) {
  ExecutionPlan plan;
  const bool stringish = ctx.input == InputShape::BufferedString || ctx.input == InputShape::StringStream;
  const bool utf8 = stringish || is_utf8_charset(ctx.charset);

  for (Backend b : backend_order(ctx.engine.hint)) {
    if (backend_allowed(b, ctx, utf8)) plan.backends.push_back(b);
  }
  for (Context c : context_order(ctx.engine.hint)) {
    if (context_allowed(c, ctx)) plan.contexts.push_back(c);
  }
  if (std::find(plan.backends.begin(), plan.backends.end(), Backend::Accelerated) != plan.backends.end())
    plan.accelerated_tuning = tuning_for(ctx.engine.hint);
  return plan;
}

}
