#pragma once
#include "csv_toolbox/capabilities.hpp"
#include "csv_toolbox/engine_config.hpp"
#include "csv_toolbox/input.hpp"
#include "csv_toolbox/record_assembler.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ctb {

enum class Backend { Plain, Compiled, Accelerated };
enum class Context { InProcess, WorkerMessage, WorkerStreamTransfer };
enum class DevicePreference { HighPerformance, LowPower };

const char* to_string(Backend b);
const char* to_string(Context c);
const char* to_string(DevicePreference d);

struct AcceleratedTuning {
  std::size_t workgroup_size = 128;               // lanes; a block is workgroup_size * 64 bytes
  DevicePreference device = DevicePreference::LowPower;
};

struct ExecutionPlan {
  std::vector<Backend> backends;   // preferred first
  std::vector<Context> contexts;   // preferred first
  std::optional<AcceleratedTuning> accelerated_tuning; // only when accelerated survived filtering

  bool empty() const noexcept { return backends.empty() || contexts.empty(); }
};

struct ResolverContext {
  InputShape input = InputShape::BufferedString;
  OutputShape output = OutputShape::Object;
  std::string charset = "utf-8";
  EngineConfig engine;
  Capabilities capabilities;
};

// Pure: the same context always yields the same plan.
ExecutionPlan resolve_execution_plan(const ResolverContext& ctx);

std::vector<Backend> backend_order(OptimizationHint hint);
std::vector<Context> context_order(OptimizationHint hint);
AcceleratedTuning tuning_for(OptimizationHint hint);

}
