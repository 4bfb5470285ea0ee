#pragma once
#include "csv_toolbox/engine_config.hpp"
#include "csv_toolbox/record.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ctb {

struct RunSummary {
  std::uint64_t records = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;

  std::string backend;
  std::string context;
  std::string engine;
  std::vector<FallbackInfo> fallbacks;

  std::string filename;
  std::string charset;
  std::string error;      // empty on success
};

class RecordJsonWriter {
public:
  // Object records -> {"k":"v",...}; array records -> ["v",...]; missing values -> null.
  static std::string to_json(const Record& r);
  static std::string to_json(const RunSummary& s);
};

}
