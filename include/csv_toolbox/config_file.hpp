#pragma once
#include "csv_toolbox/engine_config.hpp"
#include "csv_toolbox/error.hpp"
#include "csv_toolbox/options.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace ctb {

// Settings of one csv-toolbox run: parse options, engine, and input handling.
struct ToolConfig {
  ParseOptions parse;
  EngineConfig engine;
  std::size_t max_workers = 1;
  std::string charset = "utf-8";
  std::size_t chunk_bytes = 512 * 1024;
  bool stream = false;          // read files as byte streams instead of buffering
};

// JSON config, e.g.
//   {"delimiter": ";", "header": ["a","b"], "columns": "strict",
//    "engine": {"preset": "worker", "hint": "speed", "max_workers": 2}}
// Unknown keys are rejected with InvalidOption.
bool load_config_json(std::string_view json, ToolConfig& cfg, Error* err_out = nullptr);
bool load_config_file(const std::string& path, ToolConfig& cfg, Error* err_out = nullptr);

}
