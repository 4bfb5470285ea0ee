#pragma once
#include "csv_toolbox/engine_config.hpp"
#include "csv_toolbox/error.hpp"
#include "csv_toolbox/input.hpp"
#include "csv_toolbox/options.hpp"
#include "csv_toolbox/record.hpp"
#include "csv_toolbox/strategy_runner.hpp"
#include <string>
#include <vector>

namespace ctb {

// Checks options, engine config and input before anything is read.
bool validate_request(const ParseInput& input, const ParseOptions& options, const EngineConfig& engine,
                      Error* err_out = nullptr);

// Validates, detects capabilities, resolves a plan and runs it.
bool parse(ParseInput input, const ParseOptions& options, const EngineConfig& engine,
           const RecordCallback& on_record, Error* err_out = nullptr, RunReport* report = nullptr);

bool parse_all(ParseInput input, const ParseOptions& options, const EngineConfig& engine,
               std::vector<Record>& out, Error* err_out = nullptr, RunReport* report = nullptr);

// Plain backend on the calling thread.
bool parse_string(std::string text, const ParseOptions& options, std::vector<Record>& out,
                  Error* err_out = nullptr);

}
