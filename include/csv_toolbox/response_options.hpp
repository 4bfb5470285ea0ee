#pragma once
#include "csv_toolbox/engine_config.hpp"
#include "csv_toolbox/error.hpp"
#include "csv_toolbox/input.hpp"
#include "csv_toolbox/options.hpp"
#include "csv_toolbox/record.hpp"
#include "csv_toolbox/strategy_runner.hpp"
#include <string>

namespace httplib { struct Response; }

namespace ctb {

struct ResponseOptions {
  std::string mime_type = "text/csv";
  std::string charset = "utf-8";
  std::string content_encoding;   // lowercased; empty when absent
};

// Reads Content-Type (must be text/csv when present) and Content-Encoding.
bool options_from_response(const httplib::Response& res, ResponseOptions& out, Error* err_out = nullptr);

// Response body as buffered bytes in the declared charset. Compressed bodies
// are rejected; decompression is not done here.
bool input_from_response(const httplib::Response& res, ParseInput& out, Error* err_out = nullptr);

bool parse_response(const httplib::Response& res, const ParseOptions& options, const EngineConfig& engine,
                    const RecordCallback& on_record, Error* err_out = nullptr, RunReport* report = nullptr);

// GET `url` ("http://host[:port]/path") and build an input from the response.
bool fetch_csv(const std::string& url, ParseInput& out, Error* err_out = nullptr);

}
