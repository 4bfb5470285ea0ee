#include "csv_toolbox/config_file.hpp"
#include <simdjson.h>
#include <optional>
#include <vector>

namespace ctb {

namespace {

Error config_error(std::string msg) {
  return make_error(ErrorCode::InvalidOption, "config: " + std::move(msg));
}

std::string str(simdjson::ondemand::value& v) {
  std::string_view s = v.get_string();
  return std::string(s);
}

struct EngineSection {
  std::optional<std::string> preset;
  std::optional<bool> worker, compiled, accelerated, strict;
  std::optional<std::string> worker_strategy, hint, endpoint;
};

bool read_engine(simdjson::ondemand::object obj, EngineSection& eng, ToolConfig& cfg, Error* err_out) {
  for (auto field : obj) {
    std::string_view key = field.unescaped_key();
    simdjson::ondemand::value v = field.value();
    if (key == "preset")               eng.preset = str(v);
    else if (key == "worker")          eng.worker = bool(v.get_bool());
    else if (key == "compiled")        eng.compiled = bool(v.get_bool());
    else if (key == "accelerated")     eng.accelerated = bool(v.get_bool());
    else if (key == "strict")          eng.strict = bool(v.get_bool());
    else if (key == "worker_strategy") eng.worker_strategy = str(v);
    else if (key == "hint")            eng.hint = str(v);
    else if (key == "endpoint")        eng.endpoint = str(v);
    else if (key == "max_workers")     cfg.max_workers = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
    else return set_error(err_out, config_error("unknown engine key '" + std::string(key) + "'"));
  }
  return true;
}

bool apply_engine(const EngineSection& eng, ToolConfig& cfg, Error* err_out) {
  EngineConfig& e = cfg.engine;
  if (eng.preset && !engine_preset(*eng.preset, &e))
    return set_error(err_out, config_error("unknown engine preset '" + *eng.preset + "'"));
  if (eng.worker) e.worker = *eng.worker;
  if (eng.compiled) e.compiled = *eng.compiled;
  if (eng.accelerated) e.accelerated = *eng.accelerated;
  if (eng.strict) e.strict = *eng.strict;
  if (eng.worker_strategy && !parse_worker_strategy(*eng.worker_strategy, &e.worker_strategy))
    return set_error(err_out, config_error("unknown worker_strategy '" + *eng.worker_strategy + "'"));
  if (eng.hint && !parse_hint(*eng.hint, &e.hint))
    return set_error(err_out, config_error("unknown hint '" + *eng.hint + "'"));
  if (eng.endpoint) e.worker_endpoint = *eng.endpoint;
  return true;
}

bool read_root(simdjson::ondemand::object root, ToolConfig& cfg, Error* err_out) {
  ParseOptions& p = cfg.parse;
  EngineSection eng;
  for (auto field : root) {
    std::string_view key = field.unescaped_key();
    simdjson::ondemand::value v = field.value();
    if (key == "delimiter") {
      p.delimiter = str(v);
    } else if (key == "quotation") {
      p.quotation = str(v);
    } else if (key == "header") {
      if (v.is_null()) { p.header.reset(); continue; }
      std::vector<std::string> names;
      for (auto el : v.get_array()) {
        std::string_view s = el.get_string();
        names.emplace_back(s);
      }
      p.header = std::move(names);
    } else if (key == "columns") {
      const std::string s = str(v);
      if (!parse_column_policy(s, &p.column_count_policy))
        return set_error(err_out, config_error("unknown column count policy '" + s + "'"));
    } else if (key == "output") {
      const std::string s = str(v);
      if (!parse_output_shape(s, &p.output))
        return set_error(err_out, config_error("unknown output shape '" + s + "'"));
    } else if (key == "include_header") {
      p.include_header = v.get_bool();
    } else if (key == "skip_empty_lines") {
      p.skip_empty_lines = v.get_bool();
    } else if (key == "max_buffer_size") {
      p.max_buffer_size = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
    } else if (key == "max_field_count") {
      p.max_field_count = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
    } else if (key == "max_binary_size") {
      p.max_binary_size = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
    } else if (key == "lexer_backpressure_interval") {
      p.lexer_backpressure_interval = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
    } else if (key == "assembler_backpressure_interval") {
      p.assembler_backpressure_interval = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
    } else if (key == "channel_capacity") {
      p.channel_capacity = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
    } else if (key == "source") {
      p.source = str(v);
    } else if (key == "charset") {
      cfg.charset = str(v);
    } else if (key == "chunk_bytes") {
      cfg.chunk_bytes = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
    } else if (key == "stream") {
      cfg.stream = v.get_bool();
    } else if (key == "engine") {
      if (!read_engine(v.get_object(), eng, cfg, err_out)) return false;
    } else {
      return set_error(err_out, config_error("unknown key '" + std::string(key) + "'"));
    }
  }
  return apply_engine(eng, cfg, err_out);
}

}

bool load_config_json(std::string_view json, ToolConfig& cfg, Error* err_out) {
  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json);
    simdjson::ondemand::document doc = parser.iterate(padded);
    return read_root(doc.get_object(), cfg, err_out);
  } catch (const std::exception& e) {
    return set_error(err_out, config_error(e.what()));
  }
}

bool load_config_file(const std::string& path, ToolConfig& cfg, Error* err_out) {
  try {
    simdjson::padded_string json = simdjson::padded_string::load(path);
    return load_config_json(std::string_view(json.data(), json.size()), cfg, err_out);
  } catch (const std::exception& e) {
    return set_error(err_out, make_error(ErrorCode::Io, "config: cannot read '" + path + "': " + e.what()));
  }
}

}
