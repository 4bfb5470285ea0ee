#include "csv_toolbox/chunk_source.hpp"
#include "csv_toolbox/config_file.hpp"
#include "csv_toolbox/engine_config.hpp"
#include "csv_toolbox/input.hpp"
#include "csv_toolbox/parse.hpp"
#include "csv_toolbox/record_json.hpp"
#include "csv_toolbox/response_options.hpp"
#include "csv_toolbox/worker_pool.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::string config_path;
  std::string delimiter;
  std::string quotation;
  std::string header;        // comma separated
  bool headerless = false;
  std::string columns;
  std::string output;
  bool include_header = false;
  bool skip_empty_lines = false;
  std::string engine;        // preset name
  std::string hint;
  std::string charset;
  std::size_t chunk_bytes = 0;
  bool stream = false;
  std::string url;
  bool summary = false;
  bool quiet = false;
  std::vector<std::string> files;
};

[[noreturn]] void usage(int code) {
  std::cout <<
    "Usage: csv-toolbox [--config=FILE] [--delimiter=C] [--quotation=C]\n"
    "                   [--header=a,b,...|--headerless] [--columns=keep|pad|strict|truncate|fill]\n"
    "                   [--output=object|array] [--include-header] [--skip-empty-lines]\n"
    "                   [--engine=PRESET] [--hint=speed|consistency|balanced|responsive]\n"
    "                   [--charset=LABEL] [--chunk-bytes=N] [--stream] [--summary] [--quiet]\n"
    "                   [--url=http://host/path.csv] [FILE...]\n"
    "Presets: main-thread worker worker-stream-transfer compiled worker-compiled\n"
    "         accelerated fastest balanced responsive\n";
  std::exit(code);
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_z = [&](const char* pfx, std::size_t* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoull(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    if (eat("--config=", &c.config_path)) continue;
    if (eat("--delimiter=", &c.delimiter)) continue;
    if (eat("--quotation=", &c.quotation)) continue;
    if (eat("--header=", &c.header)) continue;
    if (eat("--columns=", &c.columns)) continue;
    if (eat("--output=", &c.output)) continue;
    if (eat("--engine=", &c.engine)) continue;
    if (eat("--hint=", &c.hint)) continue;
    if (eat("--charset=", &c.charset)) continue;
    if (eat("--url=", &c.url)) continue;
    if (eat_z("--chunk-bytes=", &c.chunk_bytes)) continue;
    if (a == "--headerless")       { c.headerless = true; continue; }
    if (a == "--include-header")   { c.include_header = true; continue; }
    if (a == "--skip-empty-lines") { c.skip_empty_lines = true; continue; }
    if (a == "--stream")           { c.stream = true; continue; }
    if (a == "--summary")          { c.summary = true; continue; }
    if (a == "--quiet")            { c.quiet = true; continue; }
    if (a == "-h" || a == "--help") usage(0);
    if (a.rfind("--", 0) == 0) {
      std::cerr << "[config] unknown flag: " << a << "\n";
      usage(2);
    }
    c.files.push_back(a);
  }
  return c;
}

std::vector<std::string> split_names(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) out.push_back(item);
  return out;
}

// Flags win over the config file.
bool apply_cli(const Cli& cli, ctb::ToolConfig& cfg, std::string* err) {
  ctb::ParseOptions& p = cfg.parse;
  if (!cli.delimiter.empty()) p.delimiter = cli.delimiter;
  if (!cli.quotation.empty()) p.quotation = cli.quotation;
  if (!cli.header.empty()) p.header = split_names(cli.header);
  if (cli.headerless) p.header = std::vector<std::string>{};
  if (!cli.columns.empty() && !ctb::parse_column_policy(cli.columns, &p.column_count_policy)) {
    *err = "unknown column count policy: " + cli.columns;
    return false;
  }
  if (!cli.output.empty() && !ctb::parse_output_shape(cli.output, &p.output)) {
    *err = "unknown output shape: " + cli.output;
    return false;
  }
  if (cli.include_header) p.include_header = true;
  if (cli.skip_empty_lines) p.skip_empty_lines = true;
  if (!cli.engine.empty() && !ctb::engine_preset(cli.engine, &cfg.engine)) {
    *err = "unknown engine preset: " + cli.engine;
    return false;
  }
  if (!cli.hint.empty() && !ctb::parse_hint(cli.hint, &cfg.engine.hint)) {
    *err = "unknown hint: " + cli.hint;
    return false;
  }
  if (!cli.charset.empty()) cfg.charset = cli.charset;
  if (cli.chunk_bytes) cfg.chunk_bytes = cli.chunk_bytes;
  if (cli.stream) cfg.stream = true;
  return true;
}

bool read_file(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss; ss << in.rdbuf();
  *out = ss.str();
  return true;
}

int run_one(const std::string& label, ctb::ParseInput input, std::uint64_t bytes,
            const ctb::ToolConfig& cfg, const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  ctb::ParseOptions opts = cfg.parse;
  if (opts.source.empty()) opts.source = label;
  ctb::EngineConfig engine = cfg.engine;
  engine.on_fallback = [&](const ctb::FallbackInfo& f){
    if (!cli.quiet)
      std::cerr << "[engine] fallback " << f.requested << " -> " << f.actual << ": " << f.reason << "\n";
  };

  std::uint64_t records = 0;
  auto on_record = [&](ctb::Record&& r){
    ++records;
    std::cout << ctb::RecordJsonWriter::to_json(r) << "\n";
  };

  ctb::Error err;
  ctb::RunReport report;
  const std::string charset = input.charset;
  const bool ok = ctb::parse(std::move(input), opts, engine, on_record, &err, &report);

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();
  const double sec = wall_ms / 1000.0;

  if (!ok) std::cerr << "[parse] error: " << err.to_string() << "\n";
  else if (!cli.quiet)
    std::cerr << "[parse] ok: " << label << " records=" << records << " via "
              << ctb::describe_candidate(report.backend, report.context) << "\n";

  if (cli.summary) {
    ctb::RunSummary s;
    s.records = records;
    s.bytes = bytes;
    s.wall_time_ms = wall_ms;
    s.throughput_mb_s = sec > 0.0 ? (bytes / (1024.0 * 1024.0)) / sec : 0.0;
    s.records_per_sec = sec > 0.0 ? records / sec : 0.0;
    s.backend = ctb::to_string(report.backend);
    s.context = ctb::to_string(report.context);
    s.engine = ctb::describe(cfg.engine);
    s.fallbacks = report.fallbacks;
    s.filename = label;
    s.charset = charset;
    if (!ok) s.error = err.to_string();
    std::cerr << ctb::RecordJsonWriter::to_json(s) << "\n";
  }

  if (ok) return 0;
  return err.code == ctb::ErrorCode::InvalidOption ? 2 : 3;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);

  ctb::ToolConfig cfg;
  if (!cli.config_path.empty()) {
    ctb::Error err;
    if (!ctb::load_config_file(cli.config_path, cfg, &err)) {
      std::cerr << "[config] " << err.to_string() << "\n";
      return 2;
    }
    if (!cli.quiet) std::cerr << "[config] loaded " << cli.config_path << "\n";
  }
  std::string cli_err;
  if (!apply_cli(cli, cfg, &cli_err)) {
    std::cerr << "[config] " << cli_err << "\n";
    return 2;
  }
  if (cli.files.empty() && cli.url.empty()) usage(2);

  // One pool shared by every input of this run.
  ctb::WorkerPool pool(ctb::WorkerPool::Config{cfg.max_workers});
  if (!pool.ok()) {
    std::cerr << "[config] " << pool.error().to_string() << "\n";
    return 2;
  }
  cfg.engine.worker_pool = &pool;
  if (!cli.quiet) std::cerr << "[engine] " << ctb::describe(cfg.engine) << ", hint "
                            << ctb::to_string(cfg.engine.hint) << "\n";

  int rc = 0;
  if (!cli.url.empty()) {
    ctb::ParseInput input;
    ctb::Error err;
    if (!ctb::fetch_csv(cli.url, input, &err)) {
      std::cerr << "[fetch] " << err.to_string() << "\n";
      rc = err.code == ctb::ErrorCode::InvalidOption ? 2 : 3;
    } else {
      if (!cli.quiet) std::cerr << "[fetch] " << cli.url << " charset=" << input.charset << "\n";
      const std::uint64_t bytes = input.buffer.size();
      const int r = run_one(cli.url, std::move(input), bytes, cfg, cli);
      if (r) rc = r;
    }
  }

  for (const auto& f : cli.files) {
    std::error_code fec;
    const std::uint64_t bytes = std::filesystem::file_size(f, fec);
    if (fec) {
      std::cerr << "[parse] cannot stat " << f << ": " << fec.message() << "\n";
      rc = 3;
      continue;
    }
    ctb::ParseInput input;
    if (cfg.stream) {
      ctb::FileChunkSource::Config rcfg;
      rcfg.chunk_bytes = cfg.chunk_bytes;
      input = ctb::ParseInput::from_byte_stream(std::make_shared<ctb::FileChunkSource>(f, rcfg), cfg.charset);
    } else {
      std::string data;
      if (!read_file(f, &data)) {
        std::cerr << "[parse] cannot read " << f << "\n";
        rc = 3;
        continue;
      }
      input = ctb::ParseInput::from_bytes(std::move(data), cfg.charset);
    }
    const int r = run_one(f, std::move(input), bytes, cfg, cli);
    if (r) rc = r;
  }
  return rc;
}
