#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "csv_toolbox/backends.hpp"
#include "csv_toolbox/execution_plan.hpp"
#include "csv_toolbox/input.hpp"
#include "csv_toolbox/options.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string make_synth_csv(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "ctb_bench_synth.csv";
  std::ofstream out(p, std::ios::binary);
  // header
  for (size_t c = 0; c < cols; ++c) { out << "col" << c; if (c+1<cols) out << ","; }
  out << "\n";
  // rows; every fourth column quoted, some with an embedded delimiter or doubled quote
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      if (c % 4 == 3) out << "\"" << (r%10) << ",x\"\"" << c << "\"";
      else out << (r%10) << "." << (c*37%1000);
      if (c+1<cols) out << ",";
    }
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string csv_path;        // if empty -> synth
  std::size_t rows = 200'000;  // for synth
  std::size_t cols = 8;        // for synth
  std::size_t workgroup = 128; // accelerated lanes
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--csv") a.csv_path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--workgroup") a.workgroup = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: ctb_bench_backends [--csv=path] [--rows=N] [--cols=M] [--workgroup=W] [--iters=K]\n"
        "If --csv is omitted, a synthetic CSV is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void bench_backend(ctb::Backend b, const std::string& data, const Args& args) {
  std::cout << "\n[" << ctb::to_string(b) << "] bytes=" << data.size() << " iters=" << args.iters << "\n";
  const ctb::ExecutorTable table = ctb::ExecutorTable::defaults();
  ctb::ParseOptions opts;
  ctb::AcceleratedTuning tuning;
  tuning.workgroup_size = args.workgroup;
  tuning.device = ctb::DevicePreference::HighPerformance;

  for (int k=1;k<=args.iters;++k) {
    std::uint64_t nrec = 0;
    ctb::ExecutionSink sink;
    sink.emit = [&](ctb::Record&&){ ++nrec; };
    ctb::ParseInput input = ctb::ParseInput::from_string(data);

    auto t0 = clk::now();
    ctb::Error err;
    const bool ok = table.get(b)(input, opts, tuning, sink, &err);
    auto t1 = clk::now();

    if (!ok) {
      std::cout << "  iter " << k << ": failed: " << err.to_string() << "\n";
      return;
    }
    const double sec = std::chrono::duration<double>(t1-t0).count();
    const double mib = data.size() / (1024.0*1024.0);
    std::cout << "  iter " << k
              << ": rows=" << nrec
              << " time=" << sec << "s"
              << "  throughput=" << (mib/sec) << " MiB/s"
              << "  rows/s=" << (nrec/sec) << "\n";
  }
}

int main(int argc, char** argv) {
  auto args = parse_args(argc, argv);
  const std::string path = args.csv_path.empty() ? make_synth_csv(args.rows, args.cols) : args.csv_path;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "[bench] cannot open " << path << "\n";
    return 1;
  }
  std::ostringstream ss; ss << in.rdbuf();
  const std::string data = ss.str();

  std::cout << "CSV toolbox backend bench\n";
  for (ctb::Backend b : {ctb::Backend::Plain, ctb::Backend::Compiled, ctb::Backend::Accelerated})
    bench_backend(b, data, args);
  std::cout << "\nDone.\n";
  return 0;
}
