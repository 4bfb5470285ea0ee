#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <cstdlib>
#include <ctime>
#include <vector>
#include <sys/wait.h>
#include <simdjson.h>

namespace fs = std::filesystem;

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

struct RunOut {
  int rc{-1};
  std::vector<std::string> out_lines;
  std::vector<std::string> err_lines;
};

static std::vector<std::string> read_lines(const fs::path& p) {
  std::vector<std::string> v;
  std::ifstream in(p);
  std::string line;
  while (std::getline(in, line)) if (!line.empty()) v.push_back(line);
  return v;
}

static RunOut run_cli(const std::string& bin, const std::string& args, const fs::path& art, const std::string& tag) {
  const fs::path out = art / (tag + ".out");
  const fs::path err = art / (tag + ".err");
  std::string cmd = "\"" + bin + "\" " + args + " >\"" + out.string() + "\" 2>\"" + err.string() + "\"";
  RunOut r;
  int status = std::system(cmd.c_str());
  r.rc = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
  r.out_lines = read_lines(out);
  r.err_lines = read_lines(err);
  return r;
}

static std::string field_of(simdjson::ondemand::parser& p, const std::string& line, const char* key) {
  simdjson::padded_string json(line);
  auto doc = p.iterate(json);
  std::string_view v;
  if (doc[key].get_string().get(v)) v = "";
  return std::string(v);
}

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main() {
  std::string bin = env_or("CTB_CLI_BIN", "csv-toolbox");
  fs::path in = "tests/data/simple.csv";
  if (!fs::exists(in)) { std::cerr << "[ERR] fixture not found: " << in << "\n"; return 2; }

  fs::path art = fs::temp_directory_path() / ("ctb-it-" + std::to_string(std::time(nullptr)));
  fs::create_directories(art);

  simdjson::ondemand::parser p;

  // buffered, one JSON object per record plus the summary on stderr
  {
    RunOut r = run_cli(bin, "--quiet --summary " + in.string(), art, "buffered");
    check(r.rc == 0, "buffered run exit code " + std::to_string(r.rc));
    check(r.out_lines.size() == 3, "three records printed, got " + std::to_string(r.out_lines.size()));
    if (r.out_lines.size() == 3) {
      check(field_of(p, r.out_lines[0], "name") == "Ann", "first record name");
      check(field_of(p, r.out_lines[1], "city") == "Rio, BR", "quoted city keeps its delimiter");
    }
    std::string summary;
    for (const auto& l : r.err_lines) if (!l.empty() && l[0] == '{') summary = l;
    check(!summary.empty(), "summary printed");
    if (!summary.empty()) {
      simdjson::padded_string json(summary);
      auto doc = p.iterate(json);
      uint64_t records;
      if (doc["records"].get_uint64().get(records)) records = 0;
      check(records == 3, "summary records=" + std::to_string(records));
    }
  }

  // streamed through a worker gives the same lines
  {
    RunOut a = run_cli(bin, "--quiet " + in.string(), art, "plain");
    RunOut b = run_cli(bin, "--quiet --engine=worker --stream --chunk-bytes=5 " + in.string(), art, "worker");
    check(a.rc == 0 && b.rc == 0, "plain and worker runs succeed");
    check(a.out_lines == b.out_lines, "worker stream output matches buffered output");
  }

  // array output with a custom delimiter
  {
    RunOut r = run_cli(bin, "--quiet --delimiter=';' --headerless --output=array tests/data/semicolon.txt",
                       art, "semicolon");
    check(r.rc == 0 && !r.out_lines.empty() && r.out_lines[0][0] == '[', "array output for semicolon file");
  }

  // malformed input and bad flags
  {
    RunOut bad = run_cli(bin, "--quiet tests/data/bad_unterminated.csv", art, "bad");
    check(bad.rc == 3, "unterminated quote exits 3, got " + std::to_string(bad.rc));
    bool logged = false;
    for (const auto& l : bad.err_lines) logged = logged || l.rfind("[parse] error:", 0) == 0;
    check(logged, "parse error logged");

    RunOut flag = run_cli(bin, "--columns=loose " + in.string(), art, "flag");
    check(flag.rc == 2, "unknown column policy exits 2, got " + std::to_string(flag.rc));

    RunOut missing = run_cli(bin, "--quiet tests/data/no_such_file.csv", art, "missing");
    check(missing.rc == 3, "missing file exits 3");
  }

  if (failures) { std::cerr << "[FAIL] end-to-end CSV (logs in " << art << ")\n"; return 1; }
  std::cout << "[PASS] end-to-end CSV: out=" << art << "\n";
  return 0;
}
