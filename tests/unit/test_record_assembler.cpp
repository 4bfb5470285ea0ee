#include "csv_toolbox/chunk_source.hpp"
#include "csv_toolbox/parse.hpp"
#include "csv_toolbox/record_assembler.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

using Values = std::vector<ctb::FieldValue>;
static const ctb::FieldValue kMissing = std::nullopt;

static std::vector<ctb::Record> run(const std::string& text, const ctb::ParseOptions& opts, ctb::Error* err = nullptr) {
  std::vector<ctb::Record> out;
  ctb::Error e;
  ctb::parse_string(text, opts, out, &e);
  if (err) *err = e;
  else if (!e.ok()) std::cerr << "       unexpected error: " << e.to_string() << "\n";
  return out;
}

static ctb::ParseOptions with(ctb::ColumnCountPolicy p, ctb::OutputShape o) {
  ctb::ParseOptions opts;
  opts.column_count_policy = p;
  opts.output = o;
  return opts;
}

static bool value_is(const ctb::Record& r, const char* key, const ctb::FieldValue& v) {
  const ctb::FieldValue* got = r.find(key);
  return got && *got == v;
}

int main() {
  using ctb::ColumnCountPolicy;
  using ctb::OutputShape;

  // simple document with an inferred header
  {
    auto rs = run("a,b\n1,2", ctb::ParseOptions{});
    check(rs.size() == 1, "one record");
    if (rs.size() == 1) {
      check(rs[0].is_object() && rs[0].keys() == std::vector<std::string>{"a", "b"}, "keys a,b");
      check(value_is(rs[0], "a", std::string("1")) && value_is(rs[0], "b", std::string("2")), "values 1,2");
    }
  }

  // chunk boundaries inside header and data do not change the record
  {
    auto src = std::make_shared<ctb::StringChunkSource>(std::vector<std::string>{"a,", "b\n1", ",2"});
    std::vector<ctb::Record> rs;
    ctb::Error err;
    bool ok = ctb::parse_all(ctb::ParseInput::from_string_stream(src), ctb::ParseOptions{}, ctb::EngineConfig{}, rs, &err);
    check(ok && rs == run("a,b\n1,2", ctb::ParseOptions{}), "split chunks give identical record");
  }

  // quoted header field
  {
    auto rs = run("\"x,y\",z\n1,2", ctb::ParseOptions{});
    check(rs.size() == 1 && rs[0].keys()[0] == "x,y" && value_is(rs[0], "x,y", std::string("1")),
          "quoted header field keeps the delimiter");
  }

  // strict policy with a supplied header
  {
    ctb::ParseOptions opts = with(ColumnCountPolicy::Strict, OutputShape::Object);
    opts.header = std::vector<std::string>{"a", "b"};
    ctb::Error err;
    auto rs = run("1\n2\n", opts, &err);
    check(rs.empty(), "strict emits nothing before the mismatch");
    check(err.code == ctb::ErrorCode::ColumnCountMismatch && err.row == 1, "strict mismatch on first data row");
    check(err.message == "Expected 2 columns, got 1", "strict message: " + err.message);
  }

  // header names are plain data
  {
    ctb::ParseOptions opts;
    opts.header = std::vector<std::string>{"__proto__", "constructor", "prototype"};
    auto rs = run("evil,ctor,proto", opts);
    check(rs.size() == 1 && value_is(rs[0], "__proto__", std::string("evil")), "__proto__ is an ordinary key");
    check(rs.size() == 1 && value_is(rs[0], "constructor", std::string("ctor")), "constructor is an ordinary key");
    check(rs.size() == 1 && value_is(rs[0], "prototype", std::string("proto")), "prototype is an ordinary key");
    if (rs.size() == 1) check(rs[0].keys() == std::vector<std::string>{"__proto__", "constructor", "prototype"},
                              "header order kept");
    ctb::Record fresh;
    check(!fresh.contains("__proto__") && !fresh.contains("constructor") && fresh.keys().empty(),
          "fresh record has no keys");
    auto again = run("a\n1", ctb::ParseOptions{});
    check(again.size() == 1 && !again[0].contains("__proto__"), "other records unaffected");
  }

  // column policies, array output
  {
    const std::string doc = "a,b,c\n1\n1,2,3,4\n";
    auto keep = run(doc, with(ColumnCountPolicy::Keep, OutputShape::Array));
    check(keep.size() == 2 && keep[0].values() == Values{std::string("1")} && keep[1].size() == 4,
          "keep leaves rows as they are");

    auto pad = run(doc, with(ColumnCountPolicy::Pad, OutputShape::Array));
    check(pad.size() == 2 && pad[0].values() == Values{std::string("1"), kMissing, kMissing}, "pad short row");
    check(pad.size() == 2 && pad[1].size() == 3, "pad truncates long row");

    auto fill = run(doc, with(ColumnCountPolicy::Fill, OutputShape::Array));
    check(fill.size() == 2 && fill[0].values() == Values{std::string("1"), std::string(), std::string()},
          "fill short row with empty strings");
    check(fill.size() == 2 && fill[1].size() == 3, "fill truncates long row");

    auto trunc = run(doc, with(ColumnCountPolicy::Truncate, OutputShape::Array));
    check(trunc.size() == 2 && trunc[0].size() == 1 && trunc[1].size() == 3, "truncate never pads");

    ctb::Error err;
    auto strict = run(doc, with(ColumnCountPolicy::Strict, OutputShape::Array), &err);
    check(strict.empty() && err.code == ctb::ErrorCode::ColumnCountMismatch && err.row == 2,
          "strict array mismatch on row 2");
  }

  // column policies, object output
  {
    const std::string doc = "a,b,c\n1\n1,2,3,4\n";
    auto keep = run(doc, with(ColumnCountPolicy::Keep, OutputShape::Object));
    check(keep.size() == 2 && value_is(keep[0], "b", std::string()) && value_is(keep[0], "c", std::string()),
          "keep object fills missing keys with empty strings");
    check(keep.size() == 2 && keep[1].size() == 3 && !keep[1].contains("4"), "object drops extra values");

    auto pad = run(doc, with(ColumnCountPolicy::Pad, OutputShape::Object));
    check(pad.size() == 2 && value_is(pad[0], "b", kMissing) && value_is(pad[0], "c", kMissing),
          "pad object leaves missing values absent");
  }

  // empty rows
  {
    auto rs = run("a,b\n\n1,2\n", ctb::ParseOptions{});
    check(rs.size() == 2 && value_is(rs[0], "a", std::string()) && value_is(rs[0], "b", std::string()),
          "empty row becomes an all-empty record");
    ctb::ParseOptions skip;
    skip.skip_empty_lines = true;
    auto sk = run("a,b\n\n1,2\n\n", skip);
    check(sk.size() == 1 && value_is(sk[0], "a", std::string("1")), "skip_empty_lines drops empty rows");

    auto pad = run("a,b\n\n", with(ColumnCountPolicy::Pad, OutputShape::Array));
    check(pad.size() == 1 && pad[0].values() == Values{std::string(), std::string()}, "empty row under pad is empty strings");
  }

  // empty header names are not keys
  {
    auto rs = run("a,,c\n1,2,3", ctb::ParseOptions{});
    check(rs.size() == 1 && rs[0].keys() == std::vector<std::string>{"a", "c"} &&
          value_is(rs[0], "c", std::string("3")), "empty header name skipped");
  }

  // include_header and headerless
  {
    ctb::ParseOptions inc = with(ColumnCountPolicy::Keep, OutputShape::Array);
    inc.include_header = true;
    auto rs = run("a,b\n1,2", inc);
    check(rs.size() == 2 && rs[0].values() == Values{std::string("a"), std::string("b")}, "header emitted first");

    ctb::ParseOptions hl = with(ColumnCountPolicy::Keep, OutputShape::Array);
    hl.header = std::vector<std::string>{};
    auto h = run("1,2\n3", hl);
    check(h.size() == 2 && h[0].size() == 2 && h[1].values() == Values{std::string("3")}, "headerless rows");
  }

  // inferred header errors
  {
    ctb::Error err;
    run("\n1,2", ctb::ParseOptions{}, &err);
    check(err.code == ctb::ErrorCode::ParseError && err.message == "The header must not be empty", "empty header");
    ctb::Error dup;
    run("a,a\n1,2", ctb::ParseOptions{}, &dup);
    check(dup.code == ctb::ErrorCode::ParseError, "duplicate inferred header");
  }

  // construction validation
  {
    auto invalid = [](ctb::AssemblerConfig cfg) {
      ctb::RecordAssembler a(cfg);
      return !a.ok() && a.error().code == ctb::ErrorCode::InvalidOption;
    };
    ctb::AssemblerConfig c;
    c.header = std::vector<std::string>{};
    check(invalid(c), "headerless requires array output");
    c.output = OutputShape::Array;
    c.policy = ColumnCountPolicy::Pad;
    check(invalid(c), "headerless requires keep");

    ctb::AssemblerConfig inc;
    inc.include_header = true;
    check(invalid(inc), "include_header with object output");

    ctb::AssemblerConfig dup;
    dup.header = std::vector<std::string>{"a", "a"};
    check(invalid(dup), "duplicate supplied header");

    ctb::AssemblerConfig wide;
    wide.header = std::vector<std::string>{"a", "b", "c"};
    wide.max_field_count = 2;
    check(invalid(wide), "header longer than max_field_count");

    ctb::AssemblerConfig zero;
    zero.max_field_count = 0;
    check(invalid(zero), "max_field_count 0");
  }

  // field count limit
  {
    ctb::ParseOptions opts;
    opts.max_field_count = 3;
    ctb::Error err;
    run("a,b,c,d\n", opts, &err);
    check(err.code == ctb::ErrorCode::BufferLimitExceeded &&
          err.message == "Field count (4) exceeded maximum allowed count of 3", "field count limit: " + err.message);
  }

  // direct use: flush emits the pending row
  {
    ctb::AssemblerConfig cfg;
    cfg.header = std::vector<std::string>{"k"};
    ctb::RecordAssembler a(cfg);
    std::vector<ctb::Record> out;
    auto cb = [&](ctb::Record&& r){ out.push_back(std::move(r)); };
    ctb::Token f;
    f.value = "v";
    bool ok = a.assemble(f, cb) && a.flush(cb);
    check(ok && out.size() == 1 && value_is(out[0], "k", std::string("v")) && a.records() == 1, "flush pending row");
    check(a.header() && a.header()->size() == 1, "supplied header exposed");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " assembler checks failed\n"; return 1; }
  std::cout << "[PASS] record assembler\n";
  return 0;
}
