#include "csv_toolbox/chunk_source.hpp"
#include "csv_toolbox/strategy_runner.hpp"
#include "csv_toolbox/worker_pool.hpp"
#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using ctb::Backend;
using ctb::Context;

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static ctb::BackendExecutor unavailable(const char* why, std::atomic<int>* calls) {
  return [why, calls](ctb::ParseInput&, const ctb::ParseOptions&, const std::optional<ctb::AcceleratedTuning>&,
                      ctb::ExecutionSink&, ctb::Error* err) {
    if (calls) ++*calls;
    return ctb::set_error(err, ctb::make_error(ctb::ErrorCode::BackendUnavailable, why));
  };
}

static ctb::ExecutionPlan plan_of(std::vector<Backend> b, std::vector<Context> c) {
  ctb::ExecutionPlan p;
  p.backends = std::move(b);
  p.contexts = std::move(c);
  return p;
}

static std::string first_value(const std::vector<ctb::Record>& rs) {
  return rs.empty() || rs[0].size() == 0 || !rs[0].at(0) ? std::string() : *rs[0].at(0);
}

int main() {
  // unavailable backend before any record falls back to the next one
  {
    std::atomic<int> accel_calls{0};
    ctb::ExecutorTable t = ctb::ExecutorTable::defaults();
    t.accelerated = unavailable("no device", &accel_calls);
    ctb::StrategyRunner runner(t);

    std::vector<ctb::FallbackInfo> seen;
    ctb::EngineConfig engine;
    engine.on_fallback = [&](const ctb::FallbackInfo& f){ seen.push_back(f); };

    std::vector<ctb::Record> out;
    ctb::RunReport rep;
    ctb::Error err;
    bool ok = runner.execute(ctb::ParseInput::from_string("a,b\n1,2\n3,4"), ctb::ParseOptions{}, engine,
                             plan_of({Backend::Accelerated, Backend::Plain}, {Context::InProcess}),
                             [&](ctb::Record&& r){ out.push_back(std::move(r)); }, &err, &rep);
    check(ok && out.size() == 2, "fallback run succeeds");
    check(accel_calls == 1 && rep.attempts == 2 && rep.backend == Backend::Plain, "plain ran second");
    check(seen.size() == 1 && rep.fallbacks.size() == 1, "one fallback reported");
    if (seen.size() == 1) {
      check(seen[0].requested == "accelerated@in-process" && seen[0].actual == "plain@in-process",
            "fallback labels: " + seen[0].requested + " -> " + seen[0].actual);
      check(seen[0].reason == "no device", "fallback reason");
    }
  }

  // failure after a record was delivered is surfaced, never retried
  {
    ctb::ExecutorTable t = ctb::ExecutorTable::defaults();
    t.accelerated = [](ctb::ParseInput&, const ctb::ParseOptions&, const std::optional<ctb::AcceleratedTuning>&,
                       ctb::ExecutionSink& sink, ctb::Error* err) {
      sink.record(ctb::Record::make_array({std::string("partial")}));
      return ctb::set_error(err, ctb::make_error(ctb::ErrorCode::BackendUnavailable, "lost device"));
    };
    ctb::StrategyRunner runner(t);
    std::vector<ctb::Record> out;
    ctb::RunReport rep;
    ctb::Error err;
    bool ok = runner.execute(ctb::ParseInput::from_string("a\n1"), ctb::ParseOptions{}, ctb::EngineConfig{},
                             plan_of({Backend::Accelerated, Backend::Plain}, {Context::InProcess}),
                             [&](ctb::Record&& r){ out.push_back(std::move(r)); }, &err, &rep);
    check(!ok && err.code == ctb::ErrorCode::BackendUnavailable, "post-emission failure surfaced");
    check(out.size() == 1 && first_value(out) == "partial", "delivered record stays delivered");
    check(rep.attempts == 1 && rep.fallbacks.empty(), "no fallback after emission");
  }

  // non-recoverable errors never fall back
  {
    ctb::StrategyRunner runner;
    std::vector<ctb::Record> out;
    ctb::RunReport rep;
    ctb::Error err;
    bool ok = runner.execute(ctb::ParseInput::from_string("a\n\"open"), ctb::ParseOptions{}, ctb::EngineConfig{},
                             plan_of({Backend::Plain, Backend::Compiled}, {Context::InProcess}),
                             [&](ctb::Record&& r){ out.push_back(std::move(r)); }, &err, &rep);
    check(!ok && err.code == ctb::ErrorCode::ParseError && rep.attempts == 1, "parse error not retried");
  }

  // empty plan runs plain in-process
  {
    ctb::StrategyRunner runner;
    std::vector<ctb::Record> out;
    ctb::RunReport rep;
    bool ok = runner.execute(ctb::ParseInput::from_string("a\n1"), ctb::ParseOptions{}, ctb::EngineConfig{},
                             ctb::ExecutionPlan{}, [&](ctb::Record&& r){ out.push_back(std::move(r)); },
                             nullptr, &rep);
    check(ok && out.size() == 1 && rep.backend == Backend::Plain && rep.context == Context::InProcess,
          "empty plan -> plain@in-process");
  }

  // stream input is replayed from the start after a fallback
  auto stream_case = [](bool strict, ctb::Error* err, ctb::RunReport* rep, std::vector<ctb::Record>& out) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    ctb::ExecutorTable t = ctb::ExecutorTable::defaults();
    t.plain = [calls](ctb::ParseInput& in, const ctb::ParseOptions&, const std::optional<ctb::AcceleratedTuning>&,
                      ctb::ExecutionSink& sink, ctb::Error* e) {
      std::string chunk;
      if (!in.stream->next(chunk)) return ctb::set_error(e, ctb::make_error(ctb::ErrorCode::Io, "empty"));
      if (++*calls == 1) return ctb::set_error(e, ctb::make_error(ctb::ErrorCode::BackendUnavailable, "no transfer"));
      std::string all = chunk;
      while (in.stream->next(chunk)) all += chunk;
      sink.record(ctb::Record::make_array({all}));
      return true;
    };
    ctb::StrategyRunner runner(t);
    ctb::EngineConfig engine = ctb::presets::worker_stream_transfer();
    engine.strict = strict;
    auto src = std::make_shared<ctb::StringChunkSource>(std::vector<std::string>{"a\n", "1\n", "2\n"});
    return runner.execute(ctb::ParseInput::from_string_stream(src), ctb::ParseOptions{}, engine,
                          plan_of({Backend::Plain}, {Context::WorkerStreamTransfer, Context::InProcess}),
                          [&out](ctb::Record&& r){ out.push_back(std::move(r)); }, err, rep);
  };
  {
    std::vector<ctb::Record> out;
    ctb::RunReport rep;
    ctb::Error err;
    bool ok = stream_case(false, &err, &rep, out);
    check(ok && first_value(out) == "a\n1\n2\n", "stream rewound for the next candidate");
    check(rep.fallbacks.size() == 1 && rep.fallbacks[0].requested == "plain@worker-stream-transfer" &&
          rep.context == Context::InProcess, "stream-transfer fell back to in-process");
  }
  {
    std::vector<ctb::Record> out;
    ctb::RunReport rep;
    ctb::Error err;
    bool ok = stream_case(true, &err, &rep, out);
    check(!ok && err.code == ctb::ErrorCode::BackendUnavailable && rep.attempts == 1 && out.empty(),
          "strict stream-transfer surfaces the failure");
  }

  // the last candidate reads a committed stream, nothing is kept for replay
  {
    auto committed_first = std::make_shared<bool>(false);
    auto held = std::make_shared<std::size_t>(99);
    ctb::ExecutorTable t = ctb::ExecutorTable::defaults();
    t.plain = [committed_first, held](ctb::ParseInput& in, const ctb::ParseOptions&,
                                      const std::optional<ctb::AcceleratedTuning>&, ctb::ExecutionSink& sink,
                                      ctb::Error*) {
      auto rw = std::dynamic_pointer_cast<ctb::RewindableSource>(in.stream);
      *committed_first = rw && rw->committed();
      std::string chunk, all;
      while (in.stream->next(chunk)) all += chunk;
      if (rw) *held = rw->buffered();
      sink.record(ctb::Record::make_array({all}));
      return true;
    };
    ctb::StrategyRunner runner(t);
    auto src = std::make_shared<ctb::StringChunkSource>(std::vector<std::string>{"a\n", "1\n", "2\n"});
    std::vector<ctb::Record> out;
    ctb::Error err;
    bool ok = runner.execute(ctb::ParseInput::from_string_stream(src), ctb::ParseOptions{}, ctb::EngineConfig{},
                             plan_of({Backend::Plain}, {Context::InProcess}),
                             [&](ctb::Record&& r){ out.push_back(std::move(r)); }, &err);
    check(ok && first_value(out) == "a\n1\n2\n", "single candidate reads the whole stream");
    check(*committed_first && *held == 0, "final candidate does not buffer chunks");
  }

  // a rewound source that is then committed replays its chunks once and drops them
  {
    auto src = std::make_shared<ctb::StringChunkSource>(std::vector<std::string>{"x", "y", "z"});
    ctb::RewindableSource rw(src);
    std::string c;
    rw.next(c);
    rw.next(c);
    check(rw.rewind() && rw.buffered() == 2, "two chunks held after rewind");
    rw.commit();
    std::string all;
    while (rw.next(c)) all += c;
    check(all == "xyz" && rw.buffered() == 0 && !rw.rewind(), "replayed once after commit");
  }

  // a worker job throwing a non-standard exception closes the channel
  {
    struct Boom {};
    ctb::ExecutorTable t = ctb::ExecutorTable::defaults();
    t.plain = [](ctb::ParseInput&, const ctb::ParseOptions&, const std::optional<ctb::AcceleratedTuning>&,
                 ctb::ExecutionSink&, ctb::Error*) -> bool { throw Boom{}; };
    ctb::StrategyRunner runner(t);
    bool threw = false;
    try {
      ctb::Error err;
      runner.execute(ctb::ParseInput::from_string("a\n1"), ctb::ParseOptions{}, ctb::presets::worker(),
                     plan_of({Backend::Plain}, {Context::WorkerMessage}), [](ctb::Record&&){}, &err);
    } catch (const Boom&) {
      threw = true;
    }
    check(threw, "foreign exception reaches the caller instead of blocking the consumer");
  }

  // worker-message context with the real plain backend, shared pool
  {
    ctb::WorkerPool pool(ctb::WorkerPool::Config{2});
    ctb::EngineConfig engine = ctb::presets::worker();
    engine.worker_pool = &pool;
    ctb::ParseOptions opts;
    opts.channel_capacity = 1;
    opts.lexer_backpressure_interval = 1;
    opts.assembler_backpressure_interval = 1;

    std::string doc = "n\n";
    for (int i = 0; i < 500; ++i) doc += std::to_string(i) + "\n";
    std::vector<ctb::Record> out;
    ctb::RunReport rep;
    ctb::Error err;
    ctb::StrategyRunner runner;
    bool ok = runner.execute(ctb::ParseInput::from_string(doc), opts, engine,
                             plan_of({Backend::Plain}, {Context::WorkerMessage}),
                             [&](ctb::Record&& r){ out.push_back(std::move(r)); }, &err, &rep);
    check(ok && out.size() == 500, "all records through the channel: " + err.to_string());
    bool ordered = true;
    for (std::size_t i = 0; i < out.size(); ++i) {
      const ctb::FieldValue* v = out[i].find("n");
      if (!v || *v != std::to_string(i)) { ordered = false; break; }
    }
    check(ordered, "records arrive in source order");
    check(rep.context == Context::WorkerMessage && pool.leased() == 0 && pool.size() == 1,
          "worker leased and returned");
  }

  // errors raised on a worker reach the caller
  {
    ctb::EngineConfig engine = ctb::presets::worker();
    ctb::StrategyRunner runner;
    ctb::Error err;
    std::vector<ctb::Record> out;
    bool ok = runner.execute(ctb::ParseInput::from_string("a\n1\n\"x"), ctb::ParseOptions{}, engine,
                             plan_of({Backend::Plain}, {Context::WorkerMessage}),
                             [&](ctb::Record&& r){ out.push_back(std::move(r)); }, &err);
    check(!ok && err.code == ctb::ErrorCode::ParseError && out.size() == 1, "worker parse error after one record");
  }

  // cancellation before the first candidate
  {
    ctb::CancellationSource src;
    src.cancel("user abort");
    ctb::ParseOptions opts;
    opts.cancel = src.token();
    ctb::StrategyRunner runner;
    ctb::Error err;
    bool ok = runner.execute(ctb::ParseInput::from_string("a\n1"), opts, ctb::EngineConfig{},
                             plan_of({Backend::Plain}, {Context::InProcess}), [](ctb::Record&&){}, &err);
    check(!ok && err.code == ctb::ErrorCode::Cancelled && err.message == "user abort", "cancelled up front");
  }

  // structural viability
  {
    check(!ctb::is_viable(Context::WorkerMessage, Backend::Plain, ctb::InputShape::ByteStream), "message needs buffer");
    check(!ctb::is_viable(Context::WorkerStreamTransfer, Backend::Plain, ctb::InputShape::BufferedString),
          "stream-transfer needs stream");
    check(!ctb::is_viable(Context::InProcess, Backend::Compiled, ctb::InputShape::StringStream), "compiled needs buffer");
    check(ctb::is_viable(Context::InProcess, Backend::Accelerated, ctb::InputShape::StringStream),
          "accelerated drains streams in-process");
    check(!ctb::is_viable(Context::WorkerStreamTransfer, Backend::Accelerated, ctb::InputShape::ByteStream),
          "accelerated not on transferred streams");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " runner checks failed\n"; return 1; }
  std::cout << "[PASS] strategy runner\n";
  return 0;
}
