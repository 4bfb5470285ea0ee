#include "csv_toolbox/strategy_runner.hpp"
#include "csv_toolbox/record_channel.hpp"
#include "csv_toolbox/worker_pool.hpp"
#include <future>
#include <memory>

namespace ctb {

std::string describe_candidate(Backend b, Context c) {
  return std::string(to_string(b)) + "@" + to_string(c);
}

bool is_viable(Context c, Backend b, InputShape shape) {
  const bool stream = shape == InputShape::ByteStream || shape == InputShape::StringStream;
  if (c == Context::WorkerMessage && stream) return false;
  if (c == Context::WorkerStreamTransfer && !stream) return false;
  switch (b) {
    case Backend::Plain:       return true;
    case Backend::Compiled:    return !stream;
    case Backend::Accelerated: return !stream || c == Context::InProcess;
  }
  return false;
}

namespace {

// Stops the worker job from touching the channel once the consumer unwinds.
struct ChannelGuard {
  RecordChannel& channel;
  std::future<void>& done;
  ~ChannelGuard() {
    if (!done.valid()) return;
    channel.abandon();
    done.wait();
  }
};

}

StrategyRunner::StrategyRunner(ExecutorTable executors) : executors_(std::move(executors)) {}

bool StrategyRunner::attempt(const Candidate& c, ParseInput& input, const ParseOptions& options,
                             const EngineConfig& engine, const ExecutionPlan& plan,
                             const RecordCallback& deliver, Error& err) {
  const BackendExecutor& exec = executors_.get(c.backend);
  if (!exec) {
    err = make_error(ErrorCode::BackendUnavailable,
                     std::string("no executor registered for ") + to_string(c.backend));
    return false;
  }

  if (c.context == Context::InProcess) {
    ExecutionSink sink;
    sink.emit = deliver;
    return exec(input, options, plan.accelerated_tuning, sink, &err);
  }

  std::unique_ptr<WorkerPool> local_pool;
  WorkerPool* pool = engine.worker_pool;
  if (!pool) {
    local_pool.reset(new WorkerPool(WorkerPool::Config{1}));
    pool = local_pool.get();
  }
  WorkerSession session(*pool, engine.worker_endpoint);
  if (!session.ok()) {
    err = session.error();
    if (err.code == ErrorCode::InvalidOption) err.code = ErrorCode::BackendUnavailable;
    return false;
  }

  // worker-message posts a private copy of the buffer; stream-transfer hands
  // the source itself to the worker.
  auto job_input = std::make_shared<ParseInput>();
  job_input->shape = input.shape;
  job_input->charset = input.charset;
  if (c.context == Context::WorkerMessage) job_input->buffer = input.buffer;
  else job_input->stream = input.stream;

  RecordChannel channel(options.channel_capacity);
  std::future<void> done;
  ChannelGuard guard{channel, done};
  const std::optional<AcceleratedTuning> tuning = plan.accelerated_tuning;
  try {
    done = session.worker().run([&channel, &options, exec, tuning, job_input] {
      ExecutionSink sink;
      sink.emit = [&channel](Record&& r) { channel.push(std::move(r)); };
      sink.lexing = BackpressureGate(&channel, options.lexer_backpressure_interval);
      sink.assembly = BackpressureGate(&channel, options.assembler_backpressure_interval);
      Error e;
      bool ok = false;
      try {
        ok = exec(*job_input, options, tuning, sink, &e);
      } catch (const std::exception& ex) {
        e = make_error(ErrorCode::BackendUnavailable, std::string("worker job failed: ") + ex.what());
      } catch (...) {
        // Unblock the consumer, then let the job's future carry the exception.
        channel.close(make_error(ErrorCode::BackendUnavailable, "worker job failed: unknown exception"));
        throw;
      }
      channel.close(ok ? std::nullopt : std::optional<Error>(e));
    });
  } catch (const std::exception& ex) {
    err = make_error(ErrorCode::BackendUnavailable, std::string("cannot post to worker: ") + ex.what());
    return false;
  }

  Record rec;
  while (channel.pop(rec)) deliver(std::move(rec));
  done.get();
  if (auto e = channel.error()) {
    err = *e;
    return false;
  }
  return true;
}

bool StrategyRunner::execute(ParseInput input, const ParseOptions& options, const EngineConfig& engine,
                             const ExecutionPlan& plan, const RecordCallback& on_record,
                             Error* err_out, RunReport* report) {
  RunReport local_report;
  RunReport& rep = report ? *report : local_report;
  rep = RunReport{};

  std::vector<Candidate> candidates;
  for (Context ctx : plan.contexts) {
    for (Backend b : plan.backends) {
      if (is_viable(ctx, b, input.shape)) candidates.push_back(Candidate{ctx, b});
    }
  }
  if (candidates.empty()) candidates.push_back(Candidate{Context::InProcess, Backend::Plain});

  std::shared_ptr<RewindableSource> rewindable;
  if (input.is_stream() && input.stream) {
    rewindable = std::make_shared<RewindableSource>(input.stream);
    input.stream = rewindable;
  }

  std::uint64_t delivered = 0;
  RecordCallback deliver = [&](Record&& r) {
    if (delivered == 0 && rewindable) rewindable->commit();
    ++delivered;
    on_record(std::move(r));
  };

  Error last;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const Candidate& c = candidates[i];
    if (options.cancel.cancelled())
      return set_error(err_out, make_cancelled_error(options.cancel, 0, options.source));

    rep.backend = c.backend;
    rep.context = c.context;
    ++rep.attempts;

    // Nothing can rewind past the last candidate, so stop recording chunks.
    if (rewindable && i + 1 == candidates.size()) rewindable->commit();

    Error err;
    const bool ok = attempt(c, input, options, engine, plan, deliver, err);
    rep.records = delivered;
    if (ok) return true;

    if (delivered > 0 || !is_recoverable(err.code)) return set_error(err_out, err);
    if (engine.strict && c.context == Context::WorkerStreamTransfer) return set_error(err_out, err);
    last = err;

    if (i + 1 < candidates.size()) {
      if (rewindable && !rewindable->rewind()) return set_error(err_out, err);
      FallbackInfo info;
      info.requested = describe_candidate(c.backend, c.context);
      info.actual = describe_candidate(candidates[i + 1].backend, candidates[i + 1].context);
      info.reason = err.message;
      rep.fallbacks.push_back(info);
      if (engine.on_fallback) engine.on_fallback(info);
    }
  }
  return set_error(err_out, last);
}

}
