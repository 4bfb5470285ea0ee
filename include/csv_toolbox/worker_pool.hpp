#pragma once
#include "csv_toolbox/error.hpp"
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ctb {

struct Worker;

// A leased worker thread. Valid until released back to its pool.
class WorkerHandle {
public:
  WorkerHandle() = default;

  bool valid() const noexcept { return w_ != nullptr; }
  std::size_t id() const;
  const std::string& endpoint() const;
  // Queues `job` on the worker thread. Throws std::future_error on an invalid handle.
  std::future<void> run(std::function<void()> job);

private:
  friend class WorkerPool;
  explicit WorkerHandle(Worker* w) : w_(w) {}
  Worker* w_ = nullptr;
};

// Shared pool of worker threads. A worker is leased to one caller at a time;
// idle workers are handed out round-robin.
class WorkerPool {
public:
  struct Config {
    std::size_t max_workers = 1;
  };

  WorkerPool();
  explicit WorkerPool(Config cfg);
  ~WorkerPool();
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // False when max_workers is 0.
  bool ok() const noexcept { return err_.ok(); }
  const Error& error() const noexcept { return err_; }

  // Blocks until a worker for `endpoint` is free. Returns an invalid handle and
  // sets err_out when the pool is unusable or a thread cannot be started.
  WorkerHandle acquire(const std::string& endpoint = std::string(), Error* err_out = nullptr);
  void release(WorkerHandle& handle);

  std::size_t size() const;
  std::size_t leased() const;
  std::size_t max_workers() const noexcept { return cfg_.max_workers; }

private:
  std::unique_ptr<Worker> spawn(const std::string& endpoint);

  Config cfg_;
  Error err_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::size_t next_ = 0;
  std::size_t next_id_ = 1;
};

// Scoped lease: acquires in the constructor, releases on every exit path.
class WorkerSession {
public:
  WorkerSession(WorkerPool& pool, const std::string& endpoint);
  ~WorkerSession();
  WorkerSession(const WorkerSession&) = delete;
  WorkerSession& operator=(const WorkerSession&) = delete;

  bool ok() const noexcept { return handle_.valid(); }
  const Error& error() const noexcept { return err_; }
  WorkerHandle& worker() noexcept { return handle_; }

private:
  WorkerPool& pool_;
  WorkerHandle handle_;
  Error err_;
};

}
