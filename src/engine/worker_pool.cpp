#include "csv_toolbox/worker_pool.hpp"
#include <deque>
#include <system_error>
#include <thread>

namespace ctb {

struct Worker {
  std::size_t id = 0;
  std::string endpoint;
  bool leased = false;          // guarded by the pool mutex

  std::mutex mu;
  std::condition_variable cv;
  std::deque<std::packaged_task<void()>> jobs;
  bool stop = false;
  std::thread thread;

  void loop() {
    for (;;) {
      std::packaged_task<void()> job;
      {
        std::unique_lock<std::mutex> lk(mu);
        cv.wait(lk, [&]{ return stop || !jobs.empty(); });
        if (jobs.empty()) return;
        job = std::move(jobs.front());
        jobs.pop_front();
      }
      job();
    }
  }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lk(mu);
      stop = true;
    }
    cv.notify_all();
    if (thread.joinable()) thread.join();
  }
};

std::size_t WorkerHandle::id() const { return w_ ? w_->id : 0; }

const std::string& WorkerHandle::endpoint() const {
  static const std::string kNone;
  return w_ ? w_->endpoint : kNone;
}

std::future<void> WorkerHandle::run(std::function<void()> job) {
  if (!w_) throw std::future_error(std::future_errc::no_state);
  std::packaged_task<void()> task(std::move(job));
  std::future<void> fut = task.get_future();
  {
    std::lock_guard<std::mutex> lk(w_->mu);
    w_->jobs.push_back(std::move(task));
  }
  w_->cv.notify_one();
  return fut;
}

WorkerPool::WorkerPool() : WorkerPool(Config{}) {}

WorkerPool::WorkerPool(Config cfg) : cfg_(cfg) {
  if (cfg_.max_workers == 0)
    err_ = make_error(ErrorCode::InvalidOption, "max_workers must be at least 1");
}

WorkerPool::~WorkerPool() {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& w : workers_) w->shutdown();
  workers_.clear();
}

std::unique_ptr<Worker> WorkerPool::spawn(const std::string& endpoint) {
  std::unique_ptr<Worker> w(new Worker());
  w->id = next_id_++;
  w->endpoint = endpoint;
  Worker* raw = w.get();
  w->thread = std::thread([raw]{ raw->loop(); });  // may throw std::system_error
  return w;
}

WorkerHandle WorkerPool::acquire(const std::string& endpoint, Error* err_out) {
  if (!err_.ok()) {
    set_error(err_out, err_);
    return WorkerHandle();
  }
  std::unique_lock<std::mutex> lk(mu_);
  for (;;) {
    const std::size_t n = workers_.size();
    for (std::size_t i = 0; i < n; ++i) {
      const std::size_t idx = (next_ + i) % n;
      Worker* w = workers_[idx].get();
      if (!w->leased && w->endpoint == endpoint) {
        w->leased = true;
        next_ = idx + 1;
        return WorkerHandle(w);
      }
    }

    try {
      if (n < cfg_.max_workers) {
        workers_.push_back(spawn(endpoint));
        workers_.back()->leased = true;
        next_ = workers_.size();
        return WorkerHandle(workers_.back().get());
      }
      // Full: retire an idle worker bound to another endpoint.
      for (std::size_t i = 0; i < n; ++i) {
        const std::size_t idx = (next_ + i) % n;
        if (workers_[idx]->leased) continue;
        workers_[idx]->shutdown();
        workers_[idx] = spawn(endpoint);
        workers_[idx]->leased = true;
        next_ = idx + 1;
        return WorkerHandle(workers_[idx].get());
      }
    } catch (const std::system_error& e) {
      set_error(err_out, make_error(ErrorCode::BackendUnavailable,
                                    std::string("cannot start worker thread: ") + e.what()));
      return WorkerHandle();
    }

    cv_.wait(lk);
  }
}

void WorkerPool::release(WorkerHandle& handle) {
  if (!handle.w_) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    handle.w_->leased = false;
  }
  handle.w_ = nullptr;
  cv_.notify_all();
}

std::size_t WorkerPool::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return workers_.size();
}

std::size_t WorkerPool::leased() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (const auto& w : workers_) n += w->leased ? 1 : 0;
  return n;
}

WorkerSession::WorkerSession(WorkerPool& pool, const std::string& endpoint) : pool_(pool) {
  handle_ = pool_.acquire(endpoint, &err_);
}

WorkerSession::~WorkerSession() { pool_.release(handle_); }

}
