#include "csv_toolbox/record_channel.hpp"

namespace ctb {

RecordChannel::RecordChannel(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

void RecordChannel::push(Record&& r) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (abandoned_ || closed_) return;
    q_.push_back(std::move(r));
  }
  not_empty_.notify_one();
}

bool RecordChannel::pop(Record& out) {
  std::unique_lock<std::mutex> lk(mu_);
  not_empty_.wait(lk, [&]{ return !q_.empty() || closed_ || abandoned_; });
  if (q_.empty()) return false;
  out = std::move(q_.front());
  q_.pop_front();
  lk.unlock();
  not_full_.notify_one();
  return true;
}

void RecordChannel::close(std::optional<Error> err) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return;
    closed_ = true;
    err_ = std::move(err);
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

void RecordChannel::abandon() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    abandoned_ = true;
    q_.clear();
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::ptrdiff_t RecordChannel::desired_size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<std::ptrdiff_t>(capacity_) - static_cast<std::ptrdiff_t>(q_.size());
}

void RecordChannel::wait_for_capacity() {
  std::unique_lock<std::mutex> lk(mu_);
  not_full_.wait(lk, [&]{ return q_.size() < capacity_ || abandoned_ || closed_; });
}

std::optional<Error> RecordChannel::error() const {
  std::lock_guard<std::mutex> lk(mu_);
  return err_;
}

}
