#pragma once
#include "csv_toolbox/error.hpp"
#include "csv_toolbox/record.hpp"
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace ctb {

// Hands records from one producer (a worker job) to one consumer. push() never
// blocks; producers pace themselves through BackpressureGate.
class RecordChannel {
public:
  explicit RecordChannel(std::size_t capacity);

  void push(Record&& r);
  // Blocks until a record is available. False once closed and drained.
  bool pop(Record& out);
  // Producer is done; `err` is reported to the consumer after the last record.
  void close(std::optional<Error> err = std::nullopt);
  // Consumer is gone: drop queued records and release any waiting producer.
  void abandon();

  // capacity - queued; <= 0 means saturated.
  std::ptrdiff_t desired_size() const;
  void wait_for_capacity();

  std::optional<Error> error() const;
  std::size_t capacity() const noexcept { return capacity_; }

private:
  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<Record> q_;
  std::size_t capacity_;
  bool closed_ = false;
  bool abandoned_ = false;
  std::optional<Error> err_;
};

// Checks the channel every `interval` ticks and waits while it is saturated.
// Default-constructed gates do nothing.
class BackpressureGate {
public:
  BackpressureGate() = default;
  BackpressureGate(RecordChannel* ch, std::size_t interval)
      : ch_(ch), interval_(interval ? interval : 1) {}

  void tick() {
    if (!ch_ || ++count_ < interval_) return;
    count_ = 0;
    if (ch_->desired_size() <= 0) {
      ++pauses_;
      ch_->wait_for_capacity();
    }
  }
  std::uint64_t pauses() const noexcept { return pauses_; }

private:
  RecordChannel* ch_ = nullptr;
  std::size_t interval_ = 1;
  std::size_t count_ = 0;
  std::uint64_t pauses_ = 0;
};

}
