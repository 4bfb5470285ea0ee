#pragma once
#include "csv_toolbox/error.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace ctb {

// Observer side of a cancellation flag. A default-constructed token never fires.
class CancellationToken {
public:
  CancellationToken() = default;

  bool cancelled() const noexcept {
    return st_ && st_->flag.load(std::memory_order_acquire);
  }
  std::string reason() const;

private:
  friend class CancellationSource;
  struct State {
    std::atomic<bool> flag{false};
    mutable std::mutex mu;
    std::string reason;
  };
  explicit CancellationToken(std::shared_ptr<State> st) : st_(std::move(st)) {}

  std::shared_ptr<State> st_;
};

class CancellationSource {
public:
  CancellationSource();

  CancellationToken token() const { return CancellationToken(st_); }
  // First reason wins; later calls are no-ops.
  void cancel(std::string reason = "operation cancelled");
  bool cancelled() const noexcept { return st_->flag.load(std::memory_order_acquire); }

private:
  std::shared_ptr<CancellationToken::State> st_;
};

Error make_cancelled_error(const CancellationToken& token, std::uint64_t row, const std::string& source);

}
