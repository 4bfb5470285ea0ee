#include "csv_toolbox/cancellation.hpp"

namespace ctb {

std::string CancellationToken::reason() const {
  if (!st_) return std::string();
  std::lock_guard<std::mutex> lk(st_->mu);
  return st_->reason;
}

CancellationSource::CancellationSource() : st_(std::make_shared<CancellationToken::State>()) {}

void CancellationSource::cancel(std::string reason) {
  std::lock_guard<std::mutex> lk(st_->mu);
  if (st_->flag.load(std::memory_order_relaxed)) return;
  st_->reason = std::move(reason);
  st_->flag.store(true, std::memory_order_release);
}

Error make_cancelled_error(const CancellationToken& token, std::uint64_t row, const std::string& source) {
  std::string reason = token.reason();
  Error e = make_error(ErrorCode::Cancelled, reason.empty() ? std::string("operation cancelled") : reason);
  e.row = row;
  e.source = source;
  return e;
}

}
