#include "utils/cancellation.hpp"
#include "db/db_error.hpp"

namespace cfgdb {
namespace utils {

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

void CancellationToken::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = false;
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, duration, [this]() { return cancelled_.load(); });
  return !cancelled_;
}

void CancellationToken::throw_if_cancelled(const std::string& what) const {
  if (cancelled_) {
    throw db::CancelledError(what);
  }
}

CancellationToken& CancellationToken::none() {
  static CancellationToken token;
  return token;
}

} // namespace utils
} // namespace cfgdb
