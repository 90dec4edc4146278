#ifndef CFGDB_UTILS_CANCELLATION_HPP
#define CFGDB_UTILS_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace cfgdb {
namespace utils {

// Shared flag that lets a caller interrupt retry loops and waits running on
// another thread. Sleeps taken through the token wake up as soon as it fires.
class CancellationToken {
public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;


  // ---- CONTROL ----
  void cancel();
  // Re-arms a fired token so it can be reused
  void reset();


  // ---- QUERY ----
  bool is_cancelled() const { return cancelled_.load(); }

  // Sleeps for the given duration. Returns false if cancelled before or during the sleep
  bool sleep_for(std::chrono::milliseconds duration);

  // Throws db::CancelledError if the token has fired
  void throw_if_cancelled(const std::string& what) const;

  // Token that is never cancelled, for callers that do not need one
  static CancellationToken& none();

private:
  // ---- PARAMETERS ----
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace utils
} // namespace cfgdb

#endif // CFGDB_UTILS_CANCELLATION_HPP
