#pragma once

#include "ledgerguard/http_types.hpp"
#include "ledgerguard/limits.hpp"
#include "ledgerguard/string_hash.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace ledgerguard {

struct RateLimitDecision {
  bool allowed = true;
  int limit = 0;
  int remaining = 0;
  std::chrono::seconds retryAfter{0}; // only meaningful when rejected
};

/**
 * @brief Fixed-window request counter keyed by client identifier.
 *
 * The first request of a client opens a window of `window` length with a
 * count of one. A request arriving after the window ended starts a new one.
 * Once the count reaches the limit further requests are rejected without
 * being counted until the window ends.
 *
 * Records idle for longer than `idleTtl` past their window are evicted, and
 * the table never holds more than `maxTrackedClients` records.
 */
class RateLimiter {
public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using Clock = std::function<TimePoint()>;

  struct Options {
    int requestsPerWindow = limits::kDefaultRequestsPerMinute;
    std::chrono::seconds window = limits::kDefaultRateWindow;
    std::chrono::seconds idleTtl{300};
    std::size_t maxTrackedClients = 100000;
  };

  explicit RateLimiter(Options options, Clock clock = defaultClock());
  ~RateLimiter() = default;

  RateLimiter(const RateLimiter &) = delete;
  RateLimiter &operator=(const RateLimiter &) = delete;
  RateLimiter(RateLimiter &&) = delete;
  RateLimiter &operator=(RateLimiter &&) = delete;

  // Counts the request and reports whether it may proceed
  RateLimitDecision allow(const std::string &clientId);

  // Removes records whose window ended more than idleTtl ago
  std::size_t cleanupExpiredEntries();

  std::size_t trackedClients() const;

  const Options &options() const { return options_; }

  /**
   * First X-Forwarded-For entry, else X-Real-IP, else the remote address.
   * Header values are trimmed; blank values are skipped.
   */
  static std::string extractClientId(const HttpRequest &request,
                                     std::string_view remoteAddress);

  static Clock defaultClock();

private:
  struct ClientRecord {
    int requestCount = 0;
    TimePoint windowResetAt;
    TimePoint lastSeen;
  };

  Options options_;
  Clock clock_;
  StringMap<ClientRecord> clients_;
  TimePoint nextSweepAt_;
  mutable std::mutex mutex_;

  // Callers hold mutex_
  std::size_t sweepLocked(TimePoint now);
  void makeRoomLocked(TimePoint now);
};

} // namespace ledgerguard
