#include "ledgerguard/rate_limiter.hpp"
#include "ledgerguard/logger.hpp"
#include "ledgerguard/string_utils.hpp"
#include <algorithm>

namespace ledgerguard {

RateLimiter::RateLimiter(Options options, Clock clock)
    : options_(options), clock_(std::move(clock)) {
    nextSweepAt_ = clock_() + options_.window;
    RATE_LOG_INFO("RateLimiter initialized: {} requests per {}s window",
                  options_.requestsPerWindow,
                  static_cast<long long>(options_.window.count()));
}

RateLimiter::Clock RateLimiter::defaultClock() {
    return [] { return std::chrono::steady_clock::now(); };
}

RateLimitDecision RateLimiter::allow(const std::string& clientId) {
    std::lock_guard<std::mutex> lock(mutex_);

    const TimePoint now = clock_();
    if (now >= nextSweepAt_) {
        sweepLocked(now);
        nextSweepAt_ = now + options_.window;
    }

    RateLimitDecision decision;
    decision.limit = options_.requestsPerWindow;

    auto it = clients_.find(clientId);
    if (it == clients_.end()) {
        makeRoomLocked(now);
        ClientRecord record;
        record.requestCount = 1;
        record.windowResetAt = now + options_.window;
        record.lastSeen = now;
        clients_.emplace(clientId, record);

        decision.allowed = true;
        decision.remaining = std::max(0, options_.requestsPerWindow - 1);
        return decision;
    }

    ClientRecord& record = it->second;
    record.lastSeen = now;

    if (now > record.windowResetAt) {
        record.requestCount = 0;
        record.windowResetAt = now + options_.window;
    }

    if (record.requestCount >= options_.requestsPerWindow) {
        auto wait = std::chrono::ceil<std::chrono::seconds>(record.windowResetAt - now);
        decision.allowed = false;
        decision.remaining = 0;
        decision.retryAfter = std::max(wait, std::chrono::seconds{1});
        RATE_LOG_WARN("Rate limit exceeded for client \"{}\"",
                      string_utils::sanitize_for_log(clientId));
        return decision;
    }

    record.requestCount++;
    decision.allowed = true;
    decision.remaining = options_.requestsPerWindow - record.requestCount;
    return decision;
}

std::size_t RateLimiter::cleanupExpiredEntries() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweepLocked(clock_());
}

std::size_t RateLimiter::trackedClients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

std::size_t RateLimiter::sweepLocked(TimePoint now) {
    std::size_t removed = 0;
    for (auto it = clients_.begin(); it != clients_.end();) {
        if (now > it->second.windowResetAt + options_.idleTtl) {
            it = clients_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        RATE_LOG_DEBUG("Evicted {} idle rate limit records", removed);
    }
    return removed;
}

void RateLimiter::makeRoomLocked(TimePoint now) {
    if (clients_.size() < options_.maxTrackedClients) {
        return;
    }

    sweepLocked(now);
    if (clients_.size() < options_.maxTrackedClients) {
        return;
    }

    // Still full: drop the least recently seen client
    auto oldest = std::min_element(
        clients_.begin(), clients_.end(),
        [](const auto& lhs, const auto& rhs) {
            return lhs.second.lastSeen < rhs.second.lastSeen;
        });
    if (oldest != clients_.end()) {
        RATE_LOG_WARN("Client table full, evicting \"{}\"",
                      string_utils::sanitize_for_log(oldest->first));
        clients_.erase(oldest);
    }
}

std::string RateLimiter::extractClientId(const HttpRequest& request,
                                         std::string_view remoteAddress) {
    auto forwarded = string_utils::trim(headerValue(request, "X-Forwarded-For"));
    if (!forwarded.empty()) {
        auto first = string_utils::trim(forwarded.substr(0, forwarded.find(',')));
        if (!first.empty()) {
            return std::string(first);
        }
    }

    auto realIp = string_utils::trim(headerValue(request, "X-Real-IP"));
    if (!realIp.empty()) {
        return std::string(realIp);
    }

    return std::string(remoteAddress);
}

} // namespace ledgerguard
