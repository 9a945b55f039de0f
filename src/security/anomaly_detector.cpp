#include <memguard/security/anomaly_detector.hpp>
#include <memguard/core/utils.hpp>
#include <memguard/core/logger.hpp>
#include <algorithm>
#include <vector>

namespace memguard {

// ============ SlidingWindowLimiter ============

SlidingWindowLimiter::SlidingWindowLimiter(int max_requests, int64_t window_ms)
    : max_requests_(max_requests)
    , window_ms_(window_ms) {}

void SlidingWindowLimiter::cleanup(int64_t now_ms) {
    int64_t cutoff = now_ms - window_ms_;
    
    while (!timestamps_.empty() && timestamps_.front() <= cutoff) {
        timestamps_.pop_front();
    }
}

RateLimitResult SlidingWindowLimiter::try_acquire(int64_t now_ms) {
    cleanup(now_ms);
    
    int current = static_cast<int>(timestamps_.size());
    
    if (current < max_requests_) {
        timestamps_.push_back(now_ms);
        return RateLimitResult::allow(max_requests_ - current - 1, max_requests_);
    }
    
    // Time until the oldest entry expires
    int64_t oldest = timestamps_.front();
    int64_t wait_ms = (oldest + window_ms_) - now_ms;
    
    return RateLimitResult::deny(std::max(wait_ms, static_cast<int64_t>(1)), max_requests_);
}

int SlidingWindowLimiter::current_count(int64_t now_ms) {
    cleanup(now_ms);
    return static_cast<int>(timestamps_.size());
}

// ============ AnomalyDetector ============

const int64_t AnomalyDetector::RATE_WINDOW_MS;

AnomalyDetector::AnomalyDetector(int max_requests_per_minute,
                                 int max_consecutive_failures,
                                 Clock clock)
    : max_requests_(max_requests_per_minute)
    , max_failures_(max_consecutive_failures)
    , clock_(clock) {}

int64_t AnomalyDetector::now() const {
    return clock_ ? clock_() : current_timestamp_ms();
}

RateLimitResult AnomalyDetector::try_acquire(const std::string& agent_id) {
    int64_t t = now();
    std::lock_guard<std::mutex> lock(rate_mutex_);
    
    std::map<std::string, SlidingWindowLimiter>::iterator it = windows_.find(agent_id);
    if (it == windows_.end()) {
        windows_.insert(std::make_pair(agent_id,
            SlidingWindowLimiter(max_requests_, RATE_WINDOW_MS)));
        it = windows_.find(agent_id);
    }
    return it->second.try_acquire(t);
}

bool AnomalyDetector::check_rate(const std::string& agent_id) {
    RateLimitResult result = try_acquire(agent_id);
    if (!result.allowed) {
        LOG_WARN("Rate limit reached for agent %s (%d/min, retry in %lld ms)",
                 agent_id.c_str(), result.limit,
                 static_cast<long long>(result.retry_after_ms));
    }
    return result.allowed;
}

int AnomalyDetector::request_count(const std::string& agent_id) {
    int64_t t = now();
    std::lock_guard<std::mutex> lock(rate_mutex_);
    
    std::map<std::string, SlidingWindowLimiter>::iterator it = windows_.find(agent_id);
    if (it == windows_.end()) {
        return 0;
    }
    return it->second.current_count(t);
}

bool AnomalyDetector::record_failure(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    int count = ++failures_[agent_id];
    return count <= max_failures_;
}

void AnomalyDetector::reset_failures(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    failures_.erase(agent_id);
}

int AnomalyDetector::failure_count(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    std::map<std::string, int>::const_iterator it = failures_.find(agent_id);
    return it == failures_.end() ? 0 : it->second;
}

size_t AnomalyDetector::cleanup(int64_t max_idle_ms) {
    int64_t t = now();
    std::lock_guard<std::mutex> lock(rate_mutex_);
    
    std::vector<std::string> to_remove;
    for (std::map<std::string, SlidingWindowLimiter>::iterator it = windows_.begin();
         it != windows_.end(); ++it) {
        if (t - it->second.last_request_ms() > max_idle_ms) {
            to_remove.push_back(it->first);
        }
    }
    
    for (size_t i = 0; i < to_remove.size(); ++i) {
        windows_.erase(to_remove[i]);
    }
    return to_remove.size();
}

} // namespace memguard
