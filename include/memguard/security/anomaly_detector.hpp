/*
 * memguard - Anomaly Detector
 * 
 * Per-agent request rate (sliding one-minute window) and consecutive
 * failure tracking. The rate table and the failure table are locked
 * independently.
 */
#ifndef MEMGUARD_SECURITY_ANOMALY_DETECTOR_HPP
#define MEMGUARD_SECURITY_ANOMALY_DETECTOR_HPP

#include <string>
#include <map>
#include <deque>
#include <mutex>
#include <functional>
#include <cstdint>

namespace memguard {

// Rate check result
struct RateLimitResult {
    bool allowed;
    int64_t retry_after_ms;    // Milliseconds until the oldest request leaves the window
    int remaining;             // Requests left in the current window
    int limit;
    
    RateLimitResult()
        : allowed(true)
        , retry_after_ms(0)
        , remaining(0)
        , limit(0) {}
    
    static RateLimitResult allow(int remaining, int limit) {
        RateLimitResult r;
        r.allowed = true;
        r.remaining = remaining;
        r.limit = limit;
        return r;
    }
    
    static RateLimitResult deny(int64_t retry_after, int limit) {
        RateLimitResult r;
        r.allowed = false;
        r.retry_after_ms = retry_after;
        r.limit = limit;
        r.remaining = 0;
        return r;
    }
};

// Sliding window over request timestamps. Not synchronized; the owner locks.
class SlidingWindowLimiter {
public:
    SlidingWindowLimiter(int max_requests, int64_t window_ms);
    
    // Records the request only when it is allowed
    RateLimitResult try_acquire(int64_t now_ms);
    
    int current_count(int64_t now_ms);
    int64_t last_request_ms() const { return timestamps_.empty() ? 0 : timestamps_.back(); }
    
    void reset() { timestamps_.clear(); }

private:
    void cleanup(int64_t now_ms);
    
    int max_requests_;
    int64_t window_ms_;
    std::deque<int64_t> timestamps_;
};

class AnomalyDetector {
public:
    typedef std::function<int64_t()> Clock;
    
    static const int64_t RATE_WINDOW_MS = 60000;
    
    // An empty clock means current_timestamp_ms()
    AnomalyDetector(int max_requests_per_minute = 100,
                    int max_consecutive_failures = 10,
                    Clock clock = Clock());
    
    // False once the agent has used up its window; pruning happens on every call
    bool check_rate(const std::string& agent_id);
    RateLimitResult try_acquire(const std::string& agent_id);
    
    // Counts a failure; false once the count exceeds the ceiling (escalate)
    bool record_failure(const std::string& agent_id);
    void reset_failures(const std::string& agent_id);
    
    int failure_count(const std::string& agent_id) const;
    int request_count(const std::string& agent_id);
    
    // Drop rate windows of agents idle for longer than max_idle_ms
    size_t cleanup(int64_t max_idle_ms);
    
    int max_requests_per_minute() const { return max_requests_; }
    int max_consecutive_failures() const { return max_failures_; }

private:
    AnomalyDetector(const AnomalyDetector&);
    AnomalyDetector& operator=(const AnomalyDetector&);
    
    int64_t now() const;
    
    int max_requests_;
    int max_failures_;
    Clock clock_;
    
    std::mutex rate_mutex_;
    std::map<std::string, SlidingWindowLimiter> windows_;
    
    mutable std::mutex failure_mutex_;
    std::map<std::string, int> failures_;
};

} // namespace memguard

#endif // MEMGUARD_SECURITY_ANOMALY_DETECTOR_HPP
