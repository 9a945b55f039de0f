/*
 * memguard - Security Audit Log
 * 
 * Append-only record of every allow/deny/scrub decision. Events are kept in
 * memory and, when a path is configured, appended to a JSON-lines file.
 * Each event is chained to its predecessor by a SHA-256 hash so a rewritten
 * or removed line is detectable.
 */
#ifndef MEMGUARD_SECURITY_AUDIT_LOG_HPP
#define MEMGUARD_SECURITY_AUDIT_LOG_HPP

#include <memguard/core/json.hpp>
#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <cstdint>

namespace memguard {

enum class SecurityEventType {
    ACCESS_GRANTED,
    ACCESS_DENIED,
    CREDENTIAL_SCRUBBED,
    QUERY_BLOCKED,
    COMPLEXITY_EXCEEDED,
    INJECTION_ATTEMPT,
    SESSION_CREATED,
    SESSION_CLEARED,
    CROSS_SESSION_ACCESS,
    UNUSUAL_PATTERN,
    RATE_LIMIT_EXCEEDED
};

std::string event_type_to_string(SecurityEventType type);
bool parse_event_type(const std::string& s, SecurityEventType& out);

struct SecurityEvent {
    std::string event_id;
    uint64_t sequence;           // Assigned on commit, starts at 1
    SecurityEventType type;
    int64_t timestamp_ms;
    std::string agent_id;
    std::string session_id;
    Json details;
    int severity;                // 1 info .. 5 critical
    std::string previous_hash;   // Assigned on commit
    std::string hash;            // Assigned on commit
    
    SecurityEvent()
        : sequence(0)
        , type(SecurityEventType::ACCESS_GRANTED)
        , timestamp_ms(0)
        , details(Json::object())
        , severity(1) {}
    
    // New uncommitted event stamped with an id and the current time
    static SecurityEvent make(SecurityEventType type,
                              const std::string& agent_id,
                              const std::string& session_id,
                              const Json& details,
                              int severity);
    
    Json to_json() const;
    static SecurityEvent from_json(const Json& j);
    
    // Hash input: previous hash followed by the serialized event without its hash
    std::string compute_hash() const;
};

class AuditLog {
public:
    static const char* const GENESIS_HASH;
    
    // Empty path keeps the log in memory only. An existing file is continued:
    // sequence numbers and the hash chain resume from its last line.
    explicit AuditLog(const std::string& log_path = "");
    ~AuditLog();
    
    // Never throws; a file error is logged and the in-memory copy is kept
    void record(const SecurityEvent& event);
    
    // Commits several events as one contiguous run of the chain
    void record_batch(const std::vector<SecurityEvent>& events);
    
    std::vector<SecurityEvent> query(int min_severity = 1) const;
    std::vector<SecurityEvent> query(SecurityEventType type, int min_severity = 1) const;
    std::vector<SecurityEvent> events() const;
    size_t size() const;
    
    std::string last_hash() const;
    const std::string& log_path() const { return log_path_; }
    
    // Checks sequence continuity and the hash chain of a log file
    static bool verify_file(const std::string& path, std::string& error);
    
    // Reads every event of a log file; false with 'error' set on a malformed line
    static bool load_file(const std::string& path, std::vector<SecurityEvent>& out,
                          std::string& error);

private:
    AuditLog(const AuditLog&);
    AuditLog& operator=(const AuditLog&);
    
    void resume_chain();
    void commit_locked(const SecurityEvent& event);
    
    std::string log_path_;
    std::ofstream file_;
    
    mutable std::mutex mutex_;
    std::vector<SecurityEvent> events_;
    uint64_t next_sequence_;
    std::string last_hash_;
};

} // namespace memguard

#endif // MEMGUARD_SECURITY_AUDIT_LOG_HPP
