#include <memguard/security/audit_log.hpp>
#include <memguard/core/utils.hpp>
#include <memguard/core/logger.hpp>
#include <sstream>

namespace memguard {

// ============ Event types ============

std::string event_type_to_string(SecurityEventType type) {
    switch (type) {
        case SecurityEventType::ACCESS_GRANTED: return "access_granted";
        case SecurityEventType::ACCESS_DENIED: return "access_denied";
        case SecurityEventType::CREDENTIAL_SCRUBBED: return "credential_scrubbed";
        case SecurityEventType::QUERY_BLOCKED: return "query_blocked";
        case SecurityEventType::COMPLEXITY_EXCEEDED: return "complexity_exceeded";
        case SecurityEventType::INJECTION_ATTEMPT: return "injection_attempt";
        case SecurityEventType::SESSION_CREATED: return "session_created";
        case SecurityEventType::SESSION_CLEARED: return "session_cleared";
        case SecurityEventType::CROSS_SESSION_ACCESS: return "cross_session_access";
        case SecurityEventType::UNUSUAL_PATTERN: return "unusual_pattern";
        case SecurityEventType::RATE_LIMIT_EXCEEDED: return "rate_limit_exceeded";
    }
    return "unknown";
}

bool parse_event_type(const std::string& s, SecurityEventType& out) {
    static const SecurityEventType all[] = {
        SecurityEventType::ACCESS_GRANTED,
        SecurityEventType::ACCESS_DENIED,
        SecurityEventType::CREDENTIAL_SCRUBBED,
        SecurityEventType::QUERY_BLOCKED,
        SecurityEventType::COMPLEXITY_EXCEEDED,
        SecurityEventType::INJECTION_ATTEMPT,
        SecurityEventType::SESSION_CREATED,
        SecurityEventType::SESSION_CLEARED,
        SecurityEventType::CROSS_SESSION_ACCESS,
        SecurityEventType::UNUSUAL_PATTERN,
        SecurityEventType::RATE_LIMIT_EXCEEDED
    };
    std::string name = to_lower(s);
    for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); ++i) {
        if (event_type_to_string(all[i]) == name) {
            out = all[i];
            return true;
        }
    }
    return false;
}

// ============ SecurityEvent ============

SecurityEvent SecurityEvent::make(SecurityEventType type,
                                  const std::string& agent_id,
                                  const std::string& session_id,
                                  const Json& details,
                                  int severity) {
    SecurityEvent e;
    e.event_id = generate_uuid();
    e.type = type;
    e.timestamp_ms = current_timestamp_ms();
    e.agent_id = agent_id;
    e.session_id = session_id;
    e.details = details.is_object() ? details : Json::object();
    e.severity = clamp(severity, 1, 5);
    return e;
}

Json SecurityEvent::to_json() const {
    Json j = Json::object();
    j.set("event_id", event_id);
    j.set("sequence", static_cast<int64_t>(sequence));
    j.set("type", event_type_to_string(type));
    j.set("timestamp_ms", timestamp_ms);
    j.set("time", format_timestamp_ms(timestamp_ms));
    j.set("agent_id", agent_id);
    j.set("session_id", session_id);
    j.set("details", details);
    j.set("severity", severity);
    j.set("previous_hash", previous_hash);
    if (!hash.empty()) {
        j.set("hash", hash);
    }
    return j;
}

SecurityEvent SecurityEvent::from_json(const Json& j) {
    SecurityEvent e;
    e.event_id = j.get_string("event_id");
    e.sequence = static_cast<uint64_t>(j.get_int64("sequence"));
    if (!parse_event_type(j.get_string("type"), e.type)) {
        throw JsonError("unknown event type: " + j.get_string("type"));
    }
    e.timestamp_ms = j.get_int64("timestamp_ms");
    e.agent_id = j.get_string("agent_id");
    e.session_id = j.get_string("session_id");
    e.details = j["details"].is_object() ? j["details"] : Json::object();
    e.severity = j.get_int("severity", 1);
    e.previous_hash = j.get_string("previous_hash");
    e.hash = j.get_string("hash");
    return e;
}

std::string SecurityEvent::compute_hash() const {
    Json j = to_json();
    j.erase("hash");
    return sha256_hex(previous_hash + j.dump());
}

// ============ AuditLog ============

const char* const AuditLog::GENESIS_HASH =
    "0000000000000000000000000000000000000000000000000000000000000000";

AuditLog::AuditLog(const std::string& log_path)
    : log_path_(log_path)
    , next_sequence_(1)
    , last_hash_(GENESIS_HASH) {
    
    if (log_path_.empty()) {
        return;
    }
    
    resume_chain();
    
    file_.open(log_path_.c_str(), std::ios::app);
    if (!file_.is_open()) {
        LOG_ERROR("Failed to open audit log %s; keeping events in memory only",
                  log_path_.c_str());
    } else {
        LOG_INFO("Audit log: %s", log_path_.c_str());
    }
}

AuditLog::~AuditLog() {
    if (file_.is_open()) {
        file_.close();
    }
}

void AuditLog::resume_chain() {
    std::ifstream in(log_path_.c_str());
    if (!in.is_open()) {
        return;
    }
    
    std::string line, last;
    while (std::getline(in, line)) {
        if (!trim(line).empty()) {
            last = line;
        }
    }
    if (last.empty()) {
        return;
    }
    
    try {
        SecurityEvent tail = SecurityEvent::from_json(Json::parse(last));
        next_sequence_ = tail.sequence + 1;
        last_hash_ = tail.hash;
        LOG_DEBUG("Continuing audit chain at sequence %llu",
                  static_cast<unsigned long long>(next_sequence_));
    } catch (const JsonError& e) {
        // Left at genesis; verify_file() will flag the break
        LOG_WARN("Unreadable last line in audit log %s: %s", log_path_.c_str(), e.what());
    }
}

void AuditLog::commit_locked(const SecurityEvent& event) {
    SecurityEvent e = event;
    e.sequence = next_sequence_++;
    e.previous_hash = last_hash_;
    e.hash = e.compute_hash();
    last_hash_ = e.hash;
    events_.push_back(e);
    
    if (!file_.is_open()) {
        return;
    }
    file_ << e.to_json().dump() << "\n";
    file_.flush();
    if (!file_) {
        LOG_ERROR("Failed to append to audit log %s", log_path_.c_str());
        file_.clear();
    }
}

void AuditLog::record(const SecurityEvent& event) {
    std::vector<SecurityEvent> one(1, event);
    record_batch(one);
}

void AuditLog::record_batch(const std::vector<SecurityEvent>& events) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < events.size(); ++i) {
            commit_locked(events[i]);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Audit record failed: %s", e.what());
    }
}

std::vector<SecurityEvent> AuditLog::query(int min_severity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SecurityEvent> result;
    for (size_t i = 0; i < events_.size(); ++i) {
        if (events_[i].severity >= min_severity) {
            result.push_back(events_[i]);
        }
    }
    return result;
}

std::vector<SecurityEvent> AuditLog::query(SecurityEventType type, int min_severity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SecurityEvent> result;
    for (size_t i = 0; i < events_.size(); ++i) {
        if (events_[i].type == type && events_[i].severity >= min_severity) {
            result.push_back(events_[i]);
        }
    }
    return result;
}

std::vector<SecurityEvent> AuditLog::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

size_t AuditLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::string AuditLog::last_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_hash_;
}

bool AuditLog::load_file(const std::string& path, std::vector<SecurityEvent>& out,
                         std::string& error) {
    std::ifstream in(path.c_str());
    if (!in.is_open()) {
        error = "cannot open " + path;
        return false;
    }
    
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (trim(line).empty()) continue;
        try {
            out.push_back(SecurityEvent::from_json(Json::parse(line)));
        } catch (const JsonError& e) {
            std::ostringstream ss;
            ss << "line " << line_no << ": " << e.what();
            error = ss.str();
            return false;
        }
    }
    return true;
}

bool AuditLog::verify_file(const std::string& path, std::string& error) {
    std::ifstream in(path.c_str());
    if (!in.is_open()) {
        error = "cannot open " + path;
        return false;
    }
    
    std::string expected_prev = GENESIS_HASH;
    uint64_t expected_seq = 1;
    std::string line;
    int line_no = 0;
    
    while (std::getline(in, line)) {
        line_no++;
        if (trim(line).empty()) continue;
        
        std::ostringstream where;
        where << "line " << line_no << ": ";
        
        Json j;
        try {
            j = Json::parse(line);
        } catch (const JsonError& e) {
            error = where.str() + e.what();
            return false;
        }
        
        if (static_cast<uint64_t>(j.get_int64("sequence")) != expected_seq) {
            error = where.str() + "sequence gap";
            return false;
        }
        if (j.get_string("previous_hash") != expected_prev) {
            error = where.str() + "previous hash does not match";
            return false;
        }
        
        std::string stored = j.get_string("hash");
        Json body = j;
        body.erase("hash");
        if (sha256_hex(expected_prev + body.dump()) != stored) {
            error = where.str() + "event hash does not match its content";
            return false;
        }
        
        expected_prev = stored;
        expected_seq++;
    }
    return true;
}

} // namespace memguard
