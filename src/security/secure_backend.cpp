#include <memguard/security/secure_backend.hpp>
#include <memguard/core/config.hpp>
#include <memguard/core/logger.hpp>
#include <memguard/core/utils.hpp>
#include <algorithm>
#include <sstream>

namespace memguard {

namespace {

const int SEVERITY_INFO = 1;
const int SEVERITY_NOTICE = 2;
const int SEVERITY_WARNING = 3;
const int SEVERITY_DENIAL = 4;
const int SEVERITY_CRITICAL = 5;

Json names_to_json(const std::vector<std::string>& names) {
    Json arr = Json::array();
    for (size_t i = 0; i < names.size(); ++i) {
        arr.push(names[i]);
    }
    return arr;
}

} // namespace

// ============ SecurityOptions ============

SecurityOptions SecurityOptions::from_config(const Config& config) {
    SecurityOptions opts;
    opts.audit_log_path = config.get_string("security.audit_log_path");
    opts.enable_anomaly_detection = config.get_bool("security.enable_anomaly_detection",
                                                    opts.enable_anomaly_detection);
    opts.max_requests_per_minute = static_cast<int>(
        config.get_int("security.max_requests_per_minute", opts.max_requests_per_minute));
    opts.max_consecutive_failures = static_cast<int>(
        config.get_int("security.max_consecutive_failures", opts.max_consecutive_failures));
    opts.parent_session_id = config.get_string("security.parent_session_id");
    
    if (opts.max_requests_per_minute <= 0) {
        LOG_WARN("security.max_requests_per_minute must be positive, using 100");
        opts.max_requests_per_minute = 100;
    }
    if (opts.max_consecutive_failures <= 0) {
        LOG_WARN("security.max_consecutive_failures must be positive, using 10");
        opts.max_consecutive_failures = 10;
    }
    return opts;
}

// ============ SecurityContext ============

std::shared_ptr<SecurityContext> SecurityContext::create(const SecurityOptions& options,
                                                         AnomalyDetector::Clock clock) {
    std::shared_ptr<SecurityContext> ctx(new SecurityContext());
    ctx->scrubber.reset(new CredentialScrubber());
    ctx->isolation.reset(new SessionIsolationManager());
    ctx->audit.reset(new AuditLog(options.audit_log_path));
    ctx->anomaly.reset(new AnomalyDetector(options.max_requests_per_minute,
                                           options.max_consecutive_failures,
                                           clock));
    return ctx;
}

// ============ SecureMemoryBackend ============

SecureMemoryBackend::SecureMemoryBackend(std::shared_ptr<MemoryBackend> backend,
                                         const AgentCapabilities& capabilities,
                                         const std::string& session_id,
                                         const SecurityOptions& options,
                                         std::shared_ptr<SecurityContext> context)
    : backend_(backend)
    , enforcer_(capabilities)
    , session_id_(session_id)
    , options_(options)
    , context_(context) {
    
    if (!backend_) {
        throw std::invalid_argument("SecureMemoryBackend requires a backend");
    }
    if (session_id_.empty()) {
        throw std::invalid_argument("SecureMemoryBackend requires a session id");
    }
    if (!context_) {
        context_ = SecurityContext::create(options_);
    }
    
    context_->isolation->register_session(session_id_, options_.parent_session_id);
    
    Json details = Json::object();
    details.set("scope", scope_to_string(capabilities.scope()));
    if (!options_.parent_session_id.empty()) {
        details.set("parent_session_id", options_.parent_session_id);
    }
    context_->audit->record(event(SecurityEventType::SESSION_CREATED, SEVERITY_INFO, details));
    
    LOG_INFO("Secure memory for agent %s in session %s (scope %s)",
             capabilities.agent_id().c_str(), session_id_.c_str(),
             scope_to_string(capabilities.scope()).c_str());
}

SecurityEvent SecureMemoryBackend::event(SecurityEventType type, int severity,
                                         const Json& details) const {
    return SecurityEvent::make(type, capabilities().agent_id(), session_id_, details, severity);
}

void SecureMemoryBackend::commit(Staged& staged) {
    context_->audit->record_batch(staged);
    staged.clear();
}

SecurityViolation SecureMemoryBackend::denial(Staged& staged, SecurityEventType type,
                                              int severity, const std::string& operation,
                                              const std::string& reason) {
    const std::string& agent = capabilities().agent_id();
    
    Json details = Json::object();
    details.set("operation", operation);
    details.set("reason", reason);
    staged.push_back(event(type, std::max(severity, SEVERITY_DENIAL), details));
    
    if (options_.enable_anomaly_detection && !context_->anomaly->record_failure(agent)) {
        int failures = context_->anomaly->failure_count(agent);
        Json escalation = Json::object();
        escalation.set("operation", operation);
        escalation.set("consecutive_failures", failures);
        staged.push_back(event(SecurityEventType::UNUSUAL_PATTERN, SEVERITY_CRITICAL, escalation));
        LOG_WARN("Agent %s has %d consecutive denials", agent.c_str(), failures);
    }
    
    commit(staged);
    LOG_WARN("Denied %s for agent %s in session %s: %s",
             operation.c_str(), agent.c_str(), session_id_.c_str(), reason.c_str());
    return SecurityViolation(reason);
}

SecurityViolation SecureMemoryBackend::denial(Staged& staged, const AuthDecision& decision,
                                              const std::string& operation) {
    SecurityEventType type = SecurityEventType::ACCESS_DENIED;
    if (decision.code == DenialCode::COST_EXCEEDED) {
        type = SecurityEventType::COMPLEXITY_EXCEEDED;
    } else if (decision.code == DenialCode::RESULT_LIMIT_EXCEEDED) {
        type = SecurityEventType::QUERY_BLOCKED;
    }
    return denial(staged, type, SEVERITY_DENIAL, operation, decision.reason);
}

void SecureMemoryBackend::granted(Staged& staged, const std::string& operation,
                                  const Json& details) {
    Json d = details.is_object() ? details : Json::object();
    d.set("operation", operation);
    // Grant first so the request's events read in order
    staged.insert(staged.begin(), event(SecurityEventType::ACCESS_GRANTED, SEVERITY_INFO, d));
    
    if (options_.enable_anomaly_detection) {
        context_->anomaly->reset_failures(capabilities().agent_id());
    }
    commit(staged);
    LOG_DEBUG("Granted %s for agent %s", operation.c_str(), capabilities().agent_id().c_str());
}

void SecureMemoryBackend::check_rate(Staged& staged, const std::string& operation) {
    if (!options_.enable_anomaly_detection) {
        return;
    }
    if (!context_->anomaly->check_rate(capabilities().agent_id())) {
        std::ostringstream reason;
        reason << "rate limit exceeded: more than " << options_.max_requests_per_minute
               << " requests per minute";
        throw denial(staged, SecurityEventType::RATE_LIMIT_EXCEEDED, SEVERITY_DENIAL,
                     operation, reason.str());
    }
}

bool SecureMemoryBackend::reachable(const std::string& target_session) const {
    if (capabilities().scope() == CapabilityScope::GLOBAL) {
        return true;
    }
    return context_->isolation->can_access(session_id_, target_session);
}

void SecureMemoryBackend::check_isolation(Staged& staged, const std::string& operation,
                                          const std::string& target_session) {
    if (target_session.empty() || target_session == session_id_) {
        return;
    }
    if (!reachable(target_session)) {
        throw denial(staged, SecurityEventType::ACCESS_DENIED, SEVERITY_DENIAL, operation,
            "session access denied: session " + target_session +
            " is not in the lineage of session " + session_id_);
    }
    
    Json details = Json::object();
    details.set("operation", operation);
    details.set("target_session", target_session);
    staged.push_back(event(SecurityEventType::CROSS_SESSION_ACCESS, SEVERITY_NOTICE, details));
}

std::vector<std::string> SecureMemoryBackend::scrub_outgoing(MemoryRecord& record) const {
    const CredentialScrubber& scrubber = *context_->scrubber;
    ScrubResult title = scrubber.scrub(record.title);
    ScrubResult content = scrubber.scrub(record.content);
    record.title = title.text;
    record.content = content.text;
    
    std::vector<std::string> fired = title.fired;
    for (size_t i = 0; i < content.fired.size(); ++i) {
        if (std::find(fired.begin(), fired.end(), content.fired[i]) == fired.end()) {
            fired.push_back(content.fired[i]);
        }
    }
    return fired;
}

void SecureMemoryBackend::initialize() {
    backend_->initialize();
}

void SecureMemoryBackend::close() {
    backend_->close();
}

bool SecureMemoryBackend::store(const MemoryRecord& record) {
    static const char* const OP = "store";
    Staged staged;
    check_rate(staged, OP);
    
    MemoryRecord copy = record;
    if (copy.id.empty()) copy.id = generate_uuid();
    if (copy.session_id.empty()) copy.session_id = session_id_;
    // Records are attributed to the caller, whatever the record claims
    copy.agent_id = capabilities().agent_id();
    if (copy.created_at == 0) copy.created_at = current_timestamp_ms();
    if (copy.accessed_at == 0) copy.accessed_at = copy.created_at;
    
    std::vector<std::string> fired = context_->scrubber->scrub_record(copy);
    if (!fired.empty()) {
        // Staged before authorization so a denied store still audits the redaction
        Json scrubbed = Json::object();
        scrubbed.set("record_id", copy.id);
        scrubbed.set("patterns", names_to_json(fired));
        staged.push_back(event(SecurityEventType::CREDENTIAL_SCRUBBED, SEVERITY_WARNING, scrubbed));
    }
    
    AuthDecision auth = enforcer_.authorize_store(copy.memory_type, copy.session_id, session_id_);
    if (!auth.allowed) {
        throw denial(staged, auth, OP);
    }
    
    check_isolation(staged, OP, copy.session_id);
    
    bool ok = backend_->store(copy);
    
    Json details = Json::object();
    details.set("record_id", copy.id);
    details.set("memory_type", memory_type_to_string(copy.memory_type));
    details.set("target_session", copy.session_id);
    details.set("sensitivity", copy.metadata.get_string(META_SENSITIVITY, "low"));
    granted(staged, OP, details);
    return ok;
}

std::vector<MemoryRecord> SecureMemoryBackend::retrieve(const MemoryQuery& query) {
    static const char* const OP = "retrieve";
    Staged staged;
    check_rate(staged, OP);
    
    int cost = estimator_.estimate(query).total();
    AuthDecision auth = enforcer_.authorize_query(query, session_id_, cost);
    if (!auth.allowed) {
        throw denial(staged, auth, OP);
    }
    
    check_isolation(staged, OP, query.session_id);
    
    QueryValidation validation = estimator_.validate(query, capabilities().max_query_cost());
    if (!validation.allowed) {
        if (validation.violation == QueryViolation::INJECTION) {
            throw denial(staged, SecurityEventType::INJECTION_ATTEMPT, SEVERITY_CRITICAL,
                         OP, validation.reason);
        }
        throw denial(staged, SecurityEventType::COMPLEXITY_EXCEEDED, SEVERITY_DENIAL,
                     OP, validation.reason);
    }
    
    MemoryQuery bounded = query;
    if (bounded.session_id.empty() && capabilities().scope() != CapabilityScope::GLOBAL) {
        bounded.session_id = session_id_;
    }
    if (bounded.limit <= 0) {
        bounded.limit = std::min(static_cast<int>(QueryCostEstimator::DEFAULT_RESULT_LIMIT),
                                 capabilities().max_results());
    }
    
    std::vector<MemoryRecord> raw = backend_->retrieve(bounded);
    
    // Partial-result policy: withheld records are not a denial
    std::vector<MemoryRecord> results;
    std::vector<std::string> scrubbed;
    int withheld = 0;
    for (size_t i = 0; i < raw.size(); ++i) {
        if (is_high_sensitivity(raw[i]) && !capabilities().can_read_redacted()) {
            withheld++;
            continue;
        }
        MemoryRecord r = raw[i];
        std::vector<std::string> fired = scrub_outgoing(r);
        for (size_t f = 0; f < fired.size(); ++f) {
            if (std::find(scrubbed.begin(), scrubbed.end(), fired[f]) == scrubbed.end()) {
                scrubbed.push_back(fired[f]);
            }
        }
        results.push_back(r);
    }
    
    if (!scrubbed.empty()) {
        Json details = Json::object();
        details.set("operation", OP);
        details.set("patterns", names_to_json(scrubbed));
        staged.push_back(event(SecurityEventType::CREDENTIAL_SCRUBBED, SEVERITY_WARNING, details));
    }
    
    Json details = Json::object();
    details.set("cost", validation.cost.total());
    details.set("results", static_cast<int>(results.size()));
    details.set("withheld", withheld);
    if (!bounded.session_id.empty()) {
        details.set("target_session", bounded.session_id);
    }
    granted(staged, OP, details);
    return results;
}

bool SecureMemoryBackend::get_by_id(const std::string& id, MemoryRecord& out) {
    static const char* const OP = "get_by_id";
    Staged staged;
    check_rate(staged, OP);
    
    MemoryRecord record;
    if (!backend_->get_by_id(id, record)) {
        Json details = Json::object();
        details.set("record_id", id);
        details.set("found", false);
        granted(staged, OP, details);
        return false;
    }
    
    AuthDecision auth = enforcer_.authorize_session_read(record.session_id, session_id_);
    if (!auth.allowed) {
        throw denial(staged, auth, OP);
    }
    if (!capabilities().allows_type(record.memory_type)) {
        throw denial(staged, SecurityEventType::ACCESS_DENIED, SEVERITY_DENIAL, OP,
            "memory type '" + memory_type_to_string(record.memory_type) +
            "' is not allowed for agent " + capabilities().agent_id());
    }
    check_isolation(staged, OP, record.session_id);
    
    Json details = Json::object();
    details.set("record_id", id);
    
    if (is_high_sensitivity(record) && !capabilities().can_read_redacted()) {
        details.set("found", true);
        details.set("withheld", true);
        granted(staged, OP, details);
        return false;
    }
    
    std::vector<std::string> fired = scrub_outgoing(record);
    if (!fired.empty()) {
        Json scrub_details = Json::object();
        scrub_details.set("record_id", id);
        scrub_details.set("patterns", names_to_json(fired));
        staged.push_back(event(SecurityEventType::CREDENTIAL_SCRUBBED, SEVERITY_WARNING, scrub_details));
    }
    
    details.set("found", true);
    granted(staged, OP, details);
    out = record;
    return true;
}

bool SecureMemoryBackend::delete_memory(const std::string& id) {
    static const char* const OP = "delete";
    Staged staged;
    check_rate(staged, OP);
    
    AuthDecision auth = enforcer_.authorize_delete();
    if (!auth.allowed) {
        throw denial(staged, auth, OP);
    }
    
    bool removed = backend_->delete_memory(id);
    
    Json details = Json::object();
    details.set("record_id", id);
    details.set("removed", removed);
    granted(staged, OP, details);
    return removed;
}

bool SecureMemoryBackend::clear_session(const std::string& target_session) {
    static const char* const OP = "clear_session";
    Staged staged;
    check_rate(staged, OP);
    
    std::string target = target_session.empty() ? session_id_ : target_session;
    
    AuthDecision auth = enforcer_.authorize_clear(target, session_id_);
    if (!auth.allowed) {
        throw denial(staged, auth, OP);
    }
    check_isolation(staged, OP, target);
    
    bool cleared = backend_->delete_session(target);
    
    Json details = Json::object();
    details.set("target_session", target);
    details.set("cleared", cleared);
    staged.push_back(event(SecurityEventType::SESSION_CLEARED, SEVERITY_WARNING, details));
    granted(staged, OP, details);
    return cleared;
}

bool SecureMemoryBackend::delete_session(const std::string& session_id) {
    return clear_session(session_id);
}

int SecureMemoryBackend::cleanup_expired() {
    static const char* const OP = "cleanup_expired";
    Staged staged;
    check_rate(staged, OP);
    
    AuthDecision auth = enforcer_.authorize_delete();
    if (!auth.allowed) {
        throw denial(staged, auth, OP);
    }
    
    int removed = backend_->cleanup_expired();
    
    Json details = Json::object();
    details.set("removed", removed);
    granted(staged, OP, details);
    return removed;
}

bool SecureMemoryBackend::get_session_info(const std::string& session_id, SessionInfo& out) {
    static const char* const OP = "get_session_info";
    Staged staged;
    check_rate(staged, OP);
    
    std::string target = session_id.empty() ? session_id_ : session_id;
    
    AuthDecision auth = enforcer_.authorize_session_read(target, session_id_);
    if (!auth.allowed) {
        throw denial(staged, auth, OP);
    }
    check_isolation(staged, OP, target);
    
    bool found = backend_->get_session_info(target, out);
    
    Json details = Json::object();
    details.set("target_session", target);
    details.set("found", found);
    granted(staged, OP, details);
    return found;
}

std::vector<SessionInfo> SecureMemoryBackend::list_sessions(int limit) {
    static const char* const OP = "list_sessions";
    Staged staged;
    check_rate(staged, OP);
    
    // Without GLOBAL scope the limit applies after filtering, so the backend
    // is asked for every session
    bool global = capabilities().scope() == CapabilityScope::GLOBAL;
    std::vector<SessionInfo> all = backend_->list_sessions(global ? limit : 0);
    
    std::vector<SessionInfo> visible;
    int withheld = 0;
    for (size_t i = 0; i < all.size(); ++i) {
        if (limit > 0 && static_cast<int>(visible.size()) >= limit) {
            break;
        }
        const std::string& sid = all[i].session_id;
        if (sid == session_id_ ||
            (enforcer_.authorize_session_read(sid, session_id_).allowed && reachable(sid))) {
            visible.push_back(all[i]);
        } else {
            withheld++;
        }
    }
    
    Json details = Json::object();
    details.set("sessions", static_cast<int>(visible.size()));
    details.set("withheld", withheld);
    granted(staged, OP, details);
    return visible;
}

} // namespace memguard
