/*
 * memguard - Secure Memory Backend
 * 
 * Middleware that wraps any MemoryBackend and enforces, on every call:
 *   - capability checks (kind, scope, cost, result limit, file paths)
 *   - session lineage isolation (bypassed for GLOBAL scope)
 *   - query admission (cost, graph keyword denylist)
 *   - secret scrubbing on the way in and on the way out
 *   - per-agent rate and failure tracking
 * and records the outcome in the audit log. Callers use it exactly like
 * the backend it wraps; denials surface as SecurityViolation.
 */
#ifndef MEMGUARD_SECURITY_SECURE_BACKEND_HPP
#define MEMGUARD_SECURITY_SECURE_BACKEND_HPP

#include <memguard/memory/backend.hpp>
#include <memguard/security/capabilities.hpp>
#include <memguard/security/scrubber.hpp>
#include <memguard/security/session_isolation.hpp>
#include <memguard/security/query_cost.hpp>
#include <memguard/security/audit_log.hpp>
#include <memguard/security/anomaly_detector.hpp>
#include <memguard/security/security_error.hpp>
#include <memory>
#include <string>
#include <vector>

namespace memguard {

class Config;

struct SecurityOptions {
    std::string audit_log_path;        // Empty = in-memory audit only
    bool enable_anomaly_detection;
    int max_requests_per_minute;
    int max_consecutive_failures;
    std::string parent_session_id;     // Lineage parent of the ambient session
    
    SecurityOptions()
        : enable_anomaly_detection(true)
        , max_requests_per_minute(100)
        , max_consecutive_failures(10) {}
    
    // Reads the "security" section
    static SecurityOptions from_config(const Config& config);
};

// Shared mutable components. Several middleware instances (one per agent or
// session) may hold the same context.
struct SecurityContext {
    std::shared_ptr<CredentialScrubber> scrubber;
    std::shared_ptr<SessionIsolationManager> isolation;
    std::shared_ptr<AuditLog> audit;
    std::shared_ptr<AnomalyDetector> anomaly;
    
    static std::shared_ptr<SecurityContext> create(const SecurityOptions& options,
                                                   AnomalyDetector::Clock clock = AnomalyDetector::Clock());
};

class SecureMemoryBackend : public MemoryBackend {
public:
    // Registers session_id (under options.parent_session_id) and records its
    // creation. Throws std::invalid_argument for a null backend or empty session.
    SecureMemoryBackend(std::shared_ptr<MemoryBackend> backend,
                        const AgentCapabilities& capabilities,
                        const std::string& session_id,
                        const SecurityOptions& options = SecurityOptions(),
                        std::shared_ptr<SecurityContext> context = std::shared_ptr<SecurityContext>());
    
    void initialize() override;
    void close() override;
    
    bool store(const MemoryRecord& record) override;
    std::vector<MemoryRecord> retrieve(const MemoryQuery& query) override;
    bool get_by_id(const std::string& id, MemoryRecord& out) override;
    bool delete_memory(const std::string& id) override;
    bool delete_session(const std::string& session_id) override;
    int cleanup_expired() override;
    bool get_session_info(const std::string& session_id, SessionInfo& out) override;
    std::vector<SessionInfo> list_sessions(int limit = 0) override;
    
    // Empty target means the ambient session
    bool clear_session(const std::string& target_session = "");
    
    const AgentCapabilities& capabilities() const { return enforcer_.capabilities(); }
    const std::string& session_id() const { return session_id_; }
    std::shared_ptr<SecurityContext> context() const { return context_; }

private:
    typedef std::vector<SecurityEvent> Staged;
    
    SecurityEvent event(SecurityEventType type, int severity, const Json& details) const;
    
    // Audits the denial (with any escalation) and returns the exception to throw
    SecurityViolation denial(Staged& staged, SecurityEventType type, int severity,
                             const std::string& operation, const std::string& reason);
    SecurityViolation denial(Staged& staged, const AuthDecision& decision,
                             const std::string& operation);
    
    void check_rate(Staged& staged, const std::string& operation);
    void check_isolation(Staged& staged, const std::string& operation,
                         const std::string& target_session);
    bool reachable(const std::string& target_session) const;
    
    // Scrubs title and content in place; returns the patterns that fired
    std::vector<std::string> scrub_outgoing(MemoryRecord& record) const;
    
    void granted(Staged& staged, const std::string& operation, const Json& details);
    void commit(Staged& staged);
    
    std::shared_ptr<MemoryBackend> backend_;
    CapabilityEnforcer enforcer_;
    std::string session_id_;
    SecurityOptions options_;
    std::shared_ptr<SecurityContext> context_;
    QueryCostEstimator estimator_;
};

} // namespace memguard

#endif // MEMGUARD_SECURITY_SECURE_BACKEND_HPP
