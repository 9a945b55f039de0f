/*
 * memguard - Agent Capabilities
 * 
 * Immutable per-agent permission set and the pure authorization checks
 * evaluated against it. Every check is deny-by-default.
 */
#ifndef MEMGUARD_SECURITY_CAPABILITIES_HPP
#define MEMGUARD_SECURITY_CAPABILITIES_HPP

#include <memguard/core/json.hpp>
#include <memguard/memory/types.hpp>
#include <string>
#include <vector>
#include <set>
#include <stdexcept>

namespace memguard {

class CapabilityError : public std::invalid_argument {
public:
    explicit CapabilityError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Cross-session reach, ordered by privilege
enum class CapabilityScope {
    SESSION_ONLY = 0,          // Own session only
    CROSS_SESSION_READ = 1,    // Read other sessions, write own
    CROSS_SESSION_WRITE = 2,   // Read and write other sessions
    GLOBAL = 3                 // Everything; session lineage is not consulted
};

std::string scope_to_string(CapabilityScope scope);
bool parse_scope(const std::string& s, CapabilityScope& out);

class AgentCapabilities {
public:
    static const int MAX_RESULTS_CEILING = 10000;
    
    // Throws CapabilityError if agent_id is empty, any limit is non-positive,
    // max_results exceeds MAX_RESULTS_CEILING or allowed_types is empty.
    AgentCapabilities(const std::string& agent_id,
                      CapabilityScope scope,
                      const std::set<MemoryType>& allowed_types,
                      int max_query_cost = 50,
                      int max_results = 1000,
                      int max_token_budget = 8000,
                      const std::vector<std::string>& allowed_file_patterns = std::vector<std::string>(1, "*"),
                      bool can_read_redacted = false,
                      bool can_administer = false);
    
    // Every memory type, session-only scope, default limits
    static AgentCapabilities restricted(const std::string& agent_id);
    
    const std::string& agent_id() const { return agent_id_; }
    CapabilityScope scope() const { return scope_; }
    const std::set<MemoryType>& allowed_types() const { return allowed_types_; }
    int max_query_cost() const { return max_query_cost_; }
    int max_results() const { return max_results_; }
    int max_token_budget() const { return max_token_budget_; }
    const std::vector<std::string>& allowed_file_patterns() const { return allowed_file_patterns_; }
    bool can_read_redacted() const { return can_read_redacted_; }
    bool can_administer() const { return can_administer_; }
    
    bool allows_type(MemoryType type) const;
    bool allows_path(const std::string& path) const;
    bool can_read_other_sessions() const { return scope_ >= CapabilityScope::CROSS_SESSION_READ; }
    bool can_write_other_sessions() const { return scope_ >= CapabilityScope::CROSS_SESSION_WRITE; }
    
    Json to_json() const;

private:
    std::string agent_id_;
    CapabilityScope scope_;
    std::set<MemoryType> allowed_types_;
    int max_query_cost_;
    int max_results_;
    int max_token_budget_;
    std::vector<std::string> allowed_file_patterns_;
    bool can_read_redacted_;
    bool can_administer_;
};

// Build capabilities from a JSON definition, e.g.
//   {"agent_id": "planner", "scope": "cross_session_read",
//    "allowed_memory_types": ["episodic", "semantic"], "max_query_cost": 80}
// Throws CapabilityError for unknown scope / type names or invalid limits.
AgentCapabilities capabilities_from_json(const Json& j);

// Why a check failed
enum class DenialCode {
    NONE,
    TYPE_NOT_ALLOWED,
    SESSION_ACCESS,
    COST_EXCEEDED,
    RESULT_LIMIT_EXCEEDED,
    PATH_NOT_ALLOWED,
    NOT_ADMINISTRATOR
};

// Outcome of an authorization check. 'reason' names the rule, never the data.
struct AuthDecision {
    bool allowed;
    DenialCode code;
    std::string reason;
    
    AuthDecision() : allowed(false), code(DenialCode::NONE) {}
    
    static AuthDecision allow() {
        AuthDecision d;
        d.allowed = true;
        return d;
    }
    
    static AuthDecision deny(DenialCode code, const std::string& reason) {
        AuthDecision d;
        d.allowed = false;
        d.code = code;
        d.reason = reason;
        return d;
    }
};

// Stateless checks of a request against one capability set
class CapabilityEnforcer {
public:
    explicit CapabilityEnforcer(const AgentCapabilities& caps);
    
    const AgentCapabilities& capabilities() const { return caps_; }
    
    // Empty target_session means the current session
    AuthDecision authorize_store(MemoryType type,
                                 const std::string& target_session,
                                 const std::string& current_session) const;
    
    AuthDecision authorize_query(const MemoryQuery& query,
                                 const std::string& current_session,
                                 int estimated_cost) const;
    
    AuthDecision authorize_delete() const;
    
    AuthDecision authorize_clear(const std::string& target_session,
                                 const std::string& current_session) const;
    
    // Read reach only: same session or a scope that grants cross-session reads
    AuthDecision authorize_session_read(const std::string& target_session,
                                        const std::string& current_session) const;

private:
    AuthDecision authorize_session_write(const std::string& target_session,
                                         const std::string& current_session) const;
    
    AgentCapabilities caps_;
};

} // namespace memguard

#endif // MEMGUARD_SECURITY_CAPABILITIES_HPP
