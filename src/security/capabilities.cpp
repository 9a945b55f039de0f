#include <memguard/security/capabilities.hpp>
#include <memguard/core/utils.hpp>
#include <sstream>

namespace memguard {

const int AgentCapabilities::MAX_RESULTS_CEILING;

std::string scope_to_string(CapabilityScope scope) {
    switch (scope) {
        case CapabilityScope::SESSION_ONLY: return "session_only";
        case CapabilityScope::CROSS_SESSION_READ: return "cross_session_read";
        case CapabilityScope::CROSS_SESSION_WRITE: return "cross_session_write";
        case CapabilityScope::GLOBAL: return "global";
    }
    return "session_only";
}

bool parse_scope(const std::string& s, CapabilityScope& out) {
    std::string v = to_lower(trim(s));
    if (v == "session_only") { out = CapabilityScope::SESSION_ONLY; return true; }
    if (v == "cross_session_read") { out = CapabilityScope::CROSS_SESSION_READ; return true; }
    if (v == "cross_session_write") { out = CapabilityScope::CROSS_SESSION_WRITE; return true; }
    if (v == "global") { out = CapabilityScope::GLOBAL; return true; }
    return false;
}

// ============ AgentCapabilities ============

AgentCapabilities::AgentCapabilities(const std::string& agent_id,
                                     CapabilityScope scope,
                                     const std::set<MemoryType>& allowed_types,
                                     int max_query_cost,
                                     int max_results,
                                     int max_token_budget,
                                     const std::vector<std::string>& allowed_file_patterns,
                                     bool can_read_redacted,
                                     bool can_administer)
    : agent_id_(agent_id)
    , scope_(scope)
    , allowed_types_(allowed_types)
    , max_query_cost_(max_query_cost)
    , max_results_(max_results)
    , max_token_budget_(max_token_budget)
    , allowed_file_patterns_(allowed_file_patterns)
    , can_read_redacted_(can_read_redacted)
    , can_administer_(can_administer)
{
    if (trim(agent_id_).empty()) {
        throw CapabilityError("agent_id must not be empty");
    }
    if (allowed_types_.empty()) {
        throw CapabilityError("allowed memory types must not be empty");
    }
    if (max_query_cost_ <= 0) {
        throw CapabilityError("max_query_cost must be positive");
    }
    if (max_results_ <= 0 || max_results_ > MAX_RESULTS_CEILING) {
        std::ostringstream oss;
        oss << "max_results must be between 1 and " << MAX_RESULTS_CEILING;
        throw CapabilityError(oss.str());
    }
    if (max_token_budget_ <= 0) {
        throw CapabilityError("max_token_budget must be positive");
    }
}

AgentCapabilities AgentCapabilities::restricted(const std::string& agent_id) {
    std::set<MemoryType> all;
    all.insert(MemoryType::EPISODIC);
    all.insert(MemoryType::SEMANTIC);
    all.insert(MemoryType::PROCEDURAL);
    all.insert(MemoryType::PROSPECTIVE);
    all.insert(MemoryType::WORKING);
    return AgentCapabilities(agent_id, CapabilityScope::SESSION_ONLY, all);
}

bool AgentCapabilities::allows_type(MemoryType type) const {
    return allowed_types_.count(type) > 0;
}

bool AgentCapabilities::allows_path(const std::string& path) const {
    for (size_t i = 0; i < allowed_file_patterns_.size(); ++i) {
        if (glob_match(allowed_file_patterns_[i], path)) return true;
    }
    return false;
}

Json AgentCapabilities::to_json() const {
    Json j = Json::object();
    j.set("agent_id", agent_id_);
    j.set("scope", scope_to_string(scope_));
    Json types = Json::array();
    for (std::set<MemoryType>::const_iterator it = allowed_types_.begin();
         it != allowed_types_.end(); ++it) {
        types.push(memory_type_to_string(*it));
    }
    j.set("allowed_memory_types", types);
    j.set("max_query_cost", max_query_cost_);
    j.set("max_results", max_results_);
    j.set("max_token_budget", max_token_budget_);
    Json patterns = Json::array();
    for (size_t i = 0; i < allowed_file_patterns_.size(); ++i) {
        patterns.push(allowed_file_patterns_[i]);
    }
    j.set("allowed_file_patterns", patterns);
    j.set("can_read_redacted", can_read_redacted_);
    j.set("can_administer", can_administer_);
    return j;
}

AgentCapabilities capabilities_from_json(const Json& j) {
    if (!j.is_object()) {
        throw CapabilityError("capability definition must be a JSON object");
    }
    
    CapabilityScope scope = CapabilityScope::SESSION_ONLY;
    if (j.has("scope") && !parse_scope(j.get_string("scope"), scope)) {
        throw CapabilityError("unknown scope '" + j.get_string("scope") + "'");
    }
    
    std::set<MemoryType> types;
    std::vector<std::string> names = j.get_string_array("allowed_memory_types");
    for (size_t i = 0; i < names.size(); ++i) {
        MemoryType t;
        if (!parse_memory_type(to_lower(trim(names[i])), t)) {
            throw CapabilityError("unknown memory type '" + names[i] + "'");
        }
        types.insert(t);
    }
    
    std::vector<std::string> patterns(1, "*");
    if (j.has("allowed_file_patterns")) {
        patterns = j.get_string_array("allowed_file_patterns");
    }
    
    return AgentCapabilities(j.get_string("agent_id"),
                             scope,
                             types,
                             j.get_int("max_query_cost", 50),
                             j.get_int("max_results", 1000),
                             j.get_int("max_token_budget", 8000),
                             patterns,
                             j.get_bool("can_read_redacted", false),
                             j.get_bool("can_administer", false));
}

// ============ CapabilityEnforcer ============

CapabilityEnforcer::CapabilityEnforcer(const AgentCapabilities& caps)
    : caps_(caps) {}

AuthDecision CapabilityEnforcer::authorize_session_write(const std::string& target_session,
                                                         const std::string& current_session) const {
    const std::string& target = target_session.empty() ? current_session : target_session;
    if (target == current_session || caps_.can_write_other_sessions()) {
        return AuthDecision::allow();
    }
    return AuthDecision::deny(DenialCode::SESSION_ACCESS,
        "session access denied: scope " + scope_to_string(caps_.scope()) +
        " does not permit writing to another session");
}

AuthDecision CapabilityEnforcer::authorize_session_read(const std::string& target_session,
                                                        const std::string& current_session) const {
    const std::string& target = target_session.empty() ? current_session : target_session;
    if (target == current_session || caps_.can_read_other_sessions()) {
        return AuthDecision::allow();
    }
    return AuthDecision::deny(DenialCode::SESSION_ACCESS,
        "session access denied: scope " + scope_to_string(caps_.scope()) +
        " does not permit reading another session");
}

AuthDecision CapabilityEnforcer::authorize_store(MemoryType type,
                                                 const std::string& target_session,
                                                 const std::string& current_session) const {
    if (!caps_.allows_type(type)) {
        return AuthDecision::deny(DenialCode::TYPE_NOT_ALLOWED,
            "memory type '" + memory_type_to_string(type) + "' is not allowed for agent " +
            caps_.agent_id());
    }
    return authorize_session_write(target_session, current_session);
}

AuthDecision CapabilityEnforcer::authorize_query(const MemoryQuery& query,
                                                 const std::string& current_session,
                                                 int estimated_cost) const {
    AuthDecision reach = authorize_session_read(query.session_id, current_session);
    if (!reach.allowed) return reach;
    
    if (query.has_memory_type && !caps_.allows_type(query.memory_type)) {
        return AuthDecision::deny(DenialCode::TYPE_NOT_ALLOWED,
            "memory type '" + memory_type_to_string(query.memory_type) +
            "' is not allowed for agent " + caps_.agent_id());
    }
    
    if (estimated_cost > caps_.max_query_cost()) {
        std::ostringstream oss;
        oss << "query cost " << estimated_cost << " exceeds limit " << caps_.max_query_cost();
        return AuthDecision::deny(DenialCode::COST_EXCEEDED, oss.str());
    }
    
    if (query.limit > caps_.max_results()) {
        std::ostringstream oss;
        oss << "result limit " << query.limit << " exceeds maximum " << caps_.max_results();
        return AuthDecision::deny(DenialCode::RESULT_LIMIT_EXCEEDED, oss.str());
    }
    
    for (size_t i = 0; i < query.code_paths.size(); ++i) {
        if (!caps_.allows_path(query.code_paths[i])) {
            return AuthDecision::deny(DenialCode::PATH_NOT_ALLOWED,
                "code path is outside the allowed file patterns for agent " + caps_.agent_id());
        }
    }
    
    return AuthDecision::allow();
}

AuthDecision CapabilityEnforcer::authorize_delete() const {
    if (!caps_.can_administer()) {
        return AuthDecision::deny(DenialCode::NOT_ADMINISTRATOR,
            "agent " + caps_.agent_id() + " lacks the administer capability");
    }
    return AuthDecision::allow();
}

AuthDecision CapabilityEnforcer::authorize_clear(const std::string& target_session,
                                                 const std::string& current_session) const {
    AuthDecision admin = authorize_delete();
    if (!admin.allowed) return admin;
    return authorize_session_write(target_session, current_session);
}

} // namespace memguard
