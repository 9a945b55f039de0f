/*
 * memguard - Session Isolation
 * 
 * Tracks parent/child lineage between sessions. A session may reach itself,
 * its registered parent and its registered children; nothing else.
 * Lineage lives for the lifetime of the manager and is never persisted.
 */
#ifndef MEMGUARD_SECURITY_SESSION_ISOLATION_HPP
#define MEMGUARD_SECURITY_SESSION_ISOLATION_HPP

#include <string>
#include <set>
#include <map>
#include <mutex>

namespace memguard {

struct SessionLineage {
    std::string session_id;
    std::string parent_id;              // Empty when the session has no parent
    std::set<std::string> children;
    
    bool has_parent() const { return !parent_id.empty(); }
};

class SessionIsolationManager {
public:
    SessionIsolationManager() {}
    
    // Create-or-fetch. The parent link is fixed when the session is first seen;
    // the session joins the parent's child set only if the parent is registered.
    SessionLineage register_session(const std::string& session_id,
                                    const std::string& parent_id = "");
    
    bool can_access(const std::string& current, const std::string& target) const;
    
    // Copy of the lineage record; false if the session was never registered
    bool lineage(const std::string& session_id, SessionLineage& out) const;
    
    bool is_registered(const std::string& session_id) const;
    size_t session_count() const;

private:
    SessionIsolationManager(const SessionIsolationManager&);
    SessionIsolationManager& operator=(const SessionIsolationManager&);
    
    mutable std::mutex mutex_;
    std::map<std::string, SessionLineage> sessions_;
};

} // namespace memguard

#endif // MEMGUARD_SECURITY_SESSION_ISOLATION_HPP
