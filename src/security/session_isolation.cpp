#include <memguard/security/session_isolation.hpp>
#include <memguard/core/logger.hpp>

namespace memguard {

SessionLineage SessionIsolationManager::register_session(const std::string& session_id,
                                                         const std::string& parent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::map<std::string, SessionLineage>::iterator it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return it->second;
    }
    
    SessionLineage entry;
    entry.session_id = session_id;
    if (parent_id != session_id) {
        entry.parent_id = parent_id;
    }
    
    if (entry.has_parent()) {
        std::map<std::string, SessionLineage>::iterator parent = sessions_.find(entry.parent_id);
        if (parent != sessions_.end()) {
            parent->second.children.insert(session_id);
        } else {
            LOG_DEBUG("Session %s registered with unknown parent %s",
                      session_id.c_str(), entry.parent_id.c_str());
        }
    }
    
    sessions_[session_id] = entry;
    LOG_DEBUG("Registered session %s", session_id.c_str());
    return entry;
}

bool SessionIsolationManager::can_access(const std::string& current,
                                         const std::string& target) const {
    if (current == target) {
        return true;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, SessionLineage>::const_iterator it = sessions_.find(current);
    if (it == sessions_.end()) {
        return false;
    }
    
    const SessionLineage& entry = it->second;
    if (entry.has_parent() && entry.parent_id == target) {
        return true;
    }
    return entry.children.count(target) > 0;
}

bool SessionIsolationManager::lineage(const std::string& session_id, SessionLineage& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, SessionLineage>::const_iterator it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool SessionIsolationManager::is_registered(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

size_t SessionIsolationManager::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace memguard
