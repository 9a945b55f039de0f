#ifndef MEMGUARD_MEMORY_BACKEND_HPP
#define MEMGUARD_MEMORY_BACKEND_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <stdexcept>

namespace memguard {

// Raised by backends when the underlying store fails.
// Callers above the backend see it exactly as the backend threw it.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

// Storage interface shared by raw backends and the security middleware
class MemoryBackend {
public:
    virtual ~MemoryBackend() {}
    
    // Lifecycle
    virtual void initialize() = 0;
    virtual void close() = 0;
    
    // Insert or replace a record (keyed by id)
    virtual bool store(const MemoryRecord& record) = 0;
    
    virtual std::vector<MemoryRecord> retrieve(const MemoryQuery& query) = 0;
    
    // Returns false when no record has this id
    virtual bool get_by_id(const std::string& id, MemoryRecord& out) = 0;
    
    virtual bool delete_memory(const std::string& id) = 0;
    
    // Remove every record of a session plus its tracking rows
    virtual bool delete_session(const std::string& session_id) = 0;
    
    // Remove records whose expiry has passed; returns how many
    virtual int cleanup_expired() = 0;
    
    virtual bool get_session_info(const std::string& session_id, SessionInfo& out) = 0;
    
    // Most recently accessed first; limit <= 0 means no limit
    virtual std::vector<SessionInfo> list_sessions(int limit = 0) = 0;
};

} // namespace memguard

#endif // MEMGUARD_MEMORY_BACKEND_HPP
