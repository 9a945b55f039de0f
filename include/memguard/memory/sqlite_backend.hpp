/*
 * memguard - SQLite Memory Backend
 * 
 * Reference MemoryBackend on a single SQLite database file.
 * Tables: memory_entries, sessions, session_agents.
 */
#ifndef MEMGUARD_MEMORY_SQLITE_BACKEND_HPP
#define MEMGUARD_MEMORY_SQLITE_BACKEND_HPP

#include "backend.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <sqlite3.h>

namespace memguard {

class SqliteMemoryBackend : public MemoryBackend {
public:
    // ":memory:" gives a private in-memory database
    explicit SqliteMemoryBackend(const std::string& db_path);
    ~SqliteMemoryBackend();
    
    void initialize() override;
    void close() override;
    bool is_open() const;
    
    bool store(const MemoryRecord& record) override;
    std::vector<MemoryRecord> retrieve(const MemoryQuery& query) override;
    bool get_by_id(const std::string& id, MemoryRecord& out) override;
    bool delete_memory(const std::string& id) override;
    bool delete_session(const std::string& session_id) override;
    int cleanup_expired() override;
    bool get_session_info(const std::string& session_id, SessionInfo& out) override;
    std::vector<SessionInfo> list_sessions(int limit = 0) override;
    
    // Record count across all sessions
    int count_records();
    
    const std::string& db_path() const { return db_path_; }

private:
    SqliteMemoryBackend(const SqliteMemoryBackend&);
    SqliteMemoryBackend& operator=(const SqliteMemoryBackend&);
    
    void require_open() const;
    void exec(const std::string& sql);
    void ensure_schema();
    void update_session(const std::string& session_id, const std::string& agent_id, int64_t now);
    void touch_records(const std::vector<std::string>& ids, int64_t now);
    bool load_session_info(const std::string& session_id, SessionInfo& out);
    std::string db_error(const std::string& operation) const;
    
    std::string db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;
};

} // namespace memguard

#endif // MEMGUARD_MEMORY_SQLITE_BACKEND_HPP
