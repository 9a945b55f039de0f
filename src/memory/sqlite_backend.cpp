/*
 * memguard - SQLite Memory Backend Implementation
 */
#include <memguard/memory/sqlite_backend.hpp>
#include <memguard/core/logger.hpp>
#include <memguard/core/utils.hpp>
#include <sstream>

namespace memguard {

namespace {

// Finalizes the statement on every exit path, including throws
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql, const std::string& operation)
        : stmt_(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string msg = operation + " failed: " + sqlite3_errmsg(db);
            stmt_ = nullptr;
            throw StorageError(msg);
        }
    }
    
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    
    sqlite3_stmt* get() { return stmt_; }
    
    void bind_text(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    
    void bind_int64(int idx, int64_t value) {
        sqlite3_bind_int64(stmt_, idx, value);
    }
    
    void bind_null(int idx) {
        sqlite3_bind_null(stmt_, idx);
    }
    
    std::string column_text(int col) {
        const char* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return txt ? txt : "";
    }

private:
    Statement(const Statement&);
    Statement& operator=(const Statement&);
    
    sqlite3_stmt* stmt_;
};

// Rolls back unless commit() was reached
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db), done_(false) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = std::string("begin transaction failed: ") + (err ? err : "unknown");
            sqlite3_free(err);
            throw StorageError(msg);
        }
    }
    
    ~Transaction() {
        if (done_) return;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            LOG_ERROR("SQLite rollback failed: %s", sqlite3_errmsg(db_));
        }
    }
    
    void commit() {
        char* err = nullptr;
        if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = std::string("commit failed: ") + (err ? err : "unknown");
            sqlite3_free(err);
            throw StorageError(msg);
        }
        done_ = true;
    }

private:
    Transaction(const Transaction&);
    Transaction& operator=(const Transaction&);
    
    sqlite3* db_;
    bool done_;
};

// A bound WHERE parameter
struct Param {
    bool is_text;
    std::string text;
    int64_t num;
    
    static Param of(const std::string& s) { Param p; p.is_text = true; p.text = s; p.num = 0; return p; }
    static Param of(int64_t n) { Param p; p.is_text = false; p.num = n; return p; }
};

const char* SELECT_COLUMNS =
    "SELECT id, session_id, agent_id, memory_type, title, content, metadata, tags, "
    "importance, created_at, accessed_at, expires_at, parent_id FROM memory_entries";

MemoryRecord row_to_record(Statement& stmt) {
    MemoryRecord r;
    r.id = stmt.column_text(0);
    r.session_id = stmt.column_text(1);
    r.agent_id = stmt.column_text(2);
    MemoryType type;
    if (parse_memory_type(stmt.column_text(3), type)) {
        r.memory_type = type;
    } else {
        LOG_WARN("Unknown memory_type '%s' on record %s", stmt.column_text(3).c_str(), r.id.c_str());
    }
    r.title = stmt.column_text(4);
    r.content = stmt.column_text(5);
    
    std::string meta = stmt.column_text(6);
    if (!meta.empty()) {
        try {
            Json parsed = Json::parse(meta);
            if (parsed.is_object()) r.metadata = parsed;
        } catch (const JsonError& e) {
            LOG_WARN("Bad metadata on record %s: %s", r.id.c_str(), e.what());
        }
    }
    std::string tags = stmt.column_text(7);
    if (!tags.empty()) {
        try {
            Json parsed = Json::parse(tags);
            const std::vector<Json>& arr = parsed.as_array();
            for (size_t i = 0; i < arr.size(); ++i) {
                if (arr[i].is_string()) r.tags.push_back(arr[i].as_string());
            }
        } catch (const JsonError& e) {
            LOG_WARN("Bad tags on record %s: %s", r.id.c_str(), e.what());
        }
    }
    
    r.importance = sqlite3_column_int(stmt.get(), 8);
    r.created_at = sqlite3_column_int64(stmt.get(), 9);
    r.accessed_at = sqlite3_column_int64(stmt.get(), 10);
    r.expires_at = sqlite3_column_int64(stmt.get(), 11);
    r.parent_id = stmt.column_text(12);
    return r;
}

std::string tags_to_json(const std::vector<std::string>& tags) {
    Json arr = Json::array();
    for (size_t i = 0; i < tags.size(); ++i) {
        arr.push(Json(tags[i]));
    }
    return arr.dump();
}

} // namespace

SqliteMemoryBackend::SqliteMemoryBackend(const std::string& db_path)
    : db_path_(db_path)
    , db_(nullptr)
{
}

SqliteMemoryBackend::~SqliteMemoryBackend() {
    close();
}

void SqliteMemoryBackend::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return;
    
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("open '" + db_path_ + "' failed: " + msg);
    }
    
    sqlite3_busy_timeout(db_, 30000);
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    exec("PRAGMA temp_store=MEMORY");
    ensure_schema();
    LOG_INFO("SQLite memory backend ready at %s", db_path_.c_str());
}

void SqliteMemoryBackend::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteMemoryBackend::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void SqliteMemoryBackend::ensure_schema() {
    exec(
        "CREATE TABLE IF NOT EXISTS memory_entries ("
        "  id TEXT PRIMARY KEY,"
        "  session_id TEXT NOT NULL,"
        "  agent_id TEXT NOT NULL,"
        "  memory_type TEXT NOT NULL,"
        "  title TEXT NOT NULL,"
        "  content TEXT NOT NULL,"
        "  content_hash TEXT NOT NULL,"
        "  metadata TEXT NOT NULL DEFAULT '{}',"
        "  tags TEXT DEFAULT NULL,"
        "  importance INTEGER NOT NULL DEFAULT 0,"
        "  created_at INTEGER NOT NULL,"
        "  accessed_at INTEGER NOT NULL,"
        "  expires_at INTEGER NOT NULL DEFAULT 0,"
        "  parent_id TEXT DEFAULT NULL"
        ")"
    );
    
    exec(
        "CREATE TABLE IF NOT EXISTS sessions ("
        "  session_id TEXT PRIMARY KEY,"
        "  created_at INTEGER NOT NULL,"
        "  last_accessed INTEGER NOT NULL,"
        "  metadata TEXT NOT NULL DEFAULT '{}'"
        ")"
    );
    
    exec(
        "CREATE TABLE IF NOT EXISTS session_agents ("
        "  session_id TEXT NOT NULL,"
        "  agent_id TEXT NOT NULL,"
        "  first_used INTEGER NOT NULL,"
        "  last_used INTEGER NOT NULL,"
        "  PRIMARY KEY (session_id, agent_id)"
        ")"
    );
    
    exec("CREATE INDEX IF NOT EXISTS idx_memory_session_agent ON memory_entries(session_id, agent_id)");
    exec("CREATE INDEX IF NOT EXISTS idx_memory_type ON memory_entries(memory_type)");
    exec("CREATE INDEX IF NOT EXISTS idx_memory_created ON memory_entries(created_at)");
    exec("CREATE INDEX IF NOT EXISTS idx_memory_accessed ON memory_entries(accessed_at)");
    exec("CREATE INDEX IF NOT EXISTS idx_memory_expires ON memory_entries(expires_at)");
    exec("CREATE INDEX IF NOT EXISTS idx_memory_importance ON memory_entries(importance)");
    exec("CREATE INDEX IF NOT EXISTS idx_memory_content_hash ON memory_entries(session_id, content_hash)");
    exec("CREATE INDEX IF NOT EXISTS idx_memory_parent ON memory_entries(parent_id)");
    exec("CREATE INDEX IF NOT EXISTS idx_sessions_accessed ON sessions(last_accessed)");
    exec("CREATE INDEX IF NOT EXISTS idx_session_agents_used ON session_agents(last_used)");
}

bool SqliteMemoryBackend::store(const MemoryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    if (record.id.empty() || record.session_id.empty()) {
        throw StorageError("store failed: record id and session_id are required");
    }
    
    int64_t now = current_timestamp_ms();
    Transaction tx(db_);
    update_session(record.session_id, record.agent_id, now);
    
    Statement stmt(db_,
        "INSERT OR REPLACE INTO memory_entries ("
        "  id, session_id, agent_id, memory_type, title, content, content_hash,"
        "  metadata, tags, importance, created_at, accessed_at, expires_at, parent_id"
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        "store");
    
    stmt.bind_text(1, record.id);
    stmt.bind_text(2, record.session_id);
    stmt.bind_text(3, record.agent_id);
    stmt.bind_text(4, memory_type_to_string(record.memory_type));
    stmt.bind_text(5, record.title);
    stmt.bind_text(6, record.content);
    stmt.bind_text(7, sha256_hex(record.content));
    stmt.bind_text(8, record.metadata.is_object() ? record.metadata.dump() : std::string("{}"));
    if (record.tags.empty()) {
        stmt.bind_null(9);
    } else {
        stmt.bind_text(9, tags_to_json(record.tags));
    }
    stmt.bind_int64(10, record.importance);
    stmt.bind_int64(11, record.created_at ? record.created_at : now);
    stmt.bind_int64(12, record.accessed_at ? record.accessed_at : now);
    stmt.bind_int64(13, record.expires_at);
    if (record.parent_id.empty()) {
        stmt.bind_null(14);
    } else {
        stmt.bind_text(14, record.parent_id);
    }
    
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StorageError(db_error("store"));
    }
    
    tx.commit();
    return true;
}

std::vector<MemoryRecord> SqliteMemoryBackend::retrieve(const MemoryQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    int64_t now = current_timestamp_ms();
    std::vector<std::string> where;
    std::vector<Param> params;
    
    if (!query.session_id.empty()) {
        where.push_back("session_id = ?");
        params.push_back(Param::of(query.session_id));
    }
    if (!query.agent_id.empty()) {
        where.push_back("agent_id = ?");
        params.push_back(Param::of(query.agent_id));
    }
    if (query.has_memory_type) {
        where.push_back("memory_type = ?");
        params.push_back(Param::of(memory_type_to_string(query.memory_type)));
    }
    if (!query.content_search.empty()) {
        where.push_back("(instr(lower(title), lower(?)) > 0 OR instr(lower(content), lower(?)) > 0)");
        params.push_back(Param::of(query.content_search));
        params.push_back(Param::of(query.content_search));
    }
    for (size_t i = 0; i < query.tags.size(); ++i) {
        // Tags are stored as a JSON array; match the quoted element
        where.push_back("instr(tags, ?) > 0");
        params.push_back(Param::of(Json(query.tags[i]).dump()));
    }
    if (query.min_importance > 0) {
        where.push_back("importance >= ?");
        params.push_back(Param::of(static_cast<int64_t>(query.min_importance)));
    }
    if (query.created_after > 0) {
        where.push_back("created_at >= ?");
        params.push_back(Param::of(query.created_after));
    }
    if (query.created_before > 0) {
        where.push_back("created_at <= ?");
        params.push_back(Param::of(query.created_before));
    }
    if (!query.include_expired) {
        where.push_back("(expires_at = 0 OR expires_at >= ?)");
        params.push_back(Param::of(now));
    }
    
    std::ostringstream sql;
    sql << SELECT_COLUMNS;
    if (!where.empty()) {
        sql << " WHERE " << join(where, " AND ");
    }
    sql << " ORDER BY accessed_at DESC, importance DESC";
    if (query.limit > 0) {
        sql << " LIMIT ?";
        params.push_back(Param::of(static_cast<int64_t>(query.limit)));
        if (query.offset > 0) {
            sql << " OFFSET ?";
            params.push_back(Param::of(static_cast<int64_t>(query.offset)));
        }
    }
    
    std::vector<MemoryRecord> result;
    {
        Statement stmt(db_, sql.str(), "retrieve");
        for (size_t i = 0; i < params.size(); ++i) {
            int idx = static_cast<int>(i) + 1;
            if (params[i].is_text) {
                stmt.bind_text(idx, params[i].text);
            } else {
                stmt.bind_int64(idx, params[i].num);
            }
        }
        
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            result.push_back(row_to_record(stmt));
        }
        if (rc != SQLITE_DONE) {
            throw StorageError(db_error("retrieve"));
        }
    }
    
    if (!result.empty()) {
        std::vector<std::string> ids;
        for (size_t i = 0; i < result.size(); ++i) {
            ids.push_back(result[i].id);
        }
        touch_records(ids, now);
    }
    
    return result;
}

bool SqliteMemoryBackend::get_by_id(const std::string& id, MemoryRecord& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    bool found = false;
    {
        Statement stmt(db_, std::string(SELECT_COLUMNS) + " WHERE id = ?", "get_by_id");
        stmt.bind_text(1, id);
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) {
            out = row_to_record(stmt);
            found = true;
        } else if (rc != SQLITE_DONE) {
            throw StorageError(db_error("get_by_id"));
        }
    }
    
    if (found) {
        touch_records(std::vector<std::string>(1, id), current_timestamp_ms());
    }
    return found;
}

bool SqliteMemoryBackend::delete_memory(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    Statement stmt(db_, "DELETE FROM memory_entries WHERE id = ?", "delete_memory");
    stmt.bind_text(1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StorageError(db_error("delete_memory"));
    }
    return sqlite3_changes(db_) > 0;
}

bool SqliteMemoryBackend::delete_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    static const char* statements[] = {
        "DELETE FROM memory_entries WHERE session_id = ?",
        "DELETE FROM session_agents WHERE session_id = ?",
        "DELETE FROM sessions WHERE session_id = ?"
    };
    
    int removed = 0;
    Transaction tx(db_);
    for (size_t i = 0; i < sizeof(statements) / sizeof(statements[0]); ++i) {
        Statement stmt(db_, statements[i], "delete_session");
        stmt.bind_text(1, session_id);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw StorageError(db_error("delete_session"));
        }
        removed += sqlite3_changes(db_);
    }
    tx.commit();
    
    if (removed > 0) {
        LOG_DEBUG("Deleted session %s (%d rows)", session_id.c_str(), removed);
    }
    return removed > 0;
}

int SqliteMemoryBackend::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    Statement stmt(db_, "DELETE FROM memory_entries WHERE expires_at != 0 AND expires_at < ?",
                   "cleanup_expired");
    stmt.bind_int64(1, current_timestamp_ms());
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StorageError(db_error("cleanup_expired"));
    }
    return sqlite3_changes(db_);
}

bool SqliteMemoryBackend::get_session_info(const std::string& session_id, SessionInfo& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    return load_session_info(session_id, out);
}

std::vector<SessionInfo> SqliteMemoryBackend::list_sessions(int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    std::vector<std::string> ids;
    {
        std::string sql = "SELECT session_id FROM sessions ORDER BY last_accessed DESC";
        if (limit > 0) sql += " LIMIT ?";
        Statement stmt(db_, sql, "list_sessions");
        if (limit > 0) stmt.bind_int64(1, limit);
        
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            ids.push_back(stmt.column_text(0));
        }
        if (rc != SQLITE_DONE) {
            throw StorageError(db_error("list_sessions"));
        }
    }
    
    std::vector<SessionInfo> result;
    for (size_t i = 0; i < ids.size(); ++i) {
        SessionInfo info;
        if (load_session_info(ids[i], info)) {
            result.push_back(info);
        }
    }
    return result;
}

int SqliteMemoryBackend::count_records() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    
    Statement stmt(db_, "SELECT COUNT(*) FROM memory_entries", "count_records");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StorageError(db_error("count_records"));
    }
    return sqlite3_column_int(stmt.get(), 0);
}

// ============ Private helpers (mutex held) ============

bool SqliteMemoryBackend::load_session_info(const std::string& session_id, SessionInfo& out) {
    SessionInfo info;
    {
        Statement stmt(db_,
            "SELECT session_id, created_at, last_accessed, metadata FROM sessions WHERE session_id = ?",
            "get_session_info");
        stmt.bind_text(1, session_id);
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) return false;
        if (rc != SQLITE_ROW) {
            throw StorageError(db_error("get_session_info"));
        }
        info.session_id = stmt.column_text(0);
        info.created_at = sqlite3_column_int64(stmt.get(), 1);
        info.last_accessed = sqlite3_column_int64(stmt.get(), 2);
        try {
            Json meta = Json::parse(stmt.column_text(3));
            if (meta.is_object()) info.metadata = meta;
        } catch (const JsonError& e) {
            LOG_WARN("Bad metadata on session %s: %s", session_id.c_str(), e.what());
        }
    }
    {
        Statement stmt(db_,
            "SELECT agent_id FROM session_agents WHERE session_id = ? ORDER BY last_used DESC",
            "get_session_info");
        stmt.bind_text(1, session_id);
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            info.agent_ids.push_back(stmt.column_text(0));
        }
        if (rc != SQLITE_DONE) {
            throw StorageError(db_error("get_session_info"));
        }
    }
    {
        Statement stmt(db_, "SELECT COUNT(*) FROM memory_entries WHERE session_id = ?",
                       "get_session_info");
        stmt.bind_text(1, session_id);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw StorageError(db_error("get_session_info"));
        }
        info.memory_count = sqlite3_column_int(stmt.get(), 0);
    }
    out = info;
    return true;
}

void SqliteMemoryBackend::update_session(const std::string& session_id,
                                         const std::string& agent_id,
                                         int64_t now) {
    {
        Statement stmt(db_,
            "INSERT INTO sessions (session_id, created_at, last_accessed, metadata) "
            "VALUES (?, ?, ?, '{}') "
            "ON CONFLICT(session_id) DO UPDATE SET last_accessed = excluded.last_accessed",
            "update_session");
        stmt.bind_text(1, session_id);
        stmt.bind_int64(2, now);
        stmt.bind_int64(3, now);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw StorageError(db_error("update_session"));
        }
    }
    {
        Statement stmt(db_,
            "INSERT INTO session_agents (session_id, agent_id, first_used, last_used) "
            "VALUES (?, ?, ?, ?) "
            "ON CONFLICT(session_id, agent_id) DO UPDATE SET last_used = excluded.last_used",
            "update_session");
        stmt.bind_text(1, session_id);
        stmt.bind_text(2, agent_id);
        stmt.bind_int64(3, now);
        stmt.bind_int64(4, now);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw StorageError(db_error("update_session"));
        }
    }
}

void SqliteMemoryBackend::touch_records(const std::vector<std::string>& ids, int64_t now) {
    Transaction tx(db_);
    for (size_t i = 0; i < ids.size(); ++i) {
        Statement stmt(db_, "UPDATE memory_entries SET accessed_at = ? WHERE id = ?", "touch");
        stmt.bind_int64(1, now);
        stmt.bind_text(2, ids[i]);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw StorageError(db_error("touch"));
        }
    }
    tx.commit();
}

void SqliteMemoryBackend::require_open() const {
    if (!db_) {
        throw StorageError("Database not open");
    }
}

void SqliteMemoryBackend::exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        throw StorageError("exec failed: " + msg);
    }
}

std::string SqliteMemoryBackend::db_error(const std::string& operation) const {
    return operation + " failed: " + (db_ ? sqlite3_errmsg(db_) : "database not open");
}

} // namespace memguard
