/*
 * memguard - Memory Types
 * 
 * Records, queries and session summaries exchanged with a memory backend.
 * All timestamps are Unix milliseconds; 0 means "unset".
 */
#ifndef MEMGUARD_MEMORY_TYPES_HPP
#define MEMGUARD_MEMORY_TYPES_HPP

#include <memguard/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace memguard {

// Memory categories a record can belong to
enum class MemoryType {
    EPISODIC,     // What happened (conversation turns, events)
    SEMANTIC,     // Facts and learned knowledge
    PROCEDURAL,   // How to do things
    PROSPECTIVE,  // Intentions and reminders
    WORKING       // Short-lived task context
};

inline std::string memory_type_to_string(MemoryType t) {
    switch (t) {
        case MemoryType::EPISODIC: return "episodic";
        case MemoryType::SEMANTIC: return "semantic";
        case MemoryType::PROCEDURAL: return "procedural";
        case MemoryType::PROSPECTIVE: return "prospective";
        case MemoryType::WORKING: return "working";
    }
    return "episodic";
}

// Returns false for unknown names
inline bool parse_memory_type(const std::string& s, MemoryType& out) {
    if (s == "episodic") { out = MemoryType::EPISODIC; return true; }
    if (s == "semantic") { out = MemoryType::SEMANTIC; return true; }
    if (s == "procedural") { out = MemoryType::PROCEDURAL; return true; }
    if (s == "prospective") { out = MemoryType::PROSPECTIVE; return true; }
    if (s == "working") { out = MemoryType::WORKING; return true; }
    return false;
}

// A single stored memory
struct MemoryRecord {
    std::string id;
    std::string session_id;
    std::string agent_id;
    MemoryType memory_type;
    std::string title;
    std::string content;
    Json metadata;                  // Always an object
    std::vector<std::string> tags;
    int importance;                 // 1-10, 0 = unset
    int64_t created_at;
    int64_t accessed_at;
    int64_t expires_at;             // 0 = never expires
    std::string parent_id;
    
    MemoryRecord()
        : memory_type(MemoryType::EPISODIC)
        , metadata(Json::object())
        , importance(0)
        , created_at(0)
        , accessed_at(0)
        , expires_at(0) {}
    
    bool is_expired(int64_t now_ms) const {
        return expires_at != 0 && expires_at < now_ms;
    }
};

// Retrieval filter. Empty strings / zero values mean "no filter".
struct MemoryQuery {
    std::string session_id;
    std::string agent_id;
    bool has_memory_type;
    MemoryType memory_type;
    std::string content_search;     // Substring match on title/content
    std::vector<std::string> tags;  // Record must carry every tag
    int min_importance;
    int64_t created_after;
    int64_t created_before;
    int limit;                      // 0 = backend default
    int offset;
    bool include_expired;
    std::vector<std::string> code_paths;  // Source files a code-context query touches
    
    MemoryQuery()
        : has_memory_type(false)
        , memory_type(MemoryType::EPISODIC)
        , min_importance(0)
        , created_after(0)
        , created_before(0)
        , limit(0)
        , offset(0)
        , include_expired(false) {}
    
    void set_memory_type(MemoryType t) {
        has_memory_type = true;
        memory_type = t;
    }
};

// Summary of one session as tracked by a backend
struct SessionInfo {
    std::string session_id;
    int64_t created_at;
    int64_t last_accessed;
    std::vector<std::string> agent_ids;   // Most recently active first
    int memory_count;
    Json metadata;
    
    SessionInfo() : created_at(0), last_accessed(0), memory_count(0), metadata(Json::object()) {}
};

} // namespace memguard

#endif // MEMGUARD_MEMORY_TYPES_HPP
