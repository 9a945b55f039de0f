#include <memguard/security/query_cost.hpp>
#include <memguard/core/utils.hpp>
#include <cctype>
#include <cstring>
#include <sstream>

namespace memguard {

const int QueryCostEstimator::BASE_COST;
const int QueryCostEstimator::FILTER_COST;
const int QueryCostEstimator::RESULTS_PER_COST_UNIT;
const int QueryCostEstimator::DEFAULT_RESULT_LIMIT;
const int QueryCostEstimator::CONTENT_SEARCH_COST;
const int QueryCostEstimator::CONTENT_SEARCH_CHARS_PER_UNIT;
const int QueryCostEstimator::TAG_SEARCH_COST;
const int QueryCostEstimator::PER_TAG_COST;

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// A run of word characters (upper-cased) or a single punctuation character.
// 'spaced' is set when whitespace follows the token.
struct SearchToken {
    std::string text;
    bool word;
    bool spaced;
    
    SearchToken(const std::string& t, bool w) : text(t), word(w), spaced(false) {}
};

std::vector<SearchToken> tokens_of(const std::string& text) {
    std::vector<SearchToken> tokens;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isspace(c)) {
            if (!tokens.empty()) tokens.back().spaced = true;
            ++i;
        } else if (is_word_char(text[i])) {
            std::string word;
            while (i < text.size() && is_word_char(text[i])) {
                word += static_cast<char>(std::toupper(static_cast<unsigned char>(text[i])));
                ++i;
            }
            tokens.push_back(SearchToken(word, true));
        } else {
            tokens.push_back(SearchToken(std::string(1, text[i]), false));
            ++i;
        }
    }
    return tokens;
}

bool is_punct(const std::vector<SearchToken>& tokens, size_t i, const char* set) {
    return i < tokens.size() && !tokens[i].word &&
           std::strchr(set, tokens[i].text[0]) != NULL;
}

bool starts_keyword(const std::vector<std::string>& keywords, const std::string& word) {
    for (size_t k = 0; k < keywords.size(); ++k) {
        if (split(keywords[k], ' ')[0] == word) {
            return true;
        }
    }
    return false;
}

// Keyword tokens [begin, end) read as a Cypher clause when they close a
// fragment ("}) DROP"), open one ("MATCH (", "UNWIND $"), chain into another
// clause ("DETACH DELETE"), or act on a property, label or parameter
// ("SET n.admin", "REMOVE n:Label", "FROM $url"). Plain prose such as
// "set up the build" does not.
bool in_clause_position(const std::vector<SearchToken>& tokens, size_t begin, size_t end,
                        const std::vector<std::string>& keywords) {
    if (begin > 0 && is_punct(tokens, begin - 1, ")}];")) {
        return true;
    }
    if (is_punct(tokens, end, "({[:;=$")) {
        return true;
    }
    if (end >= tokens.size() || !tokens[end].word) {
        return false;
    }
    if (starts_keyword(keywords, tokens[end].text)) {
        return true;
    }
    if (!tokens[end].spaced && is_punct(tokens, end + 1, ".:") &&
        !tokens[end + 1].spaced && end + 2 < tokens.size() && tokens[end + 2].word) {
        return true;
    }
    return is_punct(tokens, end + 1, "$");
}

} // namespace

QueryCostEstimator::QueryCostEstimator() {
    // Cypher clauses that read, write or execute procedures
    keywords_.push_back("MATCH");
    keywords_.push_back("CREATE");
    keywords_.push_back("MERGE");
    keywords_.push_back("DELETE");
    keywords_.push_back("DETACH");
    keywords_.push_back("DROP");
    keywords_.push_back("REMOVE");
    keywords_.push_back("SET");
    keywords_.push_back("CALL");
    keywords_.push_back("LOAD CSV");
    keywords_.push_back("UNWIND");
    keywords_.push_back("FOREACH");
}

int QueryCostEstimator::effective_limit(const MemoryQuery& query) {
    return query.limit > 0 ? query.limit : DEFAULT_RESULT_LIMIT;
}

QueryCost QueryCostEstimator::estimate(const MemoryQuery& query) const {
    QueryCost cost;
    cost.base = BASE_COST;
    
    int filters = 0;
    if (!query.session_id.empty()) filters++;
    if (!query.agent_id.empty()) filters++;
    if (query.has_memory_type) filters++;
    if (query.min_importance > 0) filters++;
    if (query.created_after > 0) filters++;
    if (query.created_before > 0) filters++;
    if (!query.code_paths.empty()) filters++;
    cost.filter = filters * FILTER_COST;
    
    // 64-bit so a limit near INT_MAX cannot wrap
    int64_t limit = effective_limit(query);
    cost.result = static_cast<int>((limit + RESULTS_PER_COST_UNIT - 1) / RESULTS_PER_COST_UNIT);
    
    if (!query.content_search.empty()) {
        cost.complexity += CONTENT_SEARCH_COST +
            static_cast<int>(query.content_search.size() / CONTENT_SEARCH_CHARS_PER_UNIT);
    }
    if (!query.tags.empty()) {
        cost.complexity += TAG_SEARCH_COST + static_cast<int>(query.tags.size()) * PER_TAG_COST;
    }
    
    return cost;
}

std::string QueryCostEstimator::find_injection_keyword(const std::string& text) const {
    std::vector<SearchToken> tokens = tokens_of(text);
    if (tokens.empty()) {
        return "";
    }
    
    for (size_t k = 0; k < keywords_.size(); ++k) {
        std::vector<std::string> parts = split(keywords_[k], ' ');
        if (parts.empty() || parts.size() > tokens.size()) continue;
        
        for (size_t i = 0; i + parts.size() <= tokens.size(); ++i) {
            bool hit = true;
            for (size_t j = 0; j < parts.size(); ++j) {
                if (!tokens[i + j].word || tokens[i + j].text != parts[j]) {
                    hit = false;
                    break;
                }
            }
            if (hit && in_clause_position(tokens, i, i + parts.size(), keywords_)) {
                return keywords_[k];
            }
        }
    }
    return "";
}

QueryValidation QueryCostEstimator::validate(const MemoryQuery& query, int max_cost) const {
    QueryCost cost = estimate(query);
    
    if (cost.total() > max_cost) {
        std::ostringstream ss;
        ss << "query cost " << cost.total() << " exceeds limit " << max_cost;
        return QueryValidation::deny(cost, QueryViolation::COST, ss.str());
    }
    
    std::string keyword = find_injection_keyword(query.content_search);
    for (size_t i = 0; keyword.empty() && i < query.tags.size(); ++i) {
        keyword = find_injection_keyword(query.tags[i]);
    }
    if (!keyword.empty()) {
        return QueryValidation::deny(cost, QueryViolation::INJECTION,
            "search text contains disallowed query keyword " + keyword);
    }
    
    return QueryValidation::allow(cost);
}

} // namespace memguard
