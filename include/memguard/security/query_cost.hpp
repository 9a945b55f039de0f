/*
 * memguard - Query Cost
 * 
 * Admission pricing for read requests. A query is priced before it reaches
 * the backend and rejected when it is too expensive for the caller or when
 * its search text carries graph query keywords.
 */
#ifndef MEMGUARD_SECURITY_QUERY_COST_HPP
#define MEMGUARD_SECURITY_QUERY_COST_HPP

#include <memguard/memory/types.hpp>
#include <string>
#include <vector>

namespace memguard {

struct QueryCost {
    int base;
    int filter;        // FILTER_COST per active predicate
    int result;        // Grows with the (effective) result limit
    int complexity;    // Content search and tag search surcharges
    
    QueryCost() : base(0), filter(0), result(0), complexity(0) {}
    
    int total() const { return base + filter + result + complexity; }
};

enum class QueryViolation {
    NONE,
    COST,
    INJECTION
};

struct QueryValidation {
    bool allowed;
    QueryCost cost;
    QueryViolation violation;
    std::string reason;
    
    QueryValidation() : allowed(false), violation(QueryViolation::NONE) {}
    
    static QueryValidation allow(const QueryCost& cost) {
        QueryValidation v;
        v.allowed = true;
        v.cost = cost;
        return v;
    }
    
    static QueryValidation deny(const QueryCost& cost, QueryViolation violation,
                                const std::string& reason) {
        QueryValidation v;
        v.allowed = false;
        v.cost = cost;
        v.violation = violation;
        v.reason = reason;
        return v;
    }
};

class QueryCostEstimator {
public:
    static const int BASE_COST = 1;
    static const int FILTER_COST = 2;
    static const int RESULTS_PER_COST_UNIT = 10;
    static const int DEFAULT_RESULT_LIMIT = 100;     // Used when a query names no limit
    static const int CONTENT_SEARCH_COST = 10;
    static const int CONTENT_SEARCH_CHARS_PER_UNIT = 100;
    static const int TAG_SEARCH_COST = 5;
    static const int PER_TAG_COST = 1;
    
    QueryCostEstimator();
    
    QueryCost estimate(const MemoryQuery& query) const;
    
    // Cost is checked first; the keyword scan only runs on affordable queries
    QueryValidation validate(const MemoryQuery& query, int max_cost) const;
    
    // Returns the first denylisted keyword found in 'text' in Cypher clause
    // position (whole word, case-insensitive), or an empty string. The same
    // words used as ordinary prose are not reported.
    std::string find_injection_keyword(const std::string& text) const;
    
    static int effective_limit(const MemoryQuery& query);
    
    const std::vector<std::string>& keywords() const { return keywords_; }

private:
    std::vector<std::string> keywords_;
};

} // namespace memguard

#endif // MEMGUARD_SECURITY_QUERY_COST_HPP
