#include <memguard/security/query_cost.hpp>
#include <gtest/gtest.h>
#include <limits>

using namespace memguard;

TEST(QueryCostTest, EmptyQueryUsesDefaultLimit) {
    QueryCostEstimator estimator;
    MemoryQuery q;
    QueryCost cost = estimator.estimate(q);
    EXPECT_EQ(QueryCostEstimator::BASE_COST, cost.base);
    EXPECT_EQ(0, cost.filter);
    EXPECT_EQ(QueryCostEstimator::DEFAULT_RESULT_LIMIT / 10, cost.result);
    EXPECT_EQ(0, cost.complexity);
    EXPECT_EQ(11, cost.total());
}

TEST(QueryCostTest, OmittedLimitCostsTheSameAsDefault) {
    QueryCostEstimator estimator;
    MemoryQuery omitted;
    MemoryQuery explicit_default;
    explicit_default.limit = QueryCostEstimator::DEFAULT_RESULT_LIMIT;
    EXPECT_EQ(estimator.estimate(explicit_default).total(), estimator.estimate(omitted).total());
}

TEST(QueryCostTest, MonotonicInLimit) {
    QueryCostEstimator estimator;
    MemoryQuery q;
    int previous = 0;
    for (int limit = 1; limit <= 2000; limit += 7) {
        q.limit = limit;
        int total = estimator.estimate(q).total();
        EXPECT_GE(total, previous) << "limit " << limit;
        previous = total;
    }
}

TEST(QueryCostTest, MonotonicInFilters) {
    QueryCostEstimator estimator;
    MemoryQuery q;
    q.limit = 10;
    int previous = estimator.estimate(q).total();
    
    q.session_id = "s1";
    int next = estimator.estimate(q).total();
    EXPECT_GT(next, previous);
    previous = next;
    
    q.agent_id = "a";
    next = estimator.estimate(q).total();
    EXPECT_GT(next, previous);
    previous = next;
    
    q.set_memory_type(MemoryType::SEMANTIC);
    next = estimator.estimate(q).total();
    EXPECT_GT(next, previous);
    previous = next;
    
    q.min_importance = 5;
    q.created_after = 1000;
    q.created_before = 2000;
    next = estimator.estimate(q).total();
    EXPECT_EQ(previous + 3 * QueryCostEstimator::FILTER_COST, next);
}

TEST(QueryCostTest, MonotonicInSearch) {
    QueryCostEstimator estimator;
    MemoryQuery q;
    int plain = estimator.estimate(q).total();
    
    q.content_search = "deploy";
    int with_content = estimator.estimate(q).total();
    EXPECT_GT(with_content, plain);
    
    q.tags.push_back("ops");
    int with_tags = estimator.estimate(q).total();
    EXPECT_GT(with_tags, with_content);
    
    q.tags.push_back("prod");
    EXPECT_GT(estimator.estimate(q).total(), with_tags);
    
    q.content_search = std::string(500, 'x');
    EXPECT_GT(estimator.estimate(q).total(), with_tags);
}

TEST(QueryCostTest, LongSearchDeniedOnCostBeforeKeywordScan) {
    QueryCostEstimator estimator;
    MemoryQuery q;
    // Also carries a keyword; cost must win
    q.content_search = "MATCH (n) DETACH DELETE n " + std::string(4000 - 26, 'a');
    ASSERT_EQ(4000u, q.content_search.size());
    
    QueryValidation v = estimator.validate(q, 50);
    EXPECT_FALSE(v.allowed);
    EXPECT_EQ(QueryViolation::COST, v.violation);
    EXPECT_GT(v.cost.total(), 50);
    EXPECT_NE(std::string::npos, v.reason.find("cost"));
}

TEST(QueryCostTest, AffordableQueryWithKeywordIsInjection) {
    QueryCostEstimator estimator;
    MemoryQuery q;
    q.content_search = "x' }) MATCH (n) DETACH DELETE n //";
    QueryValidation v = estimator.validate(q, 50);
    EXPECT_FALSE(v.allowed);
    EXPECT_EQ(QueryViolation::INJECTION, v.violation);
    EXPECT_EQ(std::string::npos, v.reason.find("x' })"));
}

TEST(QueryCostTest, KeywordsMatchWholeWordsOnly) {
    QueryCostEstimator estimator;
    EXPECT_EQ(12u, estimator.keywords().size());
    EXPECT_EQ("", estimator.find_injection_keyword("settings and matches of created items"));
    EXPECT_EQ("", estimator.find_injection_keyword("upload the csv file"));
    EXPECT_EQ("SET", estimator.find_injection_keyword("n SET n.admin = true"));
    EXPECT_EQ("CALL", estimator.find_injection_keyword("call db.labels()"));
    EXPECT_EQ("LOAD CSV", estimator.find_injection_keyword("Load  csv FROM $url AS row"));
    EXPECT_EQ("", estimator.find_injection_keyword(""));
}

TEST(QueryCostTest, ProseUsingKeywordWordsIsAllowed) {
    QueryCostEstimator estimator;
    const char* prose[] = {
        "how did we set up the build",
        "match the test to the call site",
        "remove the old drafts and create new ones",
        "merge conflicts after the release. drop it",
        "Call site: see the notes"
    };
    for (size_t i = 0; i < sizeof(prose) / sizeof(prose[0]); ++i) {
        MemoryQuery q;
        q.content_search = prose[i];
        QueryValidation v = estimator.validate(q, 50);
        EXPECT_TRUE(v.allowed) << prose[i] << ": " << v.reason;
    }
}

TEST(QueryCostTest, KeywordsInClausePositionAreInjection) {
    QueryCostEstimator estimator;
    EXPECT_EQ("MATCH", estimator.find_injection_keyword("MATCH (n) DETACH DELETE n"));
    EXPECT_EQ("DETACH", estimator.find_injection_keyword("x DETACH DELETE n"));
    EXPECT_EQ("REMOVE", estimator.find_injection_keyword("remove n:Admin"));
    EXPECT_EQ("UNWIND", estimator.find_injection_keyword("unwind $rows AS r"));
    EXPECT_EQ("CREATE", estimator.find_injection_keyword("'}) CREATE x"));
    EXPECT_EQ("FOREACH", estimator.find_injection_keyword("foreach (x IN list | y)"));
}

TEST(QueryCostTest, HugeLimitDoesNotWrap) {
    QueryCostEstimator estimator;
    MemoryQuery q;
    q.limit = 1000;
    int bounded = estimator.estimate(q).total();
    q.limit = std::numeric_limits<int>::max();
    int huge = estimator.estimate(q).total();
    EXPECT_GT(huge, bounded);
    EXPECT_EQ(1 + (std::numeric_limits<int>::max() / 10 + 1), huge);
    
    QueryValidation v = estimator.validate(q, 50);
    EXPECT_FALSE(v.allowed);
    EXPECT_EQ(QueryViolation::COST, v.violation);
}

TEST(QueryCostTest, TagsAreScannedToo) {
    QueryCostEstimator estimator;
    MemoryQuery q;
    q.tags.push_back("ok");
    q.tags.push_back("x}) DROP INDEX");
    QueryValidation v = estimator.validate(q, 50);
    EXPECT_EQ(QueryViolation::INJECTION, v.violation);
}

TEST(QueryCostTest, CleanAffordableQueryIsAllowed) {
    QueryCostEstimator estimator;
    MemoryQuery q;
    q.session_id = "s1";
    q.content_search = "release checklist";
    q.limit = 20;
    QueryValidation v = estimator.validate(q, 50);
    EXPECT_TRUE(v.allowed);
    EXPECT_EQ(QueryViolation::NONE, v.violation);
    EXPECT_EQ(v.cost.total(), estimator.estimate(q).total());
}
