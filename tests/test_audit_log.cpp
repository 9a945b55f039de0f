#include <memguard/security/audit_log.hpp>
#include <memguard/core/utils.hpp>
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <thread>

using namespace memguard;

namespace {

SecurityEvent sample(SecurityEventType type, int severity, const std::string& agent = "agent-1") {
    Json details = Json::object();
    details.set("operation", "retrieve");
    return SecurityEvent::make(type, agent, "s1", details, severity);
}

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path.c_str());
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path.c_str(), std::ios::trunc);
    for (size_t i = 0; i < lines.size(); ++i) {
        out << lines[i] << "\n";
    }
}

class AuditLogFileTest : public ::testing::Test {
protected:
    std::string path;
    
    void SetUp() override {
        path = ::testing::TempDir() + "memguard_audit_" + generate_uuid() + ".log";
    }
    
    void TearDown() override {
        std::remove(path.c_str());
    }
};

} // namespace

TEST(AuditLogTest, ChainsEventsInMemory) {
    AuditLog log;
    log.record(sample(SecurityEventType::ACCESS_GRANTED, 1));
    log.record(sample(SecurityEventType::ACCESS_DENIED, 4));
    
    std::vector<SecurityEvent> events = log.events();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(1u, events[0].sequence);
    EXPECT_EQ(2u, events[1].sequence);
    EXPECT_EQ(AuditLog::GENESIS_HASH, events[0].previous_hash);
    EXPECT_EQ(events[0].hash, events[1].previous_hash);
    EXPECT_EQ(events[1].compute_hash(), events[1].hash);
    EXPECT_EQ(64u, events[1].hash.size());
    EXPECT_EQ(events[1].hash, log.last_hash());
}

TEST(AuditLogTest, QueryFiltersBySeverityAndType) {
    AuditLog log;
    log.record(sample(SecurityEventType::ACCESS_GRANTED, 1));
    log.record(sample(SecurityEventType::ACCESS_DENIED, 4));
    log.record(sample(SecurityEventType::INJECTION_ATTEMPT, 5));
    log.record(sample(SecurityEventType::ACCESS_DENIED, 4));
    
    EXPECT_EQ(4u, log.query().size());
    EXPECT_EQ(3u, log.query(4).size());
    EXPECT_EQ(1u, log.query(5).size());
    EXPECT_EQ(2u, log.query(SecurityEventType::ACCESS_DENIED).size());
    EXPECT_EQ(0u, log.query(SecurityEventType::ACCESS_DENIED, 5).size());
    EXPECT_EQ(0u, log.query(SecurityEventType::SESSION_CLEARED).size());
}

TEST(AuditLogTest, SeverityIsClamped) {
    EXPECT_EQ(5, sample(SecurityEventType::UNUSUAL_PATTERN, 9).severity);
    EXPECT_EQ(1, sample(SecurityEventType::ACCESS_GRANTED, 0).severity);
}

TEST(AuditLogTest, BatchIsContiguous) {
    AuditLog log;
    std::vector<SecurityEvent> batch;
    batch.push_back(sample(SecurityEventType::ACCESS_GRANTED, 1));
    batch.push_back(sample(SecurityEventType::CREDENTIAL_SCRUBBED, 3));
    log.record_batch(batch);
    
    std::vector<SecurityEvent> events = log.events();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(SecurityEventType::ACCESS_GRANTED, events[0].type);
    EXPECT_EQ(SecurityEventType::CREDENTIAL_SCRUBBED, events[1].type);
}

TEST(AuditLogTest, EventJsonRoundTrip) {
    AuditLog log;
    log.record(sample(SecurityEventType::CROSS_SESSION_ACCESS, 2));
    SecurityEvent e = log.events()[0];
    SecurityEvent back = SecurityEvent::from_json(Json::parse(e.to_json().dump()));
    EXPECT_EQ(e.event_id, back.event_id);
    EXPECT_EQ(e.type, back.type);
    EXPECT_EQ(e.timestamp_ms, back.timestamp_ms);
    EXPECT_EQ(e.details, back.details);
    EXPECT_EQ(e.hash, back.compute_hash());
}

TEST(AuditLogTest, EventTypeNames) {
    SecurityEventType t;
    EXPECT_TRUE(parse_event_type("rate_limit_exceeded", t));
    EXPECT_EQ(SecurityEventType::RATE_LIMIT_EXCEEDED, t);
    EXPECT_TRUE(parse_event_type("SESSION_CREATED", t));
    EXPECT_EQ(SecurityEventType::SESSION_CREATED, t);
    EXPECT_FALSE(parse_event_type("bogus", t));
}

TEST(AuditLogTest, UnwritablePathDoesNotThrow) {
    AuditLog log("/nonexistent-memguard-dir/audit.log");
    EXPECT_NO_THROW(log.record(sample(SecurityEventType::ACCESS_DENIED, 4)));
    EXPECT_EQ(1u, log.size());
}

TEST(AuditLogTest, ConcurrentRecordsKeepChain) {
    AuditLog log;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.push_back(std::thread([&log]() {
            for (int i = 0; i < 25; ++i) {
                log.record(sample(SecurityEventType::ACCESS_GRANTED, 1));
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }
    
    std::vector<SecurityEvent> events = log.events();
    ASSERT_EQ(100u, events.size());
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_EQ(events[i - 1].hash, events[i].previous_hash);
        EXPECT_EQ(i + 1, events[i].sequence);
    }
}

TEST_F(AuditLogFileTest, WritesVerifiableJsonLines) {
    {
        AuditLog log(path);
        EXPECT_EQ(path, log.log_path());
        log.record(sample(SecurityEventType::SESSION_CREATED, 1));
        log.record(sample(SecurityEventType::ACCESS_DENIED, 4));
        log.record(sample(SecurityEventType::ACCESS_GRANTED, 1));
    }
    
    std::vector<std::string> lines = read_lines(path);
    ASSERT_EQ(3u, lines.size());
    EXPECT_EQ("access_denied", Json::parse(lines[1]).get_string("type"));
    
    std::string error;
    EXPECT_TRUE(AuditLog::verify_file(path, error)) << error;
    
    std::vector<SecurityEvent> loaded;
    ASSERT_TRUE(AuditLog::load_file(path, loaded, error)) << error;
    ASSERT_EQ(3u, loaded.size());
    EXPECT_EQ(4, loaded[1].severity);
}

TEST_F(AuditLogFileTest, ContinuesExistingChain) {
    {
        AuditLog log(path);
        log.record(sample(SecurityEventType::ACCESS_GRANTED, 1));
        log.record(sample(SecurityEventType::ACCESS_GRANTED, 1));
    }
    {
        AuditLog log(path);
        log.record(sample(SecurityEventType::ACCESS_DENIED, 4));
        EXPECT_EQ(3u, log.events()[0].sequence);
    }
    
    std::string error;
    EXPECT_TRUE(AuditLog::verify_file(path, error)) << error;
    EXPECT_EQ(3u, read_lines(path).size());
}

TEST_F(AuditLogFileTest, DetectsEditedLine) {
    {
        AuditLog log(path);
        log.record(sample(SecurityEventType::ACCESS_GRANTED, 1));
        log.record(sample(SecurityEventType::ACCESS_DENIED, 4));
        log.record(sample(SecurityEventType::ACCESS_GRANTED, 1));
    }
    
    std::vector<std::string> lines = read_lines(path);
    Json edited = Json::parse(lines[1]);
    edited.set("severity", 1);
    lines[1] = edited.dump();
    write_lines(path, lines);
    
    std::string error;
    EXPECT_FALSE(AuditLog::verify_file(path, error));
    EXPECT_NE(std::string::npos, error.find("line 2"));
}

TEST_F(AuditLogFileTest, DetectsRemovedLine) {
    {
        AuditLog log(path);
        log.record(sample(SecurityEventType::ACCESS_GRANTED, 1));
        log.record(sample(SecurityEventType::ACCESS_DENIED, 4));
        log.record(sample(SecurityEventType::ACCESS_GRANTED, 1));
    }
    
    std::vector<std::string> lines = read_lines(path);
    lines.erase(lines.begin() + 1);
    write_lines(path, lines);
    
    std::string error;
    EXPECT_FALSE(AuditLog::verify_file(path, error));
}

TEST_F(AuditLogFileTest, MissingFileFailsVerification) {
    std::string error;
    EXPECT_FALSE(AuditLog::verify_file(path, error));
    EXPECT_FALSE(error.empty());
}
