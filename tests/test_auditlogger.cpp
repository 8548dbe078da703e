/**
 * @file test_auditlogger.cpp
 * @brief Unit tests for the JSON Lines audit trail
 *
 * @see AuditLogger
 */

#include <gtest/gtest.h>
#include "auditlogger.hpp"
#include "utils.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

class AuditLoggerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path log_file;
    std::ostringstream fallback;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("lazyscan_audit_" + generateUuid());
        fs::create_directories(test_dir);
        log_file = test_dir / "logs" / "audit.jsonl";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    static AuditRecord makeRecord(const std::string& path, AuditDecision decision,
                                  std::uintmax_t bytes = 0) {
        AuditRecord r;
        r.operationId = generateUuid();
        r.path = path;
        r.decision = decision;
        r.reason = "test";
        r.category = "chrome";
        r.mode = "trash";
        r.dryRun = false;
        r.bytes = bytes;
        r.policyHash = "abc123def456";
        return r;
    }

    std::vector<std::string> lines() const {
        std::vector<std::string> result;
        std::ifstream in(log_file);
        std::string line;
        while (std::getline(in, line)) {
            result.push_back(line);
        }
        return result;
    }
};

/**
 * @test WritesOneJsonObjectPerLine
 * @brief Each record becomes one parseable line carrying every field
 */
TEST_F(AuditLoggerTest, WritesOneJsonObjectPerLine) {
    AuditLogger logger(log_file, fallback);
    logger.record(makeRecord("/tmp/a", AuditDecision::Allowed));
    logger.record(makeRecord("/tmp/b", AuditDecision::Executed, 42));

    auto written = lines();
    ASSERT_EQ(written.size(), 2u);

    json j = json::parse(written[1]);
    EXPECT_EQ(j["path"], "/tmp/b");
    EXPECT_EQ(j["decision"], "executed");
    EXPECT_EQ(j["bytes"], 42);
    EXPECT_EQ(j["dry_run"], false);
    EXPECT_EQ(j["policy_hash"], "abc123def456");
    EXPECT_EQ(j["session_id"], logger.sessionId());
    for (const char* key : {"operation_id", "timestamp", "reason", "category", "mode", "user"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_TRUE(fallback.str().empty());
}

TEST_F(AuditLoggerTest, AppendsAcrossLoggerInstances) {
    AuditLogger(log_file, fallback).record(makeRecord("/tmp/a", AuditDecision::Blocked));
    AuditLogger(log_file, fallback).record(makeRecord("/tmp/b", AuditDecision::Blocked));

    EXPECT_EQ(lines().size(), 2u);
}

TEST_F(AuditLoggerTest, SessionIdIsStablePerLogger) {
    AuditLogger first(log_file, fallback);
    AuditLogger second(log_file, fallback);

    EXPECT_FALSE(first.sessionId().empty());
    EXPECT_NE(first.sessionId(), second.sessionId());
}

TEST_F(AuditLoggerTest, ReadsBackRecords) {
    AuditLogger logger(log_file, fallback);
    AuditRecord original = makeRecord("/tmp/cache", AuditDecision::Failed, 7);
    logger.record(original);

    auto records = logger.readRecords(1);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].operationId, original.operationId);
    EXPECT_EQ(records[0].path, "/tmp/cache");
    EXPECT_EQ(records[0].decision, AuditDecision::Failed);
    EXPECT_EQ(records[0].bytes, 7u);
    EXPECT_FALSE(records[0].timestamp.empty());
}

/**
 * @test SkipsMalformedLines
 * @brief Garbage and records with an unknown decision are ignored on read
 */
TEST_F(AuditLoggerTest, SkipsMalformedLines) {
    AuditLogger logger(log_file, fallback);
    logger.record(makeRecord("/tmp/good", AuditDecision::Allowed));
    {
        std::ofstream out(log_file, std::ios::app);
        out << "not json at all\n";
        out << "\n";
        out << R"({"decision":"maybe","path":"/tmp/x"})" << "\n";
        out << R"({"decision":"blocked","bytes":"lots"})" << "\n";
        out << "[1,2,3]\n";
    }
    logger.record(makeRecord("/tmp/also-good", AuditDecision::Blocked));

    auto records = logger.readRecords(1);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].path, "/tmp/good");
    EXPECT_EQ(records[1].path, "/tmp/also-good");
}

TEST_F(AuditLoggerTest, FiltersByAge) {
    AuditLogger logger(log_file, fallback);

    AuditRecord old = makeRecord("/tmp/old", AuditDecision::Executed, 100);
    old.timestamp = toIsoTimestamp(std::chrono::system_clock::now() - std::chrono::hours(48));
    logger.record(old);
    logger.record(makeRecord("/tmp/new", AuditDecision::Executed, 5));

    EXPECT_EQ(logger.readRecords(24).size(), 1u);
    EXPECT_EQ(logger.readRecords(72).size(), 2u);
}

TEST_F(AuditLoggerTest, HugeWindowReadsEverything) {
    AuditLogger logger(log_file, fallback);

    AuditRecord old = makeRecord("/tmp/old", AuditDecision::Executed, 1);
    old.timestamp = "2001-01-01T00:00:00Z";
    logger.record(old);
    logger.record(makeRecord("/tmp/new", AuditDecision::Executed, 2));

    EXPECT_EQ(logger.readRecords(1000000000).size(), 2u);
    EXPECT_EQ(logger.readRecords(std::numeric_limits<int>::max()).size(), 2u);
    EXPECT_EQ(logger.summary(1000000000).bytesExecuted, 3u);
}

TEST_F(AuditLoggerTest, TimestampsParseBack) {
    auto now = std::chrono::system_clock::now();
    std::string text = toIsoTimestamp(now);
    ASSERT_EQ(text.size(), 20u);
    EXPECT_EQ(text.back(), 'Z');

    auto parsed = fromIsoTimestamp(text);
    ASSERT_TRUE(parsed.has_value());
    auto drift = std::chrono::duration_cast<std::chrono::seconds>(now - *parsed);
    EXPECT_GE(drift.count(), 0);
    EXPECT_LE(drift.count(), 1);

    EXPECT_EQ(toIsoTimestamp(*fromIsoTimestamp("2024-02-29T23:59:59Z")),
              "2024-02-29T23:59:59Z");
    EXPECT_FALSE(fromIsoTimestamp("2024-02-29 23:59:59").has_value());
    EXPECT_FALSE(fromIsoTimestamp("2024-02-29T23:59:59Zjunk").has_value());
}

TEST_F(AuditLoggerTest, MissingLogReadsAsEmpty) {
    AuditLogger logger(test_dir / "never-written.jsonl", fallback);
    EXPECT_TRUE(logger.readRecords(24).empty());
    EXPECT_EQ(logger.summary(24).total, 0);
}

TEST_F(AuditLoggerTest, SummarizesDecisions) {
    AuditLogger logger(log_file, fallback);
    logger.record(makeRecord("/tmp/a", AuditDecision::Allowed, 10));
    logger.record(makeRecord("/tmp/a", AuditDecision::Executed, 10));
    logger.record(makeRecord("/tmp/b", AuditDecision::Executed, 32));
    logger.record(makeRecord("/", AuditDecision::Blocked));

    AuditSummary summary = logger.summary(24);
    EXPECT_EQ(summary.hours, 24);
    EXPECT_EQ(summary.total, 4);
    EXPECT_EQ(summary.byDecision["allowed"], 1);
    EXPECT_EQ(summary.byDecision["executed"], 2);
    EXPECT_EQ(summary.byDecision["blocked"], 1);
    EXPECT_EQ(summary.bytesExecuted, 42u);
    ASSERT_EQ(summary.blocked.size(), 1u);
    EXPECT_EQ(summary.blocked[0].path, "/");
}

/**
 * @test FallsBackWhenLogIsUnwritable
 * @brief A log path that cannot be opened reports to the fallback stream
 *        instead of throwing
 */
TEST_F(AuditLoggerTest, FallsBackWhenLogIsUnwritable) {
    fs::create_directories(log_file); // a directory where the file should be
    AuditLogger logger(log_file, fallback);

    EXPECT_NO_THROW(logger.record(makeRecord("/tmp/a", AuditDecision::Executed)));
    EXPECT_NE(fallback.str().find("AUDIT-FALLBACK"), std::string::npos);
    EXPECT_NE(fallback.str().find("/tmp/a"), std::string::npos);
}

TEST_F(AuditLoggerTest, InvalidUtf8PathIsStillRecorded) {
    AuditLogger logger(log_file, fallback);
    logger.record(makeRecord(std::string("/tmp/bad\xff\xfename"), AuditDecision::Blocked));

    EXPECT_EQ(lines().size(), 1u);
    EXPECT_TRUE(fallback.str().empty());
}

TEST_F(AuditLoggerTest, DecisionNamesRoundTrip) {
    for (auto decision : {AuditDecision::Allowed, AuditDecision::Blocked,
                          AuditDecision::Executed, AuditDecision::Failed}) {
        auto parsed = auditDecisionFromString(auditDecisionName(decision));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, decision);
    }
    EXPECT_FALSE(auditDecisionFromString("deleted").has_value());
}
