// ---------------------------------------------------------------------------
// test_batch_auditor.cpp
//
// BatchAuditor 단위 테스트.
//
// [테스트 범위]
// - 결과 순서 = 입력 순서 (워커 수와 무관)
// - 빈 입력
// - worker_threads == 0 → 하드웨어 동시성 (최소 1)
// - summarize 집계
// ---------------------------------------------------------------------------

#include "gate/batch_auditor.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::shared_ptr<const SqlValidator> default_validator() {
    return std::make_shared<const SqlValidator>();
}

}  // namespace

TEST(BatchAuditor, PreservesInputOrder) {
    const BatchAuditor auditor{default_validator(), BatchSettings{.worker_threads = 4}};

    std::vector<std::string> statements;
    for (int i = 0; i < 40; ++i) {
        statements.push_back(i % 2 == 0 ? "SELECT id FROM t" + std::to_string(i)
                                        : "DELETE FROM t" + std::to_string(i));
    }

    const auto results = auditor.audit(statements);
    ASSERT_EQ(results.size(), statements.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].is_execution_allowed(), i % 2 == 0) << "statement " << i;
        if (i % 2 == 0) {
            ASSERT_TRUE(results[i].sanitized_sql.has_value());
            EXPECT_EQ(*results[i].sanitized_sql, statements[i] + " LIMIT 1000");
        }
    }
}

TEST(BatchAuditor, EmptyInput) {
    const BatchAuditor auditor{default_validator()};
    EXPECT_TRUE(auditor.audit({}).empty());
}

TEST(BatchAuditor, NullValidatorThrows) {
    EXPECT_THROW(BatchAuditor(nullptr), std::invalid_argument);
}

TEST(BatchAuditor, ZeroWorkersUsesHardwareConcurrency) {
    const BatchAuditor auditor{default_validator(), BatchSettings{.worker_threads = 0}};
    EXPECT_GE(auditor.worker_count(), 1u);

    const auto results = auditor.audit({"SELECT 1"});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].is_safe);
}

TEST(BatchAuditor, SingleWorkerMatchesSequential) {
    const auto         validator = default_validator();
    const BatchAuditor auditor{validator, BatchSettings{.worker_threads = 1}};

    const std::vector<std::string> statements = {
        "SELECT a FROM b",
        "SELECT * FROM information_schema.tables",
        "SELECT 1 UNION SELECT password FROM admins",
    };
    const auto results = auditor.audit(statements);
    ASSERT_EQ(results.size(), 3u);
    for (std::size_t i = 0; i < statements.size(); ++i) {
        const auto expected = validator->validate(statements[i]);
        EXPECT_EQ(results[i].is_safe, expected.is_safe);
        EXPECT_EQ(results[i].threat_level, expected.threat_level);
        EXPECT_EQ(results[i].violations, expected.violations);
    }
}

TEST(BatchAuditor, Summarize) {
    const BatchAuditor auditor{default_validator()};
    const auto results = auditor.audit({
        "SELECT id FROM users",
        "SELECT name FROM pg_tables",
        "DROP TABLE users",
        "",
    });

    const BatchSummary summary = summarize(results);
    EXPECT_EQ(summary.total, 4u);
    EXPECT_EQ(summary.allowed, 2u);
    EXPECT_EQ(summary.blocked, 2u);
    EXPECT_EQ(summary.with_warnings, 1u);
}
