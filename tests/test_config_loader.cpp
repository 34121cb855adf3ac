// ---------------------------------------------------------------------------
// test_config_loader.cpp
//
// ConfigLoader 단위 테스트.
//
// [테스트 범위]
// - 정상 YAML 파일 로드 (전 섹션)
// - 누락 섹션/빈 문서는 기본값
// - 파일 없음, 문법 오류, 범위 밖 값, 타입 오류, 컴파일 불가 패턴은 실패
//   (잘못된 설정으로 기동하지 않는다: fail-close)
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "llmgate_test_config" /
               (std::string(info->test_suite_name()) + "_" + info->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write_config(const std::string& content) const {
        const fs::path path = dir_ / "llmgate.yaml";
        std::ofstream  out(path);
        out << content;
        return path;
    }

    fs::path dir_;
};

TEST_F(ConfigLoaderTest, LoadsAllSections) {
    const auto path = write_config(R"(
global:
  log_level: warn
  log_path: /tmp/llmgate-test/audit.log
prompt:
  max_question_chars: 500
  extra_patterns:
    - 'disregard\s+prior'
sql:
  max_query_bytes: 4096
  row_limit: 200
  extra_dangerous_patterns:
    - '\bsalary\b'
  extra_suspicious_patterns:
    - '\bFROM\s+audit_log\b'
pii:
  min_confidence: 0.6
batch:
  worker_threads: 2
)");

    const auto config = ConfigLoader::load(path);
    ASSERT_TRUE(config.has_value()) << config.error();

    EXPECT_EQ(config->global.log_level, "warn");
    EXPECT_EQ(config->global.log_path, "/tmp/llmgate-test/audit.log");
    EXPECT_EQ(config->prompt.max_question_chars, 500u);
    ASSERT_EQ(config->prompt.extra_patterns.size(), 1u);
    EXPECT_EQ(config->prompt.extra_patterns[0], R"(disregard\s+prior)");
    EXPECT_EQ(config->sql.max_query_bytes, 4096u);
    EXPECT_EQ(config->sql.row_limit, 200u);
    EXPECT_EQ(config->sql.extra_dangerous_patterns.size(), 1u);
    EXPECT_EQ(config->sql.extra_suspicious_patterns.size(), 1u);
    EXPECT_DOUBLE_EQ(config->pii.min_confidence, 0.6);
    EXPECT_EQ(config->batch.worker_threads, 2u);
}

TEST_F(ConfigLoaderTest, MissingSectionsUseDefaults) {
    const auto path = write_config("sql:\n  row_limit: 25\n");

    const auto config = ConfigLoader::load(path);
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->sql.row_limit, 25u);
    EXPECT_EQ(config->sql.max_query_bytes, 10000u);
    EXPECT_EQ(config->prompt.max_question_chars, 1000u);
    EXPECT_DOUBLE_EQ(config->pii.min_confidence, 0.7);
    EXPECT_EQ(config->global.log_level, "info");
}

TEST_F(ConfigLoaderTest, EmptyDocumentIsDefaults) {
    const auto config = ConfigLoader::parse("");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->sql.row_limit, 1000u);
    EXPECT_TRUE(config->prompt.extra_patterns.empty());
}

TEST_F(ConfigLoaderTest, MissingFileFails) {
    const auto config = ConfigLoader::load(dir_ / "does_not_exist.yaml");
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("cannot resolve config path"), std::string::npos);
}

TEST_F(ConfigLoaderTest, SyntaxErrorFails) {
    const auto path = write_config("sql: [row_limit: 1\n");
    EXPECT_FALSE(ConfigLoader::load(path).has_value());
}

TEST_F(ConfigLoaderTest, TopLevelMustBeMap) {
    const auto config = ConfigLoader::parse("- a\n- b\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("not a map"), std::string::npos);
}

TEST_F(ConfigLoaderTest, OutOfRangeValuesFail) {
    EXPECT_FALSE(ConfigLoader::parse("pii:\n  min_confidence: 1.5\n").has_value());
    EXPECT_FALSE(ConfigLoader::parse("pii:\n  min_confidence: -0.2\n").has_value());
    EXPECT_FALSE(ConfigLoader::parse("sql:\n  row_limit: 0\n").has_value());
    EXPECT_FALSE(ConfigLoader::parse("sql:\n  max_query_bytes: 0\n").has_value());
    EXPECT_FALSE(ConfigLoader::parse("prompt:\n  max_question_chars: 0\n").has_value());
}

TEST_F(ConfigLoaderTest, WrongTypeFailsInsteadOfDefaulting) {
    const auto config = ConfigLoader::parse("sql:\n  row_limit: many\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("'sql'"), std::string::npos)
        << "error should name the failing section";
}

TEST_F(ConfigLoaderTest, UnknownLogLevelFails) {
    const auto config = ConfigLoader::parse("global:\n  log_level: chatty\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("log_level"), std::string::npos);
}

TEST_F(ConfigLoaderTest, InvalidExtraPatternFails) {
    const auto config = ConfigLoader::parse("sql:\n  extra_suspicious_patterns:\n    - '('\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("sql.extra_suspicious_patterns"), std::string::npos);
}

TEST_F(ConfigLoaderTest, ShippedSampleConfigParses) {
    const fs::path sample = fs::path(LLMGATE_SOURCE_DIR) / "config" / "llmgate.yaml";
    const auto     config = ConfigLoader::load(sample);
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_FALSE(config->prompt.extra_patterns.empty());
}
