// ---------------------------------------------------------------------------
// test_code_validator.cpp
//
// CodeValidator 단위 테스트.
//
// [테스트 범위]
// - pandas 분석 코드 통과
// - 시스템 모듈 import, 동적 실행, 파일 접근, 네임스페이스 조회 차단
// - 빈 코드는 안전하지 않음
//
// [오탐/미탐 트레이드오프]
// - 정규식 기반이라 getattr(__builtins__, "ev" + "al") 같은 문자열 조립은 미탐.
//   실행 격리는 샌드박스 책임이다.
// ---------------------------------------------------------------------------

#include "detector/code_validator.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>

namespace {

bool has_violation(const CodeValidationResult& result, const std::string& rule) {
    const std::string expected = "forbidden code construct: " + rule;
    return std::find(result.violations.begin(), result.violations.end(), expected) !=
           result.violations.end();
}

}  // namespace

TEST(CodeValidator, PandasCodeIsSafe) {
    const CodeValidator validator;
    const auto result = validator.validate(
        "import pandas as pd\n"
        "df = pd.DataFrame(rows)\n"
        "summary = df.groupby('region')['revenue'].sum()\n");

    EXPECT_TRUE(result.is_safe);
    EXPECT_TRUE(result.violations.empty());
}

TEST(CodeValidator, DangerousImportBlocked) {
    const CodeValidator validator;

    const auto plain = validator.validate("import os\nos.listdir('/')");
    EXPECT_FALSE(plain.is_safe);
    EXPECT_TRUE(has_violation(plain, "dangerous_import"));

    const auto from = validator.validate("from subprocess import run");
    EXPECT_FALSE(from.is_safe);
    EXPECT_TRUE(has_violation(from, "dangerous_from_import"));
}

TEST(CodeValidator, DynamicExecutionBlocked) {
    const CodeValidator validator;
    EXPECT_TRUE(has_violation(validator.validate("eval('1+1')"), "eval_call"));
    EXPECT_TRUE(has_violation(validator.validate("exec (code)"), "exec_call"));
    EXPECT_TRUE(has_violation(validator.validate("m = __import__('os')"), "dunder_import"));
}

TEST(CodeValidator, FileAccessAndIntrospectionBlocked) {
    const CodeValidator validator;
    EXPECT_TRUE(has_violation(validator.validate("open('/etc/passwd').read()"), "open_call"));
    EXPECT_TRUE(has_violation(validator.validate("print(globals())"), "globals_call"));
}

TEST(CodeValidator, MultipleViolationsReported) {
    const CodeValidator validator;
    const auto result = validator.validate("import sys\neval(sys.argv[1])");
    EXPECT_FALSE(result.is_safe);
    EXPECT_GE(result.violations.size(), 2u);
}

TEST(CodeValidator, IdentifiersContainingRuleWordsPass) {
    const CodeValidator validator;
    const auto result = validator.validate("evaluation = df['open_price'].mean()");
    EXPECT_TRUE(result.is_safe) << "evaluation / open_price are not calls";
}

TEST(CodeValidator, EmptyCodeIsUnsafe) {
    const CodeValidator validator;
    for (const std::string code : {"", "  \n "}) {
        const auto result = validator.validate(code);
        EXPECT_FALSE(result.is_safe);
        ASSERT_EQ(result.violations.size(), 1u);
        EXPECT_EQ(result.violations[0], "empty code is not allowed");
    }
}
