#pragma once

// ---------------------------------------------------------------------------
// sql_validator.hpp
//
// LLM 이 생성한 SQL 을 실행 전에 검증하는 보안 검증기.
// 읽기 전용(SELECT) 쿼리만 통과시키고, 통과한 쿼리에는 행 수 상한을 붙인다.
//
// [검증 단계 (고정 순서, 각 단계는 violations/warnings 에 추가만 한다)]
// 1. 빈 SQL                  → kCritical, 즉시 반환
// 2. 금지 키워드 (단어 경계)  → violation, kCritical
// 3. 위험 패턴               → violation, 최소 kHigh
// 4. 의심 패턴               → warning 만, kLow 이면 kMedium
// 5. 주석 제거 후 첫 키워드가 SELECT 가 아니면 → violation, kCritical
// 6. 최대 길이 초과          → violation, 최소 kHigh
// 7. violation 이 없으면 LIMIT 정규화
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 토큰화가 아닌 정규식 기반이므로 문자열 리터럴 안의 키워드도 탐지한다
//    (예: WHERE memo = 'please update' → UPDATE 로 차단, false positive).
// 2. WITH ... SELECT (CTE) 는 첫 키워드가 WITH 이므로 차단된다.
// 3. 인코딩 우회 (hex 리터럴, CHAR() 조합) 는 탐지하지 못한다.
//    실행 계정의 DB 권한을 읽기 전용으로 제한하는 것이 최종 방어선이다.
//
// [실패 정책]
// - 예외를 던지지 않는다. 항상 SqlValidationResult 를 반환한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/gate_config.hpp"
#include "patterns/pattern_library.hpp"
#include "patterns/pattern_rule.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class StructuredLogger;

// ---------------------------------------------------------------------------
// SqlValidationResult
//   불변식: is_safe == violations.empty()
//           sanitized_sql 은 is_safe 일 때만 값이 있다.
//   violations/warnings 는 서버 측 감사 용도. 사용자에게 그대로 노출 금지.
// ---------------------------------------------------------------------------
struct SqlValidationResult {
    bool                       is_safe{false};
    ThreatLevel                threat_level{ThreatLevel::kCritical};
    std::vector<std::string>   violations{};
    std::vector<std::string>   warnings{};
    std::optional<std::string> sanitized_sql{};

    [[nodiscard]] bool has_violations() const noexcept { return !violations.empty(); }

    // kCritical 은 is_safe == true 와 공존할 수 없으므로 사실상 is_safe 와 같다.
    [[nodiscard]] bool is_execution_allowed() const noexcept {
        return is_safe && threat_level != ThreatLevel::kCritical;
    }
};

// ---------------------------------------------------------------------------
// SqlValidator
//
//   [스레드 안전성]
//   - 생성 후 불변. validate() 는 동시 호출 안전 (BatchAuditor 가 공유).
// ---------------------------------------------------------------------------
class SqlValidator {
public:
    // settings 의 추가 패턴 컴파일 실패 시 PatternCompileError.
    explicit SqlValidator(SqlSettings settings = {},
                          std::shared_ptr<StructuredLogger> audit = nullptr);

    [[nodiscard]] SqlValidationResult validate(std::string_view sql,
                                               const RequestContext& context = {}) const;

    [[nodiscard]] const SqlSettings& settings() const noexcept { return settings_; }

private:
    void check_forbidden_keywords(std::string_view sql,
                                  std::vector<std::string>& violations) const;
    void check_dangerous_patterns(std::string_view sql,
                                  std::vector<std::string>& violations) const;
    void check_suspicious_patterns(std::string_view sql,
                                   std::vector<std::string>& warnings) const;

    [[nodiscard]] std::string ensure_limit_clause(std::string_view sql) const;

    void log_security_event(std::string_view sql,
                            const SqlValidationResult& result,
                            const RequestContext& context) const;

    SqlSettings                               settings_;
    std::vector<PatternRule<SqlRuleCategory>> keyword_rules_;
    std::vector<PatternRule<SqlRuleCategory>> dangerous_rules_;
    std::vector<PatternRule<SqlRuleCategory>> suspicious_rules_;
    std::shared_ptr<const re2::RE2>           limit_clause_;
    std::shared_ptr<StructuredLogger>         audit_;
};

// ---------------------------------------------------------------------------
// 헬퍼 (테스트에서 직접 사용)
// ---------------------------------------------------------------------------

// /* ... */ 블록 주석과 -- 줄 주석을 제거한다. 블록 주석 자리에는 공백 하나.
[[nodiscard]] std::string strip_sql_comments(std::string_view sql);

// 주석 제거된 SQL 의 첫 키워드 (대문자). 없으면 빈 문자열.
[[nodiscard]] std::string first_sql_keyword(std::string_view sql);
