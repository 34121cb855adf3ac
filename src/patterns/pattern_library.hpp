#pragma once

// ---------------------------------------------------------------------------
// pattern_library.hpp
//
// 분류기별 기본 규칙 테이블 (컴파일 전 정의).
// 각 분류기는 생성 시 이 테이블을 순서대로 컴파일한다.
//
// [순서 = 계약]
// - PII 테이블은 구체적인 패턴부터 나열한다 (주민등록번호가 계좌번호보다 앞).
//   마스킹은 이전 카테고리의 출력 위에서 다음 카테고리를 적용하므로
//   순서를 바꾸면 결과가 달라진다.
// - SQL/인젝션 테이블의 순서는 violation 메시지 순서를 결정한다.
//
// [오탐/미탐 트레이드오프]
// - 금지 키워드는 단어 경계로만 매칭한다. created_at 은 CREATE 로 탐지되지
//   않지만, comment 라는 컬럼명은 COMMENT 키워드로 탐지된다 (false positive).
// - 계좌번호 패턴(10~16자리 숫자)은 주민등록번호/카드번호와 겹친다.
//   기본 신뢰도 0.60 이 기본 임계값 0.7 보다 낮아 기본 설정에서는 비활성.
// ---------------------------------------------------------------------------

#include "patterns/pattern_rule.hpp"

#include <cstdint>
#include <span>
#include <string_view>

// 프롬프트 인젝션 규칙 분류
enum class InjectionCategory : std::uint8_t {
    kInstructionOverride = 0,  // "ignore previous instructions" 류
    kRoleSpoofing        = 1,  // system:/assistant:/user:, 시스템:/사용자: 등
    kCodeBlock           = 2,  // ``` 펜스 코드 블록
    kControlToken        = 3,  // <|...|> 특수 토큰
    kRuleDeclaration     = 4,  // "critical rules:", "response format"
    kCustom              = 5,  // 설정 파일에서 추가된 패턴
};

// SQL 규칙 분류
enum class SqlRuleCategory : std::uint8_t {
    kForbiddenKeyword  = 0,
    kStatementChaining = 1,
    kComment           = 2,
    kUnionSelect       = 3,
    kTautology         = 4,
    kTimingAttack      = 5,
    kFileAccess        = 6,
    kSystemCatalog     = 7,
    kCommentedScan     = 8,
    kCustom            = 9,
};

// ---------------------------------------------------------------------------
// PiiCategory
//   개인정보 유형. 선언 순서가 PII 테이블 적용 순서와 같다.
//   kGeneric 은 전용 마스킹 함수가 없는 유형(설정 확장 등)의 fallback.
// ---------------------------------------------------------------------------
enum class PiiCategory : std::uint8_t {
    kEmail          = 0,
    kPhone          = 1,
    kNationalId     = 2,  // 주민등록번호 (6-7 자리)
    kSsn            = 3,  // 3-2-4 형태
    kCreditCard     = 4,
    kIpAddress      = 5,
    kPassportNumber = 6,
    kBankAccount    = 7,
    kGeneric        = 8,
};

// 분석 코드(LLM 생성 Python) 금지 구문 분류
enum class CodeRuleCategory : std::uint8_t {
    kDangerousImport  = 0,
    kDynamicExecution = 1,
    kFileAccess       = 2,
    kIntrospection    = 3,
};

[[nodiscard]] std::string_view pii_category_name(PiiCategory category) noexcept;
[[nodiscard]] std::string_view injection_category_name(InjectionCategory category) noexcept;

[[nodiscard]] std::span<const PatternSpec<InjectionCategory>> injection_pattern_specs() noexcept;

// 단어 경계로 매칭되는 금지 키워드 (대문자)
[[nodiscard]] std::span<const std::string_view> forbidden_sql_keywords() noexcept;
[[nodiscard]] std::span<const PatternSpec<SqlRuleCategory>> dangerous_sql_pattern_specs() noexcept;
[[nodiscard]] std::span<const PatternSpec<SqlRuleCategory>> suspicious_sql_pattern_specs() noexcept;

// weight = 기본 신뢰도(confidence)
[[nodiscard]] std::span<const PatternSpec<PiiCategory>> pii_pattern_specs() noexcept;

[[nodiscard]] std::span<const PatternSpec<CodeRuleCategory>> code_pattern_specs() noexcept;
