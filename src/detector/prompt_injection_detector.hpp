#pragma once

// ---------------------------------------------------------------------------
// prompt_injection_detector.hpp
//
// 정규식 패턴 기반 프롬프트 인젝션 탐지기. LLM 입력을 보호한다.
//
// [탐지 대상 (기본값, pattern_library 참고)]
// - 지시사항 무력화: "ignore previous instructions", "이전 지시사항을 무시"
// - 역할 사칭: 줄 시작의 "system:", "assistant:", "user:", "시스템:"
// - 입력 내 ``` 코드 블록, <|...|> 특수 토큰
// - 새 규칙 선언: "critical rules:", "response format", "응답 형식"
//
// [판정 정책]
// - 이진 판정. 패턴 하나라도 매칭되면 전체 입력을 거부한다.
//   신뢰도 누적이나 "안전한 부분집합" 개념이 없다 (fail-close).
// - 빈 입력/공백만 있는 입력은 인젝션이 아니다 (내용이 없으면 주입 불가).
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 유니코드 동형 문자(homoglyph), 전각 문자, 제로폭 공백 삽입은 탐지 불가.
// 2. 패러프레이즈 ("disregard what you were told") 는 패턴 목록에 없으면 미탐.
//    → 운영자가 config 의 prompt.extra_patterns 로 보강한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "patterns/pattern_library.hpp"
#include "patterns/pattern_rule.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

class StructuredLogger;

// ---------------------------------------------------------------------------
// InjectionResult
//   탐지 결과. matched_rule 은 감사 로그 전용이며 사용자에게 노출하지 않는다
//   (공격자 피드백 최소화).
// ---------------------------------------------------------------------------
struct InjectionResult {
    bool              detected{false};
    std::string       matched_rule{};
    InjectionCategory category{InjectionCategory::kCustom};
};

// ---------------------------------------------------------------------------
// PromptInjectionError
//   sanitize() 가 탐지된 입력에 대해 반환하는 오류 (InputRejected).
// ---------------------------------------------------------------------------
struct PromptInjectionError {
    std::string       matched_rule{};
    InjectionCategory category{InjectionCategory::kCustom};
    std::string       message{"prompt injection attempt detected"};
};

// ---------------------------------------------------------------------------
// PromptInjectionDetector
//   생성 시 기본 패턴 + 추가 패턴을 컴파일하고 detect()/sanitize() 에서 매칭.
//
//   [성능 고려사항]
//   - 생성자에서 RE2 컴파일 비용이 발생하므로 인스턴스를 재사용할 것.
//   - O(P * N). 길이 제한 없이 호출해도 안전하다. 질문 길이 상한은
//     SecurityGate 가 별도로 적용한다.
//
//   [스레드 안전성]
//   - 생성 후 불변. 모든 const 메서드는 동시 호출 안전.
// ---------------------------------------------------------------------------
class PromptInjectionDetector {
public:
    // extra_patterns: config 에서 로드한 추가 정규식 (kCustom 으로 분류)
    // audit: nullptr 이면 감사 이벤트를 기록하지 않는다.
    // 패턴 컴파일 실패 시 PatternCompileError.
    explicit PromptInjectionDetector(const std::vector<std::string>& extra_patterns = {},
                                     std::shared_ptr<StructuredLogger> audit = nullptr);

    // detect
    //   인젝션 의심 입력이면 true. 예외를 던지지 않는다.
    [[nodiscard]] bool detect(std::string_view input) const;

    // inspect
    //   detect() 와 같은 검사 + 매칭 규칙 정보. 첫 매칭에서 즉시 반환.
    //   context 는 감사 이벤트의 user_id 로만 사용된다.
    [[nodiscard]] InjectionResult inspect(std::string_view input,
                                          const RequestContext& context = {}) const;

    // sanitize
    //   탐지되면 PromptInjectionError (부분 정화 없음).
    //   아니면 앞뒤 공백 제거 + 연속 공백을 공백 하나로 축약.
    //   공백 외 문자와 그 순서는 변경하지 않는다.
    [[nodiscard]] std::expected<std::string, PromptInjectionError>
    sanitize(std::string_view input, const RequestContext& context = {}) const;

    [[nodiscard]] std::size_t rule_count() const noexcept { return rules_.size(); }

private:
    std::vector<PatternRule<InjectionCategory>> rules_;
    std::shared_ptr<StructuredLogger>           audit_;
};

// 연속 공백(NBSP, 전각 공백 등 UTF-8 공백 포함)을 공백 하나로 축약하고
// 앞뒤 공백을 제거한다.
[[nodiscard]] std::string collapse_whitespace(std::string_view input);
