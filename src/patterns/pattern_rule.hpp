#pragma once

// ---------------------------------------------------------------------------
// pattern_rule.hpp
//
// 정규식 규칙 하나를 표현하는 불변 타입과 컴파일 헬퍼.
// 세 분류기(prompt injection / SQL / PII)의 공통 leaf 의존성.
//
// [설계 원칙]
// - 규칙은 프로세스 시작 시 한 번 컴파일되고 이후 변경되지 않는다.
//   컴파일된 re2::RE2 는 shared_ptr<const> 로 공유되므로 여러 요청
//   스레드에서 잠금 없이 동시에 읽을 수 있다.
// - 엔진은 RE2 다. 매칭 시간은 입력 길이에 선형이고 스택 사용량은
//   입력 길이와 무관하다. 호출자는 길이 제한 없이 매칭해도 된다.
// - RE2 는 UTF-8 단위로 동작한다. 역참조와 lookaround 는 지원하지 않으며
//   그런 패턴은 컴파일 오류다.
// - 컴파일 실패는 설정 오류다. 실패한 규칙을 건너뛰고 계속하지 않는다.
//   일부 규칙만 적재된 상태로 서비스를 시작하면 탐지 범위가 조용히
//   줄어들기 때문에 PatternCompileError 로 생성 자체를 실패시킨다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <re2/re2.h>

// ---------------------------------------------------------------------------
// PatternCompileError
//   규칙 컴파일 실패 (ConfigurationError).
//   what() 에는 규칙 이름과 RE2 오류 설명이 포함된다.
// ---------------------------------------------------------------------------
class PatternCompileError : public std::runtime_error {
public:
    PatternCompileError(std::string rule_name, const std::string& detail);

    [[nodiscard]] const std::string& rule_name() const noexcept { return rule_name_; }

private:
    std::string rule_name_;
};

// compile_pattern
//   대소문자 무시로 컴파일한다. multiline = true 이면 ^/$ 가 줄 단위로
//   매칭된다 (역할 사칭 패턴처럼 줄 시작을 기준으로 하는 규칙용).
//   실패 시 PatternCompileError 를 던진다.
[[nodiscard]] std::shared_ptr<const re2::RE2>
compile_pattern(std::string_view rule_name, std::string_view source, bool multiline = false);

// 비앵커 검색을 string_view 에 대해 수행한다.
[[nodiscard]] bool search_view(const re2::RE2& re, std::string_view text);

// 매칭 구간 (바이트 offset, 길이)
struct MatchSpan {
    std::size_t offset{0};
    std::size_t length{0};
};

// find_all
//   겹치지 않는 모든 매칭을 왼쪽부터 수집한다. 빈 매칭은 건너뛴다.
//   \b 와 ^ 는 검색 시작 위치 앞의 문맥을 보고 판정된다.
[[nodiscard]] std::vector<MatchSpan> find_all(const re2::RE2& re, std::string_view text);

// ---------------------------------------------------------------------------
// PatternSpec
//   컴파일 전 규칙 정의 (정적 테이블 행).
//   weight: 심각도/신뢰도 가중치 [0, 1]. PII 규칙에서는 confidence 로 사용.
// ---------------------------------------------------------------------------
template <typename Category>
struct PatternSpec {
    std::string_view name;
    std::string_view source;
    Category         category;
    double           weight{1.0};
    bool             multiline{false};
};

// ---------------------------------------------------------------------------
// PatternRule
//   컴파일된 규칙. 생성 후 불변.
// ---------------------------------------------------------------------------
template <typename Category>
struct PatternRule {
    std::string                        name{};
    std::string                        source{};   // 원본 패턴 (감사 로그용)
    std::shared_ptr<const re2::RE2>    regex{};
    Category                           category{};
    double                             weight{1.0};

    [[nodiscard]] bool matches(std::string_view text) const {
        return regex && search_view(*regex, text);
    }
};

template <typename Category>
[[nodiscard]] PatternRule<Category> compile_rule(const PatternSpec<Category>& spec) {
    return PatternRule<Category>{
        .name     = std::string(spec.name),
        .source   = std::string(spec.source),
        .regex    = compile_pattern(spec.name, spec.source, spec.multiline),
        .category = spec.category,
        .weight   = spec.weight,
    };
}
