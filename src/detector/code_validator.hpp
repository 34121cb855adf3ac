#pragma once

// ---------------------------------------------------------------------------
// code_validator.hpp
//
// LLM 이 생성한 분석 코드(Python)를 외부 샌드박스로 넘기기 전에 검사한다.
// 실행은 이 프로세스의 책임이 아니다. 여기서는 금지 구문 여부만 판정한다.
//
// [금지 구문]
// - import os / sys / subprocess / shutil (from ... import 포함)
// - exec( eval( compile( __import__( open( globals( locals(
//
// [설계 한계]
// - 문자열 조합 (getattr(__builtins__, "ev" + "al")) 은 탐지하지 못한다.
//   샌드박스 격리가 최종 방어선이다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "patterns/pattern_library.hpp"
#include "patterns/pattern_rule.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

class StructuredLogger;

struct CodeValidationResult {
    bool                     is_safe{false};
    std::vector<std::string> violations{};
};

class CodeValidator {
public:
    explicit CodeValidator(std::shared_ptr<StructuredLogger> audit = nullptr);

    // 빈 코드는 안전하지 않다. 예외를 던지지 않는다.
    [[nodiscard]] CodeValidationResult validate(std::string_view code,
                                                const RequestContext& context = {}) const;

private:
    std::vector<PatternRule<CodeRuleCategory>> rules_;
    std::shared_ptr<StructuredLogger>          audit_;
};
