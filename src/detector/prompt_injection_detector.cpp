// ---------------------------------------------------------------------------
// prompt_injection_detector.cpp
//
// 프롬프트 인젝션 탐지기 구현.
//
// [로그 정책]
// - 탐지 시 입력 원문은 로그에 남기지 않는다. SHA-256 앞 16자만 기록.
//   (원문을 남기면 로그 자체가 인젝션 페이로드 저장소가 된다)
// ---------------------------------------------------------------------------

#include "detector/prompt_injection_detector.hpp"

#include "common/digest.hpp"
#include "logger/structured_logger.hpp"

#include <cctype>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// whitespace_length
//   input[pos] 에서 시작하는 공백 문자의 바이트 길이. 공백이 아니면 0.
//   ASCII 공백/제어 구분자 외에 UTF-8 공백도 포함한다:
//   U+0085, U+00A0 (NBSP), U+1680, U+2000..U+200A, U+2028, U+2029,
//   U+202F, U+205F, U+3000 (전각 공백)
// ---------------------------------------------------------------------------
std::size_t whitespace_length(std::string_view input, std::size_t pos) {
    const auto byte_at = [&](std::size_t i) {
        return i < input.size() ? static_cast<unsigned char>(input[i]) : 0u;
    };

    const unsigned char b0 = byte_at(pos);
    if (std::isspace(b0) != 0 || (b0 >= 0x1C && b0 <= 0x1F)) {
        return 1;
    }

    const unsigned char b1 = byte_at(pos + 1);
    if (b0 == 0xC2 && (b1 == 0x85 || b1 == 0xA0)) {
        return 2;
    }

    const unsigned char b2 = byte_at(pos + 2);
    if (b0 == 0xE1 && b1 == 0x9A && b2 == 0x80) {
        return 3;
    }
    if (b0 == 0xE2 && b1 == 0x80 &&
        ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) {
        return 3;
    }
    if (b0 == 0xE2 && b1 == 0x81 && b2 == 0x9F) {
        return 3;
    }
    if (b0 == 0xE3 && b1 == 0x80 && b2 == 0x80) {
        return 3;
    }
    return 0;
}

bool is_blank(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const std::size_t len = whitespace_length(s, i);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// collapse_whitespace
// ---------------------------------------------------------------------------
std::string collapse_whitespace(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    bool        pending_space = false;
    std::size_t i             = 0;
    while (i < input.size()) {
        const std::size_t len = whitespace_length(input, i);
        if (len > 0) {
            pending_space = !result.empty();
            i += len;
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(input[i]);
        ++i;
    }
    return result;
}

// ---------------------------------------------------------------------------
// PromptInjectionDetector 생성자
// ---------------------------------------------------------------------------
PromptInjectionDetector::PromptInjectionDetector(const std::vector<std::string>& extra_patterns,
                                                 std::shared_ptr<StructuredLogger> audit)
    : audit_(std::move(audit))
{
    const auto specs = injection_pattern_specs();
    rules_.reserve(specs.size() + extra_patterns.size());

    for (const auto& spec : specs) {
        rules_.push_back(compile_rule(spec));
    }

    // 추가 패턴도 multiline 로 컴파일한다 (운영자가 ^ 를 줄 시작으로 기대).
    for (std::size_t i = 0; i < extra_patterns.size(); ++i) {
        const std::string name = "custom_" + std::to_string(i);
        rules_.push_back(PatternRule<InjectionCategory>{
            .name     = name,
            .source   = extra_patterns[i],
            .regex    = compile_pattern(name, extra_patterns[i], true),
            .category = InjectionCategory::kCustom,
            .weight   = 1.0,
        });
    }

    spdlog::info("prompt_injection_detector: {} rules loaded ({} custom)",
                 rules_.size(), extra_patterns.size());
}

bool PromptInjectionDetector::detect(std::string_view input) const {
    return inspect(input).detected;
}

// ---------------------------------------------------------------------------
// inspect: 첫 매칭에서 즉시 반환 (OR 합성)
// ---------------------------------------------------------------------------
InjectionResult PromptInjectionDetector::inspect(std::string_view input,
                                                 const RequestContext& context) const {
    if (input.empty() || is_blank(input)) {
        return InjectionResult{};
    }

    for (const auto& rule : rules_) {
        if (!rule.matches(input)) {
            continue;
        }

        const std::string input_hash = short_digest(input);
        spdlog::warn("prompt_injection_detector: injection attempt detected, rule={}, input_hash={}",
                     rule.name, input_hash);

        if (audit_) {
            audit_->log_injection(InjectionLog{
                .input_hash   = input_hash,
                .matched_rule = rule.name,
                .category     = std::string(injection_category_name(rule.category)),
                .user_id      = context.user_id,
                .timestamp    = std::chrono::system_clock::now(),
            });
        }

        return InjectionResult{true, rule.name, rule.category};
    }

    return InjectionResult{};
}

// ---------------------------------------------------------------------------
// sanitize: 탐지 → 오류, 아니면 공백 정규화만 수행
// ---------------------------------------------------------------------------
std::expected<std::string, PromptInjectionError>
PromptInjectionDetector::sanitize(std::string_view input, const RequestContext& context) const {
    const InjectionResult result = inspect(input, context);
    if (result.detected) {
        return std::unexpected(PromptInjectionError{
            .matched_rule = result.matched_rule,
            .category     = result.category,
        });
    }
    return collapse_whitespace(input);
}
