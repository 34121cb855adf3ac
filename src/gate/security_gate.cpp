// ---------------------------------------------------------------------------
// security_gate.cpp
//
// 보안 게이트 오케스트레이터 구현.
//
// [로그 정책]
// - 요청 1건당 gate_decision 이벤트 1회. 질문/SQL 원문은 기록하지 않는다.
// - 협력자 오류 문자열은 audit_reasons 에만 담고 사용자 메시지와 분리한다.
// ---------------------------------------------------------------------------

#include "gate/security_gate.hpp"

#include "auth/token_blacklist.hpp"
#include "common/digest.hpp"
#include "detector/code_validator.hpp"
#include "detector/prompt_injection_detector.hpp"
#include "detector/sql_validator.hpp"
#include "logger/structured_logger.hpp"
#include "masking/pii_masker.hpp"
#include "masking/yaml_codec.hpp"
#include "stats/gate_stats.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

constexpr std::string_view kRejectedMessage =
    "The request could not be processed.";
constexpr std::string_view kBlockedMessage =
    "The generated query was blocked by the security policy.";
constexpr std::string_view kFailedMessage =
    "The analysis could not be completed. Please try again later.";
constexpr std::string_view kCompletedMessage =
    "The analysis completed successfully.";

constexpr std::string_view kSqlPreamble =
    "You translate analytics questions into a single read-only SQL SELECT statement.\n"
    "Return only the SQL inside a ```sql fenced block.\n";

constexpr std::string_view kCodePreamble =
    "You write Python (pandas) code that answers an analytics question.\n"
    "Do not import os, sys, subprocess or shutil and do not read or write files.\n"
    "Return only the code inside a ```python fenced block.\n";

// 한 줄 펜스(```sql SELECT 1```)에서 떼어낼 언어 태그
constexpr std::array<std::string_view, 8> kFenceLanguageTags{{
    "sql", "mysql", "postgresql", "postgres", "sqlite", "python", "python3", "py",
}};

bool is_fence_language_tag(std::string_view word) {
    return std::any_of(kFenceLanguageTags.begin(), kFenceLanguageTags.end(),
                       [word](std::string_view tag) {
                           return tag.size() == word.size() &&
                                  std::equal(tag.begin(), tag.end(), word.begin(),
                                             [](char a, char b) {
                                                 return a == std::tolower(static_cast<unsigned char>(b));
                                             });
                       });
}

std::string_view trim_view(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
        s.remove_suffix(1);
    }
    return s;
}

// UTF-8 코드 포인트 수 (연속 바이트 10xxxxxx 는 세지 않는다)
std::size_t utf8_length(std::string_view s) {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](unsigned char c) {
        return (c & 0xC0U) != 0x80U;
    }));
}

std::string_view message_for(GateStatus status) {
    switch (status) {
        case GateStatus::kCompleted: return kCompletedMessage;
        case GateStatus::kRejected:  return kRejectedMessage;
        case GateStatus::kBlocked:   return kBlockedMessage;
        case GateStatus::kFailed:    return kFailedMessage;
    }
    return kRejectedMessage;
}

GateResult make_result(GateStatus status, std::string reason,
                       ThreatLevel level = ThreatLevel::kLow) {
    GateResult result;
    result.status       = status;
    result.user_message = std::string(message_for(status));
    result.threat_level = level;
    if (!reason.empty()) {
        result.audit_reasons.push_back(std::move(reason));
    }
    return result;
}

}  // namespace

std::string_view gate_status_name(GateStatus status) noexcept {
    switch (status) {
        case GateStatus::kCompleted: return "completed";
        case GateStatus::kRejected:  return "rejected";
        case GateStatus::kBlocked:   return "blocked";
        case GateStatus::kFailed:    return "failed";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// extract_generated_code
// ---------------------------------------------------------------------------
std::string extract_generated_code(std::string_view response, std::string_view json_key) {
    constexpr std::string_view kFence = "```";

    const std::size_t open = response.find(kFence);
    if (open != std::string_view::npos) {
        const std::size_t close = response.find(kFence, open + kFence.size());
        if (close != std::string_view::npos) {
            std::string_view inner = response.substr(open + kFence.size(),
                                                     close - open - kFence.size());
            // 첫 줄이 언어 태그 (```sql, ```python) 면 건너뛴다.
            const std::size_t line_end = inner.find('\n');
            if (line_end != std::string_view::npos) {
                const std::string_view tag = inner.substr(0, line_end);
                const bool is_tag = std::all_of(tag.begin(), tag.end(), [](unsigned char c) {
                    return std::isalnum(c) != 0 || c == '_' || c == '-' || c == '\r';
                });
                if (is_tag) {
                    inner.remove_prefix(line_end + 1);
                }
            } else {
                // 한 줄 펜스: 알려진 언어 태그 + 공백으로 시작하면 태그를 뗀다.
                const std::string_view body     = trim_view(inner);
                const std::size_t      word_end = body.find_first_of(" \t");
                if (word_end != std::string_view::npos &&
                    is_fence_language_tag(body.substr(0, word_end))) {
                    inner = body.substr(word_end + 1);
                }
            }
            return std::string(trim_view(inner));
        }
    }

    const std::string_view trimmed = trim_view(response);
    if (!trimmed.empty() && trimmed.front() == '{') {
        auto parsed = parse_yaml(trimmed);
        if (parsed && parsed->is_map()) {
            const DataValue* value = parsed->find(json_key);
            if (value != nullptr && value->is_string()) {
                return std::string(trim_view(value->as_string()));
            }
        }
    }

    return std::string(trimmed);
}

// ---------------------------------------------------------------------------
// SecurityGate 생성자
// ---------------------------------------------------------------------------
SecurityGate::SecurityGate(SecurityGateDeps deps, PromptSettings prompt_settings)
    : deps_(std::move(deps))
    , prompt_settings_(std::move(prompt_settings))
{
    if (!deps_.detector || !deps_.sql_validator || !deps_.code_validator ||
        !deps_.masker || !deps_.llm) {
        throw std::invalid_argument(
            "security_gate: detector, sql_validator, code_validator, masker and llm are required");
    }
    if (!deps_.executor) {
        spdlog::warn("security_gate: no query executor configured, sql analysis will not execute");
    }
}

// ---------------------------------------------------------------------------
// admit_and_generate (단계 0~3)
// ---------------------------------------------------------------------------
std::expected<std::string, GateResult>
SecurityGate::admit_and_generate(std::string_view question,
                                 const RequestContext& context,
                                 std::string_view preamble) {
    if (deps_.blacklist && !context.token_hash.empty() &&
        deps_.blacklist->contains(context.token_hash)) {
        return std::unexpected(make_result(GateStatus::kRejected, "revoked token"));
    }

    if (trim_view(question).empty()) {
        return std::unexpected(make_result(GateStatus::kRejected, "empty question"));
    }
    if (utf8_length(question) > prompt_settings_.max_question_chars) {
        return std::unexpected(make_result(
            GateStatus::kRejected,
            fmt::format("question exceeds maximum length of {} characters",
                        prompt_settings_.max_question_chars)));
    }

    auto sanitized = deps_.detector->sanitize(question, context);
    if (!sanitized) {
        return std::unexpected(make_result(
            GateStatus::kRejected,
            fmt::format("{} (rule={})", sanitized.error().message, sanitized.error().matched_rule),
            ThreatLevel::kHigh));
    }

    const std::string prompt = fmt::format("{}Question: {}\n", preamble, *sanitized);
    auto response = deps_.llm->generate(prompt);
    if (!response) {
        spdlog::error("security_gate: llm call failed, question_hash={}", short_digest(question));
        return std::unexpected(make_result(
            GateStatus::kFailed, fmt::format("llm call failed: {}", response.error())));
    }
    return std::move(*response);
}

// ---------------------------------------------------------------------------
// run_sql_analysis
// ---------------------------------------------------------------------------
GateResult SecurityGate::run_sql_analysis(std::string_view question,
                                          const RequestContext& context) {
    const auto started = std::chrono::steady_clock::now();
    if (deps_.stats) {
        deps_.stats->on_request();
    }

    auto response = admit_and_generate(question, context, kSqlPreamble);
    if (!response) {
        return finish(std::move(response.error()), "sql_analysis", context, started);
    }

    // 4~5. SQL 추출 및 검증
    const std::string         sql     = extract_generated_code(*response, "sql");
    const SqlValidationResult verdict = deps_.sql_validator->validate(sql, context);
    if (!verdict.is_execution_allowed()) {
        GateResult blocked = make_result(GateStatus::kBlocked, "", verdict.threat_level);
        blocked.audit_reasons = verdict.violations;
        return finish(std::move(blocked), "sql_analysis", context, started);
    }

    // 6. 실행
    if (!deps_.executor) {
        return finish(make_result(GateStatus::kFailed, "no query executor configured"),
                      "sql_analysis", context, started);
    }
    auto rows = deps_.executor->execute(*verdict.sanitized_sql);
    if (!rows) {
        return finish(make_result(GateStatus::kFailed,
                                  fmt::format("query execution failed: {}", rows.error()),
                                  verdict.threat_level),
                      "sql_analysis", context, started);
    }

    // 7. 결과 마스킹
    MaskingResult masking = deps_.masker->mask(*rows, context);

    GateResult completed       = make_result(GateStatus::kCompleted, "", verdict.threat_level);
    completed.sql              = verdict.sanitized_sql;
    completed.warnings         = verdict.warnings;
    completed.rows             = std::move(masking.masked);
    completed.pii_masked_count = static_cast<std::uint32_t>(masking.findings.size());
    return finish(std::move(completed), "sql_analysis", context, started);
}

// ---------------------------------------------------------------------------
// run_code_analysis
// ---------------------------------------------------------------------------
GateResult SecurityGate::run_code_analysis(std::string_view question,
                                           const RequestContext& context) {
    const auto started = std::chrono::steady_clock::now();
    if (deps_.stats) {
        deps_.stats->on_request();
    }

    auto response = admit_and_generate(question, context, kCodePreamble);
    if (!response) {
        return finish(std::move(response.error()), "code_analysis", context, started);
    }

    std::string                code    = extract_generated_code(*response, "code");
    const CodeValidationResult verdict = deps_.code_validator->validate(code, context);
    if (!verdict.is_safe) {
        GateResult blocked    = make_result(GateStatus::kBlocked, "", ThreatLevel::kHigh);
        blocked.audit_reasons = verdict.violations;
        return finish(std::move(blocked), "code_analysis", context, started);
    }

    GateResult completed = make_result(GateStatus::kCompleted, "");
    completed.code       = std::move(code);
    return finish(std::move(completed), "code_analysis", context, started);
}

// ---------------------------------------------------------------------------
// finish: 통계 + 판정 로그
// ---------------------------------------------------------------------------
GateResult SecurityGate::finish(GateResult result,
                                std::string_view operation,
                                const RequestContext& context,
                                std::chrono::steady_clock::time_point started) const {
    if (deps_.stats) {
        switch (result.status) {
            case GateStatus::kCompleted: deps_.stats->on_completed(result.pii_masked_count > 0); break;
            case GateStatus::kRejected:  deps_.stats->on_rejected(); break;
            case GateStatus::kBlocked:   deps_.stats->on_blocked();  break;
            case GateStatus::kFailed:    deps_.stats->on_failed();   break;
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (result.status != GateStatus::kCompleted) {
        spdlog::info("security_gate: {} {} (threat={}, reasons={})",
                     operation, gate_status_name(result.status),
                     threat_level_name(result.threat_level), result.audit_reasons.size());
    }

    if (deps_.audit) {
        deps_.audit->log_decision(GateDecisionLog{
            .operation    = std::string(operation),
            .status_raw   = static_cast<std::uint8_t>(result.status),
            .status       = std::string(gate_status_name(result.status)),
            .threat_level = result.threat_level,
            .user_id      = context.user_id,
            .timestamp    = std::chrono::system_clock::now(),
            .duration     = elapsed,
        });
    }
    return result;
}
