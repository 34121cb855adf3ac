#pragma once

// ---------------------------------------------------------------------------
// security_gate.hpp
//
// 자연어 질문 → LLM → 생성된 SQL/코드 → 실행 → 결과 마스킹 파이프라인의
// 각 경계에 분류기를 배치하는 오케스트레이터.
//
// [처리 흐름: run_sql_analysis]
//   0. 폐기된 토큰                          → kRejected
//   1. 빈 질문 / 최대 길이 초과              → kRejected
//   2. 프롬프트 인젝션 (sanitize 실패)       → kRejected
//   3. LlmClient::generate 실패              → kFailed
//   4. 응답에서 SQL 추출
//   5. SqlValidator 판정이 실행 불가         → kBlocked (threat_level 포함)
//   6. QueryExecutor::execute 실패           → kFailed
//   7. 결과 PII 마스킹                        → kCompleted
//
// [Fail-close 원칙]
//   - GateResult 의 기본 상태는 kRejected. 모든 단계를 통과해야 kCompleted.
//   - LLM/실행기 실패는 재시도하지 않는다.
//
// [사용자 메시지 정책]
//   - user_message 는 상태별 고정 문구. 탐지된 패턴, 위반 목록, SQL 원문을
//     사용자에게 돌려주지 않는다 (공격자 피드백 최소화).
//   - 상세 사유는 audit_reasons 와 감사 로그에만 남는다.
//
// [스레드 안전성]
//   - 모든 협력자는 생성 후 불변이거나 자체 동기화된다.
//     run_*() 는 동시 호출 안전하다 (LlmClient/QueryExecutor 구현이 안전하다면).
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/gate_config.hpp"
#include "masking/data_value.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class PromptInjectionDetector;
class SqlValidator;
class CodeValidator;
class PiiMasker;
class StructuredLogger;
class GateStats;
class TokenBlacklist;

// ---------------------------------------------------------------------------
// LlmClient
//   외부 LLM 호출 추상화. 실패 시 오류 문자열 (감사 로그 전용).
// ---------------------------------------------------------------------------
class LlmClient {
public:
    virtual ~LlmClient() = default;

    [[nodiscard]] virtual std::expected<std::string, std::string>
    generate(std::string_view prompt) = 0;
};

// ---------------------------------------------------------------------------
// QueryExecutor
//   검증을 통과한 SQL 을 실행하는 외부 실행기 추상화.
//   SqlValidationResult::is_execution_allowed() 일 때만 호출된다.
// ---------------------------------------------------------------------------
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    [[nodiscard]] virtual std::expected<DataValue, std::string>
    execute(std::string_view sql) = 0;
};

enum class GateStatus : std::uint8_t {
    kCompleted = 0,
    kRejected  = 1,  // 입력 단계 거부 (InputRejected)
    kBlocked   = 2,  // 출력 단계 차단 (OutputBlocked)
    kFailed    = 3,  // 협력자 실패
};

[[nodiscard]] std::string_view gate_status_name(GateStatus status) noexcept;

// ---------------------------------------------------------------------------
// GateResult
//   rows 는 마스킹된 결과만 담는다. 원본 행과 PII 원문은 반환하지 않는다.
// ---------------------------------------------------------------------------
struct GateResult {
    GateStatus                 status{GateStatus::kRejected};
    std::string                user_message{};
    std::vector<std::string>   audit_reasons{};
    ThreatLevel                threat_level{ThreatLevel::kLow};
    std::optional<std::string> sql{};         // LIMIT 정규화된 SQL
    std::optional<std::string> code{};        // 검증된 분석 코드
    std::vector<std::string>   warnings{};
    std::optional<DataValue>   rows{};        // 마스킹된 실행 결과
    std::uint32_t              pii_masked_count{0};

    [[nodiscard]] bool completed() const noexcept { return status == GateStatus::kCompleted; }
};

// ---------------------------------------------------------------------------
// SecurityGateDeps
//   필수: detector, sql_validator, code_validator, masker, llm
//   선택: executor (없으면 SQL 실행 단계가 kFailed), audit, stats, blacklist
// ---------------------------------------------------------------------------
struct SecurityGateDeps {
    std::shared_ptr<const PromptInjectionDetector> detector{};
    std::shared_ptr<const SqlValidator>            sql_validator{};
    std::shared_ptr<const CodeValidator>           code_validator{};
    std::shared_ptr<const PiiMasker>               masker{};
    std::shared_ptr<LlmClient>                     llm{};
    std::shared_ptr<QueryExecutor>                 executor{};
    std::shared_ptr<StructuredLogger>              audit{};
    std::shared_ptr<GateStats>                     stats{};
    std::shared_ptr<const TokenBlacklist>          blacklist{};
};

class SecurityGate {
public:
    // 필수 의존성이 없으면 std::invalid_argument.
    SecurityGate(SecurityGateDeps deps, PromptSettings prompt_settings = {});

    ~SecurityGate() = default;

    SecurityGate(const SecurityGate&)            = delete;
    SecurityGate& operator=(const SecurityGate&) = delete;

    [[nodiscard]] GateResult run_sql_analysis(std::string_view question,
                                              const RequestContext& context = {});

    // 검증된 코드를 반환할 뿐 실행하지 않는다 (샌드박스는 외부 책임).
    [[nodiscard]] GateResult run_code_analysis(std::string_view question,
                                               const RequestContext& context = {});

private:
    // 0~3 단계 공통 처리. 성공 시 LLM 응답 원문.
    // preamble 뒤에 정화된 질문을 붙여 프롬프트를 만든다.
    [[nodiscard]] std::expected<std::string, GateResult>
    admit_and_generate(std::string_view question,
                       const RequestContext& context,
                       std::string_view preamble);

    GateResult finish(GateResult result,
                      std::string_view operation,
                      const RequestContext& context,
                      std::chrono::steady_clock::time_point started) const;

    SecurityGateDeps deps_;
    PromptSettings   prompt_settings_;
};

// ---------------------------------------------------------------------------
// extract_generated_code
//   LLM 응답에서 코드 본문을 꺼낸다.
//   1. 첫 ``` 펜스 블록 (첫 줄이 언어 태그면 제외)
//   2. 응답이 JSON 객체이고 json_key 가 문자열이면 그 값
//   3. 그 외에는 앞뒤 공백을 제거한 응답 전체
// ---------------------------------------------------------------------------
[[nodiscard]] std::string extract_generated_code(std::string_view response,
                                                 std::string_view json_key);
