#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 보안 이벤트 구조화 로그 타입 정의.
//
// [민감정보 취급 원칙]
// - 어떤 로그 타입도 원문 사용자 입력, 원문 SQL, PII 값을 담지 않는다.
//   원문은 *_hash (SHA-256 앞 16자) 로만 식별한다.
// - violations / warnings 는 규칙 이름 기반 메시지이며 입력 단편을
//   포함하지 않는다.
//
// [순환 의존성 방지 설계]
// - ThreatLevel 외 detector/masking 타입을 include 하지 않는다.
// - status_raw: 호출자가 static_cast<uint8_t>(GateStatus) 로 변환
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// InjectionLog
//   프롬프트 인젝션 탐지 이벤트.
// ---------------------------------------------------------------------------
struct InjectionLog {
    std::string                            input_hash{};
    std::string                            matched_rule{};  // 규칙 이름 (패턴 원문 아님)
    std::string                            category{};
    std::string                            user_id{};
    std::chrono::system_clock::time_point  timestamp{};
};

// ---------------------------------------------------------------------------
// SqlValidationLog
//   SQL 검증 결과 이벤트. 위반 → error, 경고만 → warn, 통과 → info.
// ---------------------------------------------------------------------------
struct SqlValidationLog {
    std::string                            sql_hash{};
    ThreatLevel                            threat_level{ThreatLevel::kLow};
    std::vector<std::string>               violations{};
    std::vector<std::string>               warnings{};
    std::string                            user_id{};
    std::string                            connection_id{};
    std::chrono::system_clock::time_point  timestamp{};
};

// ---------------------------------------------------------------------------
// MaskingLog
//   PII 마스킹 요약. 유형별 건수만 기록한다.
// ---------------------------------------------------------------------------
struct MaskingLog {
    std::vector<std::pair<std::string, std::uint32_t>> counts{};  // (유형, 건수)
    std::uint32_t                                      total{0};
    std::string                                        user_id{};
    std::string                                        query_id{};
    std::chrono::system_clock::time_point              timestamp{};
};

// ---------------------------------------------------------------------------
// CodeValidationLog
//   분석 코드 검증 실패 이벤트.
// ---------------------------------------------------------------------------
struct CodeValidationLog {
    std::string                            code_hash{};
    std::vector<std::string>               violations{};
    std::string                            user_id{};
    std::chrono::system_clock::time_point  timestamp{};
};

// ---------------------------------------------------------------------------
// GateDecisionLog
//   게이트 최종 판정 (요청 1건당 1회).
// ---------------------------------------------------------------------------
struct GateDecisionLog {
    std::string                            operation{};     // "sql_analysis" | "code_analysis"
    std::uint8_t                           status_raw{0};   // GateStatus as uint8_t
    std::string                            status{};        // 사람이 읽을 수 있는 상태명
    ThreatLevel                            threat_level{ThreatLevel::kLow};
    std::string                            user_id{};
    std::chrono::system_clock::time_point  timestamp{};
    std::chrono::microseconds              duration{0};
};
