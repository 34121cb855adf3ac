#pragma once

// ---------------------------------------------------------------------------
// gate_config.hpp
//
// 게이트 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/llmgate.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. 설정 파일에 키가 없으면 기본값이
//   그대로 적용되며, 기본값만으로도 안전한 게이트가 구성된다.
// - 기본 패턴 테이블은 코드(pattern_library)에 있고, 설정 파일은
//   추가 패턴과 임계값만 조정한다. 설정 실수로 기본 방어가 사라지지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GlobalSettings
//   log_level: "debug"|"info"|"warn"|"error"
// ---------------------------------------------------------------------------
struct GlobalSettings {
    std::string log_level{"info"};
    std::string log_path{"logs/llmgate.log"};
};

// ---------------------------------------------------------------------------
// PromptSettings
//   max_question_chars: 질문 최대 길이 (UTF-8 문자 수). 초과 시 LLM 호출 전 거부.
// ---------------------------------------------------------------------------
struct PromptSettings {
    std::uint32_t            max_question_chars{1000};
    std::vector<std::string> extra_patterns{};
};

// ---------------------------------------------------------------------------
// SqlSettings
//   max_query_bytes: 초과 시 violation (kHigh). 정규식 단계는 건너뛴다.
//   row_limit: LIMIT 이 없는 안전한 쿼리에 붙일 행 수 상한.
// ---------------------------------------------------------------------------
struct SqlSettings {
    std::size_t              max_query_bytes{10000};
    std::uint32_t            row_limit{1000};
    std::vector<std::string> extra_dangerous_patterns{};
    std::vector<std::string> extra_suspicious_patterns{};
};

// ---------------------------------------------------------------------------
// PiiSettings
//   min_confidence: 이 값 이상의 신뢰도를 가진 PII 유형만 적용. [0, 1]
// ---------------------------------------------------------------------------
struct PiiSettings {
    double min_confidence{0.7};
};

// ---------------------------------------------------------------------------
// BatchSettings
//   worker_threads: audit-sql 명령의 동시 검증 스레드 수 (0 = 하드웨어 동시성)
// ---------------------------------------------------------------------------
struct BatchSettings {
    std::uint32_t worker_threads{4};
};

// ---------------------------------------------------------------------------
// GateConfig
//   전체 설정의 루트. ConfigLoader::load 가 반환하는 최종 결과물.
// ---------------------------------------------------------------------------
struct GateConfig {
    GlobalSettings global{};
    PromptSettings prompt{};
    SqlSettings    sql{};
    PiiSettings    pii{};
    BatchSettings  batch{};
};
