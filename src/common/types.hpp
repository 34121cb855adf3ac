#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// RequestContext
//   요청 하나를 식별하는 불변 컨텍스트.
//   요청 핸들러가 생성하고 detector/masking/logger 레이어에 const-ref 로 전달한다.
//   token_hash 외의 필드는 감사 로그 상관관계(correlation) 용도로만 사용한다.
// ---------------------------------------------------------------------------
struct RequestContext {
    std::string user_id{};        // 인증된 사용자 ID (빈값 = 익명/미상)
    std::string connection_id{};  // 대상 데이터베이스 연결 ID
    std::string query_id{};       // 질의 이력 ID
    std::string token_hash{};     // 인증 토큰 해시 (TokenBlacklist 조회용, 로그 기록 금지)
};

// ---------------------------------------------------------------------------
// ThreatLevel
//   보안 위협 수준. 전순서(total order) 를 가지며, 한 번의 검증에서
//   도달한 최고 수준이 최종 판정 수준이 된다.
//   kCritical 은 금지 키워드/비 SELECT 구문 전용이다.
// ---------------------------------------------------------------------------
enum class ThreatLevel : std::uint8_t {
    kLow      = 0,
    kMedium   = 1,
    kHigh     = 2,
    kCritical = 3,
};

// 두 수준 중 높은 쪽을 반환한다.
[[nodiscard]] constexpr ThreatLevel raise_to(ThreatLevel current, ThreatLevel floor) noexcept {
    return static_cast<std::uint8_t>(current) >= static_cast<std::uint8_t>(floor) ? current : floor;
}

[[nodiscard]] constexpr std::string_view threat_level_name(ThreatLevel level) noexcept {
    switch (level) {
        case ThreatLevel::kLow:      return "low";
        case ThreatLevel::kMedium:   return "medium";
        case ThreatLevel::kHigh:     return "high";
        case ThreatLevel::kCritical: return "critical";
    }
    return "unknown";
}
