#pragma once

// ---------------------------------------------------------------------------
// gate_stats.hpp
//
// 게이트 판정 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_* 갱신 메서드: 요청 경로에서 concurrent 호출 안전 (atomic, relaxed).
// - snapshot(): 조회 경로. 갱신 경로와 mutex 없이 읽는다.
//   카운터 간 원자적 일관성은 보장하지 않는다 (근사치 스냅샷).
//
// [격리 원칙]
// - 통계 갱신 실패가 판정 경로로 전파되지 않도록 모든 갱신 메서드는 noexcept.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// GateStatsSnapshot
//   block_rate: (rejected + blocked) / total_requests (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct GateStatsSnapshot {
    std::uint64_t                          total_requests{0};
    std::uint64_t                          completed{0};
    std::uint64_t                          rejected{0};
    std::uint64_t                          blocked{0};
    std::uint64_t                          failed{0};
    std::uint64_t                          pii_masked_results{0};
    double                                 block_rate{0.0};
    std::chrono::system_clock::time_point  captured_at{};
};

class GateStats {
public:
    GateStats() noexcept = default;
    ~GateStats()         = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    GateStats(const GateStats&)            = delete;
    GateStats& operator=(const GateStats&) = delete;
    GateStats(GateStats&&)                 = delete;
    GateStats& operator=(GateStats&&)      = delete;

    void on_request() noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
    }

    // pii_masked: 결과에서 PII 가 하나 이상 마스킹되었으면 true
    void on_completed(bool pii_masked) noexcept {
        completed_.fetch_add(1, std::memory_order_relaxed);
        if (pii_masked) {
            pii_masked_results_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // 입력 단계 거부 (길이 초과, 프롬프트 인젝션)
    void on_rejected() noexcept {
        rejected_.fetch_add(1, std::memory_order_relaxed);
    }

    // 출력 단계 차단 (SQL/코드 검증 실패)
    void on_blocked() noexcept {
        blocked_.fetch_add(1, std::memory_order_relaxed);
    }

    // 협력자(LLM, 실행기) 실패
    void on_failed() noexcept {
        failed_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] GateStatsSnapshot snapshot() const noexcept {
        const auto total    = total_requests_.load(std::memory_order_relaxed);
        const auto rejected = rejected_.load(std::memory_order_relaxed);
        const auto blocked  = blocked_.load(std::memory_order_relaxed);

        double block_rate = 0.0;
        if (total > 0) {
            block_rate = static_cast<double>(rejected + blocked) / static_cast<double>(total);
        }

        return GateStatsSnapshot{
            .total_requests     = total,
            .completed          = completed_.load(std::memory_order_relaxed),
            .rejected           = rejected,
            .blocked            = blocked,
            .failed             = failed_.load(std::memory_order_relaxed),
            .pii_masked_results = pii_masked_results_.load(std::memory_order_relaxed),
            .block_rate         = block_rate,
            .captured_at        = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::atomic<std::uint64_t> blocked_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> pii_masked_results_{0};
};
