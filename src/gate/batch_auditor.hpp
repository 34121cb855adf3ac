#pragma once

// ---------------------------------------------------------------------------
// batch_auditor.hpp
//
// 여러 SQL 문을 동시에 검증한다 (`llmgate audit-sql <file>`).
// 예: 쿼리 이력 테이블이나 LLM 생성 로그를 사후 점검할 때 사용.
//
// [스레드/비동기 모델]
// - 호출마다 boost::asio::thread_pool 을 만들고 문장 하나를 작업 하나로 post.
//   join() 후 반환하므로 audit() 자체는 동기 호출이다.
// - SqlValidator 인스턴스 하나를 모든 워커가 공유한다 (생성 후 불변).
// - 결과 순서 = 입력 순서. 워커는 자기 인덱스 슬롯에만 쓴다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/gate_config.hpp"
#include "detector/sql_validator.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

struct BatchSummary {
    std::size_t total{0};
    std::size_t allowed{0};
    std::size_t blocked{0};
    std::size_t with_warnings{0};
};

class BatchAuditor {
public:
    // validator 가 nullptr 이면 std::invalid_argument.
    BatchAuditor(std::shared_ptr<const SqlValidator> validator, BatchSettings settings = {});

    [[nodiscard]] std::vector<SqlValidationResult>
    audit(const std::vector<std::string>& statements, const RequestContext& context = {}) const;

    // 실제로 사용할 워커 수 (worker_threads == 0 이면 하드웨어 동시성).
    [[nodiscard]] std::size_t worker_count() const noexcept { return worker_count_; }

private:
    std::shared_ptr<const SqlValidator> validator_;
    std::size_t                         worker_count_;
};

[[nodiscard]] BatchSummary summarize(const std::vector<SqlValidationResult>& results);
