#pragma once

// ---------------------------------------------------------------------------
// pii_masker.hpp
//
// 쿼리 결과(DataValue 트리)에서 개인정보를 찾아 유형별 규칙으로 마스킹한다.
//
// [처리 방식]
// - map 은 키 순서대로, list/tuple 은 원소 순서대로 재귀 탐색한다.
//   문자열만 검사하고 나머지 스칼라는 그대로 복사한다.
// - 문자열 하나에 대해 PII 테이블 순서대로 유형별 패스를 돈다.
//   각 패스는 "현재" 텍스트에서 겹치지 않는 매칭을 모두 찾은 뒤
//   오른쪽부터 치환한다 (앞쪽 offset 이 변하지 않도록).
//   다음 패스는 이전 패스가 치환한 텍스트 위에서 동작한다.
// - 신뢰도가 min_confidence 미만인 유형은 건너뛴다.
//
// [불변식]
// - masked 는 original 과 컨테이너 구조(종류, 키, 길이, 순서)가 같다.
// - 마스킹 결과에서 원문을 복원할 수 없다.
//
// [오탐/미탐 트레이드오프]
// - 계좌번호 패턴은 일반 숫자 ID 와 구분하지 못한다. 기본 임계값 0.7 에서는
//   신뢰도 0.60 이라 비활성이며, 임계값을 낮추면 과잉 마스킹이 발생한다.
// - 이름/주소처럼 형태가 없는 PII 는 탐지하지 못한다.
//
// [스레드 안전성]
// - 생성 후 불변. mask()/detect_only()/is_sensitive() 는 동시 호출 안전.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/gate_config.hpp"
#include "masking/data_value.hpp"
#include "patterns/pattern_library.hpp"
#include "patterns/pattern_rule.hpp"

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

class StructuredLogger;

// ---------------------------------------------------------------------------
// PiiFinding
//   offset: 해당 유형 패스 시점의 텍스트 기준 바이트 위치.
//   original_span 은 메모리 내에서만 사용하며 로그에 기록하지 않는다.
// ---------------------------------------------------------------------------
struct PiiFinding {
    PiiCategory category{PiiCategory::kGeneric};
    std::string original_span{};
    std::string masked_span{};
    double      confidence{0.0};
    std::size_t offset{0};
};

struct MaskingResult {
    DataValue               original{};
    DataValue               masked{};
    std::vector<PiiFinding> findings{};
    bool                    any_found{false};
};

class PiiMasker {
public:
    // settings.min_confidence 가 [0, 1] 밖이면 std::invalid_argument.
    explicit PiiMasker(const PiiSettings& settings = {},
                       std::shared_ptr<StructuredLogger> audit = nullptr);

    // 원본은 변경하지 않는다. findings 가 있으면 pii_masking 감사 이벤트를 남긴다.
    [[nodiscard]] MaskingResult mask(const DataValue& data,
                                     const RequestContext& context = {}) const;

    // 문자열 하나 마스킹. findings 에 결과를 추가한다.
    [[nodiscard]] std::string mask_text(std::string_view text,
                                        std::vector<PiiFinding>& findings) const;

    // 치환 없이 탐지된 유형만 반환.
    [[nodiscard]] std::set<PiiCategory> detect_only(std::string_view text) const;

    // 트리 어딘가에 활성 유형의 PII 가 있으면 true. 치환하지 않는다.
    [[nodiscard]] bool is_sensitive(const DataValue& data) const;

    [[nodiscard]] double min_confidence() const noexcept { return min_confidence_; }

private:
    using MaskFn = std::string (*)(std::string_view);

    struct MaskRule {
        PatternRule<PiiCategory> rule;
        MaskFn                   mask;
    };

    [[nodiscard]] DataValue mask_recursive(const DataValue& data,
                                           std::vector<PiiFinding>& findings) const;

    void log_masking_event(const std::vector<PiiFinding>& findings,
                           const RequestContext& context) const;

    double                            min_confidence_;
    std::vector<MaskRule>             rules_;   // 활성 유형만, 테이블 순서
    std::shared_ptr<StructuredLogger> audit_;
};

// ---------------------------------------------------------------------------
// 유형별 마스킹 함수
//   형태가 기대와 다르면 고정 토큰 (***MASKED_EMAIL*** 등) 을 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string mask_email(std::string_view value);
[[nodiscard]] std::string mask_phone(std::string_view value);
[[nodiscard]] std::string mask_national_id(std::string_view value);
[[nodiscard]] std::string mask_ssn(std::string_view value);
[[nodiscard]] std::string mask_credit_card(std::string_view value);
[[nodiscard]] std::string mask_ip_address(std::string_view value);
[[nodiscard]] std::string mask_passport(std::string_view value);
[[nodiscard]] std::string mask_bank_account(std::string_view value);
[[nodiscard]] std::string mask_generic(std::string_view value);

// category 에 해당하는 마스킹 함수를 적용한다.
[[nodiscard]] std::string mask_span(PiiCategory category, std::string_view value);
