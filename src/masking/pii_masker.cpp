// ---------------------------------------------------------------------------
// pii_masker.cpp
//
// PII 마스킹 엔진 구현.
//
// [로그 정책]
// - 마스킹 이벤트에는 유형별 건수만 남긴다. 원문/마스킹 값 모두 기록 금지.
// ---------------------------------------------------------------------------

#include "masking/pii_masker.hpp"

#include "logger/structured_logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

std::string digits_of(std::string_view value) {
    std::string digits;
    digits.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isdigit(c) != 0) {
            digits.push_back(static_cast<char>(c));
        }
    }
    return digits;
}

std::vector<std::string_view> split(std::string_view value, char delimiter) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = value.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.push_back(value.substr(start));
            break;
        }
        parts.push_back(value.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

}  // namespace

// ---------------------------------------------------------------------------
// 유형별 마스킹 함수
// ---------------------------------------------------------------------------

// john@example.com → j**n@example.com, ab@x.com → **@x.com
std::string mask_email(std::string_view value) {
    const std::size_t at = value.find('@');
    if (at == std::string_view::npos) {
        return "***MASKED_EMAIL***";
    }

    const std::string_view local  = value.substr(0, at);
    const std::string_view domain = value.substr(at + 1);

    std::string masked;
    if (local.size() <= 2) {
        masked.assign(local.size(), '*');
    } else {
        masked.push_back(local.front());
        masked.append(local.size() - 2, '*');
        masked.push_back(local.back());
    }
    masked.push_back('@');
    masked.append(domain);
    return masked;
}

// 010-1234-5678 → 010-****-5678
std::string mask_phone(std::string_view value) {
    const std::string digits = digits_of(value);
    if (digits.size() < 8) {
        return "***MASKED_PHONE***";
    }
    return digits.substr(0, 3) + "-****-" + digits.substr(digits.size() - 4);
}

// 900101-1234567 → 900101-1******
std::string mask_national_id(std::string_view value) {
    const std::size_t dash = value.find('-');
    if (dash == std::string_view::npos || dash + 1 >= value.size()) {
        return "***MASKED_RRN***";
    }

    const std::string_view back = value.substr(dash + 1);
    std::string masked(value.substr(0, dash));
    masked.push_back('-');
    masked.push_back(back.front());
    masked.append(back.size() - 1, '*');
    return masked;
}

// 123-45-6789 → ***-**-6789
std::string mask_ssn(std::string_view value) {
    const auto parts = split(value, '-');
    if (parts.size() != 3) {
        return "***MASKED_SSN***";
    }
    return "***-**-" + std::string(parts[2]);
}

// 1234 5678 9012 3456 → ****-****-****-3456
std::string mask_credit_card(std::string_view value) {
    const std::string digits = digits_of(value);
    if (digits.size() < 12) {
        return "***MASKED_CARD***";
    }
    return "****-****-****-" + digits.substr(digits.size() - 4);
}

// 192.168.1.100 → 192.168.*.***
std::string mask_ip_address(std::string_view value) {
    const auto parts = split(value, '.');
    if (parts.size() != 4) {
        return "***MASKED_IP***";
    }
    return std::string(parts[0]) + "." + std::string(parts[1]) + ".*.***";
}

// M12345678 → M*****678
std::string mask_passport(std::string_view value) {
    if (value.size() < 6) {
        return "***MASKED_PASSPORT***";
    }
    std::string masked(1, value.front());
    masked.append(value.size() - 4, '*');
    masked.append(value.substr(value.size() - 3));
    return masked;
}

// 1234567890123 → 123*******123
std::string mask_bank_account(std::string_view value) {
    if (value.size() < 8) {
        return "***MASKED_ACCOUNT***";
    }
    std::string masked(value.substr(0, 3));
    masked.append(value.size() - 6, '*');
    masked.append(value.substr(value.size() - 3));
    return masked;
}

std::string mask_generic(std::string_view value) {
    if (value.size() <= 4) {
        return std::string(value.size(), '*');
    }
    std::string masked(value.substr(0, 2));
    masked.append(value.size() - 4, '*');
    masked.append(value.substr(value.size() - 2));
    return masked;
}

std::string mask_span(PiiCategory category, std::string_view value) {
    switch (category) {
        case PiiCategory::kEmail:          return mask_email(value);
        case PiiCategory::kPhone:          return mask_phone(value);
        case PiiCategory::kNationalId:     return mask_national_id(value);
        case PiiCategory::kSsn:            return mask_ssn(value);
        case PiiCategory::kCreditCard:     return mask_credit_card(value);
        case PiiCategory::kIpAddress:      return mask_ip_address(value);
        case PiiCategory::kPassportNumber: return mask_passport(value);
        case PiiCategory::kBankAccount:    return mask_bank_account(value);
        case PiiCategory::kGeneric:        return mask_generic(value);
    }
    return mask_generic(value);
}

namespace {

using MaskFn = std::string (*)(std::string_view);

MaskFn mask_function_for(PiiCategory category) {
    switch (category) {
        case PiiCategory::kEmail:          return &mask_email;
        case PiiCategory::kPhone:          return &mask_phone;
        case PiiCategory::kNationalId:     return &mask_national_id;
        case PiiCategory::kSsn:            return &mask_ssn;
        case PiiCategory::kCreditCard:     return &mask_credit_card;
        case PiiCategory::kIpAddress:      return &mask_ip_address;
        case PiiCategory::kPassportNumber: return &mask_passport;
        case PiiCategory::kBankAccount:    return &mask_bank_account;
        case PiiCategory::kGeneric:        return &mask_generic;
    }
    return &mask_generic;
}

}  // namespace

// ---------------------------------------------------------------------------
// PiiMasker 생성자
//   임계값 미만 유형은 아예 컴파일 목록에 넣지 않는다.
// ---------------------------------------------------------------------------
PiiMasker::PiiMasker(const PiiSettings& settings, std::shared_ptr<StructuredLogger> audit)
    : min_confidence_(settings.min_confidence)
    , audit_(std::move(audit))
{
    if (min_confidence_ < 0.0 || min_confidence_ > 1.0) {
        throw std::invalid_argument(
            fmt::format("pii min_confidence must be in [0, 1], got {}", min_confidence_));
    }

    for (const auto& spec : pii_pattern_specs()) {
        if (spec.weight < min_confidence_) {
            spdlog::debug("pii_masker: rule '{}' disabled (confidence {:.2f} < {:.2f})",
                          spec.name, spec.weight, min_confidence_);
            continue;
        }
        rules_.push_back(MaskRule{
            .rule = compile_rule(spec),
            .mask = mask_function_for(spec.category),
        });
    }

    spdlog::info("pii_masker: {} of {} rules active (min_confidence={:.2f})",
                 rules_.size(), pii_pattern_specs().size(), min_confidence_);
}

MaskingResult PiiMasker::mask(const DataValue& data, const RequestContext& context) const {
    MaskingResult result;
    result.original  = data;
    result.masked    = mask_recursive(data, result.findings);
    result.any_found = !result.findings.empty();

    if (result.any_found) {
        log_masking_event(result.findings, context);
    }
    return result;
}

DataValue PiiMasker::mask_recursive(const DataValue& data,
                                    std::vector<PiiFinding>& findings) const {
    switch (data.kind()) {
        case DataValue::Kind::kString:
            return DataValue::string(mask_text(data.as_string(), findings));

        case DataValue::Kind::kMap: {
            DataValue masked = DataValue::map();
            const auto& keys  = data.keys();
            const auto& items = data.items();
            for (std::size_t i = 0; i < keys.size(); ++i) {
                masked.append_unique(keys[i], mask_recursive(items[i], findings));
            }
            return masked;
        }

        case DataValue::Kind::kList:
        case DataValue::Kind::kTuple: {
            std::vector<DataValue> items;
            items.reserve(data.size());
            for (const auto& item : data.items()) {
                items.push_back(mask_recursive(item, findings));
            }
            return data.kind() == DataValue::Kind::kList
                       ? DataValue::list(std::move(items))
                       : DataValue::tuple(std::move(items));
        }

        default:
            return data;
    }
}

// ---------------------------------------------------------------------------
// mask_text
//   유형별 패스: 매칭 위치를 먼저 모두 수집한 뒤 오른쪽부터 치환한다.
//   findings 는 패스 안에서 offset 오름차순으로 추가된다.
// ---------------------------------------------------------------------------
std::string PiiMasker::mask_text(std::string_view text,
                                 std::vector<PiiFinding>& findings) const {
    std::string current(text);
    if (current.empty()) {
        return current;
    }

    for (const auto& entry : rules_) {
        const std::vector<MatchSpan> spans = find_all(*entry.rule.regex, current);
        if (spans.empty()) {
            continue;
        }

        std::vector<PiiFinding> pass;
        pass.reserve(spans.size());
        for (auto span = spans.rbegin(); span != spans.rend(); ++span) {
            std::string original = current.substr(span->offset, span->length);
            std::string masked   = entry.mask(original);
            current.replace(span->offset, span->length, masked);
            pass.push_back(PiiFinding{
                .category      = entry.rule.category,
                .original_span = std::move(original),
                .masked_span   = std::move(masked),
                .confidence    = entry.rule.weight,
                .offset        = span->offset,
            });
        }
        findings.insert(findings.end(),
                        std::make_move_iterator(pass.rbegin()),
                        std::make_move_iterator(pass.rend()));
    }
    return current;
}

std::set<PiiCategory> PiiMasker::detect_only(std::string_view text) const {
    std::set<PiiCategory> detected;
    for (const auto& entry : rules_) {
        if (entry.rule.matches(text)) {
            detected.insert(entry.rule.category);
        }
    }
    return detected;
}

bool PiiMasker::is_sensitive(const DataValue& data) const {
    switch (data.kind()) {
        case DataValue::Kind::kString:
            return !detect_only(data.as_string()).empty();
        case DataValue::Kind::kMap:
        case DataValue::Kind::kList:
        case DataValue::Kind::kTuple:
            return std::any_of(data.items().begin(), data.items().end(),
                               [this](const DataValue& item) { return is_sensitive(item); });
        default:
            return false;
    }
}

void PiiMasker::log_masking_event(const std::vector<PiiFinding>& findings,
                                  const RequestContext& context) const {
    constexpr std::size_t kCategoryCount = static_cast<std::size_t>(PiiCategory::kGeneric) + 1;
    std::array<std::uint32_t, kCategoryCount> per_category{};
    for (const auto& finding : findings) {
        ++per_category[static_cast<std::size_t>(finding.category)];
    }

    MaskingLog entry{
        .counts    = {},
        .total     = static_cast<std::uint32_t>(findings.size()),
        .user_id   = context.user_id,
        .query_id  = context.query_id,
        .timestamp = std::chrono::system_clock::now(),
    };
    for (std::size_t i = 0; i < kCategoryCount; ++i) {
        if (per_category[i] > 0) {
            entry.counts.emplace_back(
                std::string(pii_category_name(static_cast<PiiCategory>(i))), per_category[i]);
        }
    }

    spdlog::debug("pii_masker: masked {} PII value(s), query_id={}", entry.total, context.query_id);
    if (audit_) {
        audit_->log_masking(entry);
    }
}
