// ---------------------------------------------------------------------------
// sql_validator.cpp
//
// SQL 보안 검증기 구현.
//
// [최대 길이 초과 입력 처리]
// 길이 초과 입력도 모든 단계를 거친다. 길이 violation 만으로 차단은
// 확정되지만 금지 키워드가 섞여 있으면 kCritical 로 감사 기록에 남아야
// 한다. 규칙 엔진(RE2)이 입력 길이에 선형이므로 비용은 길이에 비례한다.
// ---------------------------------------------------------------------------

#include "detector/sql_validator.hpp"

#include "common/digest.hpp"
#include "logger/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::vector<PatternRule<SqlRuleCategory>>
compile_extra(const std::vector<std::string>& patterns, std::string_view prefix) {
    std::vector<PatternRule<SqlRuleCategory>> rules;
    rules.reserve(patterns.size());
    for (std::size_t i = 0; i < patterns.size(); ++i) {
        std::string name = fmt::format("{}_{}", prefix, i);
        auto        re   = compile_pattern(name, patterns[i]);
        rules.push_back(PatternRule<SqlRuleCategory>{
            .name     = std::move(name),
            .source   = patterns[i],
            .regex    = std::move(re),
            .category = SqlRuleCategory::kCustom,
            .weight   = 1.0,
        });
    }
    return rules;
}

}  // namespace

// ---------------------------------------------------------------------------
// strip_sql_comments
//   처리 순서: /* ... */ (중첩 미지원, 닫히지 않으면 끝까지) → -- (줄 끝까지)
//   블록 주석 자리에 공백을 넣어 SEL/**/ECT 가 SELECT 로 붙지 않게 한다.
// ---------------------------------------------------------------------------
std::string strip_sql_comments(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    std::size_t       i   = 0;
    const std::size_t len = sql.size();

    while (i < len) {
        if (i + 1 < len && sql[i] == '/' && sql[i + 1] == '*') {
            i += 2;
            while (i < len) {
                if (i + 1 < len && sql[i] == '*' && sql[i + 1] == '/') {
                    i += 2;
                    break;
                }
                ++i;
            }
            result.push_back(' ');
            continue;
        }

        if (i + 1 < len && sql[i] == '-' && sql[i + 1] == '-') {
            while (i < len && sql[i] != '\n') {
                ++i;
            }
            continue;
        }

        result.push_back(sql[i]);
        ++i;
    }

    return result;
}

// ---------------------------------------------------------------------------
// first_sql_keyword
//   선행 공백을 건너뛴 뒤 [A-Za-z0-9_] 연속 구간을 대문자로 반환.
//   "(SELECT ..." 처럼 괄호로 시작하면 빈 문자열 → 비 SELECT 로 처리된다.
// ---------------------------------------------------------------------------
std::string first_sql_keyword(std::string_view sql) {
    const std::string cleaned = strip_sql_comments(sql);

    std::size_t i = 0;
    while (i < cleaned.size() && std::isspace(static_cast<unsigned char>(cleaned[i])) != 0) {
        ++i;
    }

    std::string keyword;
    while (i < cleaned.size()) {
        const auto c = static_cast<unsigned char>(cleaned[i]);
        if (std::isalnum(c) == 0 && c != '_') {
            break;
        }
        keyword.push_back(static_cast<char>(std::toupper(c)));
        ++i;
    }
    return keyword;
}

// ---------------------------------------------------------------------------
// SqlValidator 생성자
// ---------------------------------------------------------------------------
SqlValidator::SqlValidator(SqlSettings settings, std::shared_ptr<StructuredLogger> audit)
    : settings_(std::move(settings))
    , audit_(std::move(audit))
{
    for (const std::string_view keyword : forbidden_sql_keywords()) {
        const std::string source = fmt::format(R"(\b{}\b)", keyword);
        keyword_rules_.push_back(PatternRule<SqlRuleCategory>{
            .name     = std::string(keyword),
            .source   = source,
            .regex    = compile_pattern(keyword, source),
            .category = SqlRuleCategory::kForbiddenKeyword,
            .weight   = 1.0,
        });
    }

    for (const auto& spec : dangerous_sql_pattern_specs()) {
        dangerous_rules_.push_back(compile_rule(spec));
    }
    for (auto& rule : compile_extra(settings_.extra_dangerous_patterns, "custom_dangerous")) {
        dangerous_rules_.push_back(std::move(rule));
    }

    for (const auto& spec : suspicious_sql_pattern_specs()) {
        suspicious_rules_.push_back(compile_rule(spec));
    }
    for (auto& rule : compile_extra(settings_.extra_suspicious_patterns, "custom_suspicious")) {
        suspicious_rules_.push_back(std::move(rule));
    }

    limit_clause_ = compile_pattern("limit_clause", R"(\bLIMIT\b)");

    spdlog::info("sql_validator: {} keywords, {} dangerous, {} suspicious rules, "
                 "max_query_bytes={}, row_limit={}",
                 keyword_rules_.size(), dangerous_rules_.size(), suspicious_rules_.size(),
                 settings_.max_query_bytes, settings_.row_limit);
}

// ---------------------------------------------------------------------------
// SqlValidator::validate
// ---------------------------------------------------------------------------
SqlValidationResult SqlValidator::validate(std::string_view sql,
                                           const RequestContext& context) const {
    // 1. 빈 SQL → 즉시 kCritical
    if (sql.empty() || is_blank(sql)) {
        SqlValidationResult result{
            .is_safe       = false,
            .threat_level  = ThreatLevel::kCritical,
            .violations    = {"empty SQL query is not allowed"},
            .warnings      = {},
            .sanitized_sql = std::nullopt,
        };
        log_security_event(sql, result, context);
        return result;
    }

    std::vector<std::string> violations;
    std::vector<std::string> warnings;
    ThreatLevel              level = ThreatLevel::kLow;

    // 2. 금지 키워드
    const std::size_t before_keywords = violations.size();
    check_forbidden_keywords(sql, violations);
    if (violations.size() > before_keywords) {
        level = ThreatLevel::kCritical;
    }

    // 3. 위험 패턴
    const std::size_t before_patterns = violations.size();
    check_dangerous_patterns(sql, violations);
    if (violations.size() > before_patterns) {
        level = raise_to(level, ThreatLevel::kHigh);
    }

    // 4. 의심 패턴 (경고만)
    check_suspicious_patterns(sql, warnings);
    if (!warnings.empty() && level == ThreatLevel::kLow) {
        level = ThreatLevel::kMedium;
    }

    // 5. SELECT 전용
    if (first_sql_keyword(sql) != "SELECT") {
        violations.emplace_back("only SELECT statements are allowed");
        level = ThreatLevel::kCritical;
    }

    // 6. 길이 상한
    if (sql.size() > settings_.max_query_bytes) {
        violations.push_back(fmt::format("query exceeds maximum length of {} bytes",
                                         settings_.max_query_bytes));
        level = raise_to(level, ThreatLevel::kHigh);
    }

    SqlValidationResult result{
        .is_safe       = violations.empty(),
        .threat_level  = level,
        .violations    = std::move(violations),
        .warnings      = std::move(warnings),
        .sanitized_sql = std::nullopt,
    };

    // 7. LIMIT 정규화 (안전한 경우에만)
    if (result.is_safe) {
        result.sanitized_sql = ensure_limit_clause(sql);
    }

    log_security_event(sql, result, context);
    return result;
}

void SqlValidator::check_forbidden_keywords(std::string_view sql,
                                            std::vector<std::string>& violations) const {
    for (const auto& rule : keyword_rules_) {
        if (rule.matches(sql)) {
            violations.push_back(fmt::format("forbidden SQL keyword: {}", rule.name));
        }
    }
}

void SqlValidator::check_dangerous_patterns(std::string_view sql,
                                            std::vector<std::string>& violations) const {
    for (const auto& rule : dangerous_rules_) {
        if (rule.matches(sql)) {
            violations.push_back(fmt::format("dangerous SQL pattern: {}", rule.name));
        }
    }
}

void SqlValidator::check_suspicious_patterns(std::string_view sql,
                                             std::vector<std::string>& warnings) const {
    for (const auto& rule : suspicious_rules_) {
        if (rule.matches(sql)) {
            warnings.push_back(fmt::format("suspicious SQL pattern: {}", rule.name));
        }
    }
}

// ---------------------------------------------------------------------------
// ensure_limit_clause
//   LIMIT 이 이미 있으면 원문 그대로. 없으면 끝의 공백/세미콜론을 제거하고
//   " LIMIT <row_limit>" 을 붙인다.
//   결과를 다시 validate() 해도 새 violation 이 생기지 않는다 (멱등).
// ---------------------------------------------------------------------------
std::string SqlValidator::ensure_limit_clause(std::string_view sql) const {
    if (limit_clause_ && search_view(*limit_clause_, sql)) {
        return std::string(sql);
    }

    std::size_t end = sql.size();
    while (end > 0) {
        const auto c = static_cast<unsigned char>(sql[end - 1]);
        if (c != ';' && std::isspace(c) == 0) {
            break;
        }
        --end;
    }

    return fmt::format("{} LIMIT {}", sql.substr(0, end), settings_.row_limit);
}

void SqlValidator::log_security_event(std::string_view sql,
                                      const SqlValidationResult& result,
                                      const RequestContext& context) const {
    if (!audit_) {
        return;
    }

    audit_->log_sql_validation(SqlValidationLog{
        .sql_hash      = short_digest(sql),
        .threat_level  = result.threat_level,
        .violations    = result.violations,
        .warnings      = result.warnings,
        .user_id       = context.user_id,
        .connection_id = context.connection_id,
        .timestamp     = std::chrono::system_clock::now(),
    });
}
