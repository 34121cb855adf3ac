// ---------------------------------------------------------------------------
// pattern_library.cpp
//
// 기본 규칙 테이블.
//
// [RE2 문법]
// RE2 는 UTF-8 코드포인트 단위로 매칭하지만 \s, \b 는 ASCII 기준이다.
// 한글 선택 음절은 (?:을)? 처럼 그룹으로 감싸 의도를 드러낸다.
// lookaround/역참조는 쓰지 않는다 (RE2 미지원).
// ---------------------------------------------------------------------------

#include "patterns/pattern_library.hpp"

#include <array>

namespace {

using IC = InjectionCategory;
using SC = SqlRuleCategory;
using PC = PiiCategory;
using CC = CodeRuleCategory;

constexpr std::array<PatternSpec<IC>, 14> kInjectionPatterns{{
    // 지시사항 무력화
    {"ignore_previous_instructions", R"(ignore\s+(?:all\s+)?previous\s+instructions)", IC::kInstructionOverride, 1.0},
    {"forget_everything_above",      R"(forget\s+everything\s+above)",                 IC::kInstructionOverride, 1.0},
    {"ko_ignore_previous",           R"(이전\s*지시사항(?:을)?\s*무시)",               IC::kInstructionOverride, 1.0},
    {"ko_forget_above",              R"(위(?:의)?\s*모(?:든)?\s*것(?:을)?\s*잊어)",     IC::kInstructionOverride, 1.0},
    {"ko_new_instructions",          R"(새로(?:운)?\s*지시사(?:항)?\s*:)",             IC::kInstructionOverride, 1.0},

    // 역할 사칭. 영문은 줄 시작 기준(multiline), 한글은 위치 무관.
    {"role_marker",    R"(^\s*(?:system|assistant|user)\s*:)", IC::kRoleSpoofing, 1.0, true},
    {"ko_role_marker", R"((?:시스템|어시스턴트|사용자)\s*:)",      IC::kRoleSpoofing, 1.0},

    // 입력에 포함된 코드 블록 / 특수 토큰
    {"fenced_code_block", R"(```[\s\S]*?```)", IC::kCodeBlock,    1.0},
    {"control_token",     R"(<\|.*?\|>)",      IC::kControlToken, 1.0},

    // 새 규칙 선언
    {"critical_rules",     R"(critical\s+rules?\s*:)",  IC::kRuleDeclaration, 1.0},
    {"response_format",    R"(response\s+format)",      IC::kRuleDeclaration, 1.0},
    {"ko_important_rules", R"(중요\s*규(?:칙)?\s*:)",   IC::kRuleDeclaration, 1.0},
    {"ko_response_format", R"(응답\s*형식)",            IC::kRuleDeclaration, 1.0},
    {"new_system_prompt",  R"(new\s+system\s+prompt)",  IC::kRuleDeclaration, 1.0},
}};

constexpr std::array<std::string_view, 21> kForbiddenKeywords{{
    "INSERT", "UPDATE", "DELETE", "DROP", "CREATE", "ALTER",
    "TRUNCATE", "EXEC", "EXECUTE", "CALL", "GRANT", "REVOKE",
    "COMMIT", "ROLLBACK", "SAVEPOINT", "MERGE", "REPLACE",
    "RENAME", "COMMENT", "LOCK", "UNLOCK",
}};

constexpr std::array<PatternSpec<SC>, 14> kDangerousSqlPatterns{{
    {"statement_chaining", R"(;\s*(?:INSERT|UPDATE|DELETE|DROP|CREATE|ALTER|TRUNCATE)\b)", SC::kStatementChaining, 1.0},
    {"line_comment",       R"(--)",                          SC::kComment,      0.8},
    {"block_comment",      R"(/\*[\s\S]*?\*/)",              SC::kComment,      0.8},
    {"union_select",       R"(\bUNION\s+SELECT\b)",          SC::kUnionSelect,  0.9},
    {"or_always_true",     R"(\bOR\s+1\s*=\s*1\b)",          SC::kTautology,    0.9},
    {"and_always_true",    R"(\bAND\s+1\s*=\s*1\b)",         SC::kTautology,    0.9},
    {"quoted_tautology",   R"('\s*OR\s+['"\d])",             SC::kTautology,    0.9},
    {"sleep_call",         R"(\bSLEEP\s*\()",                SC::kTimingAttack, 0.9},
    {"pg_sleep_call",      R"(\bPG_SLEEP\s*\()",             SC::kTimingAttack, 0.9},
    {"benchmark_call",     R"(\bBENCHMARK\s*\()",            SC::kTimingAttack, 0.9},
    {"waitfor_delay",      R"(\bWAITFOR\s+DELAY\b)",         SC::kTimingAttack, 0.9},
    {"load_file_call",     R"(\bLOAD_FILE\s*\()",            SC::kFileAccess,   1.0},
    {"into_outfile",       R"(\bINTO\s+OUTFILE\b)",          SC::kFileAccess,   1.0},
    {"into_dumpfile",      R"(\bINTO\s+DUMPFILE\b)",         SC::kFileAccess,   1.0},
}};

constexpr std::array<PatternSpec<SC>, 5> kSuspiciousSqlPatterns{{
    {"commented_full_scan",   R"(\bSELECT\s+\*\s+FROM\s+\w+\s*;?\s*--)",        SC::kCommentedScan, 0.5},
    {"information_schema",    R"(\b(?:FROM|JOIN)\s+information_schema\b)",      SC::kSystemCatalog, 0.5},
    {"mysql_system_schema",   R"(\b(?:FROM|JOIN)\s+mysql\.)",                   SC::kSystemCatalog, 0.5},
    {"postgres_catalog",      R"(\b(?:FROM|JOIN)\s+pg_)",                       SC::kSystemCatalog, 0.5},
    {"sys_schema",            R"(\b(?:FROM|JOIN)\s+sys\.)",                     SC::kSystemCatalog, 0.5},
}};

constexpr std::array<PatternSpec<PC>, 8> kPiiPatterns{{
    {"email",        R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)",      PC::kEmail,          0.95},
    {"phone",        R"(\b(?:\+82|0)(?:10|11|16|17|18|19)-?\d{3,4}-?\d{4}\b)",     PC::kPhone,          0.90},
    {"national_id",  R"(\b\d{6}-[1-4]\d{6}\b)",                                    PC::kNationalId,     0.98},
    {"ssn",          R"(\b\d{3}-\d{2}-\d{4}\b)",                                   PC::kSsn,            0.85},
    {"credit_card",  R"(\b(?:\d{4}[-\s]?){3}\d{1,7}\b)",                           PC::kCreditCard,     0.80},
    {"ipv4_address", R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)",                       PC::kIpAddress,      0.70},
    {"passport",     R"(\b[A-Z]{1,2}\d{7,9}\b)",                                   PC::kPassportNumber, 0.75},
    {"bank_account", R"(\b\d{10,16}\b)",                                           PC::kBankAccount,    0.60},
}};

constexpr std::array<PatternSpec<CC>, 9> kCodePatterns{{
    {"dangerous_import",      R"(\bimport\s+(?:os|sys|subprocess|shutil)\b)",        CC::kDangerousImport,  1.0},
    {"dangerous_from_import", R"(\bfrom\s+(?:os|sys|subprocess|shutil)\s+import\b)", CC::kDangerousImport,  1.0},
    {"exec_call",             R"(\bexec\s*\()",                                     CC::kDynamicExecution, 1.0},
    {"eval_call",             R"(\beval\s*\()",                                     CC::kDynamicExecution, 1.0},
    {"compile_call",          R"(\bcompile\s*\()",                                  CC::kDynamicExecution, 1.0},
    {"dunder_import",         R"(__import__)",                                      CC::kDynamicExecution, 1.0},
    {"open_call",             R"(\bopen\s*\()",                                     CC::kFileAccess,       1.0},
    {"globals_call",          R"(\bglobals\s*\()",                                  CC::kIntrospection,    1.0},
    {"locals_call",           R"(\blocals\s*\()",                                   CC::kIntrospection,    1.0},
}};

}  // namespace

std::string_view pii_category_name(PiiCategory category) noexcept {
    switch (category) {
        case PiiCategory::kEmail:          return "email";
        case PiiCategory::kPhone:          return "phone";
        case PiiCategory::kNationalId:     return "national_id";
        case PiiCategory::kSsn:            return "ssn";
        case PiiCategory::kCreditCard:     return "credit_card";
        case PiiCategory::kIpAddress:      return "ip_address";
        case PiiCategory::kPassportNumber: return "passport";
        case PiiCategory::kBankAccount:    return "bank_account";
        case PiiCategory::kGeneric:        return "generic";
    }
    return "unknown";
}

std::string_view injection_category_name(InjectionCategory category) noexcept {
    switch (category) {
        case InjectionCategory::kInstructionOverride: return "instruction_override";
        case InjectionCategory::kRoleSpoofing:        return "role_spoofing";
        case InjectionCategory::kCodeBlock:           return "code_block";
        case InjectionCategory::kControlToken:        return "control_token";
        case InjectionCategory::kRuleDeclaration:     return "rule_declaration";
        case InjectionCategory::kCustom:              return "custom";
    }
    return "unknown";
}

std::span<const PatternSpec<InjectionCategory>> injection_pattern_specs() noexcept {
    return kInjectionPatterns;
}

std::span<const std::string_view> forbidden_sql_keywords() noexcept {
    return kForbiddenKeywords;
}

std::span<const PatternSpec<SqlRuleCategory>> dangerous_sql_pattern_specs() noexcept {
    return kDangerousSqlPatterns;
}

std::span<const PatternSpec<SqlRuleCategory>> suspicious_sql_pattern_specs() noexcept {
    return kSuspiciousSqlPatterns;
}

std::span<const PatternSpec<PiiCategory>> pii_pattern_specs() noexcept {
    return kPiiPatterns;
}

std::span<const PatternSpec<CodeRuleCategory>> code_pattern_specs() noexcept {
    return kCodePatterns;
}
