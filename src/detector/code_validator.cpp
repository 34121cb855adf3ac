#include "detector/code_validator.hpp"

#include "common/digest.hpp"
#include "logger/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

#include <spdlog/spdlog.h>

CodeValidator::CodeValidator(std::shared_ptr<StructuredLogger> audit)
    : audit_(std::move(audit))
{
    for (const auto& spec : code_pattern_specs()) {
        rules_.push_back(compile_rule(spec));
    }
    spdlog::info("code_validator: {} rules loaded", rules_.size());
}

CodeValidationResult CodeValidator::validate(std::string_view code,
                                             const RequestContext& context) const {
    const bool blank = std::all_of(code.begin(), code.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        return CodeValidationResult{false, {"empty code is not allowed"}};
    }

    CodeValidationResult result;
    for (const auto& rule : rules_) {
        if (rule.matches(code)) {
            result.violations.push_back(fmt::format("forbidden code construct: {}", rule.name));
        }
    }
    result.is_safe = result.violations.empty();

    if (!result.is_safe) {
        const std::string code_hash = short_digest(code);
        spdlog::warn("code_validator: {} violation(s), code_hash={}",
                     result.violations.size(), code_hash);
        if (audit_) {
            audit_->log_code_validation(CodeValidationLog{
                .code_hash  = code_hash,
                .violations = result.violations,
                .user_id    = context.user_id,
                .timestamp  = std::chrono::system_clock::now(),
            });
        }
    }
    return result;
}
