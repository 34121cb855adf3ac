// ---------------------------------------------------------------------------
// pattern_rule.cpp
// ---------------------------------------------------------------------------

#include "patterns/pattern_rule.hpp"

#include <spdlog/spdlog.h>

PatternCompileError::PatternCompileError(std::string rule_name, const std::string& detail)
    : std::runtime_error(fmt::format("pattern '{}' failed to compile: {}", rule_name, detail))
    , rule_name_(std::move(rule_name))
{}

std::shared_ptr<const re2::RE2>
compile_pattern(std::string_view rule_name, std::string_view source, bool multiline) {
    re2::RE2::Options options;
    options.set_log_errors(false);
    options.set_case_sensitive(false);

    // RE2 의 ^/$ 는 기본이 입력 전체 기준이다. 줄 단위는 (?m) 플래그로 켠다.
    std::string pattern = multiline ? "(?m)" : "";
    pattern.append(source);

    auto re = std::make_shared<const re2::RE2>(
        re2::StringPiece(pattern.data(), pattern.size()), options);
    if (!re->ok()) {
        spdlog::error("pattern_rule: cannot compile '{}' ({}): {}", rule_name, source, re->error());
        throw PatternCompileError(std::string(rule_name), re->error());
    }
    return re;
}

bool search_view(const re2::RE2& re, std::string_view text) {
    const re2::StringPiece input(text.data(), text.size());
    return re.Match(input, 0, input.size(), re2::RE2::UNANCHORED, nullptr, 0);
}

std::vector<MatchSpan> find_all(const re2::RE2& re, std::string_view text) {
    std::vector<MatchSpan> spans;
    const re2::StringPiece input(text.data(), text.size());

    std::size_t pos = 0;
    while (pos <= input.size()) {
        re2::StringPiece match;
        if (!re.Match(input, pos, input.size(), re2::RE2::UNANCHORED, &match, 1)) {
            break;
        }
        const auto offset = static_cast<std::size_t>(match.data() - input.data());
        if (match.empty()) {
            pos = offset + 1;
            continue;
        }
        spans.push_back(MatchSpan{.offset = offset, .length = match.size()});
        pos = offset + match.size();
    }
    return spans;
}
