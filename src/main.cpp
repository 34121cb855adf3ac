// ---------------------------------------------------------------------------
// main.cpp
//
// llmgate CLI. 설정을 로드하고 분류기를 한 번씩 생성하여 명령에 주입한다.
//
// 사용법:
//   llmgate prompt <text>       질문 검사 → 정화된 텍스트 (exit 0) / 거부 (exit 2)
//   llmgate sql <query>         SQL 판정 → 허용 (exit 0) / 차단 (exit 2)
//   llmgate code <file>         분석 코드 판정
//   llmgate mask                stdin 의 YAML/JSON 을 마스킹하여 stdout 으로 출력
//   llmgate audit-sql <file>    한 줄에 SQL 하나, 동시 검증
//
// 환경변수:
//   LLMGATE_CONFIG  설정 파일 경로 (기본 config/llmgate.yaml)
//   LOG_PATH        감사 로그 경로 (설정 파일 값을 덮어쓴다)
//   LOG_LEVEL       debug|info|warn|error (설정 파일 값을 덮어쓴다)
//
// 종료 코드: 0 허용/성공, 1 사용법·설정·입출력 오류, 2 거부/차단
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"
#include "detector/code_validator.hpp"
#include "detector/prompt_injection_detector.hpp"
#include "detector/sql_validator.hpp"
#include "gate/batch_auditor.hpp"
#include "logger/structured_logger.hpp"
#include "masking/pii_masker.hpp"
#include "masking/yaml_codec.hpp"
#include "patterns/pattern_rule.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitRejected = 2;

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

bool env_set(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    return val != nullptr && val[0] != '\0';
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

void print_usage() {
    std::cerr << "usage: llmgate <command> [args]\n"
                 "  prompt <text>       check a question for prompt injection\n"
                 "  sql <query>         validate a generated SQL statement\n"
                 "  code <file>         validate generated analysis code\n"
                 "  mask                mask PII in YAML/JSON read from stdin\n"
                 "  audit-sql <file>    validate one SQL statement per line\n";
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::error("llmgate: cannot open '{}'", path.string());
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// ---------------------------------------------------------------------------
// 설정 로드: LLMGATE_CONFIG 가 명시되었는데 실패하면 오류.
// 기본 경로에 파일이 없으면 기본값으로 진행한다.
// ---------------------------------------------------------------------------
std::optional<GateConfig> load_config() {
    const bool        explicit_path = env_set("LLMGATE_CONFIG");
    const std::string path          = env_str("LLMGATE_CONFIG", "config/llmgate.yaml");

    GateConfig config{};
    if (explicit_path || std::filesystem::exists(path)) {
        auto loaded = ConfigLoader::load(path);
        if (!loaded) {
            return std::nullopt;
        }
        config = std::move(*loaded);
    } else {
        spdlog::warn("llmgate: '{}' not found, using built-in defaults", path);
    }

    config.global.log_path  = env_str("LOG_PATH",  config.global.log_path);
    config.global.log_level = env_str("LOG_LEVEL", config.global.log_level);
    return config;
}

// ---------------------------------------------------------------------------
// 명령 구현
// ---------------------------------------------------------------------------
int run_prompt(const PromptInjectionDetector& detector, std::string_view text) {
    auto sanitized = detector.sanitize(text);
    if (!sanitized) {
        std::cout << "rejected: " << sanitized.error().message << '\n';
        return kExitRejected;
    }
    std::cout << *sanitized << '\n';
    return EXIT_SUCCESS;
}

void print_verdict(const SqlValidationResult& verdict) {
    std::cout << (verdict.is_execution_allowed() ? "allowed" : "blocked")
              << " (threat=" << threat_level_name(verdict.threat_level) << ")\n";
    for (const auto& violation : verdict.violations) {
        std::cout << "  violation: " << violation << '\n';
    }
    for (const auto& warning : verdict.warnings) {
        std::cout << "  warning: " << warning << '\n';
    }
    if (verdict.sanitized_sql) {
        std::cout << *verdict.sanitized_sql << '\n';
    }
}

int run_sql(const SqlValidator& validator, std::string_view sql) {
    const SqlValidationResult verdict = validator.validate(sql);
    print_verdict(verdict);
    return verdict.is_execution_allowed() ? EXIT_SUCCESS : kExitRejected;
}

int run_code(const CodeValidator& validator, const std::filesystem::path& path) {
    const auto code = read_file(path);
    if (!code) {
        return EXIT_FAILURE;
    }
    const CodeValidationResult verdict = validator.validate(*code);
    std::cout << (verdict.is_safe ? "allowed" : "blocked") << '\n';
    for (const auto& violation : verdict.violations) {
        std::cout << "  violation: " << violation << '\n';
    }
    return verdict.is_safe ? EXIT_SUCCESS : kExitRejected;
}

int run_mask(const PiiMasker& masker) {
    const std::string input((std::istreambuf_iterator<char>(std::cin)),
                            std::istreambuf_iterator<char>());
    auto data = parse_yaml(input);
    if (!data) {
        spdlog::error("llmgate: {}", data.error());
        return EXIT_FAILURE;
    }

    const MaskingResult result = masker.mask(*data);
    auto emitted = to_yaml(result.masked);
    if (!emitted) {
        return EXIT_FAILURE;
    }
    std::cout << *emitted << '\n';
    spdlog::info("llmgate: masked {} PII value(s)", result.findings.size());
    return EXIT_SUCCESS;
}

int run_audit(const BatchAuditor& auditor, const std::filesystem::path& path) {
    const auto content = read_file(path);
    if (!content) {
        return EXIT_FAILURE;
    }

    std::vector<std::string> statements;
    std::istringstream       lines(*content);
    for (std::string line; std::getline(lines, line);) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            statements.push_back(std::move(line));
        }
    }

    const auto results = auditor.audit(statements);
    for (std::size_t i = 0; i < results.size(); ++i) {
        std::cout << (i + 1) << ": ";
        print_verdict(results[i]);
    }

    const BatchSummary summary = summarize(results);
    std::cout << "total=" << summary.total << " allowed=" << summary.allowed
              << " blocked=" << summary.blocked << " warnings=" << summary.with_warnings << '\n';
    return summary.blocked == 0 ? EXIT_SUCCESS : kExitRejected;
}

}  // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    // 진단 로그는 stderr 로 (stdout 은 명령 결과 전용)
    spdlog::set_default_logger(spdlog::stderr_color_mt("llmgate"));

    if (argc < 2) {
        print_usage();
        return EXIT_FAILURE;
    }
    const std::string_view command = argv[1];
    const bool             needs_arg = command != "mask";
    if (needs_arg && argc < 3) {
        print_usage();
        return EXIT_FAILURE;
    }

    // ── 설정 로드 ──────────────────────────────────────────────────────
    const auto config = load_config();
    if (!config) {
        return EXIT_FAILURE;
    }

    const auto level = StructuredLogger::parse_level(config->global.log_level);
    if (!level) {
        spdlog::error("llmgate: unknown log level '{}'", config->global.log_level);
        return EXIT_FAILURE;
    }
    spdlog::set_level(to_spdlog_level(*level));

    // ── 분류기 생성 (패턴 컴파일 실패 = 설정 오류) ──────────────────────
    try {
        auto audit = std::make_shared<StructuredLogger>(*level, config->global.log_path);

        if (command == "prompt") {
            const PromptInjectionDetector detector{config->prompt.extra_patterns, audit};
            return run_prompt(detector, argv[2]);
        }
        if (command == "sql") {
            const SqlValidator validator{config->sql, audit};
            return run_sql(validator, argv[2]);
        }
        if (command == "code") {
            const CodeValidator validator{audit};
            return run_code(validator, argv[2]);
        }
        if (command == "mask") {
            const PiiMasker masker{config->pii, audit};
            return run_mask(masker);
        }
        if (command == "audit-sql") {
            auto validator = std::make_shared<const SqlValidator>(config->sql, audit);
            const BatchAuditor auditor{validator, config->batch};
            return run_audit(auditor, argv[2]);
        }
    } catch (const PatternCompileError& e) {
        spdlog::critical("llmgate: pattern '{}' failed to compile: {}", e.rule_name(), e.what());
        return EXIT_FAILURE;
    } catch (const std::invalid_argument& e) {
        spdlog::critical("llmgate: invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::runtime_error& e) {
        spdlog::critical("llmgate: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::error("llmgate: unknown command '{}'", command);
    print_usage();
    return EXIT_FAILURE;
}
