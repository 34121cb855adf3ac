#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 보안 이벤트(감사) JSON 로거.
//
// [설계 원칙]
// - 싱글턴 금지: main 에서 생성하여 shared_ptr 로 각 분류기에 주입한다.
//   분류기는 nullptr 을 허용하며, 이 경우 감사 이벤트를 기록하지 않는다.
// - 감사 로깅은 판정 경로의 의존성이 아니다. sink 기록 오류는 spdlog
//   오류 핸들러가 처리하며 판정 결과에 영향을 주지 않는다.
// - 모든 구조체 필드는 snake_case JSON 키로 직렬화한다.
//
// [스레드 안전성]
// - 내부 sink 는 *_mt 계열이므로 여러 요청 스레드에서 동시 호출 안전.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger
//   보안 이벤트를 JSON 한 줄로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   sink 생성 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&)                 = delete;
    StructuredLogger& operator=(StructuredLogger&&)      = delete;

    // parse_level
    //   "debug" | "info" | "warn" | "warning" | "error" (대소문자 무관).
    //   알 수 없는 값이면 std::nullopt.
    [[nodiscard]] static std::optional<LogLevel> parse_level(std::string_view text);

    void log_injection(const InjectionLog& entry);
    void log_sql_validation(const SqlValidationLog& entry);
    void log_masking(const MaskingLog& entry);
    void log_code_validation(const CodeValidationLog& entry);
    void log_decision(const GateDecisionLog& entry);

    // 버퍼된 로그를 파일로 내보낸다 (테스트/종료 시).
    void flush();

    // 내부 진단용 spdlog 래퍼
    //   사용자 입력/SQL 원문을 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    [[nodiscard]] LogLevel min_level() const noexcept { return min_level_; }
    [[nodiscard]] const std::filesystem::path& log_path() const noexcept { return log_path_; }

private:
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
