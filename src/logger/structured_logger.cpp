// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 보안 이벤트 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

// ["a","b"] 형태로 직렬화
void append_string_array(std::ostringstream& json, const std::vector<std::string>& items) {
    json << '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            json << ',';
        }
        json << '"' << escape_json_string(items[i]) << '"';
    }
    json << ']';
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

}  // namespace

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        // 콘솔 사본은 stderr 로 보낸다. stdout 은 CLI 명령 결과 전용.
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        // 이름 있는 전역 레지스트리에 등록하지 않는다.
        // 테스트/배치에서 인스턴스를 여러 개 만들 수 있어야 하기 때문.
        logger_ = std::make_shared<spdlog::logger>("llmgate.audit", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

std::optional<LogLevel> StructuredLogger::parse_level(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(min_level_) <= static_cast<int>(level);
}

// ---------------------------------------------------------------------------
// log_injection: JSON 직렬화 (warn)
// ---------------------------------------------------------------------------
void StructuredLogger::log_injection(const InjectionLog& entry) {
    if (!enabled(LogLevel::kWarn)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"prompt_injection","input_hash":")" << escape_json_string(entry.input_hash)
         << R"(","matched_rule":")" << escape_json_string(entry.matched_rule)
         << R"(","category":")" << escape_json_string(entry.category)
         << R"(","user_id":")" << escape_json_string(entry.user_id)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->warn(json.str());
}

// ---------------------------------------------------------------------------
// log_sql_validation: 위반 → error, 경고 → warn, 통과 → info
// ---------------------------------------------------------------------------
void StructuredLogger::log_sql_validation(const SqlValidationLog& entry) {
    LogLevel level = LogLevel::kInfo;
    std::string_view outcome = "passed";
    if (!entry.violations.empty()) {
        level   = LogLevel::kError;
        outcome = "violation";
    } else if (!entry.warnings.empty()) {
        level   = LogLevel::kWarn;
        outcome = "suspicious";
    }

    if (!enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"sql_validation","outcome":")" << outcome
         << R"(","sql_hash":")" << escape_json_string(entry.sql_hash)
         << R"(","threat_level":")" << threat_level_name(entry.threat_level)
         << R"(","violations":)";
    append_string_array(json, entry.violations);
    json << R"(,"warnings":)";
    append_string_array(json, entry.warnings);
    json << R"(,"user_id":")" << escape_json_string(entry.user_id)
         << R"(","connection_id":")" << escape_json_string(entry.connection_id)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    switch (level) {
        case LogLevel::kError:
            logger_->error(json.str());
            break;
        case LogLevel::kWarn:
            logger_->warn(json.str());
            break;
        default:
            logger_->info(json.str());
            break;
    }
}

// ---------------------------------------------------------------------------
// log_masking: 유형별 건수 (info)
// ---------------------------------------------------------------------------
void StructuredLogger::log_masking(const MaskingLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"pii_masking","pii_detected":{)";
    for (std::size_t i = 0; i < entry.counts.size(); ++i) {
        if (i > 0) {
            json << ',';
        }
        json << '"' << escape_json_string(entry.counts[i].first) << R"(":)" << entry.counts[i].second;
    }
    json << R"(},"total_pii_count":)" << entry.total
         << R"(,"user_id":")" << escape_json_string(entry.user_id)
         << R"(","query_id":")" << escape_json_string(entry.query_id)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_code_validation: 분석 코드 차단 (warn)
// ---------------------------------------------------------------------------
void StructuredLogger::log_code_validation(const CodeValidationLog& entry) {
    if (!enabled(LogLevel::kWarn)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"code_validation","code_hash":")" << escape_json_string(entry.code_hash)
         << R"(","violations":)";
    append_string_array(json, entry.violations);
    json << R"(,"user_id":")" << escape_json_string(entry.user_id)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->warn(json.str());
}

// ---------------------------------------------------------------------------
// log_decision: 게이트 최종 판정 (info)
// ---------------------------------------------------------------------------
void StructuredLogger::log_decision(const GateDecisionLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"gate_decision","operation":")" << escape_json_string(entry.operation)
         << R"(","status":")" << escape_json_string(entry.status)
         << R"(","status_raw":)" << static_cast<int>(entry.status_raw)
         << R"(,"threat_level":")" << threat_level_name(entry.threat_level)
         << R"(","user_id":")" << escape_json_string(entry.user_id)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    logger_->info(json.str());
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
