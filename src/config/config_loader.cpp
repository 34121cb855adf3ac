// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 GateConfig 구조체로 파싱한다.
//
// [검증 규칙]
// - global.log_level 은 debug|info|warn|error 중 하나.
// - pii.min_confidence 는 [0, 1].
// - sql.row_limit > 0, sql.max_query_bytes > 0, prompt.max_question_chars > 0.
// - extra 패턴은 로드 시점에 컴파일해 본다. 실패하면 설정 전체를 거부한다.
//   잘못된 패턴을 건너뛰고 기동하면 탐지 범위가 조용히 줄어든다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include "logger/structured_logger.hpp"
#include "patterns/pattern_rule.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// 숫자 필드는 타입이 틀리면 기본값으로 넘어가지 않고 오류로 처리한다.
// (row_limit: "many" 같은 오타가 기본값 1000 으로 조용히 바뀌지 않도록)
template <typename T>
[[nodiscard]] T read_number(const YAML::Node& node, T fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<T>();
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<std::string>();
}

[[nodiscard]] GlobalSettings parse_global(const YAML::Node& node) {
    GlobalSettings cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.log_level = read_string(node["log_level"], cfg.log_level);
    cfg.log_path  = read_string(node["log_path"],  cfg.log_path);
    return cfg;
}

[[nodiscard]] PromptSettings parse_prompt(const YAML::Node& node) {
    PromptSettings cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.max_question_chars = read_number(node["max_question_chars"], cfg.max_question_chars);
    cfg.extra_patterns     = read_string_sequence(node["extra_patterns"]);
    return cfg;
}

[[nodiscard]] SqlSettings parse_sql(const YAML::Node& node) {
    SqlSettings cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.max_query_bytes           = read_number(node["max_query_bytes"], cfg.max_query_bytes);
    cfg.row_limit                 = read_number(node["row_limit"], cfg.row_limit);
    cfg.extra_dangerous_patterns  = read_string_sequence(node["extra_dangerous_patterns"]);
    cfg.extra_suspicious_patterns = read_string_sequence(node["extra_suspicious_patterns"]);
    return cfg;
}

[[nodiscard]] PiiSettings parse_pii(const YAML::Node& node) {
    PiiSettings cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.min_confidence = read_number(node["min_confidence"], cfg.min_confidence);
    return cfg;
}

[[nodiscard]] BatchSettings parse_batch(const YAML::Node& node) {
    BatchSettings cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.worker_threads = read_number(node["worker_threads"], cfg.worker_threads);
    return cfg;
}

// 패턴 목록 중 첫 번째 컴파일 실패 메시지. 모두 성공하면 nullopt.
[[nodiscard]] std::optional<std::string>
check_patterns(std::string_view section, const std::vector<std::string>& patterns) {
    for (std::size_t i = 0; i < patterns.size(); ++i) {
        try {
            (void)compile_pattern(fmt::format("{}[{}]", section, i), patterns[i]);
        } catch (const PatternCompileError& e) {
            return fmt::format("config_loader: invalid pattern in {}: {}", section, e.what());
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<std::string> validate(const GateConfig& cfg) {
    if (!StructuredLogger::parse_level(cfg.global.log_level)) {
        return fmt::format("config_loader: global.log_level '{}' must be debug|info|warn|error",
                           cfg.global.log_level);
    }
    if (cfg.prompt.max_question_chars == 0) {
        return std::string("config_loader: prompt.max_question_chars must be greater than 0");
    }
    if (cfg.sql.max_query_bytes == 0) {
        return std::string("config_loader: sql.max_query_bytes must be greater than 0");
    }
    if (cfg.sql.row_limit == 0) {
        return std::string("config_loader: sql.row_limit must be greater than 0");
    }
    if (cfg.pii.min_confidence < 0.0 || cfg.pii.min_confidence > 1.0) {
        return fmt::format("config_loader: pii.min_confidence {} is outside [0, 1]",
                           cfg.pii.min_confidence);
    }

    if (auto err = check_patterns("prompt.extra_patterns", cfg.prompt.extra_patterns)) {
        return err;
    }
    if (auto err = check_patterns("sql.extra_dangerous_patterns", cfg.sql.extra_dangerous_patterns)) {
        return err;
    }
    if (auto err = check_patterns("sql.extra_suspicious_patterns", cfg.sql.extra_suspicious_patterns)) {
        return err;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// 파싱된 루트 노드 → GateConfig (섹션별 예외 처리)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<GateConfig, std::string> build_config(const YAML::Node& root) {
    // 빈 파일은 전부 기본값
    if (!root || root.IsNull()) {
        return GateConfig{};
    }
    if (!root.IsMap()) {
        const std::string err = "config_loader: top-level YAML node is not a map";
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    GateConfig  cfg{};
    std::string section;
    try {
        section    = "global";
        cfg.global = parse_global(root["global"]);
        section    = "prompt";
        cfg.prompt = parse_prompt(root["prompt"]);
        section    = "sql";
        cfg.sql    = parse_sql(root["sql"]);
        section    = "pii";
        cfg.pii    = parse_pii(root["pii"]);
        section    = "batch";
        cfg.batch  = parse_batch(root["batch"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing '{}' section: {}", section, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (auto err = validate(cfg)) {
        spdlog::error("{}", *err);
        return std::unexpected(*err);
    }

    spdlog::info("config_loader: config loaded, log_level={}, row_limit={}, "
                 "max_query_bytes={}, min_confidence={:.2f}, extra_patterns={}/{}/{}",
                 cfg.global.log_level, cfg.sql.row_limit, cfg.sql.max_query_bytes,
                 cfg.pii.min_confidence, cfg.prompt.extra_patterns.size(),
                 cfg.sql.extra_dangerous_patterns.size(),
                 cfg.sql.extra_suspicious_patterns.size());
    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<GateConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화 (path traversal 방지 목적)
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading config from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 섹션 파싱 + 검증
    return build_config(root);
}

std::expected<GateConfig, std::string> ConfigLoader::parse(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("config_loader: YAML error: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return build_config(root);
}
