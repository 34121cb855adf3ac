#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일(config/llmgate.yaml)을 로드하여 GateConfig 로 파싱한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자(main)는
//   게이트를 구성하지 않고 종료해야 한다.
// - All-or-nothing: 부분적으로 파싱된 설정을 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다.
//
// [보안 고려사항]
// - 설정 파일 경로는 환경 변수에서만 받는다. 사용자 입력을 직접 사용 금지.
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include "config/gate_config.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

class ConfigLoader {
public:
    // load
    //   파일 없음, 파싱 오류, 범위를 벗어난 값, 컴파일되지 않는 추가 패턴은
    //   모두 실패로 처리한다.
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load(const std::filesystem::path& config_path);

    // 이미 메모리에 있는 YAML 텍스트를 파싱한다 (경로 정규화 제외 load 와 동일).
    [[nodiscard]] static std::expected<GateConfig, std::string>
    parse(std::string_view yaml_text);
};
