#pragma once

// ---------------------------------------------------------------------------
// yaml_codec.hpp
//
// DataValue <-> YAML 변환 (yaml-cpp). JSON 은 YAML 의 부분집합이므로
// `llmgate mask` 는 JSON 입력도 같은 경로로 읽는다.
//
// [스칼라 해석 규칙 (plain scalar 만, 따옴표 문자열은 항상 string)]
// - "", "~", "null"        → null
// - "true" / "false"       → bool (대소문자 무시, yes/no 는 string)
// - 정수 전체 소비         → integer (int64)
// - 실수 전체 소비         → real
// - 그 외                   → string
//
// [알려진 한계]
// - YAML 에는 tuple 이 없다. tuple 은 sequence 로 출력되고 다시 읽으면 list.
// - map 키는 scalar 만 지원한다. 복합 키는 std::unexpected.
// - 앵커/별칭은 펼쳐진 값으로 읽힌다.
// ---------------------------------------------------------------------------

#include "masking/data_value.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace YAML {
class Node;
}

// YAML 노드 하나를 DataValue 로 변환. 복합 키 등 표현 불가 구조는 오류.
[[nodiscard]] std::expected<DataValue, std::string> from_yaml(const YAML::Node& node);

// YAML/JSON 텍스트를 파싱하여 DataValue 로 변환.
[[nodiscard]] std::expected<DataValue, std::string> parse_yaml(std::string_view text);

// DataValue 를 블록 스타일 YAML 텍스트로 출력한다.
// 다시 읽었을 때 타입이 바뀌는 문자열 ("123", "true" 등) 은 따옴표로 감싼다.
[[nodiscard]] std::expected<std::string, std::string> to_yaml(const DataValue& value);

// plain scalar 텍스트의 해석 결과 (위 규칙).
[[nodiscard]] DataValue classify_plain_scalar(std::string_view text);
