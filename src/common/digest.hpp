#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// short_digest
//   SHA-256 해시의 앞 hex_chars 글자 (소문자 hex) 를 반환한다.
//   감사 로그에서 원문 SQL/사용자 입력 대신 상관관계 키로 사용한다.
//   원문을 복원할 수 없으므로 로그에 남겨도 안전하다.
[[nodiscard]] std::string short_digest(std::string_view data, std::size_t hex_chars = 16);
