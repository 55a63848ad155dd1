#pragma once

// ---------------------------------------------------------------------------
// json_format.hpp
//
// 응답/로그용 최소 JSON 직렬화 헬퍼 (nlohmann/json 없이 수동 직렬화).
// 출력 전용이며 파싱은 지원하지 않는다.
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// json_escape
//   JSON 문자열 값 이스케이프 (따옴표 없이 내용만 반환).
//   제어 문자는 \u00XX 로 변환한다. 올바른 UTF-8 은 그대로 두고,
//   잘못된 바이트는 하나씩 \ufffd 로 바꾼다.
[[nodiscard]] std::string json_escape(std::string_view sv);

// json_quote
//   "<escaped>" 형태로 따옴표까지 포함해 반환.
[[nodiscard]] std::string json_quote(std::string_view sv);

// json_string_array
//   ["a","b",...]. 입력 순서를 유지한다.
[[nodiscard]] std::string json_string_array(const std::vector<std::string>& values);

// json_number_or_na
//   값이 있으면 숫자, 없으면 "N/A" 문자열.
[[nodiscard]] std::string json_number_or_na(const std::optional<double>& value);
