#pragma once

// ---------------------------------------------------------------------------
// environment_loader.hpp
//
// 환경 문서(vms + fw_rules)를 읽어 Environment 로 파싱하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(LoadError) 반환. 호출자는 실패 시
//   리스너를 열지 않고 프로세스를 종료해야 한다.
// - yaml-cpp 로 파싱한다. JSON 은 YAML flow 스타일이므로 원본 JSON
//   문서를 그대로 읽을 수 있다.
// - All-or-nothing: 부분적으로 파싱된 환경을 반환하지 않는다.
//
// [순환 의존성]
// environment_loader.hpp → environment.hpp, common/types.hpp (단방향만)
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string_view>

#include "common/types.hpp"  // LoadError
#include "environment.hpp"   // Environment

// ---------------------------------------------------------------------------
// EnvironmentLoader
//   정적 로드만 제공한다. 로드 이후 환경은 변경되지 않는다.
// ---------------------------------------------------------------------------
class EnvironmentLoader {
public:
    // load
    //   지정된 경로의 문서를 읽어 Environment 로 파싱한다.
    //
    //   [실패 분류]
    //   - 경로 없음            → kFileNotFound
    //   - 열기 실패            → kUnreadable
    //   - 문법 오류            → kSyntaxError (라인/컬럼 포함)
    //   - 필수 필드 누락/타입  → kSchemaError (항목 위치 포함)
    //   - vm_id 중복           → kDuplicateVmId
    [[nodiscard]] static std::expected<Environment, LoadError>
    load(const std::filesystem::path& path);

    // parse
    //   메모리상의 문서 텍스트를 load() 와 동일한 규칙으로 파싱한다.
    //   source_name 은 오류 메시지의 위치 표시에만 쓰인다.
    [[nodiscard]] static std::expected<Environment, LoadError>
    parse(std::string_view document, std::string_view source_name = "<memory>");
};
