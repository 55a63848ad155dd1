#pragma once

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AttackerList
//   특정 VM 을 공격할 수 있는 VM id 목록 (사전순 정렬, 중복 없음).
//   조회 결과는 항상 스냅샷의 복사본이므로 호출자가 자유롭게 수정해도 된다.
// ---------------------------------------------------------------------------
using AttackerList = std::vector<std::string>;

// ---------------------------------------------------------------------------
// LoadErrorCode
//   환경 문서 로드 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class LoadErrorCode : std::uint8_t {
    kFileNotFound   = 0,  // 경로가 존재하지 않거나 정규화 실패
    kUnreadable     = 1,  // 파일은 있으나 열 수 없음
    kSyntaxError    = 2,  // JSON/YAML 문법 오류
    kSchemaError    = 3,  // 필수 필드 누락 또는 타입 불일치
    kDuplicateVmId  = 4,  // 동일 vm_id 가 두 번 이상 등장
};

// ---------------------------------------------------------------------------
// LoadError
//   환경 로드 실패 시 반환되는 오류 정보.
//   std::expected<Environment, LoadError> 패턴과 함께 사용한다.
//   이 오류는 복구 불가: 호출자는 리스너를 열기 전에 프로세스를 종료한다.
// ---------------------------------------------------------------------------
struct LoadError {
    LoadErrorCode code{LoadErrorCode::kSchemaError};
    std::string   message{};  // 사람이 읽을 수 있는 오류 설명
    std::string   context{};  // 오류 위치 (파일 경로, "vms[3].tags" 등)
};

// ---------------------------------------------------------------------------
// QueryErrorCode
//   공격자 조회 결과 중 "성공이 아닌" 분류.
//   예외가 아닌 정상 흐름의 결과값이다.
// ---------------------------------------------------------------------------
enum class QueryErrorCode : std::uint8_t {
    kNotFound = 0,  // 스냅샷에 없는 vm_id
};

struct QueryError {
    QueryErrorCode code{QueryErrorCode::kNotFound};
    std::string    vm_id{};  // 조회에 사용된 id (로깅용)
};

// to_string
//   LoadErrorCode 를 로그용 문자열로 변환한다.
[[nodiscard]] constexpr const char* to_string(LoadErrorCode code) noexcept {
    switch (code) {
        case LoadErrorCode::kFileNotFound:  return "file_not_found";
        case LoadErrorCode::kUnreadable:    return "unreadable";
        case LoadErrorCode::kSyntaxError:   return "syntax_error";
        case LoadErrorCode::kSchemaError:   return "schema_error";
        case LoadErrorCode::kDuplicateVmId: return "duplicate_vm_id";
    }
    return "unknown";
}
