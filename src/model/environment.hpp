#pragma once

// ---------------------------------------------------------------------------
// environment.hpp
//
// 클라우드 환경 모델 구조체 정의 (헤더만, 구현 없음).
// EnvironmentLoader 를 통해 환경 문서(JSON 또는 YAML)에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다 (독립적).
// - 로드 이후 값은 변경되지 않는다. 인덱스 빌더는 const-ref 로만 받는다.
// ---------------------------------------------------------------------------

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// VirtualMachine
//   vm_id: 환경 전체에서 유일한 불투명 식별자.
//   tags : 순서 무의미, 중복 무의미 (인덱스 빌드 시 집합으로 취급).
// ---------------------------------------------------------------------------
struct VirtualMachine {
    std::string              vm_id{};
    std::vector<std::string> tags{};
};

// ---------------------------------------------------------------------------
// FirewallRule
//   source_tag 를 가진 VM 이 dest_tag 를 가진 VM 에 도달할 수 있음을 의미.
//   방향성 규칙이다 (dest → source 역방향 허용 아님).
// ---------------------------------------------------------------------------
struct FirewallRule {
    std::string source_tag{};
    std::string dest_tag{};
};

// ---------------------------------------------------------------------------
// Environment
//   환경 문서의 루트 구조체. EnvironmentLoader::load 가 반환하는 최종 결과물.
//   문서 순서를 그대로 보존한다.
// ---------------------------------------------------------------------------
struct Environment {
    std::vector<VirtualMachine> vms{};
    std::vector<FirewallRule>   fw_rules{};
};
