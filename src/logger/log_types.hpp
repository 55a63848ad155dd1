#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - 인덱스/조회 헤더를 include 하지 않는다. 호출자가 필요한 값만 채운다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// EnvironmentLoadLog
//   기동 시 환경 로드 + 인덱스 빌드 완료 이벤트.
// ---------------------------------------------------------------------------
struct EnvironmentLoadLog {
    std::string                                source_path{};
    std::uint64_t                              vm_count{0};
    std::uint64_t                              fw_rule_count{0};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};    // 로드 + 빌드 소요 시간
};

// ---------------------------------------------------------------------------
// AttackQueryLog
//   공격자 조회 한 건.
//   found == false 이면 attacker_count 는 0 이다.
//   transport: "http" | "uds" (호출 경로 구분용)
// ---------------------------------------------------------------------------
struct AttackQueryLog {
    std::string                                vm_id{};
    bool                                       found{false};
    std::uint64_t                              attacker_count{0};
    std::string                                transport{};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};    // 조회 소요 시간
};
