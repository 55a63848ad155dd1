#pragma once

// ---------------------------------------------------------------------------
// attack_api.hpp
//
// 전송 계층(HTTP/UDS)과 무관한 조회 경계.
//
//   GetAttackers(vm_id) -> (attacker_ids, found)
//   GetStats(operation) -> (vm_count, request_count, average_request_time | N/A)
//
// [계측]
// get_attackers() 는 QueryService::attackers_of() 를
// StatsRecorder::measure(kAttackOperation, ...) 로 감싼다.
// 결과(found/not found)와 무관하게 호출마다 정확히 한 번 기록된다.
//
// [스레드 안전성]
// QueryService(불변 스냅샷), StatsRecorder(mutex), StructuredLogger(_mt sink)
// 모두 concurrent 호출 안전하므로 이 클래스도 여러 워커 스레드에서 공유한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "logger/structured_logger.hpp"
#include "query/query_service.hpp"
#include "stats/stats_recorder.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// 공격자 조회 연산의 통계 이름
inline constexpr std::string_view kAttackOperation = "attack";

// ---------------------------------------------------------------------------
// AttackersResponse
//   found == false 이면 attacker_ids 는 비어 있다.
//   found == true 이고 attacker_ids 가 비어 있으면 "알려진 VM, 공격자 없음".
// ---------------------------------------------------------------------------
struct AttackersResponse {
    std::string  vm_id{};
    AttackerList attacker_ids{};
    bool         found{false};
};

// ---------------------------------------------------------------------------
// StatsResponse
//   average_request_time: 초 단위. request_count == 0 이면 std::nullopt.
// ---------------------------------------------------------------------------
struct StatsResponse {
    std::size_t           vm_count{0};
    std::uint64_t         request_count{0};
    std::optional<double> average_request_time{};
};

class AttackApi {
public:
    // 생성자
    //   query  : 스냅샷 조회 서비스 (필수)
    //   stats  : 공유 통계 기록기 (필수)
    //   logger : 이벤트 로거 (nullptr 이면 이벤트 로그 생략)
    AttackApi(std::shared_ptr<const QueryService> query,
              std::shared_ptr<StatsRecorder>      stats,
              std::shared_ptr<StructuredLogger>   logger = nullptr);

    AttackApi(const AttackApi&)            = delete;
    AttackApi& operator=(const AttackApi&) = delete;

    // get_attackers
    //   transport: 이벤트 로그의 호출 경로 표시 ("http" | "uds" | ...)
    [[nodiscard]] AttackersResponse get_attackers(const std::string& vm_id,
                                                  std::string_view   transport = "api");

    // get_stats
    //   vm_count 는 스냅샷의 키 수, 나머지는 operation 의 통계.
    [[nodiscard]] StatsResponse get_stats(std::string_view operation = kAttackOperation) const;

private:
    std::shared_ptr<const QueryService> query_;
    std::shared_ptr<StatsRecorder>      stats_;
    std::shared_ptr<StructuredLogger>   logger_;
};

// ---------------------------------------------------------------------------
// JSON 직렬화 (HTTP/UDS 공통)
// ---------------------------------------------------------------------------

// {"vm_count":N,"request_count":N,"average_request_time":<float>|"N/A"}
[[nodiscard]] std::string to_json(const StatsResponse& stats);

// {"vm_id":"x","attackers":["a","b"]}
[[nodiscard]] std::string to_json(const AttackersResponse& response);
