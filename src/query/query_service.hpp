#pragma once

// ---------------------------------------------------------------------------
// query_service.hpp
//
// AttackerIndex 스냅샷에 대한 읽기 전용 조회.
//
// [스레드 안전성]
// - 스냅샷이 불변이므로 모든 메서드는 concurrent 호출 안전 (잠금 없음).
// - 반환값은 항상 복사본이다. 호출자가 공유 스냅샷을 수정할 수 없다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "index/attacker_index.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <string>

class QueryService {
public:
    // 생성자: 빌드가 끝난 스냅샷을 주입받는다. nullptr 이면 모든 조회가 kNotFound.
    explicit QueryService(std::shared_ptr<const AttackerIndex> index);

    // attackers_of
    //   성공: vm_id 의 공격자 목록 (정렬된 복사본, 비어 있을 수 있음)
    //   실패: QueryErrorCode::kNotFound (스냅샷에 없는 vm_id)
    //
    //   빈 목록과 kNotFound 는 구분된다. 알려진 VM 은 공격자가 없어도 성공이다.
    [[nodiscard]] std::expected<AttackerList, QueryError>
    attackers_of(const std::string& vm_id) const;

    [[nodiscard]] std::size_t vm_count() const noexcept;

private:
    std::shared_ptr<const AttackerIndex> index_;
};
