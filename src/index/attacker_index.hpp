#pragma once

// ---------------------------------------------------------------------------
// attacker_index.hpp
//
// VM id → 해당 VM 을 공격할 수 있는 VM id 집합. 조회 가능한 유일한 산출물.
//
// [불변 스냅샷]
// - 생성 후 변경 메서드가 없다. 서버는 std::shared_ptr<const AttackerIndex>
//   로 보관하고 모든 동시 조회가 잠금 없이 공유한다.
// - 환경의 모든 VM 이 키로 존재한다 (공격자가 없으면 빈 집합).
//   키가 없다는 것은 "알 수 없는 vm_id" 를 의미한다.
//
// [자기 공격]
// VM 자신의 tag 하나가 자신의 다른 tag 로의 source 로 허용되면 그 VM 은
// 자기 자신의 공격자 목록에 포함된다. 제외하지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "index/tag_index.hpp"
#include "model/environment.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

// 정렬된 집합: 응답 순서를 결정적으로 유지한다.
using AttackerSet = std::set<std::string>;

class AttackerIndex {
public:
    // build
    //   env 의 각 VM v 에 대해
    //     threatening = ∪_{t ∈ v.tags} tags.sources_reaching(t)
    //     attackers   = ∪_{s ∈ threatening} tags.vm_ids_with(s)
    //   를 계산한다. 없는 키는 빈 집합으로 취급한다.
    [[nodiscard]] static AttackerIndex build(const Environment& env, const TagIndex& tags);

    // from_environment
    //   TagIndex 빌드 → AttackerIndex 빌드를 한 번에 수행하고 공유 스냅샷으로 반환.
    [[nodiscard]] static std::shared_ptr<const AttackerIndex>
    from_environment(const Environment& env);

    // find
    //   vm_id 의 공격자 집합 포인터. 없는 id 면 nullptr. 평균 O(1).
    //   반환 포인터는 스냅샷 수명 동안 유효하며 읽기 전용이다.
    [[nodiscard]] const AttackerSet* find(const std::string& vm_id) const noexcept;

    [[nodiscard]] bool contains(const std::string& vm_id) const noexcept {
        return find(vm_id) != nullptr;
    }

    // vm_count
    //   스냅샷에 등록된 VM 수 (= 환경의 VM 수).
    [[nodiscard]] std::size_t vm_count() const noexcept { return attackers_.size(); }

    // entries
    //   전체 매핑 (테스트/진단용 읽기 전용 뷰).
    [[nodiscard]] const std::unordered_map<std::string, AttackerSet>& entries() const noexcept {
        return attackers_;
    }

private:
    explicit AttackerIndex(std::unordered_map<std::string, AttackerSet> attackers);

    std::unordered_map<std::string, AttackerSet> attackers_;
};
