// ---------------------------------------------------------------------------
// attacker_index.cpp
//
// [복잡도]
// O(전체 VM 태그 수 × dest_tag 당 평균 source_tag 수 × tag 당 평균 VM 수).
// 기동 시 한 번만 수행하므로 조회 경로에는 영향이 없다.
// ---------------------------------------------------------------------------

#include "index/attacker_index.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <unordered_set>
#include <utility>

AttackerIndex::AttackerIndex(std::unordered_map<std::string, AttackerSet> attackers)
    : attackers_{std::move(attackers)}
{}

AttackerIndex AttackerIndex::build(const Environment& env, const TagIndex& tags) {
    std::unordered_map<std::string, AttackerSet> attackers;
    attackers.reserve(env.vms.size());

    for (const auto& vm : env.vms) {
        // 1. vm 의 tag 중 하나로 도달 가능한 source_tag 합집합
        std::unordered_set<std::string> threatening_tags;
        for (const auto& tag : vm.tags) {
            const auto& sources = tags.sources_reaching(tag);
            threatening_tags.insert(sources.begin(), sources.end());
        }

        // 2. 해당 source_tag 를 가진 VM 합집합 (자기 자신 포함 가능)
        AttackerSet vm_attackers;
        for (const auto& source_tag : threatening_tags) {
            const auto& holders = tags.vm_ids_with(source_tag);
            vm_attackers.insert(holders.begin(), holders.end());
        }

        // 공격자가 없어도 키는 반드시 등록한다.
        attackers[vm.vm_id] = std::move(vm_attackers);
    }

    return AttackerIndex{std::move(attackers)};
}

std::shared_ptr<const AttackerIndex> AttackerIndex::from_environment(const Environment& env) {
    const auto started = std::chrono::steady_clock::now();

    const TagIndex tags = TagIndex::build(env);
    auto index = std::make_shared<const AttackerIndex>(build(env, tags));

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("[attacker_index] built for {} vms and {} firewall rules in {}us",
                 env.vms.size(), env.fw_rules.size(), elapsed.count());
    return index;
}

const AttackerSet* AttackerIndex::find(const std::string& vm_id) const noexcept {
    const auto it = attackers_.find(vm_id);
    return it == attackers_.end() ? nullptr : &it->second;
}
