#pragma once

// ---------------------------------------------------------------------------
// tag_index.hpp
//
// 환경을 한 번 훑어 AttackerIndex 빌드에 쓰이는 두 중간 맵을 만든다.
//
//   tag_to_vm_ids           : tag      → 해당 tag 를 가진 VM id 집합
//   dest_tag_to_source_tags : dest_tag → 그 dest_tag 에 도달 가능한 source_tag 집합
//
// 두 맵 모두 집합 누적이므로 중복 태그/중복 규칙은 결과에 영향이 없다.
// 빌드 후에는 변경하지 않는다.
// ---------------------------------------------------------------------------

#include "model/environment.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>

using TagSet              = std::unordered_set<std::string>;
using TagToVmIds          = std::unordered_map<std::string, std::unordered_set<std::string>>;
using DestTagToSourceTags = std::unordered_map<std::string, TagSet>;

struct TagIndex {
    TagToVmIds          tag_to_vm_ids{};
    DestTagToSourceTags dest_tag_to_source_tags{};

    // build
    //   vms / fw_rules 를 각각 한 번씩 순회한다. O(전체 태그 수 + 규칙 수).
    [[nodiscard]] static TagIndex build(const Environment& env);

    // vm_ids_with
    //   tag 를 가진 VM id 집합. 없는 tag 는 빈 집합 (오류 아님).
    [[nodiscard]] const std::unordered_set<std::string>& vm_ids_with(const std::string& tag) const;

    // sources_reaching
    //   dest_tag 에 도달 가능한 source_tag 집합. 규칙이 없으면 빈 집합.
    [[nodiscard]] const TagSet& sources_reaching(const std::string& dest_tag) const;
};
