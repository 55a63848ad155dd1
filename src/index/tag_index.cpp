#include "index/tag_index.hpp"

#include <spdlog/spdlog.h>

namespace {

// 없는 키 조회 시 돌려줄 공용 빈 집합
const std::unordered_set<std::string> kEmptySet{};

}  // namespace

TagIndex TagIndex::build(const Environment& env) {
    TagIndex index{};

    for (const auto& vm : env.vms) {
        for (const auto& tag : vm.tags) {
            index.tag_to_vm_ids[tag].insert(vm.vm_id);
        }
    }

    for (const auto& rule : env.fw_rules) {
        index.dest_tag_to_source_tags[rule.dest_tag].insert(rule.source_tag);
    }

    spdlog::debug("[tag_index] built: tags={}, dest_tags={}",
                  index.tag_to_vm_ids.size(), index.dest_tag_to_source_tags.size());
    return index;
}

const std::unordered_set<std::string>& TagIndex::vm_ids_with(const std::string& tag) const {
    const auto it = tag_to_vm_ids.find(tag);
    return it == tag_to_vm_ids.end() ? kEmptySet : it->second;
}

const TagSet& TagIndex::sources_reaching(const std::string& dest_tag) const {
    const auto it = dest_tag_to_source_tags.find(dest_tag);
    return it == dest_tag_to_source_tags.end() ? kEmptySet : it->second;
}
