// ---------------------------------------------------------------------------
// test_tag_index.cpp
//
// TagIndex 단위 테스트.
//
// [테스트 범위]
// - tag → VM id 집합 누적
// - dest_tag → source_tag 집합 누적
// - 중복 태그/중복 규칙은 집합 크기에 영향 없음
// - 없는 키 조회는 빈 집합 (오류 아님)
// ---------------------------------------------------------------------------

#include "index/tag_index.hpp"

#include <gtest/gtest.h>

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace {

VirtualMachine make_vm(std::string id, std::vector<std::string> tags) {
    VirtualMachine vm{};
    vm.vm_id = std::move(id);
    vm.tags  = std::move(tags);
    return vm;
}

FirewallRule make_rule(std::string source, std::string dest) {
    FirewallRule rule{};
    rule.source_tag = std::move(source);
    rule.dest_tag   = std::move(dest);
    return rule;
}

using IdSet = std::unordered_set<std::string>;

} // namespace

TEST(TagIndexTest, CollectsVmsPerTag) {
    Environment env;
    env.vms = {
        make_vm("A", {"web", "prod"}),
        make_vm("B", {"web"}),
        make_vm("C", {"db"}),
    };

    const TagIndex index = TagIndex::build(env);

    EXPECT_EQ(index.vm_ids_with("web"),  (IdSet{"A", "B"}));
    EXPECT_EQ(index.vm_ids_with("prod"), (IdSet{"A"}));
    EXPECT_EQ(index.vm_ids_with("db"),   (IdSet{"C"}));
    EXPECT_EQ(index.tag_to_vm_ids.size(), 3u);
}

TEST(TagIndexTest, CollectsSourcesPerDestTag) {
    Environment env;
    env.fw_rules = {
        make_rule("web",   "db"),
        make_rule("admin", "db"),
        make_rule("db",    "backup"),
    };

    const TagIndex index = TagIndex::build(env);

    EXPECT_EQ(index.sources_reaching("db"),     (IdSet{"web", "admin"}));
    EXPECT_EQ(index.sources_reaching("backup"), (IdSet{"db"}));
    // 규칙은 방향성이 있다: source 쪽 tag 는 dest 키로 등록되지 않는다.
    EXPECT_TRUE(index.sources_reaching("web").empty());
}

TEST(TagIndexTest, DuplicatesAreIdempotent) {
    Environment env;
    env.vms = {
        make_vm("A", {"web", "web"}),
    };
    env.fw_rules = {
        make_rule("web", "db"),
        make_rule("web", "db"),
    };

    const TagIndex index = TagIndex::build(env);

    EXPECT_EQ(index.vm_ids_with("web").size(), 1u);
    EXPECT_EQ(index.sources_reaching("db").size(), 1u);
}

TEST(TagIndexTest, MissingKeysYieldEmptySets) {
    const TagIndex index = TagIndex::build(Environment{});

    EXPECT_TRUE(index.vm_ids_with("nope").empty());
    EXPECT_TRUE(index.sources_reaching("nope").empty());
    EXPECT_TRUE(index.tag_to_vm_ids.empty()) << "lookups must not insert keys";
    EXPECT_TRUE(index.dest_tag_to_source_tags.empty());
}

TEST(TagIndexTest, VmWithoutTagsIsNotIndexed) {
    Environment env;
    env.vms = {make_vm("lonely", {})};

    const TagIndex index = TagIndex::build(env);
    EXPECT_TRUE(index.tag_to_vm_ids.empty());
}
