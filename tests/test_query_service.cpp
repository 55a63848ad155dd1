// ---------------------------------------------------------------------------
// test_query_service.cpp
//
// QueryService 단위 테스트.
//
// [테스트 범위]
// - 알려진 VM → 정렬된 공격자 목록
// - 알려진 VM, 공격자 없음 → 성공 + 빈 목록 (kNotFound 아님)
// - 알 수 없는 vm_id → 항상 kNotFound
// - 반환값은 복사본 (스냅샷 불변)
// - 여러 스레드 동시 조회
// ---------------------------------------------------------------------------

#include "query/query_service.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace {

std::shared_ptr<const AttackerIndex> make_snapshot() {
    Environment env;
    env.vms = {
        VirtualMachine{.vm_id = "A", .tags = {"web"}},
        VirtualMachine{.vm_id = "B", .tags = {"web"}},
        VirtualMachine{.vm_id = "C", .tags = {"db"}},
        VirtualMachine{.vm_id = "D", .tags = {"admin"}},
    };
    env.fw_rules = {
        FirewallRule{.source_tag = "web", .dest_tag = "db"},
    };
    return AttackerIndex::from_environment(env);
}

} // namespace

TEST(QueryServiceTest, KnownVmReturnsSortedAttackers) {
    const QueryService service{make_snapshot()};

    auto result = service.attackers_of("C");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (AttackerList{"A", "B"}));
}

TEST(QueryServiceTest, KnownVmWithoutAttackersIsFoundAndEmpty) {
    const QueryService service{make_snapshot()};

    auto result = service.attackers_of("D");
    ASSERT_TRUE(result.has_value()) << "empty attacker set must not be reported as not found";
    EXPECT_TRUE(result->empty());
}

TEST(QueryServiceTest, UnknownVmIsNotFound) {
    const QueryService service{make_snapshot()};

    for (int i = 0; i < 3; ++i) {
        auto result = service.attackers_of("does-not-exist");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, QueryErrorCode::kNotFound);
        EXPECT_EQ(result.error().vm_id, "does-not-exist");
    }
}

TEST(QueryServiceTest, EmptyIdIsNotFound) {
    const QueryService service{make_snapshot()};
    EXPECT_FALSE(service.attackers_of("").has_value());
}

TEST(QueryServiceTest, NullSnapshotAlwaysNotFound) {
    const QueryService service{nullptr};
    EXPECT_FALSE(service.attackers_of("A").has_value());
    EXPECT_EQ(service.vm_count(), 0u);
}

TEST(QueryServiceTest, ResultIsACopy) {
    auto snapshot = make_snapshot();
    const QueryService service{snapshot};

    auto first = service.attackers_of("C");
    ASSERT_TRUE(first.has_value());
    first->clear();
    first->push_back("tampered");

    auto second = service.attackers_of("C");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, (AttackerList{"A", "B"}));
    EXPECT_EQ(snapshot->find("C")->size(), 2u);
}

TEST(QueryServiceTest, VmCountMatchesSnapshot) {
    const QueryService service{make_snapshot()};
    EXPECT_EQ(service.vm_count(), 4u);
}

TEST(QueryServiceTest, ConcurrentLookups) {
    const QueryService service{make_snapshot()};

    constexpr int kThreads = 8;
    constexpr int kCalls   = 500;
    std::atomic<int> mismatches{0};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&service, &mismatches]() {
            for (int i = 0; i < kCalls; ++i) {
                auto found = service.attackers_of("C");
                if (!found || found->size() != 2) {
                    mismatches.fetch_add(1);
                }
                if (service.attackers_of("zzz").has_value()) {
                    mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
}
