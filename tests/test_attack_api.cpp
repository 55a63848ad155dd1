// ---------------------------------------------------------------------------
// test_attack_api.cpp
//
// AttackApi 단위 테스트.
//
// [테스트 범위]
// - get_attackers: found / not found / 알려진 VM + 빈 목록
// - 호출마다 "attack" 통계가 정확히 한 번 증가 (not found 포함)
// - get_stats: 요청 전 average_request_time == N/A, vm_count == 스냅샷 키 수
// - to_json 직렬화 형태
// - 필수 의존성 누락 시 std::invalid_argument
// ---------------------------------------------------------------------------

#include "api/attack_api.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::shared_ptr<const QueryService> make_query_service() {
    Environment env;
    env.vms = {
        VirtualMachine{.vm_id = "A", .tags = {"web"}},
        VirtualMachine{.vm_id = "B", .tags = {"db"}},
        VirtualMachine{.vm_id = "C", .tags = {"admin"}},
    };
    env.fw_rules = {
        FirewallRule{.source_tag = "web", .dest_tag = "db"},
    };
    return std::make_shared<const QueryService>(AttackerIndex::from_environment(env));
}

} // namespace

class AttackApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        stats_ = std::make_shared<StatsRecorder>();
        api_   = std::make_unique<AttackApi>(make_query_service(), stats_);
    }

    std::shared_ptr<StatsRecorder> stats_;
    std::unique_ptr<AttackApi>     api_;
};

TEST_F(AttackApiTest, KnownVmReturnsAttackers) {
    const AttackersResponse resp = api_->get_attackers("B");

    EXPECT_TRUE(resp.found);
    EXPECT_EQ(resp.vm_id, "B");
    EXPECT_EQ(resp.attacker_ids, (AttackerList{"A"}));
}

TEST_F(AttackApiTest, KnownVmWithoutAttackersIsFound) {
    const AttackersResponse resp = api_->get_attackers("C");

    EXPECT_TRUE(resp.found);
    EXPECT_TRUE(resp.attacker_ids.empty());
}

TEST_F(AttackApiTest, UnknownVmIsNotFound) {
    const AttackersResponse resp = api_->get_attackers("does-not-exist");

    EXPECT_FALSE(resp.found);
    EXPECT_TRUE(resp.attacker_ids.empty());
}

TEST_F(AttackApiTest, EveryCallIsCountedRegardlessOfOutcome) {
    (void)api_->get_attackers("A");
    (void)api_->get_attackers("B");
    (void)api_->get_attackers("missing");

    EXPECT_EQ(stats_->stats_of(kAttackOperation).count, 3u);

    const StatsResponse stats = api_->get_stats();
    EXPECT_EQ(stats.request_count, 3u);
    ASSERT_TRUE(stats.average_request_time.has_value());
    EXPECT_GE(*stats.average_request_time, 0.0);
}

TEST_F(AttackApiTest, StatsBeforeAnyRequest) {
    const StatsResponse stats = api_->get_stats();

    EXPECT_EQ(stats.vm_count, 3u);
    EXPECT_EQ(stats.request_count, 0u);
    EXPECT_FALSE(stats.average_request_time.has_value());
    EXPECT_EQ(to_json(stats), R"({"vm_count":3,"request_count":0,"average_request_time":"N/A"})");
}

TEST_F(AttackApiTest, StatsForOtherOperationIsIndependent) {
    (void)api_->get_attackers("A");

    const StatsResponse other = api_->get_stats("something_else");
    EXPECT_EQ(other.vm_count, 3u);
    EXPECT_EQ(other.request_count, 0u);
}

TEST_F(AttackApiTest, ConcurrentRequestsAreAllCounted) {
    constexpr int kThreads = 6;
    constexpr int kCalls   = 300;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < kCalls; ++i) {
                (void)api_->get_attackers((i + t) % 2 == 0 ? "B" : "nope");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(api_->get_stats().request_count, static_cast<std::uint64_t>(kThreads) * kCalls);
}

TEST(AttackApiJsonTest, AttackersResponseJson) {
    AttackersResponse resp;
    resp.vm_id        = "vm-1";
    resp.attacker_ids = {"vm-2", "vm-3"};
    resp.found        = true;

    EXPECT_EQ(to_json(resp), R"({"vm_id":"vm-1","attackers":["vm-2","vm-3"]})");
}

TEST(AttackApiJsonTest, StatsResponseJsonWithAverage) {
    StatsResponse stats;
    stats.vm_count             = 10;
    stats.request_count        = 4;
    stats.average_request_time = 0.25;

    EXPECT_EQ(to_json(stats), R"({"vm_count":10,"request_count":4,"average_request_time":0.25})");
}

TEST(AttackApiConstructionTest, RequiresQueryAndStats) {
    EXPECT_THROW(AttackApi(nullptr, std::make_shared<StatsRecorder>()), std::invalid_argument);
    EXPECT_THROW(AttackApi(make_query_service(), nullptr), std::invalid_argument);
}
