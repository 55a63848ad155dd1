#pragma once

// ---------------------------------------------------------------------------
// stats_recorder.hpp
//
// 이름 붙은 연산별 호출 횟수와 누적 실행 시간을 기록한다.
//
// [스레드 안전성]
// - record / stats_of / operations: concurrent 호출 안전.
// - count 증가와 total_time 누적은 하나의 mutex 구간에서 함께 수행한다.
//   두 값이 서로 다른 시점의 값으로 관측되지 않는다 (평균 계산 일관성).
//
// [격리 원칙]
// - 통계 기록 실패가 요청 처리 실패로 전파되지 않도록 record() 는 noexcept.
// - measure() 는 감싼 호출이 예외로 끝나도 정확히 한 번 기록한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// OperationStats
//   특정 시점의 연산 통계 (값 객체).
//   average_seconds(): count == 0 이면 std::nullopt ("N/A").
// ---------------------------------------------------------------------------
struct OperationStats {
    std::uint64_t            count{0};
    std::chrono::nanoseconds total_time{0};

    [[nodiscard]] std::optional<double> average_seconds() const noexcept {
        if (count == 0) {
            return std::nullopt;
        }
        return std::chrono::duration<double>(total_time).count() / static_cast<double>(count);
    }
};

class StatsRecorder {
public:
    StatsRecorder()  = default;
    ~StatsRecorder() = default;

    // 복사/이동 금지 (mutex 소유)
    StatsRecorder(const StatsRecorder&)            = delete;
    StatsRecorder& operator=(const StatsRecorder&) = delete;
    StatsRecorder(StatsRecorder&&)                 = delete;
    StatsRecorder& operator=(StatsRecorder&&)      = delete;

    // record
    //   operation 의 count 를 1 증가시키고 elapsed 를 누적한다.
    void record(std::string_view operation, std::chrono::nanoseconds elapsed) noexcept;

    // stats_of
    //   기록이 없는 연산은 {0, 0} (오류 아님).
    [[nodiscard]] OperationStats stats_of(std::string_view operation) const;

    // operations
    //   한 번 이상 기록된 연산 이름 목록 (사전순).
    [[nodiscard]] std::vector<std::string> operations() const;

    // measure
    //   fn() 실행 시간을 측정해 operation 으로 기록하고 결과를 그대로 반환한다.
    //   fn 이 예외를 던져도 기록 후 예외를 그대로 전파한다.
    template <typename Fn>
    decltype(auto) measure(std::string_view operation, Fn&& fn) {
        const ScopedTimer timer{*this, operation};
        return std::forward<Fn>(fn)();
    }

private:
    // ScopedTimer
    //   소멸 시점에 경과 시간을 record() 한다 (정상 반환/예외 모두).
    class ScopedTimer {
    public:
        ScopedTimer(StatsRecorder& recorder, std::string_view operation) noexcept
            : recorder_{recorder}
            , operation_{operation}
            , started_{std::chrono::steady_clock::now()}
        {}

        ~ScopedTimer() {
            recorder_.record(operation_, std::chrono::steady_clock::now() - started_);
        }

        ScopedTimer(const ScopedTimer&)            = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        StatsRecorder&                        recorder_;
        std::string_view                      operation_;
        std::chrono::steady_clock::time_point started_;
    };

    mutable std::mutex                              mutex_;
    std::unordered_map<std::string, OperationStats> stats_;
};
