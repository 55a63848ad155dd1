#include "stats/stats_recorder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

void StatsRecorder::record(std::string_view operation, std::chrono::nanoseconds elapsed) noexcept {
    try {
        const std::lock_guard<std::mutex> lock{mutex_};
        auto it = stats_.find(std::string{operation});
        if (it == stats_.end()) {
            it = stats_.emplace(std::string{operation}, OperationStats{}).first;
        }
        it->second.count += 1;
        it->second.total_time += elapsed;
    } catch (const std::exception& e) {
        // 할당 실패 등: 해당 기록 한 건만 유실한다.
        spdlog::warn("[stats] failed to record operation '{}': {}", operation, e.what());
    }
}

OperationStats StatsRecorder::stats_of(std::string_view operation) const {
    const std::lock_guard<std::mutex> lock{mutex_};
    const auto it = stats_.find(std::string{operation});
    return it == stats_.end() ? OperationStats{} : it->second;
}

std::vector<std::string> StatsRecorder::operations() const {
    std::vector<std::string> names;
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        names.reserve(stats_.size());
        for (const auto& [name, stats] : stats_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}
