#include "api/attack_api.hpp"

#include "common/json_format.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>
#include <utility>

AttackApi::AttackApi(std::shared_ptr<const QueryService> query,
                     std::shared_ptr<StatsRecorder>      stats,
                     std::shared_ptr<StructuredLogger>   logger)
    : query_{std::move(query)}
    , stats_{std::move(stats)}
    , logger_{std::move(logger)}
{
    if (!query_ || !stats_) {
        throw std::invalid_argument("AttackApi requires a query service and a stats recorder");
    }
}

AttackersResponse AttackApi::get_attackers(const std::string& vm_id, std::string_view transport) {
    const auto started = std::chrono::steady_clock::now();

    auto result = stats_->measure(kAttackOperation, [&] {
        return query_->attackers_of(vm_id);
    });

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    AttackersResponse response{};
    response.vm_id = vm_id;
    response.found = result.has_value();
    if (result) {
        response.attacker_ids = std::move(*result);
        spdlog::debug("[api] attack response for '{}': {} attackers",
                      vm_id, response.attacker_ids.size());
    } else {
        spdlog::info("[api] vm_id not found in environment: '{}'", vm_id);
    }

    if (logger_) {
        logger_->log_query(AttackQueryLog{
            .vm_id          = vm_id,
            .found          = response.found,
            .attacker_count = response.attacker_ids.size(),
            .transport      = std::string{transport},
            .timestamp      = std::chrono::system_clock::now(),
            .duration       = elapsed,
        });
    }

    return response;
}

StatsResponse AttackApi::get_stats(std::string_view operation) const {
    const OperationStats op = stats_->stats_of(operation);
    return StatsResponse{
        .vm_count             = query_->vm_count(),
        .request_count        = op.count,
        .average_request_time = op.average_seconds(),
    };
}

std::string to_json(const StatsResponse& stats) {
    return fmt::format(
        R"({{"vm_count":{},"request_count":{},"average_request_time":{}}})",
        stats.vm_count,
        stats.request_count,
        json_number_or_na(stats.average_request_time)
    );
}

std::string to_json(const AttackersResponse& response) {
    return fmt::format(
        R"({{"vm_id":{},"attackers":{}}})",
        json_quote(response.vm_id),
        json_string_array(response.attacker_ids)
    );
}
