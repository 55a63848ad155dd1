#include "server/attack_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace {

// 설정 변수 원문. 정의되지 않았으면 std::nullopt.
std::optional<std::string_view> lookup(const char* name) {
    const char* raw = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (raw == nullptr) {
        return std::nullopt;
    }
    return std::string_view{raw};
}

// 비어 있으면 fallback. keep_empty 이면 빈 값도 그대로 쓴다 (UDS_SOCKET_PATH="" → 비활성).
std::string setting(const char* name, std::string fallback, bool keep_empty = false) {
    const auto value = lookup(name);
    if (!value || (value->empty() && !keep_empty)) {
        return fallback;
    }
    return std::string{*value};
}

// 부호 없는 정수 설정. 숫자가 아니거나 T 범위를 넘으면 경고 후 fallback.
template <typename T>
T numeric_setting(const char* name, T fallback) {
    const auto value = lookup(name);
    if (!value || value->empty()) {
        return fallback;
    }

    unsigned long long parsed = 0;
    const char* const  last   = value->data() + value->size();
    const auto [ptr, ec]      = std::from_chars(value->data(), last, parsed);
    if (ec != std::errc{} || ptr != last || parsed > std::numeric_limits<T>::max()) {
        spdlog::warn("[config] {}='{}' is not a valid value, falling back to {}",
                     name, *value, fallback);
        return fallback;
    }
    return static_cast<T>(parsed);
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

} // namespace

// ---------------------------------------------------------------------------
// main
//   사용법: surfacegate [environment.json]
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 설정 로드 (인자 > 환경변수 > 기본값) ─────────────────────────────
    const uint32_t hw_threads = std::max(1u, std::thread::hardware_concurrency());

    ServerConfig config;
    config.environment_path = setting("ENVIRONMENT_PATH", "config/environment.json");
    config.listen_address   = setting("LISTEN_ADDR", "127.0.0.1");
    config.listen_port      = numeric_setting<std::uint16_t>("LISTEN_PORT", 5000);
    config.uds_socket_path  = setting("UDS_SOCKET_PATH", "/tmp/surfacegate.sock", true);
    config.log_path         = setting("LOG_PATH", "/tmp/surfacegate.log");
    config.log_level        = setting("LOG_LEVEL", "info");
    config.worker_threads   = std::max(1u, numeric_setting<std::uint32_t>("WORKER_THREADS", hw_threads));

    if (argc > 1 && argv[1][0] != '\0') {
        config.environment_path = argv[1];
    }

    // ── 진단 로그 레벨 (이벤트 로그와 동일) ─────────────────────────────
    spdlog::set_level(to_spdlog_level(parse_log_level(config.log_level)));
    spdlog::info("[main] surfacegate starting: environment={} http={}:{} uds={} workers={} level={}",
                 config.environment_path, config.listen_address, config.listen_port,
                 config.uds_socket_path.empty() ? "(disabled)" : config.uds_socket_path,
                 config.worker_threads, config.log_level);

    // io_context 는 server 가 소유한 리스너보다 오래 살아야 한다.
    boost::asio::io_context ioc{static_cast<int>(config.worker_threads)};

    // ── 블로킹 초기화. 실패하면 리스너를 열지 않고 종료 ────────────────
    AttackServer server{config};
    if (auto init = server.init(); !init) {
        const LoadError& err = init.error();
        spdlog::critical("[main] environment load failed [{}]: {} ({})",
                         to_string(err.code), err.message, err.context);
        return EXIT_FAILURE;
    }

    // ── 워커 N 개가 io_context 하나를 공유한다 (메인 스레드 포함) ───────
    server.run(ioc);

    auto run_worker = [&ioc]() {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            spdlog::critical("[main] worker aborted: {}", e.what());
            ioc.stop();
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(config.worker_threads - 1);
    for (uint32_t i = 1; i < config.worker_threads; ++i) {
        workers.emplace_back(run_worker);
    }
    run_worker();

    for (auto& worker : workers) {
        worker.join();
    }

    spdlog::info("[main] all workers returned, exiting");
    return EXIT_SUCCESS;
}
