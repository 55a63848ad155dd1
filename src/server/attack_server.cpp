#include "server/attack_server.hpp"

#include "model/environment_loader.hpp"

#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <stdexcept>
#include <utility>

// ---------------------------------------------------------------------------
// AttackServer 구현
//
// init() 흐름:
//   1. EnvironmentLoader::load(config_.environment_path)
//   2. AttackerIndex::from_environment → 불변 스냅샷
//   3. logger_, stats_, query_, api_ 생성
//   4. environment_loaded 이벤트 기록
//
// run() 흐름:
//   1. io_ctx_ 저장
//   2. http_server_ + start()
//   3. uds_server_ + start() (경로가 비어 있지 않을 때만)
//   4. SIGTERM/SIGINT 핸들러
//
// stop() 흐름:
//   1. stopping_ = true
//   2. http_server_->stop(), uds_server_->stop()
//   3. signals_ 대기 취소 → 남은 작업이 없으면 io_context::run() 반환
// ---------------------------------------------------------------------------

AttackServer::AttackServer(ServerConfig config)
    : config_{std::move(config)}
{}

// ---------------------------------------------------------------------------
// init
// ---------------------------------------------------------------------------
std::expected<void, LoadError> AttackServer::init()
{
    const auto started_at = std::chrono::steady_clock::now();

    // -----------------------------------------------------------------------
    // 1. 환경 로드. 실패 시 즉시 반환 (리스너는 아직 열리지 않음)
    // -----------------------------------------------------------------------
    auto env = EnvironmentLoader::load(config_.environment_path);
    if (!env) {
        return std::unexpected(std::move(env.error()));
    }

    // -----------------------------------------------------------------------
    // 2. 인덱스 빌드
    // -----------------------------------------------------------------------
    auto snapshot = AttackerIndex::from_environment(*env);

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started_at
    );

    // -----------------------------------------------------------------------
    // 3. logger, stats, query, api 생성
    //    이벤트 로그 sink 생성 실패는 조회 기능에 영향을 주지 않는다.
    // -----------------------------------------------------------------------
    try {
        logger_ = std::make_shared<StructuredLogger>(
            parse_log_level(config_.log_level), config_.log_path
        );
    } catch (const std::runtime_error& e) {
        spdlog::warn("[server] event log disabled ({}): {}", config_.log_path, e.what());
        logger_ = nullptr;
    }

    stats_ = std::make_shared<StatsRecorder>();
    query_ = std::make_shared<const QueryService>(std::move(snapshot));
    api_   = std::make_shared<AttackApi>(query_, stats_, logger_);

    // -----------------------------------------------------------------------
    // 4. 로드 이벤트
    // -----------------------------------------------------------------------
    if (logger_) {
        EnvironmentLoadLog entry;
        entry.source_path   = config_.environment_path;
        entry.vm_count      = env->vms.size();
        entry.fw_rule_count = env->fw_rules.size();
        entry.timestamp     = std::chrono::system_clock::now();
        entry.duration      = elapsed;
        logger_->log_environment_load(entry);
    }

    spdlog::info("[server] initialised: vms={} fw_rules={} in {}us",
                 env->vms.size(), env->fw_rules.size(), elapsed.count());
    return {};
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
void AttackServer::run(boost::asio::io_context& io_ctx)
{
    if (!api_) {
        spdlog::error("[server] run() called before successful init(); not serving");
        return;
    }

    io_ctx_ = &io_ctx;

    // -----------------------------------------------------------------------
    // 2. HTTP 리스너
    // -----------------------------------------------------------------------
    http_server_ = std::make_unique<HttpServer>(
        config_.listen_address,
        config_.listen_port,
        api_,
        io_ctx
    );
    http_server_->start();

    // -----------------------------------------------------------------------
    // 3. UDS 리스너 (선택)
    // -----------------------------------------------------------------------
    if (!config_.uds_socket_path.empty()) {
        uds_server_ = std::make_unique<UdsServer>(
            config_.uds_socket_path,
            api_,
            io_ctx
        );
        uds_server_->start();
    } else {
        spdlog::info("[server] UDS socket disabled");
    }

    // -----------------------------------------------------------------------
    // 4. 시그널 핸들러
    //    SIGTERM / SIGINT → stop()
    // -----------------------------------------------------------------------
    signals_ = std::make_unique<boost::asio::signal_set>(io_ctx, SIGTERM, SIGINT);
    signals_->async_wait(
        [this](const boost::system::error_code& ec, int signum) {
            if (!ec) {
                spdlog::info("[server] shutdown signal {} received", signum);
                stop();
            }
        }
    );
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------
void AttackServer::stop()
{
    if (stopping_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    spdlog::info("[server] stopping");

    if (http_server_) {
        http_server_->stop();
    }
    if (uds_server_) {
        uds_server_->stop();
    }

    if (!signals_ || io_ctx_ == nullptr) {
        return;
    }

    auto cancel_signals = [this]() {
        boost::system::error_code ec;
        signals_->cancel(ec);
        if (ec) {
            spdlog::warn("[server] signal cancel error: {}", ec.message());
        }
    };

    if (io_ctx_->stopped()) {
        cancel_signals();
        return;
    }
    boost::asio::post(*io_ctx_, std::move(cancel_signals));
}
