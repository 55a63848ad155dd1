#pragma once

#include "api/attack_api.hpp"
#include "common/types.hpp"
#include "http/http_server.hpp"
#include "index/attacker_index.hpp"
#include "logger/structured_logger.hpp"
#include "query/query_service.hpp"
#include "stats/stats_recorder.hpp"
#include "uds/uds_server.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// ServerConfig
//   AttackServer 의 모든 설정 값을 담는다.
//   하드코딩 금지: 값은 main 에서 환경변수/인자로부터 채운다.
//
//   environment_path : 환경 문서 경로 (vms + fw_rules)
//   listen_address   : HTTP 리슨 IP 주소 (예: "127.0.0.1")
//   listen_port      : HTTP 리슨 포트 (0 이면 OS 할당)
//   uds_socket_path  : 운영 도구용 Unix Domain Socket 경로 (빈 문자열이면 비활성)
//   log_path         : 이벤트 로그 파일 경로
//   log_level        : 로그 레벨 문자열 ("debug","info","warn","error")
//   worker_threads   : io_context 를 구동할 워커 스레드 수
// ---------------------------------------------------------------------------
struct ServerConfig {
    std::string   environment_path{};

    std::string   listen_address{};
    std::uint16_t listen_port{0};

    std::string   uds_socket_path{};
    std::string   log_path{};
    std::string   log_level{};

    std::uint32_t worker_threads{1};
};

// ---------------------------------------------------------------------------
// AttackServer
//   환경 로드 → 인덱스 빌드 → 리스너 기동 → Graceful Shutdown 을 담당한다.
//
//   사용 예:
//     AttackServer server(config);
//     if (!server.init()) { return EXIT_FAILURE; }  // 리스너 열기 전 실패
//     server.run(io_ctx);                          // io_ctx.run() 은 호출자가 실행
//
//   Graceful Shutdown:
//     stop() 호출 시 두 acceptor 를 닫고 시그널 대기를 취소한다.
//     진행 중인 연결 코루틴이 끝나면 io_context 의 작업이 소진되어
//     모든 워커의 io_context::run() 이 반환된다.
// ---------------------------------------------------------------------------
class AttackServer {
public:
    explicit AttackServer(ServerConfig config);

    ~AttackServer() = default;

    // 복사/이동 금지
    AttackServer(const AttackServer&)            = delete;
    AttackServer& operator=(const AttackServer&) = delete;
    AttackServer(AttackServer&&)                 = delete;
    AttackServer& operator=(AttackServer&&)      = delete;

    // -----------------------------------------------------------------------
    // init
    //   블로킹 초기화. 환경 로드 + TagIndex/AttackerIndex 빌드 후
    //   QueryService / StatsRecorder / AttackApi 를 구성한다.
    //   실패 시 아무 리스너도 열지 않은 상태로 LoadError 를 반환한다.
    // -----------------------------------------------------------------------
    [[nodiscard]] std::expected<void, LoadError> init();

    // -----------------------------------------------------------------------
    // run
    //   io_ctx 위에서 HTTP/UDS 리스너와 SIGTERM/SIGINT 핸들러를 등록한다.
    //   init() 성공 이후에만 호출해야 한다.
    // -----------------------------------------------------------------------
    void run(boost::asio::io_context& io_ctx);

    // -----------------------------------------------------------------------
    // stop
    //   Graceful Shutdown 을 시작한다. 여러 번 호출해도 안전.
    // -----------------------------------------------------------------------
    void stop();

    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }

    // 아래 접근자는 init()/run() 이전에는 nullptr 을 반환한다.
    [[nodiscard]] std::shared_ptr<AttackApi> api() const noexcept { return api_; }
    [[nodiscard]] HttpServer* http_server() const noexcept { return http_server_.get(); }
    [[nodiscard]] UdsServer*  uds_server()  const noexcept { return uds_server_.get(); }

private:
    ServerConfig config_;
    std::atomic<bool> stopping_{false};

    std::shared_ptr<StructuredLogger>        logger_{};
    std::shared_ptr<StatsRecorder>           stats_{};
    std::shared_ptr<const QueryService>      query_{};
    std::shared_ptr<AttackApi>               api_{};

    std::unique_ptr<HttpServer>              http_server_{};
    std::unique_ptr<UdsServer>               uds_server_{};
    std::unique_ptr<boost::asio::signal_set> signals_{};

    boost::asio::io_context*                 io_ctx_{nullptr};
};
