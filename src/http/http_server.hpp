#pragma once

// ---------------------------------------------------------------------------
// http_server.hpp
//
// 조회 API 를 노출하는 HTTP/1.0 subset 서버.
//
// [라우트]
//   GET /api/v1/attack?vm_id=<id>  → 200 ["a","b"] | 404 | 400 (vm_id 누락)
//   GET /api/v1/stats              → 200 {"vm_count":..,"request_count":..,
//                                         "average_request_time":..|"N/A"}
//   GET /health                    → 200 {"status":"ok"} | 503 (종료 중)
//   기타 경로 → 404, GET 이외 메서드 → 405, 요청 라인 오류 → 400
//
// [연결 모델]
//   요청 하나 처리 후 즉시 close (Connection: close).
//   요청 헤더는 kMaxRequestHeadSize 까지만 읽는다.
//
// [스레드/비동기 모델]
//   Boost.Asio co_await 기반. io_context 는 외부에서 주입되며 여러 워커
//   스레드가 run() 할 수 있다. acceptor 는 strand 위에서만 접근하므로
//   stop() 이 accept 루프와 경합하지 않는다. 각 연결 코루틴은 io_context
//   위에서 독립적으로 실행된다.
// ---------------------------------------------------------------------------

#include "api/attack_api.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// HealthStatus
//   kHealthy   : 정상 동작 중 (HTTP 200 반환)
//   kUnhealthy : 종료 중 등 (HTTP 503 반환)
// ---------------------------------------------------------------------------
enum class HealthStatus : std::uint8_t {
    kHealthy   = 0,
    kUnhealthy = 1,
};

// ---------------------------------------------------------------------------
// HttpResponse
//   라우팅 결과. 직렬화는 to_wire() 에서 수행한다.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int         status_code{200};
    std::string status_text{"OK"};
    std::string body{};

    // HTTP/1.0 응답 문자열 (헤더 + 본문)
    [[nodiscard]] std::string to_wire() const;
};

class HttpServer {
public:
    // 요청 헤더 최대 크기 (8KiB)
    static constexpr std::size_t kMaxRequestHeadSize = 8 * 1024;

    // -----------------------------------------------------------------------
    // 생성자
    //   listen_address : 바인딩할 IP 주소 (예: "127.0.0.1")
    //   port           : 리슨 포트 (0 이면 OS 가 할당, local_port() 로 확인)
    //   api            : 조회 경계 (shared 소유권)
    //   io_context     : Boost.Asio io_context (코루틴 실행에 사용)
    // -----------------------------------------------------------------------
    HttpServer(std::string                 listen_address,
               std::uint16_t               port,
               std::shared_ptr<AttackApi>  api,
               boost::asio::io_context&    io_context);

    ~HttpServer();

    // 복사/이동 금지
    HttpServer(const HttpServer&)            = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&)                 = delete;
    HttpServer& operator=(HttpServer&&)      = delete;

    // -----------------------------------------------------------------------
    // start
    //   run() 을 acceptor strand 위에서 co_spawn 한다.
    // -----------------------------------------------------------------------
    void start();

    // -----------------------------------------------------------------------
    // run
    //   bind/listen 후 Accept 루프를 실행한다. stop() 전까지 반환하지 않는다.
    //   bind 실패 시 로그 후 co_return.
    //   반드시 strand 위에서 구동해야 한다 (start() 사용 권장).
    // -----------------------------------------------------------------------
    auto run() -> boost::asio::awaitable<void>;

    // -----------------------------------------------------------------------
    // stop
    //   acceptor 를 닫아 run() 을 종료시킨다. 여러 번 호출해도 안전.
    // -----------------------------------------------------------------------
    void stop();

    // -----------------------------------------------------------------------
    // handle_request
    //   요청 헤더(요청 라인 포함) 문자열을 라우팅해 응답을 만든다.
    //   소켓 I/O 와 분리되어 있어 단독으로 호출할 수 있다.
    // -----------------------------------------------------------------------
    [[nodiscard]] HttpResponse handle_request(std::string_view request_head);

    void set_unhealthy(std::string_view reason);
    void set_healthy();
    [[nodiscard]] auto status() const noexcept -> HealthStatus;

    // local_port
    //   listen 성공 후 실제 바인딩된 포트. listen 전이면 0.
    [[nodiscard]] std::uint16_t local_port() const noexcept;

private:
    auto handle_connection(boost::asio::ip::tcp::socket socket)
        -> boost::asio::awaitable<void>;

    [[nodiscard]] HttpResponse handle_attack(std::string_view query);
    [[nodiscard]] HttpResponse handle_health() const;

    std::string                                                    listen_address_;
    std::uint16_t                                                  port_;
    std::shared_ptr<AttackApi>                                     api_;
    boost::asio::io_context&                                       io_context_;
    boost::asio::strand<boost::asio::io_context::executor_type>    strand_;
    boost::asio::ip::tcp::acceptor                                 acceptor_;

    std::atomic<HealthStatus>                                      status_{HealthStatus::kHealthy};
    mutable std::mutex                                             reason_mutex_;
    std::string                                                    unhealthy_reason_{};

    std::atomic<std::uint16_t>                                     bound_port_{0};
    std::atomic<bool>                                              stop_requested_{false};
};

// ---------------------------------------------------------------------------
// percent_decode
//   application/x-www-form-urlencoded 디코딩 ('+' → ' ', %XX → byte).
//   잘못된 %-시퀀스는 그대로 남긴다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string percent_decode(std::string_view encoded);
