#pragma once

// ---------------------------------------------------------------------------
// uds_server.hpp
//
// 운영 도구(CLI/대시보드)용 Unix Domain Socket 서버. 조회와 통계를 노출한다.
//
// 프레임은 [u32 little-endian 길이][JSON 본문] 이고 요청/응답 모두 같다.
//
//   {"command":"stats"}                   → {"ok":true,"payload":<StatsResponse>}
//   {"command":"attack","vm_id":"vm-1"}   → {"ok":true,"payload":<AttackersResponse>}
//   없는 vm_id                             → {"ok":false,"error":"vm_id not found","code":404,...}
//   그 밖의 오류                           → {"ok":false,"error":"<메시지>"}
//
// acceptor 는 strand 위에서만 만진다. 연결 코루틴은 io_context 에 바로 띄우므로
// 워커 스레드가 여럿이면 연결들이 병렬로 처리된다.
// ---------------------------------------------------------------------------

#include "api/attack_api.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace asio = boost::asio;

class UdsServer {
public:
    // 단일 요청 최대 크기 (4MiB)
    static constexpr std::uint32_t kMaxRequestSize = 4u * 1024u * 1024u;

    // socket_path 는 run() 에서 bind 하고, stop() 또는 소멸 시 지운다.
    UdsServer(const std::filesystem::path& socket_path,
              std::shared_ptr<AttackApi>   api,
              asio::io_context&            ioc);

    ~UdsServer();

    UdsServer(const UdsServer&)            = delete;
    UdsServer& operator=(const UdsServer&) = delete;
    UdsServer(UdsServer&&)                 = delete;
    UdsServer& operator=(UdsServer&&)      = delete;

    // start
    //   run() 을 acceptor strand 위에서 co_spawn 한다.
    void start();

    // run
    //   stale 소켓 파일 정리, bind/listen, accept 루프. strand 위에서만 구동한다.
    asio::awaitable<void> run();

    // stop
    //   멱등. 어느 스레드에서든 호출할 수 있고, 처리 중인 연결은 끝까지 응답한다.
    void stop();

    // dispatch
    //   요청 JSON 본문 하나를 처리해 응답 JSON 본문을 반환한다.
    //   소켓 I/O 와 분리되어 있어 단독으로 호출할 수 있다.
    [[nodiscard]] std::string dispatch(std::string_view request_json);

private:
    // close_listener
    //   acceptor 를 닫고 바인드했던 소켓 파일을 제거한다.
    void close_listener();

    // 프레임 하나 읽기 → dispatch → 프레임 하나 쓰기
    asio::awaitable<void> handle_client(asio::local::stream_protocol::socket socket);

    std::filesystem::path                         socket_path_;
    std::shared_ptr<AttackApi>                    api_;
    asio::io_context&                             ioc_;
    asio::strand<asio::io_context::executor_type> strand_;
    asio::local::stream_protocol::acceptor        acceptor_;
    std::atomic<bool>                             stop_requested_{false};
};

// ---------------------------------------------------------------------------
// parse_string_field
//   요청 본문 최상위 객체에서 key 의 문자열 값을 꺼낸다. 이스케이프(\uXXXX 와
//   서로게이트 쌍 포함)는 UTF-8 로 풀린다. 키가 없거나, 값이 문자열이 아니거나,
//   본문이 JSON 객체로 읽히지 않으면 빈 문자열.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string parse_string_field(std::string_view json, std::string_view key);
