#include "http/http_server.hpp"

#include "common/json_format.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <optional>
#include <utility>

// ---------------------------------------------------------------------------
// HttpServer: HTTP/1.0 subset 구현
//
// 요청 헤더를 "\r\n\r\n" 까지 읽고 요청 라인만 해석한다. 본문은 읽지 않는다.
// 응답 후 소켓 즉시 close.
// ---------------------------------------------------------------------------

namespace asio = boost::asio;
using tcp      = asio::ip::tcp;

namespace {

constexpr std::string_view kAttackPath = "/api/v1/attack";
constexpr std::string_view kStatsPath  = "/api/v1/stats";
constexpr std::string_view kHealthPath = "/health";

HttpResponse json_response(int status_code, std::string_view status_text, std::string body) {
    return HttpResponse{
        .status_code = status_code,
        .status_text = std::string{status_text},
        .body        = std::move(body),
    };
}

HttpResponse error_response(int status_code, std::string_view status_text, std::string_view message) {
    return json_response(status_code, status_text,
                         fmt::format(R"({{"error":{}}})", json_quote(message)));
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') { return c - '0'; }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return -1;
}

// -----------------------------------------------------------------------
// find_query_param
//   "a=1&vm_id=x%20y" 에서 key 에 해당하는 첫 값을 디코딩해 반환.
//   "vm_id" 처럼 값 없이 키만 있으면 빈 문자열.
// -----------------------------------------------------------------------
std::optional<std::string> find_query_param(std::string_view query, std::string_view key) {
    while (!query.empty()) {
        const auto amp  = query.find('&');
        const auto pair = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);

        const auto eq = pair.find('=');
        const auto raw_key = pair.substr(0, eq);
        if (percent_decode(raw_key) != key) {
            continue;
        }
        if (eq == std::string_view::npos) {
            return std::string{};
        }
        return percent_decode(pair.substr(eq + 1));
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------
// split_request_line
//   "GET /path?x=1 HTTP/1.1" → {"GET", "/path?x=1"}
//   형식이 맞지 않으면 std::nullopt.
// -----------------------------------------------------------------------
struct RequestLine {
    std::string_view method{};
    std::string_view target{};
};

std::optional<RequestLine> split_request_line(std::string_view head) {
    const auto eol  = head.find("\r\n");
    const auto line = head.substr(0, eol);

    const auto sp1 = line.find(' ');
    if (sp1 == std::string_view::npos || sp1 == 0) {
        return std::nullopt;
    }
    const auto rest = line.substr(sp1 + 1);
    const auto sp2  = rest.find(' ');
    const auto target = rest.substr(0, sp2);
    if (target.empty() || target.front() != '/') {
        return std::nullopt;
    }
    return RequestLine{
        .method = line.substr(0, sp1),
        .target = target,
    };
}

void log_spawn_exception(std::exception_ptr eptr) {
    if (eptr) {
        try { std::rethrow_exception(eptr); }
        catch (const std::exception& e) {
            spdlog::error("[http] coroutine exception: {}", e.what());
        }
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// percent_decode
// ---------------------------------------------------------------------------
std::string percent_decode(std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        const char c = encoded[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < encoded.size()) {
            const int hi = hex_value(encoded[i + 1]);
            const int lo = hex_value(encoded[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// HttpResponse::to_wire
// ---------------------------------------------------------------------------
std::string HttpResponse::to_wire() const {
    return fmt::format(
        "HTTP/1.0 {} {}\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: {}\r\n"
        "Connection: close\r\n"
        "\r\n"
        "{}",
        status_code,
        status_text,
        body.size(),
        body
    );
}

// ---------------------------------------------------------------------------
// HttpServer 생성자/소멸자
// ---------------------------------------------------------------------------
HttpServer::HttpServer(std::string                listen_address,
                       std::uint16_t              port,
                       std::shared_ptr<AttackApi> api,
                       asio::io_context&          io_context)
    : listen_address_{std::move(listen_address)}
    , port_{port}
    , api_{std::move(api)}
    , io_context_{io_context}
    , strand_{asio::make_strand(io_context)}
    , acceptor_{strand_}
{}

HttpServer::~HttpServer() {
    // 소멸 시점에는 io_context 가 이 acceptor 를 더 이상 구동하지 않는다.
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void HttpServer::start() {
    asio::co_spawn(strand_, run(), [](std::exception_ptr eptr) { log_spawn_exception(eptr); });
}

// ---------------------------------------------------------------------------
// stop
//   acceptor 를 strand 위에서 닫아 run() 의 accept 루프를 종료한다.
// ---------------------------------------------------------------------------
void HttpServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    set_unhealthy("server shutting down");

    auto close_acceptor = [this]() {
        boost::system::error_code ec;
        acceptor_.cancel(ec);
        if (ec && ec != asio::error::bad_descriptor) {
            spdlog::warn("[http] stop: acceptor cancel error: {}", ec.message());
        }
        acceptor_.close(ec);
        if (ec && ec != asio::error::bad_descriptor) {
            spdlog::warn("[http] stop: acceptor close error: {}", ec.message());
        }
    };

    if (io_context_.stopped()) {
        close_acceptor();
        return;
    }
    asio::post(strand_, std::move(close_acceptor));
}

// ---------------------------------------------------------------------------
// run
//   bind/listen → accept 루프. 연결마다 handle_connection 코루틴을 spawn.
// ---------------------------------------------------------------------------
auto HttpServer::run() -> asio::awaitable<void> {
    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(listen_address_, ec);
    if (ec) {
        spdlog::error("[http] invalid listen address '{}': {}", listen_address_, ec.message());
        co_return;
    }
    const tcp::endpoint endpoint{address, port_};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        spdlog::error("[http] open error: {}", ec.message());
        co_return;
    }
    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        spdlog::warn("[http] cannot set SO_REUSEADDR: {}", ec.message());
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
        spdlog::error("[http] bind error on {}:{}: {}", listen_address_, port_, ec.message());
        co_return;
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("[http] listen error: {}", ec.message());
        co_return;
    }

    bound_port_.store(acceptor_.local_endpoint(ec).port(), std::memory_order_release);
    spdlog::info("[http] listening on {}:{}", listen_address_, local_port());

    for (;;) {
        tcp::socket socket{io_context_};
        co_await acceptor_.async_accept(
            socket, asio::redirect_error(asio::use_awaitable, ec));

        if (ec) {
            if (ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor) {
                // stop() 으로 acceptor 가 닫힘. 정상 종료
                spdlog::info("[http] accept loop stopped");
                co_return;
            }
            spdlog::warn("[http] accept error: {}", ec.message());
            continue;
        }

        // 각 연결을 독립 코루틴으로 처리 (실패가 accept 루프에 영향 없음)
        asio::co_spawn(io_context_, handle_connection(std::move(socket)),
                       [](std::exception_ptr eptr) { log_spawn_exception(eptr); });
    }
}

// ---------------------------------------------------------------------------
// handle_connection
//   1. 요청 헤더 읽기 ("\r\n\r\n" 까지, 최대 kMaxRequestHeadSize)
//   2. handle_request() 로 라우팅
//   3. 응답 송신 후 close
// ---------------------------------------------------------------------------
auto HttpServer::handle_connection(tcp::socket socket) -> asio::awaitable<void> {
    std::string               head;
    boost::system::error_code ec;

    co_await asio::async_read_until(
        socket,
        asio::dynamic_buffer(head, kMaxRequestHeadSize),
        "\r\n\r\n",
        asio::redirect_error(asio::use_awaitable, ec));

    HttpResponse response;
    if (!ec || (ec == asio::error::eof && !head.empty())) {
        response = handle_request(head);
    } else if (ec == asio::error::not_found) {
        // 버퍼 한도 초과
        spdlog::debug("[http] request head exceeds {} bytes", kMaxRequestHeadSize);
        response = error_response(431, "Request Header Fields Too Large", "request head too large");
    } else {
        if (ec != asio::error::eof) {
            spdlog::debug("[http] read error: {}", ec.message());
        }
        co_return;
    }

    const std::string wire = response.to_wire();
    co_await asio::async_write(
        socket, asio::buffer(wire), asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::debug("[http] write error: {}", ec.message());
    }

    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

// ---------------------------------------------------------------------------
// handle_request
// ---------------------------------------------------------------------------
HttpResponse HttpServer::handle_request(std::string_view request_head) {
    const auto request_line = split_request_line(request_head);
    if (!request_line) {
        return error_response(400, "Bad Request", "malformed request line");
    }
    if (request_line->method != "GET") {
        return error_response(405, "Method Not Allowed", "only GET is supported");
    }

    const auto qmark = request_line->target.find('?');
    const auto path  = request_line->target.substr(0, qmark);
    const auto query = (qmark == std::string_view::npos)
                       ? std::string_view{}
                       : request_line->target.substr(qmark + 1);

    spdlog::debug("[http] GET {}", request_line->target);

    if (path == kAttackPath) {
        return handle_attack(query);
    }
    if (path == kStatsPath) {
        const StatsResponse stats = api_->get_stats(kAttackOperation);
        std::string body = to_json(stats);
        spdlog::debug("[http] stats response: {}", body);
        return json_response(200, "OK", std::move(body));
    }
    if (path == kHealthPath) {
        return handle_health();
    }
    return error_response(404, "Not Found", "not found");
}

HttpResponse HttpServer::handle_attack(std::string_view query) {
    const auto vm_id = find_query_param(query, "vm_id");
    if (!vm_id || vm_id->empty()) {
        return error_response(400, "Bad Request", "missing required query parameter 'vm_id'");
    }

    const AttackersResponse result = api_->get_attackers(*vm_id, "http");
    if (!result.found) {
        return json_response(404, "Not Found",
                             fmt::format(R"({{"error":"vm_id not found","vm_id":{}}})",
                                         json_quote(result.vm_id)));
    }
    return json_response(200, "OK", json_string_array(result.attacker_ids));
}

HttpResponse HttpServer::handle_health() const {
    if (status() == HealthStatus::kHealthy) {
        return json_response(200, "OK", R"({"status":"ok"})");
    }

    std::string reason;
    {
        const std::lock_guard<std::mutex> lock{reason_mutex_};
        reason = unhealthy_reason_.empty() ? "service unavailable" : unhealthy_reason_;
    }
    return json_response(503, "Service Unavailable",
                         fmt::format(R"({{"status":"unhealthy","reason":{}}})", json_quote(reason)));
}

void HttpServer::set_unhealthy(std::string_view reason) {
    {
        const std::lock_guard<std::mutex> lock{reason_mutex_};
        unhealthy_reason_ = std::string{reason};
    }
    status_.store(HealthStatus::kUnhealthy, std::memory_order_release);
}

void HttpServer::set_healthy() {
    {
        const std::lock_guard<std::mutex> lock{reason_mutex_};
        unhealthy_reason_.clear();
    }
    status_.store(HealthStatus::kHealthy, std::memory_order_release);
}

auto HttpServer::status() const noexcept -> HealthStatus {
    return status_.load(std::memory_order_acquire);
}

std::uint16_t HttpServer::local_port() const noexcept {
    return bound_port_.load(std::memory_order_acquire);
}
