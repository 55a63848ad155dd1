// ---------------------------------------------------------------------------
// uds_server.cpp
//
// 운영 도구용 Unix Domain Socket 인터페이스.
//
// [프레임]
//   [u32 LE 본문 길이][JSON 본문]. 요청/응답 동일.
//   연결당 요청 1건을 처리하고 닫는다.
//
// [격리]
//   프레임 오류나 I/O 실패는 해당 연결만 종료한다. 리스너와 HTTP 경로는 영향 없음.
// ---------------------------------------------------------------------------

#include "uds/uds_server.hpp"

#include "common/json_format.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace {

using stream_protocol = asio::local::stream_protocol;
using FrameHeader     = std::array<std::uint8_t, 4>;

// ---------------------------------------------------------------------------
// 응답 본문
// ---------------------------------------------------------------------------
std::string ok_body(std::string_view payload_json) {
    return fmt::format(R"({{"ok":true,"payload":{}}})", payload_json);
}

std::string error_body(std::string_view message) {
    return fmt::format(R"({{"ok":false,"error":{}}})", json_quote(message));
}

std::string not_found_body(std::string_view vm_id) {
    return fmt::format(R"({{"ok":false,"error":"vm_id not found","code":404,"vm_id":{}}})",
                       json_quote(vm_id));
}

// ---------------------------------------------------------------------------
// 프레임 헤더 (little-endian u32)
// ---------------------------------------------------------------------------
FrameHeader to_header(std::uint32_t length) {
    FrameHeader header{};
    for (std::size_t i = 0; i < header.size(); ++i) {
        header[i] = static_cast<std::uint8_t>(length >> (8 * i));
    }
    return header;
}

std::uint32_t from_header(const FrameHeader& header) {
    std::uint32_t length = 0;
    for (std::size_t i = 0; i < header.size(); ++i) {
        length |= static_cast<std::uint32_t>(header[i]) << (8 * i);
    }
    return length;
}

// ---------------------------------------------------------------------------
// read_frame
//   요청 프레임 1개를 읽는다. EOF, I/O 오류, 길이 위반이면 std::nullopt.
// ---------------------------------------------------------------------------
asio::awaitable<std::optional<std::string>> read_frame(stream_protocol::socket& socket,
                                                       std::uint32_t            max_length) {
    boost::system::error_code ec;

    FrameHeader header{};
    co_await asio::async_read(socket, asio::buffer(header),
                              asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        if (ec != asio::error::eof) {
            spdlog::warn("[uds] frame header read failed: {}", ec.message());
        }
        co_return std::nullopt;
    }

    const std::uint32_t length = from_header(header);
    if (length == 0 || length > max_length) {
        spdlog::warn("[uds] rejecting frame of {} bytes (limit {})", length, max_length);
        co_return std::nullopt;
    }

    std::string body(length, '\0');
    co_await asio::async_read(socket, asio::buffer(body),
                              asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::warn("[uds] frame body read failed after header of {} bytes: {}",
                     length, ec.message());
        co_return std::nullopt;
    }
    co_return body;
}

// ---------------------------------------------------------------------------
// write_frame
//   헤더와 본문을 gather write 로 한 번에 보낸다.
// ---------------------------------------------------------------------------
asio::awaitable<void> write_frame(stream_protocol::socket& socket, const std::string& body) {
    const FrameHeader header = to_header(static_cast<std::uint32_t>(body.size()));
    const std::array<asio::const_buffer, 2> frame{
        asio::buffer(header),
        asio::buffer(body),
    };

    boost::system::error_code ec;
    co_await asio::async_write(socket, frame, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::warn("[uds] response write failed: {}", ec.message());
    }
}

void log_spawn_exception(std::exception_ptr eptr) {
    if (eptr) {
        try { std::rethrow_exception(eptr); }
        catch (const std::exception& e) {
            spdlog::error("[uds] coroutine exception: {}", e.what());
        }
    }
}

// 코드 포인트 하나를 UTF-8 로 덧붙인다.
void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// ---------------------------------------------------------------------------
// RequestScanner
//   요청 본문의 최상위 객체를 키 단위로 훑는다. 값 안에 든 문자열은
//   키로 보지 않으며, 중첩 객체/배열 값은 건너뛴다.
// ---------------------------------------------------------------------------
class RequestScanner {
public:
    explicit RequestScanner(std::string_view json) : json_{json} {}

    // key 의 문자열 값. 키가 없거나 값이 문자열이 아니거나 문서가 깨졌으면 nullopt.
    std::optional<std::string> string_field(std::string_view key) {
        pos_ = 0;
        skip_spaces();
        if (!consume('{')) {
            return std::nullopt;
        }
        skip_spaces();
        if (consume('}')) {
            return std::nullopt;
        }

        for (;;) {
            skip_spaces();
            const auto name = read_string();
            if (!name) {
                return std::nullopt;
            }
            skip_spaces();
            if (!consume(':')) {
                return std::nullopt;
            }
            skip_spaces();

            if (*name == key) {
                if (peek() != '"') {
                    return std::nullopt;   // 문자열 값이 아님
                }
                return read_string();
            }
            if (!skip_value()) {
                return std::nullopt;
            }
            skip_spaces();
            if (!consume(',')) {
                return std::nullopt;   // '}' 로 끝났거나 손상
            }
        }
    }

private:
    [[nodiscard]] char peek() const { return pos_ < json_.size() ? json_[pos_] : '\0'; }

    bool consume(char c) {
        if (pos_ < json_.size() && json_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_spaces() {
        while (pos_ < json_.size() &&
               (json_[pos_] == ' ' || json_[pos_] == '\t' || json_[pos_] == '\n' || json_[pos_] == '\r')) {
            ++pos_;
        }
    }

    std::optional<char32_t> read_hex4() {
        if (json_.size() - pos_ < 4) {
            return std::nullopt;
        }
        char32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = json_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9')      { value |= static_cast<char32_t>(c - '0'); }
            else if (c >= 'a' && c <= 'f') { value |= static_cast<char32_t>(c - 'a' + 10); }
            else if (c >= 'A' && c <= 'F') { value |= static_cast<char32_t>(c - 'A' + 10); }
            else { return std::nullopt; }
        }
        return value;
    }

    // "\u" 뒤의 XXXX (서로게이트 쌍이면 다음 \uXXXX 까지) 를 UTF-8 로 붙인다.
    bool read_unicode_escape(std::string& out) {
        const auto unit = read_hex4();
        if (!unit) {
            return false;
        }
        char32_t cp = *unit;
        if (cp >= 0xD800 && cp <= 0xDBFF && json_.substr(pos_, 2) == "\\u") {
            const std::size_t resume = pos_;
            pos_ += 2;
            const auto low = read_hex4();
            if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (*low - 0xDC00);
            } else {
                pos_ = resume;
            }
        }
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            cp = 0xFFFD;   // 짝이 없는 서로게이트
        }
        append_utf8(out, cp);
        return true;
    }

    std::optional<std::string> read_string() {
        if (!consume('"')) {
            return std::nullopt;
        }
        std::string out;
        while (pos_ < json_.size()) {
            const char c = json_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= json_.size()) {
                break;
            }
            switch (json_[pos_++]) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u':
                    if (!read_unicode_escape(out)) {
                        return std::nullopt;
                    }
                    break;
                default:
                    return std::nullopt;   // 정의되지 않은 이스케이프
            }
        }
        return std::nullopt;   // 닫는 따옴표 없음
    }

    bool skip_value() {
        const char first = peek();
        if (first == '"') {
            return read_string().has_value();
        }
        if (first == '{' || first == '[') {
            int depth = 0;
            while (pos_ < json_.size()) {
                const char c = peek();
                if (c == '"') {
                    if (!read_string()) {
                        return false;
                    }
                    continue;
                }
                ++pos_;
                if (c == '{' || c == '[') {
                    ++depth;
                } else if ((c == '}' || c == ']') && --depth == 0) {
                    return true;
                }
            }
            return false;
        }
        // 숫자, true/false/null
        const std::size_t start = pos_;
        while (pos_ < json_.size() && std::string_view{",}] \t\r\n"}.find(json_[pos_]) == std::string_view::npos) {
            ++pos_;
        }
        return pos_ > start;
    }

    std::string_view json_;
    std::size_t      pos_{0};
};

} // namespace

// ---------------------------------------------------------------------------
// parse_string_field
// ---------------------------------------------------------------------------
std::string parse_string_field(std::string_view json, std::string_view key) {
    return RequestScanner{json}.string_field(key).value_or(std::string{});
}

// ---------------------------------------------------------------------------
// 생성/소멸
// ---------------------------------------------------------------------------
UdsServer::UdsServer(const std::filesystem::path& socket_path,
                     std::shared_ptr<AttackApi>   api,
                     asio::io_context&            ioc)
    : socket_path_{socket_path}
    , api_{std::move(api)}
    , ioc_{ioc}
    , strand_{asio::make_strand(ioc)}
    , acceptor_{strand_}
{}

UdsServer::~UdsServer() {
    close_listener();
}

void UdsServer::start() {
    asio::co_spawn(strand_, run(), [](std::exception_ptr eptr) { log_spawn_exception(eptr); });
}

// ---------------------------------------------------------------------------
// close_listener
//   strand 위에서, 또는 io_context 가 더 이상 구동되지 않을 때만 호출한다.
// ---------------------------------------------------------------------------
void UdsServer::close_listener() {
    if (!acceptor_.is_open()) {
        return;
    }

    boost::system::error_code ec;
    acceptor_.cancel(ec);
    if (ec && ec != asio::error::bad_descriptor) {
        spdlog::warn("[uds] acceptor cancel failed: {}", ec.message());
    }
    acceptor_.close(ec);
    if (ec && ec != asio::error::bad_descriptor) {
        spdlog::warn("[uds] acceptor close failed: {}", ec.message());
    }

    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
}

void UdsServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (ioc_.stopped()) {
        close_listener();
        return;
    }
    asio::post(strand_, [this]() { close_listener(); });
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
asio::awaitable<void> UdsServer::run() {
    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    // 이전 프로세스가 남긴 소켓 파일이 있으면 bind 가 실패한다.
    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec) {
        spdlog::error("[uds] cannot remove stale socket {}: {}",
                      socket_path_.string(), fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    const stream_protocol::endpoint endpoint{socket_path_.string()};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) { acceptor_.bind(endpoint, ec); }
    if (!ec) { acceptor_.listen(asio::socket_base::max_listen_connections, ec); }
    if (ec) {
        spdlog::error("[uds] cannot listen on {}: {}", socket_path_.string(), ec.message());
        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        co_return;
    }

    spdlog::info("[uds] operator socket ready at {}", socket_path_.string());

    for (;;) {
        stream_protocol::socket client{ioc_};
        co_await acceptor_.async_accept(client, asio::redirect_error(asio::use_awaitable, ec));

        if (ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor) {
            spdlog::info("[uds] operator socket closed");
            co_return;
        }
        if (ec) {
            spdlog::error("[uds] accept failed, closing operator socket: {}", ec.message());
            co_return;
        }

        asio::co_spawn(ioc_, handle_client(std::move(client)),
                       [](std::exception_ptr eptr) { log_spawn_exception(eptr); });
    }
}

// ---------------------------------------------------------------------------
// dispatch
// ---------------------------------------------------------------------------
std::string UdsServer::dispatch(std::string_view request_json) {
    const std::string command = parse_string_field(request_json, "command");

    if (command == "stats") {
        return ok_body(to_json(api_->get_stats(kAttackOperation)));
    }

    if (command == "attack") {
        const std::string vm_id = parse_string_field(request_json, "vm_id");
        if (vm_id.empty()) {
            spdlog::warn("[uds] attack command without vm_id");
            return error_body("missing or malformed 'vm_id' field");
        }
        const AttackersResponse result = api_->get_attackers(vm_id, "uds");
        return result.found ? ok_body(to_json(result)) : not_found_body(vm_id);
    }

    if (command.empty()) {
        spdlog::warn("[uds] request without a command field");
        return error_body("missing or malformed 'command' field");
    }

    spdlog::warn("[uds] unsupported command '{}'", command);
    return error_body(fmt::format("unknown command '{}'", command));
}

// ---------------------------------------------------------------------------
// handle_client
// ---------------------------------------------------------------------------
asio::awaitable<void> UdsServer::handle_client(stream_protocol::socket socket) {
    const auto request = co_await read_frame(socket, kMaxRequestSize);
    if (!request) {
        co_return;
    }

    const std::string response = dispatch(*request);
    co_await write_frame(socket, response);
    spdlog::debug("[uds] served request ({} -> {} bytes)", request->size(), response.size());
}
