// ---------------------------------------------------------------------------
// test_uds_server.cpp
//
// UdsServer 테스트.
//
// 서버는 전용 io_context 를 백그라운드 스레드에서 돌리고, 클라이언트는
// 별도 io_context 의 동기 소켓으로 [u32 LE 길이][JSON] 프레임을 주고받는다.
// 소켓 경로는 테스트마다 /tmp 아래 고유 이름을 쓴다.
// ---------------------------------------------------------------------------

#include "uds/uds_server.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <unistd.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace asio = boost::asio;
namespace fs   = std::filesystem;

namespace {

fs::path unique_socket_path() {
    static std::atomic<int> seq{0};
    return fs::path{"/tmp"} / fmt::format("surfacegate_uds_{}_{}.sock", ::getpid(), seq++);
}

std::array<std::uint8_t, 4> length_prefix(std::uint32_t n) {
    std::array<std::uint8_t, 4> out{};
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<std::uint8_t>((n >> (8 * i)) & 0xFFu);
    }
    return out;
}

// A(web) → B(db), C(admin) 는 고립
std::shared_ptr<AttackApi> make_api() {
    Environment env;
    env.vms = {
        VirtualMachine{.vm_id = "A", .tags = {"web"}},
        VirtualMachine{.vm_id = "B", .tags = {"db"}},
        VirtualMachine{.vm_id = "C", .tags = {"admin"}},
    };
    env.fw_rules = {
        FirewallRule{.source_tag = "web", .dest_tag = "db"},
    };
    auto query = std::make_shared<const QueryService>(AttackerIndex::from_environment(env));
    return std::make_shared<AttackApi>(std::move(query), std::make_shared<StatsRecorder>());
}

// ---------------------------------------------------------------------------
// FramedClient
//   테스트용 동기 클라이언트. 서버가 응답 없이 닫으면 빈 문자열을 돌려준다.
// ---------------------------------------------------------------------------
class FramedClient {
public:
    explicit FramedClient(const fs::path& path) {
        // bind 직후 listen 전에는 연결이 거부될 수 있다.
        boost::system::error_code ec;
        for (int attempt = 0; attempt < 20; ++attempt) {
            socket_.connect(asio::local::stream_protocol::endpoint{path.string()}, ec);
            if (!ec) { return; }
            boost::system::error_code ignored;
            socket_.close(ignored);
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        throw boost::system::system_error(ec);
    }

    void write_frame(std::string_view body) {
        const auto prefix = length_prefix(static_cast<std::uint32_t>(body.size()));
        asio::write(socket_, std::array<asio::const_buffer, 2>{
            asio::buffer(prefix), asio::buffer(body.data(), body.size())});
    }

    // 본문 없이 길이 헤더만 보낸다.
    void write_prefix_only(std::uint32_t declared_length) {
        const auto prefix = length_prefix(declared_length);
        boost::system::error_code ec;
        asio::write(socket_, asio::buffer(prefix), ec);
    }

    std::string read_frame() {
        std::array<std::uint8_t, 4> prefix{};
        boost::system::error_code   ec;
        asio::read(socket_, asio::buffer(prefix), ec);
        if (ec) { return {}; }

        std::uint32_t length = 0;
        for (std::size_t i = 0; i < prefix.size(); ++i) {
            length |= static_cast<std::uint32_t>(prefix[i]) << (8 * i);
        }
        if (length == 0) { return {}; }

        std::string body(length, '\0');
        asio::read(socket_, asio::buffer(body), ec);
        return ec ? std::string{} : body;
    }

private:
    asio::io_context                     ioc_;
    asio::local::stream_protocol::socket socket_{ioc_};
};

} // namespace

class UdsServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_   = unique_socket_path();
        api_    = make_api();
        server_ = std::make_unique<UdsServer>(path_, api_, ioc_);
    }

    void TearDown() override {
        server_->stop();
        ioc_.stop();
        if (worker_.joinable()) { worker_.join(); }
        server_.reset();
        std::error_code ec;
        fs::remove(path_, ec);
    }

    // 서버를 띄우고 소켓 파일이 생길 때까지 기다린다.
    bool launch() {
        server_->start();
        worker_ = std::thread([this]() { ioc_.run(); });

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
        while (std::chrono::steady_clock::now() < deadline) {
            if (fs::exists(path_)) { return true; }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        return false;
    }

    std::string exchange(std::string_view body) {
        FramedClient client{path_};
        client.write_frame(body);
        return client.read_frame();
    }

    fs::path                   path_;
    asio::io_context           ioc_;
    std::shared_ptr<AttackApi> api_;
    std::unique_ptr<UdsServer> server_;
    std::thread                worker_;
};

TEST_F(UdsServerTest, StatsCommandReportsCounters) {
    (void)api_->get_attackers("B");
    ASSERT_TRUE(launch()) << "socket file did not appear";

    const std::string resp = exchange(R"({"command":"stats"})");
    EXPECT_EQ(resp.rfind(R"({"ok":true,"payload":{"vm_count":3,"request_count":1,)", 0), 0u)
        << resp;
    EXPECT_NE(resp.find(R"("average_request_time":)"), std::string::npos) << resp;
}

TEST_F(UdsServerTest, AttackCommandReturnsSortedAttackers) {
    ASSERT_TRUE(launch());

    EXPECT_EQ(exchange(R"({"command": "attack", "vm_id": "B"})"),
              R"({"ok":true,"payload":{"vm_id":"B","attackers":["A"]}})");
}

TEST_F(UdsServerTest, UnknownVmIsReportedAs404AndCounted) {
    ASSERT_TRUE(launch());

    const std::string resp = exchange(R"({"command":"attack","vm_id":"zzz"})");
    EXPECT_EQ(resp, R"({"ok":false,"error":"vm_id not found","code":404,"vm_id":"zzz"})");
    EXPECT_EQ(api_->get_stats().request_count, 1u);
}

TEST_F(UdsServerTest, AttackWithoutVmIdIsRejectedUncounted) {
    ASSERT_TRUE(launch());

    const std::string resp = exchange(R"({"command":"attack"})");
    EXPECT_EQ(resp, R"({"ok":false,"error":"missing or malformed 'vm_id' field"})");
    EXPECT_EQ(api_->get_stats().request_count, 0u);
}

TEST_F(UdsServerTest, UnsupportedCommandNamesTheCommand) {
    ASSERT_TRUE(launch());

    EXPECT_EQ(exchange(R"({"command":"reload","version":1})"),
              R"({"ok":false,"error":"unknown command 'reload'"})");
}

TEST_F(UdsServerTest, MissingCommandFieldIsAnError) {
    ASSERT_TRUE(launch());

    const std::string resp = exchange(R"({"version":1})");
    EXPECT_EQ(resp.rfind(R"({"ok":false,)", 0), 0u) << resp;
}

TEST_F(UdsServerTest, ZeroLengthFrameClosesConnection) {
    ASSERT_TRUE(launch());

    FramedClient client{path_};
    client.write_prefix_only(0u);
    EXPECT_TRUE(client.read_frame().empty());
}

TEST_F(UdsServerTest, OversizedFrameClosesConnection) {
    ASSERT_TRUE(launch());

    FramedClient client{path_};
    client.write_prefix_only(UdsServer::kMaxRequestSize + 1);
    EXPECT_TRUE(client.read_frame().empty());

    // 리스너는 계속 살아 있다.
    EXPECT_EQ(exchange(R"({"command":"attack","vm_id":"C"})"),
              R"({"ok":true,"payload":{"vm_id":"C","attackers":[]}})");
}

TEST_F(UdsServerTest, ConcurrentClientsAllServed) {
    ASSERT_TRUE(launch());

    constexpr int kClients = 8;
    std::atomic<int>         served{0};
    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([this, &served]() {
            if (exchange(R"({"command":"attack","vm_id":"B"})").find(R"(["A"])") !=
                std::string::npos) {
                ++served;
            }
        });
    }
    for (auto& th : clients) {
        th.join();
    }

    EXPECT_EQ(served.load(), kClients);
    EXPECT_EQ(api_->get_stats().request_count, static_cast<std::uint64_t>(kClients));
}

TEST_F(UdsServerTest, StopBeforeStartNeverBinds) {
    server_->stop();
    server_->start();
    worker_ = std::thread([this]() { ioc_.run(); });
    worker_.join();   // run() 이 바로 끝나므로 io_context 가 반환된다
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(UdsServerTest, StopRemovesSocketFile) {
    ASSERT_TRUE(launch());
    server_->stop();
    worker_.join();
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(UdsServerTest, DispatchWorksWithoutSocket) {
    EXPECT_EQ(server_->dispatch(R"({"command":"attack","vm_id":"C"})"),
              R"({"ok":true,"payload":{"vm_id":"C","attackers":[]}})");
    EXPECT_EQ(server_->dispatch("not json at all"),
              R"({"ok":false,"error":"missing or malformed 'command' field"})");
}

TEST(ParseStringFieldTest, ReadsStringValues) {
    EXPECT_EQ(parse_string_field(R"({"command":"stats"})", "command"), "stats");
    EXPECT_EQ(parse_string_field(R"({"command" :  "attack"})", "command"), "attack");
    EXPECT_EQ(parse_string_field(R"({"vm_id":"a\"b\\c"})", "vm_id"), R"(a"b\c)");
    EXPECT_EQ(parse_string_field(R"({"vm_id":"line\nbreak"})", "vm_id"), "line\nbreak");
}

TEST(ParseStringFieldTest, IgnoresAbsentOrNonStringValues) {
    EXPECT_EQ(parse_string_field(R"({"other":"x"})", "command"), "");
    EXPECT_EQ(parse_string_field(R"({"command":1})", "command"), "");
    EXPECT_EQ(parse_string_field(R"({"command":"unterminated)", "command"), "");
}

// 값 문자열이 키 이름과 같아도 실제 키를 찾는다.
TEST(ParseStringFieldTest, MatchesKeysOnlyAtKeyPositions) {
    EXPECT_EQ(parse_string_field(R"({"vm_id":"command","command":"attack"})", "command"), "attack");
    EXPECT_EQ(parse_string_field(R"({"note":"\"command\":\"x\"","command":"stats"})", "command"),
              "stats");
    EXPECT_EQ(parse_string_field(R"({"meta":{"command":"x"},"command":"stats"})", "command"),
              "stats");
    EXPECT_EQ(parse_string_field(R"({"list":["command",{"a":"]"}],"command":"stats"})", "command"),
              "stats");
    EXPECT_EQ(parse_string_field(R"({"n":1.5e3,"b":true,"z":null,
                                     "command":"stats"})", "command"), "stats");
    EXPECT_EQ(parse_string_field(R"({"meta":{"command":"x"}})", "command"), "");
    EXPECT_EQ(parse_string_field("not json at all", "command"), "");
}

TEST(ParseStringFieldTest, DecodesUnicodeEscapesToUtf8) {
    EXPECT_EQ(parse_string_field(R"({"vm_id":"caf\u00e9"})", "vm_id"), "caf\xC3\xA9");
    EXPECT_EQ(parse_string_field(R"({"vm_id":"\u0041\/"})", "vm_id"), "A/");
    EXPECT_EQ(parse_string_field(R"({"vm_id":"\ud83d\ude80"})", "vm_id"), "\xF0\x9F\x9A\x80");
    // 짝 없는 서로게이트는 U+FFFD
    EXPECT_EQ(parse_string_field(R"({"vm_id":"\ud800x"})", "vm_id"), "\xEF\xBF\xBDx");
    EXPECT_EQ(parse_string_field(R"({"vm_id":"\udc00"})", "vm_id"), "\xEF\xBF\xBD");
}

TEST(ParseStringFieldTest, RejectsMalformedEscapes) {
    EXPECT_EQ(parse_string_field(R"({"vm_id":"a\qb"})", "vm_id"), "");
    EXPECT_EQ(parse_string_field(R"({"vm_id":"\u12g4"})", "vm_id"), "");
    EXPECT_EQ(parse_string_field(R"({"vm_id":"\u12"})", "vm_id"), "");
}

TEST(UdsDispatchTest, AwkwardVmIdsAreLookedUp) {
    Environment env;
    env.vms = {
        VirtualMachine{.vm_id = "command",     .tags = {"web"}},
        VirtualMachine{.vm_id = "caf\xC3\xA9", .tags = {"db"}},
    };
    env.fw_rules = {
        FirewallRule{.source_tag = "web", .dest_tag = "db"},
    };
    auto query = std::make_shared<const QueryService>(AttackerIndex::from_environment(env));
    auto api   = std::make_shared<AttackApi>(std::move(query), std::make_shared<StatsRecorder>());

    asio::io_context ioc;
    UdsServer        server{unique_socket_path(), api, ioc};

    EXPECT_EQ(server.dispatch(R"({"vm_id":"command","command":"attack"})"),
              R"({"ok":true,"payload":{"vm_id":"command","attackers":[]}})");
    EXPECT_EQ(server.dispatch(R"({"command":"attack","vm_id":"caf\u00e9"})"),
              "{\"ok\":true,\"payload\":{\"vm_id\":\"caf\xC3\xA9\",\"attackers\":[\"command\"]}}");
    EXPECT_EQ(api->get_stats().request_count, 2u);
}
