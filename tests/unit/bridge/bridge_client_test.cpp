#include <gtest/gtest.h>

#include <gmcp/bridge/bridge_client.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <functional>
#include <string>
#include <thread>

using namespace gmcp::bridge;
using boost::asio::ip::tcp;

namespace {

// Single-connection line server driven by a per-line handler on a background thread.
class FakeEditorBridge {
public:
    using Handler = std::function<std::string(const json& message)>;

    explicit FakeEditorBridge(Handler handler)
        : acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)),
          handler_(std::move(handler)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this] { serve(); });
    }

    ~FakeEditorBridge() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int port() const { return port_; }

private:
    void serve() {
        boost::system::error_code ec;
        tcp::socket socket(io_);
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }
        std::string buffer;
        while (true) {
            auto n = boost::asio::read_until(socket, boost::asio::dynamic_buffer(buffer), '\n', ec);
            if (ec) {
                return;
            }
            auto line = buffer.substr(0, n - 1);
            buffer.erase(0, n);
            auto reply = handler_(json::parse(line, nullptr, false));
            if (reply.empty()) {
                continue;
            }
            reply.push_back('\n');
            boost::asio::write(socket, boost::asio::buffer(reply), ec);
            if (ec) {
                return;
            }
        }
    }

    boost::asio::io_context io_;
    tcp::acceptor acceptor_;
    Handler handler_;
    int port_{0};
    std::thread thread_;
};

std::string healthyBridge(const json& msg) {
    if (msg.value("type", "") == "hello") {
        if (msg.value("token", "") != "tok") {
            return R"({"type":"hello_error","error":"bad token"})";
        }
        return R"({"type":"hello_ok","capabilities":{"version":"1"}})";
    }
    if (msg.value("method", "") == "health") {
        // An unrelated line first; the client must skip it
        json reply = {{"id", msg["id"]},
                      {"ok", true},
                      {"result", {{"project_root", "/work/game"}}}};
        return std::string(R"({"type":"log","text":"hi"})") + "\n" + reply.dump();
    }
    return "";
}

} // namespace

TEST(BridgeClient, HelloThenRequestMatchesById) {
    FakeEditorBridge server(healthyBridge);
    BridgeClient client;
    auto hello = client.connect({.host = "127.0.0.1",
                                 .port = server.port(),
                                 .token = "tok",
                                 .timeout = std::chrono::milliseconds{2000}});
    ASSERT_TRUE(hello) << hello.error().message;
    EXPECT_EQ(hello.value().capabilities.value("version", ""), "1");
    EXPECT_TRUE(client.isConnected());

    auto health = client.request("health", json::object(), std::chrono::milliseconds{2000});
    ASSERT_TRUE(health) << health.error().message;
    EXPECT_TRUE(health.value().ok);
    EXPECT_EQ(health.value().id, 1);
    EXPECT_EQ(health.value().result.value("project_root", ""), "/work/game");
}

TEST(BridgeClient, WrongTokenIsAuthRejected) {
    FakeEditorBridge server(healthyBridge);
    BridgeClient client;
    auto hello = client.connect({.host = "127.0.0.1",
                                 .port = server.port(),
                                 .token = "nope",
                                 .timeout = std::chrono::milliseconds{2000}});
    ASSERT_FALSE(hello);
    EXPECT_EQ(parseBridgeFailureKind(hello.error().message).value_or(BridgeFailureKind::Other),
              BridgeFailureKind::AuthRejected);
    EXPECT_FALSE(client.isConnected());
}

TEST(BridgeClient, SilentPeerIsHelloTimeout) {
    FakeEditorBridge server([](const json&) { return std::string(); });
    BridgeClient client;
    auto hello = client.connect({.host = "127.0.0.1",
                                 .port = server.port(),
                                 .token = "tok",
                                 .timeout = std::chrono::milliseconds{200}});
    ASSERT_FALSE(hello);
    EXPECT_EQ(parseBridgeFailureKind(hello.error().message).value_or(BridgeFailureKind::Other),
              BridgeFailureKind::HelloTimeout);
    EXPECT_FALSE(isStaleLockSignal(BridgeFailureKind::HelloTimeout));
}

TEST(BridgeClient, ClosedPortIsRefused) {
    int port = 0;
    {
        boost::asio::io_context io;
        tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }
    BridgeClient client;
    auto hello = client.connect({.host = "127.0.0.1",
                                 .port = port,
                                 .token = "tok",
                                 .timeout = std::chrono::milliseconds{1000}});
    ASSERT_FALSE(hello);
    auto kind = parseBridgeFailureKind(hello.error().message);
    ASSERT_TRUE(kind.has_value());
    EXPECT_TRUE(isStaleLockSignal(*kind));
}

TEST(BridgeClient, RequestBeforeConnectIsInvalidState) {
    BridgeClient client;
    auto r = client.request("health");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, gmcp::ErrorCode::InvalidState);
}
