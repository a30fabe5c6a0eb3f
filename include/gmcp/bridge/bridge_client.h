#pragma once

#include <gmcp/bridge/bridge_failure.h>
#include <gmcp/core/types.h>

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace gmcp::bridge {

using json = nlohmann::json;

struct BridgeConnectOptions {
    std::string host{"127.0.0.1"};
    int port{0};
    std::string token;
    std::chrono::milliseconds timeout{5000};
};

struct BridgeHello {
    json capabilities = json::object();
};

struct BridgeResponse {
    int id{0};
    bool ok{false};
    json result;
    json error;
};

/**
 * Client for the editor plugin's bridge: line-delimited JSON over TCP.
 *
 * connect() sends {"type":"hello","token":..} and expects hello_ok / hello_error.
 * request() sends {"id","method","params"} and waits for the response with the same id.
 * Every socket operation runs under a watchdog timer that cancels it on expiry. Failures are classified with a
 * [bridge:<kind>] message prefix (see bridge_failure.h).
 *
 * Not thread-safe; each instance owns its io_context and runs it on the calling thread.
 */
class BridgeClient {
public:
    BridgeClient();
    ~BridgeClient();

    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;

    Result<BridgeHello> connect(const BridgeConnectOptions& options);
    Result<BridgeResponse> request(std::string_view method, json params = json::object(),
                                   std::chrono::milliseconds timeout = std::chrono::seconds{10});

    bool isConnected() const noexcept;
    void close() noexcept;

private:
    using tcp = boost::asio::ip::tcp;

    boost::asio::awaitable<Result<BridgeHello>> do_connect(BridgeConnectOptions options);
    boost::asio::awaitable<Result<BridgeResponse>> do_request(std::string method, json params,
                                                              std::chrono::milliseconds timeout);
    boost::asio::awaitable<Result<void>> async_write_line(std::string line,
                                                          std::chrono::milliseconds timeout);
    boost::asio::awaitable<Result<std::string>> async_read_line(std::chrono::milliseconds timeout,
                                                                BridgeFailureKind timeoutKind);

    template <typename T> Result<T> run(boost::asio::awaitable<Result<T>> op);

    boost::asio::io_context io_;
    std::unique_ptr<tcp::socket> socket_;
    std::string read_buffer_;
    int next_id_{1};
};

} // namespace gmcp::bridge
