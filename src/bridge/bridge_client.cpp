#include <gmcp/bridge/bridge_client.h>
#include <gmcp/core/format.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <functional>
#include <future>
#include <memory>
#include <optional>

namespace gmcp::bridge {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
namespace this_coro = boost::asio::this_coro;

namespace {

Error bridgeError(ErrorCode code, BridgeFailureKind kind, std::string_view detail) {
    return Error{code, formatBridgeFailure(kind, detail)};
}

BridgeFailureKind classifyIoError(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::eof) {
        return BridgeFailureKind::Eof;
    }
    if (ec == boost::asio::error::connection_reset || ec == boost::asio::error::broken_pipe ||
        ec == boost::asio::error::connection_aborted) {
        return BridgeFailureKind::ResetOrBrokenPipe;
    }
    return BridgeFailureKind::Other;
}

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds{0};
}

/// Runs @p onExpire if the timer fires before the guard goes out of scope.
class Watchdog {
public:
    Watchdog(const boost::asio::any_io_executor& executor, std::chrono::milliseconds timeout,
             std::function<void()> onExpire)
        : timer_(executor), state_(std::make_shared<State>()) {
        state_->onExpire = std::move(onExpire);
        timer_.expires_after(timeout);
        timer_.async_wait([state = state_](const boost::system::error_code& ec) {
            if (ec || !state->armed) {
                return;
            }
            state->fired = true;
            state->onExpire();
        });
    }

    ~Watchdog() {
        state_->armed = false;
        timer_.cancel();
    }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    bool fired() const noexcept { return state_->fired; }

private:
    struct State {
        bool armed{true};
        bool fired{false};
        std::function<void()> onExpire;
    };

    boost::asio::steady_timer timer_;
    std::shared_ptr<State> state_;
};

} // namespace

BridgeClient::BridgeClient() = default;

BridgeClient::~BridgeClient() {
    close();
}

bool BridgeClient::isConnected() const noexcept {
    return socket_ && socket_->is_open();
}

void BridgeClient::close() noexcept {
    if (socket_) {
        boost::system::error_code ec;
        socket_->shutdown(tcp::socket::shutdown_both, ec);
        socket_->close(ec);
        socket_.reset();
    }
    read_buffer_.clear();
}

// co_spawn needs a default-constructible result type
template <typename T>
awaitable<std::optional<Result<T>>> optionalResult(awaitable<Result<T>> op) {
    co_return co_await std::move(op);
}

template <typename T> Result<T> BridgeClient::run(awaitable<Result<T>> op) {
    io_.restart();
    auto future =
        boost::asio::co_spawn(io_, optionalResult(std::move(op)), boost::asio::use_future);
    io_.run();
    try {
        auto result = future.get();
        if (!result) {
            return bridgeError(ErrorCode::InternalError, BridgeFailureKind::Other,
                               "bridge operation produced no result");
        }
        return std::move(*result);
    } catch (const std::exception& e) {
        return bridgeError(ErrorCode::InternalError, BridgeFailureKind::Other, e.what());
    }
}

Result<BridgeHello> BridgeClient::connect(const BridgeConnectOptions& options) {
    if (isConnected()) {
        return bridgeError(ErrorCode::InvalidState, BridgeFailureKind::Other,
                           "editor bridge already connected");
    }
    auto result = run(do_connect(options));
    if (!result) {
        close();
    }
    return result;
}

Result<BridgeResponse> BridgeClient::request(std::string_view method, json params,
                                             std::chrono::milliseconds timeout) {
    if (!isConnected()) {
        return bridgeError(ErrorCode::InvalidState, BridgeFailureKind::Other,
                           "editor bridge not connected");
    }
    return run(do_request(std::string(method), std::move(params), timeout));
}

awaitable<Result<BridgeHello>> BridgeClient::do_connect(BridgeConnectOptions options) {
    auto executor = co_await this_coro::executor;
    auto deadline = std::chrono::steady_clock::now() + options.timeout;
    auto where = gmcp::format("{}:{}", options.host, options.port);

    tcp::resolver resolver(executor);
    boost::system::error_code resolveEc;
    tcp::resolver::results_type endpoints;
    {
        Watchdog watchdog(executor, remaining(deadline), [&resolver] { resolver.cancel(); });
        endpoints = co_await resolver.async_resolve(options.host, std::to_string(options.port),
                                                    redirect_error(use_awaitable, resolveEc));
        if (watchdog.fired()) {
            co_return bridgeError(ErrorCode::Timeout, BridgeFailureKind::ConnectTimeout,
                                  gmcp::format("name resolution timeout ({})", where));
        }
    }
    if (resolveEc) {
        co_return bridgeError(ErrorCode::NetworkError, BridgeFailureKind::Other,
                              gmcp::format("cannot resolve {}: {}", options.host,
                                           resolveEc.message()));
    }

    auto socket = std::make_unique<tcp::socket>(executor);
    boost::system::error_code connectEc;
    {
        auto* raw = socket.get();
        Watchdog watchdog(executor, remaining(deadline), [raw] {
            boost::system::error_code ignored;
            raw->close(ignored);
        });
        co_await boost::asio::async_connect(*socket, endpoints,
                                            redirect_error(use_awaitable, connectEc));
        if (watchdog.fired()) {
            co_return bridgeError(
                ErrorCode::Timeout, BridgeFailureKind::ConnectTimeout,
                gmcp::format("connect timeout after {}ms ({})", options.timeout.count(), where));
        }
    }
    if (connectEc) {
        if (connectEc == boost::asio::error::connection_refused ||
            connectEc == make_error_code(boost::system::errc::connection_refused)) {
            co_return bridgeError(ErrorCode::NetworkError, BridgeFailureKind::Refused,
                                  gmcp::format("connection refused ({})", where));
        }
        if (connectEc == boost::asio::error::timed_out) {
            co_return bridgeError(ErrorCode::Timeout, BridgeFailureKind::ConnectTimeout,
                                  gmcp::format("connect timed out ({})", where));
        }
        co_return bridgeError(ErrorCode::NetworkError, BridgeFailureKind::Other,
                              gmcp::format("connect failed ({}): {}", where, connectEc.message()));
    }

    boost::system::error_code optEc;
    socket->set_option(tcp::no_delay(true), optEc);
    socket_ = std::move(socket);
    read_buffer_.clear();

    json hello = {{"type", "hello"}, {"token", options.token}};
    auto written = co_await async_write_line(hello.dump(), remaining(deadline));
    if (!written) {
        co_return written.error();
    }

    while (true) {
        auto line = co_await async_read_line(remaining(deadline), BridgeFailureKind::HelloTimeout);
        if (!line) {
            co_return line.error();
        }
        auto msg = json::parse(line.value(), nullptr, false);
        if (msg.is_discarded() || !msg.is_object()) {
            continue;
        }
        auto type = msg.value("type", "");
        if (type == "hello_ok") {
            BridgeHello hello_ok;
            if (msg.contains("capabilities") && msg["capabilities"].is_object()) {
                hello_ok.capabilities = msg["capabilities"];
            }
            spdlog::debug("BridgeClient: authenticated with {}", where);
            co_return hello_ok;
        }
        if (type == "hello_error") {
            std::string reason = msg.contains("error") && msg["error"].is_string()
                                     ? msg["error"].get<std::string>()
                                     : std::string("hello_error");
            co_return bridgeError(ErrorCode::PermissionDenied, BridgeFailureKind::AuthRejected,
                                  reason);
        }
    }
}

awaitable<Result<BridgeResponse>>
BridgeClient::do_request(std::string method, json params, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    int id = next_id_++;
    json message = {{"id", id}, {"method", method}, {"params", std::move(params)}};

    auto written = co_await async_write_line(message.dump(), timeout);
    if (!written) {
        co_return written.error();
    }

    while (true) {
        auto line = co_await async_read_line(remaining(deadline), BridgeFailureKind::RequestTimeout);
        if (!line) {
            if (line.error().code == ErrorCode::Timeout) {
                co_return bridgeError(ErrorCode::Timeout, BridgeFailureKind::RequestTimeout,
                                      gmcp::format("request timeout after {}ms (method={})",
                                                   timeout.count(), method));
            }
            co_return line.error();
        }
        auto msg = json::parse(line.value(), nullptr, false);
        if (msg.is_discarded() || !msg.is_object() || !msg.contains("id") ||
            !msg["id"].is_number_integer() || msg["id"].get<int>() != id) {
            continue;
        }
        BridgeResponse response;
        response.id = id;
        response.ok = msg.value("ok", false);
        if (msg.contains("result")) {
            response.result = msg["result"];
        }
        if (msg.contains("error")) {
            response.error = msg["error"];
        }
        co_return response;
    }
}

awaitable<Result<void>> BridgeClient::async_write_line(std::string line,
                                                       std::chrono::milliseconds timeout) {
    line.push_back('\n');
    boost::system::error_code ec;
    {
        auto* socket = socket_.get();
        Watchdog watchdog(co_await this_coro::executor, timeout, [socket] {
            boost::system::error_code ignored;
            socket->cancel(ignored);
        });
        co_await boost::asio::async_write(*socket_, boost::asio::buffer(line),
                                          redirect_error(use_awaitable, ec));
        if (watchdog.fired()) {
            co_return bridgeError(ErrorCode::Timeout, BridgeFailureKind::RequestTimeout,
                                  "write timeout");
        }
    }
    if (ec) {
        co_return bridgeError(ErrorCode::NetworkError, classifyIoError(ec),
                              gmcp::format("write failed: {}", ec.message()));
    }
    co_return Result<void>{};
}

awaitable<Result<std::string>> BridgeClient::async_read_line(std::chrono::milliseconds timeout,
                                                             BridgeFailureKind timeoutKind) {
    auto take_line = [this](size_t n) {
        std::string line = read_buffer_.substr(0, n - 1);
        read_buffer_.erase(0, n);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return line;
    };

    if (auto pos = read_buffer_.find('\n'); pos != std::string::npos) {
        co_return take_line(pos + 1);
    }

    boost::system::error_code ec;
    size_t n = 0;
    {
        auto* socket = socket_.get();
        Watchdog watchdog(co_await this_coro::executor, timeout, [socket] {
            boost::system::error_code ignored;
            socket->cancel(ignored);
        });
        n = co_await boost::asio::async_read_until(
            *socket_, boost::asio::dynamic_buffer(read_buffer_), '\n',
            redirect_error(use_awaitable, ec));
        if (watchdog.fired()) {
            co_return bridgeError(ErrorCode::Timeout, timeoutKind,
                                  gmcp::format("no reply within {}ms", timeout.count()));
        }
    }
    if (ec) {
        co_return bridgeError(ErrorCode::NetworkError, classifyIoError(ec),
                              gmcp::format("read failed: {}", ec.message()));
    }
    co_return take_line(n);
}

} // namespace gmcp::bridge
