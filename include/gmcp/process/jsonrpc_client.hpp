#pragma once

#include <gmcp/core/types.h>
#include <gmcp/process/child_process.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gmcp::process {

using json = nlohmann::json;

/**
 * @brief Uniform payload returned by dispatcher tools
 *
 * Tools answer with MCP `content[0].text` holding `{"ok":..,"summary":..,"details":..}`.
 */
struct ToolResponse {
    bool ok{false};
    std::string summary;
    json details = json::object();
};

/**
 * @brief JSON-RPC 2.0 client over a child process's stdio (one JSON message per line)
 *
 * Thread-safe: calls are serialized.
 *
 * Example:
 * @code
 * ChildProcess server{ChildProcessConfig{.executable = "node", .args = {"build/index.js"}}};
 * JsonRpcClient rpc{server};
 * auto tools = rpc.listTools(std::chrono::seconds{10});
 * @endcode
 */
class JsonRpcClient {
public:
    explicit JsonRpcClient(ChildProcess& process);

    /**
     * @brief Send a request and wait for the response carrying the same id
     *
     * Responses for other ids (late answers to earlier timed-out calls) are discarded.
     * Errors: ProcessError (child gone), WriteError, Timeout, InvalidData (malformed or
     * error response).
     */
    [[nodiscard]] Result<json> call(std::string_view method, json params = json::object(),
                                    std::chrono::milliseconds timeout = std::chrono::seconds{10});

    /// `tools/list` returning the advertised tool names
    [[nodiscard]] Result<std::vector<std::string>> listTools(std::chrono::milliseconds timeout);

    /// `tools/call` unwrapped into a ToolResponse
    [[nodiscard]] Result<ToolResponse> callTool(std::string_view name, json arguments,
                                                std::chrono::milliseconds timeout);

    [[nodiscard]] int next_id() noexcept {
        return next_id_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] static ToolResponse parseToolResult(const json& result);

private:
    [[nodiscard]] std::optional<json> read_next_message();

    [[nodiscard]] static json build_request(int id, std::string_view method, json params);

    ChildProcess& process_;
    std::atomic<int> next_id_{1};
    std::mutex mutex_;
};

} // namespace gmcp::process
