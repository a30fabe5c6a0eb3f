#include <gmcp/core/format.h>
#include <gmcp/process/jsonrpc_client.hpp>

#include <spdlog/spdlog.h>

#include <thread>

namespace gmcp::process {

JsonRpcClient::JsonRpcClient(ChildProcess& process) : process_(process) {}

Result<json> JsonRpcClient::call(std::string_view method, json params,
                                 std::chrono::milliseconds timeout) {
    std::lock_guard lock{mutex_};

    if (!process_.is_alive()) {
        return Error{ErrorCode::ProcessError,
                     gmcp::format("process exited (code {}) before '{}'",
                                  process_.exit_code().value_or(-1), method)};
    }

    int id = next_id();
    std::string request_str = build_request(id, method, std::move(params)).dump() + "\n";

    spdlog::debug("JsonRpcClient: sending request id={} method='{}'", id, method);
    size_t written = process_.write_stdin(std::string_view{request_str});
    if (written != request_str.size()) {
        return Error{ErrorCode::WriteError,
                     gmcp::format("failed to write request '{}' ({}/{} bytes)", method, written,
                                  request_str.size())};
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto response = read_next_message();

        if (!response) {
            if (!process_.is_alive()) {
                // Output written right before exit may still be in flight
                (void)process_.drain_output(std::chrono::milliseconds{200});
                if (auto late = read_next_message()) {
                    response = std::move(late);
                } else {
                    return Error{ErrorCode::ProcessError,
                                 gmcp::format("process exited (code {}) while waiting for '{}'",
                                              process_.exit_code().value_or(-1), method)};
                }
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds{10});
                continue;
            }
        }

        if (!response->is_object() || response->value("jsonrpc", "") != "2.0") {
            spdlog::debug("JsonRpcClient: ignoring non JSON-RPC line");
            continue;
        }

        // Server-initiated notifications carry no id
        if (!response->contains("id") || !(*response)["id"].is_number_integer()) {
            continue;
        }

        int responseId = (*response)["id"].get<int>();
        if (responseId != id) {
            spdlog::debug("JsonRpcClient: discarding response for old id={} (expected {})",
                          responseId, id);
            continue;
        }

        if (response->contains("error")) {
            const auto& error = (*response)["error"];
            std::string message = error.is_object() ? error.value("message", "unknown")
                                                    : error.dump();
            int code = error.is_object() ? error.value("code", -1) : -1;
            spdlog::warn("JsonRpcClient: RPC error for '{}': code={}, message={}", method, code,
                         message);
            return Error{ErrorCode::InvalidData,
                         gmcp::format("{} error ({}): {}", method, code, message)};
        }

        if (!response->contains("result")) {
            return Error{ErrorCode::InvalidData,
                         gmcp::format("{} response missing 'result'", method)};
        }
        return (*response)["result"];
    }

    spdlog::warn("JsonRpcClient: timeout after {}ms waiting for '{}' (id={})", timeout.count(),
                 method, id);
    return Error{ErrorCode::Timeout,
                 gmcp::format("timed out after {}ms waiting for '{}'", timeout.count(), method)};
}

Result<std::vector<std::string>> JsonRpcClient::listTools(std::chrono::milliseconds timeout) {
    auto result = call("tools/list", json::object(), timeout);
    if (!result) {
        return result.error();
    }
    const auto& body = result.value();
    if (!body.is_object() || !body.contains("tools") || !body["tools"].is_array()) {
        return Error{ErrorCode::InvalidData, "tools/list result has no 'tools' array"};
    }
    std::vector<std::string> names;
    for (const auto& tool : body["tools"]) {
        if (tool.is_object() && tool.contains("name") && tool["name"].is_string()) {
            names.push_back(tool["name"].get<std::string>());
        }
    }
    return names;
}

Result<ToolResponse> JsonRpcClient::callTool(std::string_view name, json arguments,
                                             std::chrono::milliseconds timeout) {
    json params = {{"name", name}, {"arguments", std::move(arguments)}};
    auto result = call("tools/call", std::move(params), timeout);
    if (!result) {
        return result.error();
    }
    return parseToolResult(result.value());
}

ToolResponse JsonRpcClient::parseToolResult(const json& result) {
    ToolResponse out;
    if (!result.is_object()) {
        out.summary = "tool returned a non-object result";
        return out;
    }

    bool isError = result.value("isError", false);
    std::string text;
    if (result.contains("content") && result["content"].is_array()) {
        for (const auto& item : result["content"]) {
            if (item.is_object() && item.value("type", "") == "text" && item.contains("text") &&
                item["text"].is_string()) {
                text = item["text"].get<std::string>();
                break;
            }
        }
    }

    auto payload = json::parse(text, nullptr, false);
    if (!payload.is_discarded() && payload.is_object()) {
        out.ok = payload.value("ok", !isError);
        out.summary = payload.value("summary", "");
        if (payload.contains("details")) {
            out.details = payload["details"];
        }
        return out;
    }

    out.ok = !isError;
    out.summary = text;
    return out;
}

std::optional<json> JsonRpcClient::read_next_message() {
    while (auto line = process_.take_stdout_line()) {
        if (line->empty()) {
            continue;
        }
        auto parsed = json::parse(*line, nullptr, false);
        if (parsed.is_discarded()) {
            // Dispatchers sometimes print banners on stdout
            spdlog::debug("JsonRpcClient: skipping non-JSON line: {}", line->substr(0, 200));
            continue;
        }
        return parsed;
    }
    return std::nullopt;
}

json JsonRpcClient::build_request(int id, std::string_view method, json params) {
    json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) {
        request["params"] = std::move(params);
    }
    return request;
}

} // namespace gmcp::process
