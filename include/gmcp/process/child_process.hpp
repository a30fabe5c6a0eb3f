#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gmcp::process {

/**
 * @brief Lifecycle state of a spawned child process
 */
enum class ProcessState : uint8_t {
    Unstarted,    ///< Process not yet spawned
    Starting,     ///< Process spawn in progress
    Running,      ///< Process running
    ShuttingDown, ///< Termination requested
    Terminated,   ///< Process has exited and was reaped
    Failed        ///< Spawn failed
};

const char* to_string(ProcessState s) noexcept;

/**
 * @brief Configuration for spawning a child process
 *
 * Example:
 * @code
 * ChildProcessConfig config{.executable = "/usr/bin/godot", .args = {"--version"}};
 * config.with_env("GODOT_MCP_TOKEN", token).in_directory(projectRoot);
 * @endcode
 */
struct ChildProcessConfig {
    std::filesystem::path executable;                 ///< Resolved via PATH when not absolute
    std::vector<std::string> args;                    ///< Command-line arguments
    std::unordered_map<std::string, std::string> env; ///< Added on top of the parent environment
    std::optional<std::filesystem::path> workdir;     ///< Working directory (optional)
    bool redirect_stderr{true};                       ///< Capture stderr instead of inheriting it
    size_t tail_capacity{64 * 1024};                  ///< Bytes of output history kept for tails

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    auto& in_directory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }
};

/**
 * @brief RAII wrapper around a child process with piped stdio
 *
 * Output is pumped by background threads into internal buffers. Destruction terminates
 * the child (graceful signal first, forced kill after a grace period) and joins the pumps.
 *
 * All public methods are thread-safe.
 */
class ChildProcess {
public:
    /**
     * @throws std::runtime_error if pipes cannot be created or fork fails
     */
    explicit ChildProcess(ChildProcessConfig config);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) noexcept;
    ChildProcess& operator=(ChildProcess&&) noexcept;

    [[nodiscard]] ProcessState state() const noexcept;

    /// Polls the child without blocking; reaps it when it has exited.
    [[nodiscard]] bool is_alive() const noexcept;

    /**
     * @brief Close stdin, send SIGTERM, then SIGKILL once @p grace expires
     */
    void terminate(std::chrono::milliseconds grace = std::chrono::seconds{2});

    /// Writes all bytes to the child's stdin. Returns bytes written (0 on error).
    size_t write_stdin(std::span<const std::byte> data);
    size_t write_stdin(std::string_view text);

    void close_stdin();

    /// Removes and returns the next complete stdout line (without the newline).
    [[nodiscard]] std::optional<std::string> take_stdout_line();

    /// Last @p maxBytes of everything the child wrote to stdout / stderr.
    [[nodiscard]] std::string stdout_tail(size_t maxBytes = 4000) const;
    [[nodiscard]] std::string stderr_tail(size_t maxBytes = 4000) const;

    [[nodiscard]] int64_t pid() const noexcept;

    /// @return true if the process exited within @p timeout
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);

    /// Exit code (128+signal when killed), or nullopt while running.
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

    /// Waits until both output pipes reached EOF. @return false on timeout
    bool drain_output(std::chrono::milliseconds timeout);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Result of running a command to completion.
struct CommandOutput {
    std::optional<int> exitCode; ///< nullopt when the command timed out
    std::string stdoutText;
    std::string stderrText;
    bool timedOut{false};
};

/**
 * @brief Run a command and wait for it, killing it once @p timeout elapses
 * @throws std::runtime_error if the process cannot be spawned
 */
CommandOutput runCommand(ChildProcessConfig config, std::chrono::milliseconds timeout);

} // namespace gmcp::process
