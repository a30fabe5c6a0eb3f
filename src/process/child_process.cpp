#include <gmcp/process/child_process.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>

#ifndef _WIN32
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;
#endif

namespace gmcp::process {

const char* to_string(ProcessState s) noexcept {
    switch (s) {
        case ProcessState::Unstarted:
            return "unstarted";
        case ProcessState::Starting:
            return "starting";
        case ProcessState::Running:
            return "running";
        case ProcessState::ShuttingDown:
            return "shutting_down";
        case ProcessState::Terminated:
            return "terminated";
        case ProcessState::Failed:
            return "failed";
    }
    return "unknown";
}

namespace {

// Appends to a bounded history buffer, dropping the oldest bytes.
void append_bounded(std::string& history, std::string_view chunk, size_t capacity) {
    history.append(chunk);
    if (history.size() > capacity) {
        history.erase(0, history.size() - capacity);
    }
}

std::string tail_of(const std::string& s, size_t maxBytes) {
    if (s.size() <= maxBytes) {
        return s;
    }
    return s.substr(s.size() - maxBytes);
}

} // namespace

class ChildProcess::Impl {
public:
    explicit Impl(ChildProcessConfig config);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    [[nodiscard]] ProcessState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool is_alive() const noexcept;
    void terminate(std::chrono::milliseconds grace);
    size_t write_stdin(std::span<const std::byte> data);
    void close_stdin();
    std::optional<std::string> take_stdout_line();
    std::string stdout_tail(size_t maxBytes) const;
    std::string stderr_tail(size_t maxBytes) const;
    [[nodiscard]] int64_t pid() const noexcept { return static_cast<int64_t>(process_id_); }
    bool wait_for_exit(std::chrono::milliseconds timeout);
    std::optional<int> exit_code() const noexcept;
    bool drain_output(std::chrono::milliseconds timeout);

private:
    void spawn_process();
    void start_io_threads();
    void stop_io_threads();
    void pump(std::stop_token stop, int fd, bool isStdout);

    ChildProcessConfig config_;
    std::atomic<ProcessState> state_{ProcessState::Unstarted};

    mutable std::mutex wait_mutex_;
    mutable std::optional<int> exit_code_;

    std::string stdout_pending_;
    std::string stdout_history_;
    std::string stderr_history_;
    mutable std::mutex stdout_mutex_;
    mutable std::mutex stderr_mutex_;
    std::mutex stdin_mutex_;

    std::atomic<bool> stdout_eof_{false};
    std::atomic<bool> stderr_eof_{false};
    std::jthread stdout_thread_;
    std::jthread stderr_thread_;

#ifndef _WIN32
    pid_t process_id_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
#else
    int64_t process_id_{-1};
#endif
};

// ============================================================================
// Unix (Linux/macOS) Implementation
// ============================================================================

#ifndef _WIN32

ChildProcess::Impl::Impl(ChildProcessConfig config) : config_{std::move(config)} {
    // A child closing its stdin early must not kill us with SIGPIPE
    signal(SIGPIPE, SIG_IGN);

    state_.store(ProcessState::Starting, std::memory_order_release);

    try {
        spawn_process();
        start_io_threads();
        state_.store(ProcessState::Running, std::memory_order_release);
    } catch (...) {
        state_.store(ProcessState::Failed, std::memory_order_release);
        throw;
    }
}

ChildProcess::Impl::~Impl() {
    if (is_alive()) {
        spdlog::debug("ChildProcess: pid={} still alive at destruction, terminating", process_id_);
        terminate(std::chrono::seconds{2});
    }
    stop_io_threads();

    if (stdin_fd_ >= 0)
        close(stdin_fd_);
    if (stdout_fd_ >= 0)
        close(stdout_fd_);
    if (stderr_fd_ >= 0)
        close(stderr_fd_);
}

void ChildProcess::Impl::spawn_process() {
    int stdin_pipe[2], stdout_pipe[2], stderr_pipe[2];
    if (pipe(stdin_pipe) < 0) {
        throw std::runtime_error("Failed to create pipes: " + std::string(strerror(errno)));
    }
    if (pipe(stdout_pipe) < 0) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        throw std::runtime_error("Failed to create pipes: " + std::string(strerror(errno)));
    }
    if (pipe(stderr_pipe) < 0) {
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1]})
            close(fd);
        throw std::runtime_error("Failed to create pipes: " + std::string(strerror(errno)));
    }

    // Parent ends must not leak into other children
    for (int fd : {stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]}) {
        fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    // Everything the child needs is prepared before fork: no allocation after it
    std::vector<std::string> argStorage;
    argStorage.push_back(config_.executable.string());
    for (const auto& a : config_.args) {
        argStorage.push_back(a);
    }
    std::vector<char*> argv;
    for (auto& a : argStorage) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStorage;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry{*e};
        auto eq = entry.find('=');
        auto key = entry.substr(0, eq);
        if (config_.env.find(std::string(key)) != config_.env.end()) {
            continue;
        }
        envStorage.emplace_back(entry);
    }
    for (const auto& [key, value] : config_.env) {
        envStorage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& e : envStorage) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    std::string workdir = config_.workdir ? config_.workdir->string() : std::string{};

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                       stderr_pipe[0], stderr_pipe[1]})
            close(fd);
        throw std::runtime_error("fork() failed: " + std::string(strerror(err)));
    }

    if (pid == 0) {
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        if (config_.redirect_stderr) {
            dup2(stderr_pipe[1], STDERR_FILENO);
        }
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);

        if (!workdir.empty() && chdir(workdir.c_str()) < 0) {
            _exit(127);
        }

        environ = envp.data();
        execvp(argv[0], argv.data());
        _exit(127);
    }

    process_id_ = pid;
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];

    spdlog::info("ChildProcess: spawned {} (pid={})", config_.executable.string(), process_id_);
}

bool ChildProcess::Impl::is_alive() const noexcept {
    auto current = state();
    if (current != ProcessState::Starting && current != ProcessState::Running &&
        current != ProcessState::ShuttingDown) {
        return false;
    }
    if (process_id_ <= 0) {
        return false;
    }

    std::lock_guard lock{wait_mutex_};
    if (exit_code_) {
        return false;
    }
    int status = 0;
    pid_t result = waitpid(process_id_, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    if (result == process_id_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            return true;
        }
    } else {
        // ECHILD: already reaped elsewhere
        exit_code_ = -1;
    }
    const_cast<std::atomic<ProcessState>&>(state_).store(ProcessState::Terminated,
                                                         std::memory_order_release);
    return false;
}

void ChildProcess::Impl::terminate(std::chrono::milliseconds grace) {
    if (!is_alive()) {
        return;
    }

    spdlog::debug("ChildProcess: terminating {} (pid={})", config_.executable.string(),
                  process_id_);
    state_.store(ProcessState::ShuttingDown, std::memory_order_release);

    close_stdin();

    if (kill(process_id_, SIGTERM) == 0) {
        if (wait_for_exit(grace)) {
            return;
        }
    }

    spdlog::warn("ChildProcess: pid={} ignored SIGTERM for {}ms, sending SIGKILL", process_id_,
                 grace.count());
    kill(process_id_, SIGKILL);
    if (!wait_for_exit(std::chrono::seconds{1})) {
        spdlog::error("ChildProcess: pid={} did not exit after SIGKILL", process_id_);
    }
}

size_t ChildProcess::Impl::write_stdin(std::span<const std::byte> data) {
    std::lock_guard lock{stdin_mutex_};

    if (stdin_fd_ < 0 || !is_alive()) {
        return 0;
    }

    size_t total = 0;
    while (total < data.size()) {
        ssize_t written = write(stdin_fd_, data.data() + total, data.size() - total);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                spdlog::warn("ChildProcess: broken pipe writing to pid={}", process_id_);
            } else {
                spdlog::error("ChildProcess: failed to write to stdin: {} (errno: {})",
                              strerror(errno), errno);
            }
            break;
        }
        total += static_cast<size_t>(written);
    }
    return total;
}

void ChildProcess::Impl::close_stdin() {
    std::lock_guard lock{stdin_mutex_};
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

void ChildProcess::Impl::pump(std::stop_token stop, int fd, bool isStdout) {
    std::array<char, 4096> buffer;

    while (!stop.stop_requested()) {
        ssize_t bytes_read = read(fd, buffer.data(), buffer.size());
        if (bytes_read > 0) {
            std::string_view chunk{buffer.data(), static_cast<size_t>(bytes_read)};
            if (isStdout) {
                std::lock_guard lock{stdout_mutex_};
                stdout_pending_.append(chunk);
                append_bounded(stdout_history_, chunk, config_.tail_capacity);
            } else {
                std::lock_guard lock{stderr_mutex_};
                append_bounded(stderr_history_, chunk, config_.tail_capacity);
            }
            continue;
        }
        if (bytes_read == 0) {
            // EOF: every writer of the pipe is gone
            break;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    (isStdout ? stdout_eof_ : stderr_eof_).store(true, std::memory_order_release);
}

#else

ChildProcess::Impl::Impl(ChildProcessConfig config) : config_{std::move(config)} {
    state_.store(ProcessState::Failed, std::memory_order_release);
    throw std::runtime_error("ChildProcess: native Windows hosts are not supported");
}

ChildProcess::Impl::~Impl() = default;
bool ChildProcess::Impl::is_alive() const noexcept {
    return false;
}
void ChildProcess::Impl::terminate(std::chrono::milliseconds) {}
size_t ChildProcess::Impl::write_stdin(std::span<const std::byte>) {
    return 0;
}
void ChildProcess::Impl::close_stdin() {}
void ChildProcess::Impl::pump(std::stop_token, int, bool) {}

#endif // !_WIN32

// ============================================================================
// Common Implementation
// ============================================================================

void ChildProcess::Impl::start_io_threads() {
#ifndef _WIN32
    stdout_thread_ =
        std::jthread{[this](std::stop_token stop) { pump(stop, stdout_fd_, true); }};
    if (config_.redirect_stderr) {
        stderr_thread_ =
            std::jthread{[this](std::stop_token stop) { pump(stop, stderr_fd_, false); }};
    }
#endif
}

void ChildProcess::Impl::stop_io_threads() {
    stdout_thread_.request_stop();
    stderr_thread_.request_stop();
    if (stdout_thread_.joinable()) {
        stdout_thread_.join();
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
}

std::optional<std::string> ChildProcess::Impl::take_stdout_line() {
    std::lock_guard lock{stdout_mutex_};
    auto newline = stdout_pending_.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    std::string line = stdout_pending_.substr(0, newline);
    stdout_pending_.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::string ChildProcess::Impl::stdout_tail(size_t maxBytes) const {
    std::lock_guard lock{stdout_mutex_};
    return tail_of(stdout_history_, maxBytes);
}

std::string ChildProcess::Impl::stderr_tail(size_t maxBytes) const {
    std::lock_guard lock{stderr_mutex_};
    return tail_of(stderr_history_, maxBytes);
}

bool ChildProcess::Impl::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (is_alive()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return true;
}

std::optional<int> ChildProcess::Impl::exit_code() const noexcept {
    std::lock_guard lock{wait_mutex_};
    return exit_code_;
}

bool ChildProcess::Impl::drain_output(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto drained = [this] {
        bool out = !stdout_thread_.joinable() || stdout_eof_.load(std::memory_order_acquire);
        bool err = !stderr_thread_.joinable() || stderr_eof_.load(std::memory_order_acquire);
        return out && err;
    };
    while (!drained()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return true;
}

// ============================================================================
// ChildProcess Public Interface (forwards to Impl)
// ============================================================================

ChildProcess::ChildProcess(ChildProcessConfig config)
    : impl_{std::make_unique<Impl>(std::move(config))} {}

ChildProcess::~ChildProcess() = default;

ChildProcess::ChildProcess(ChildProcess&&) noexcept = default;
ChildProcess& ChildProcess::operator=(ChildProcess&&) noexcept = default;

ProcessState ChildProcess::state() const noexcept {
    return impl_->state();
}

bool ChildProcess::is_alive() const noexcept {
    return impl_->is_alive();
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    impl_->terminate(grace);
}

size_t ChildProcess::write_stdin(std::span<const std::byte> data) {
    return impl_->write_stdin(data);
}

size_t ChildProcess::write_stdin(std::string_view text) {
    return impl_->write_stdin(std::as_bytes(std::span{text.data(), text.size()}));
}

void ChildProcess::close_stdin() {
    impl_->close_stdin();
}

std::optional<std::string> ChildProcess::take_stdout_line() {
    return impl_->take_stdout_line();
}

std::string ChildProcess::stdout_tail(size_t maxBytes) const {
    return impl_->stdout_tail(maxBytes);
}

std::string ChildProcess::stderr_tail(size_t maxBytes) const {
    return impl_->stderr_tail(maxBytes);
}

int64_t ChildProcess::pid() const noexcept {
    return impl_->pid();
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    return impl_->wait_for_exit(timeout);
}

std::optional<int> ChildProcess::exit_code() const noexcept {
    return impl_->exit_code();
}

bool ChildProcess::drain_output(std::chrono::milliseconds timeout) {
    return impl_->drain_output(timeout);
}

CommandOutput runCommand(ChildProcessConfig config, std::chrono::milliseconds timeout) {
    auto exe = config.executable.string();
    ChildProcess child{std::move(config)};
    child.close_stdin();

    CommandOutput out;
    if (!child.wait_for_exit(timeout)) {
        spdlog::warn("runCommand: '{}' exceeded {}ms, killing", exe, timeout.count());
        child.terminate(std::chrono::milliseconds{500});
        out.timedOut = true;
    } else {
        out.exitCode = child.exit_code();
    }
    if (!child.drain_output(std::chrono::milliseconds{500})) {
        spdlog::debug("runCommand: output of '{}' still open after exit", exe);
    }
    out.stdoutText = child.stdout_tail(std::string::npos);
    out.stderrText = child.stderr_tail(std::string::npos);
    return out;
}

} // namespace gmcp::process
