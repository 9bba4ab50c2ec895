#include "mcphub/transport/process_transport.hpp"
#include "mcphub/log/logger.hpp"

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/read_until.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>

extern char** environ;

namespace mcphub {

namespace {

constexpr std::chrono::milliseconds kReapPollInterval{10};
constexpr int kReapPollAttempts = 100;  // ~1s for a process that closed stdout to exit
constexpr std::size_t kLoggedLinePreview = 200;

TransportError make_error(TransportError::Category cat, std::string msg,
                          std::optional<int> exit_code = std::nullopt) {
    return TransportError{cat, std::move(msg), exit_code};
}

bool make_cloexec_pipe(int fds[2]) {
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void close_pipe(int fds[2]) {
    if (fds[0] != -1) ::close(fds[0]);
    if (fds[1] != -1) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

// A server that dies mid-write must surface as EPIPE, not kill the host.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

std::string preview(const std::string& line) {
    if (line.size() <= kLoggedLinePreview) {
        return line;
    }
    return line.substr(0, kLoggedLinePreview) + "...";
}

// Releases the write gate when a send leaves scope.
struct GateRelease {
    asio::experimental::channel<void(asio::error_code)>& gate;
    ~GateRelease() { gate.try_receive([](asio::error_code) {}); }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

ProcessTransport::ProcessTransport(asio::any_io_executor executor, ProcessConfig config)
    : config_(std::move(config))
    , executor_(std::move(executor))
    , strand_(asio::make_strand(executor_))
{
    read_buffer_.reserve(4096);
}

ProcessTransport::~ProcessTransport() {
    // Synchronous cleanup - can't co_await in destructor
    running_ = false;
    kill_process_blocking();
}

// ═══════════════════════════════════════════════════════════════════════════
// IAsyncTransport Interface
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor ProcessTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> ProcessTransport::async_start() {
    if (running_ || stopped_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "transport already started"
        ));
    }
    if (config_.command.empty()) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            "command is empty"
        ));
    }

    ignore_sigpipe_once();

    auto spawned = spawn_process();
    if (!spawned) {
        MCPHUB_LOG_ERROR("[{}] {}", config_.name, spawned.error().message);
        co_return spawned;
    }

    message_channel_ = std::make_unique<MessageChannel>(executor_, config_.channel_capacity);
    write_gate_ = std::make_unique<WriteGate>(executor_, 1);

    running_ = true;

    asio::co_spawn(strand_, [self = shared_from_this()] {
        return self->reader_loop();
    }, asio::detached);
    asio::co_spawn(strand_, [self = shared_from_this()] {
        return self->stderr_reader_loop();
    }, asio::detached);

    MCPHUB_LOG_INFO("[{}] spawned '{}' (pid {})", config_.name, config_.command, child_pid_.load());

    co_return TransportResult<void>{};
}

asio::awaitable<void> ProcessTransport::async_stop() {
    if (stopped_.exchange(true)) {
        co_return;
    }
    running_ = false;

    if (message_channel_) {
        message_channel_->close();
    }
    if (write_gate_) {
        write_gate_->close();
    }
    close_streams();

    const pid_t pid = child_pid_.exchange(-1);
    if (pid > 0) {
        ::kill(pid, SIGTERM);

        asio::steady_timer timer(executor_);
        const auto deadline = std::chrono::steady_clock::now() + config_.kill_grace;
        int status = 0;
        bool reaped = false;
        bool gone = false;

        while (true) {
            const pid_t result = ::waitpid(pid, &status, WNOHANG);
            if (result == pid) {
                reaped = true;
                break;
            }
            if (result < 0) {
                gone = true;  // reaped elsewhere
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            timer.expires_after(kReapPollInterval);
            co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
        }

        if (!reaped && !gone) {
            MCPHUB_LOG_WARN("[{}] pid {} ignored SIGTERM, sending SIGKILL", config_.name, pid);
            ::kill(pid, SIGKILL);
            reaped = (::waitpid(pid, &status, 0) == pid);
        }
        if (reaped) {
            record_exit_status(status);
        }
    }

    MCPHUB_LOG_INFO("[{}] transport stopped", config_.name);
}

asio::awaitable<TransportResult<void>> ProcessTransport::async_send(Json message) {
    if (!running_ || !stdin_stream_ || !write_gate_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Io,
            "no live process"
        ));
    }

    std::string data = message.dump();
    data.push_back('\n');

    // Concurrent senders queue here so lines never interleave.
    auto [gate_ec] = co_await write_gate_->async_send(
        asio::error_code{}, asio::as_tuple(asio::use_awaitable));
    if (gate_ec) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Io,
            "transport stopped while waiting to write"
        ));
    }
    GateRelease release{*write_gate_};

    if (!running_ || !stdin_stream_->is_open()) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Io,
            "no live process"
        ));
    }

    auto [ec, written] = co_await asio::async_write(
        *stdin_stream_,
        asio::buffer(data),
        asio::as_tuple(asio::use_awaitable)
    );
    if (ec) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Io,
            "write failed: " + ec.message()
        ));
    }

    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<Json>> ProcessTransport::async_receive() {
    if (!message_channel_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Io,
            "transport not started"
        ));
    }
    if (reader_done_ && !message_channel_->ready()) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "transport closed",
            exit_code()
        ));
    }

    auto [ec, result] = co_await message_channel_->async_receive(
        asio::as_tuple(asio::use_awaitable));
    if (ec) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "transport closed",
            exit_code()
        ));
    }
    co_return std::move(result);
}

bool ProcessTransport::is_running() const {
    return running_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Diagnostics
// ═══════════════════════════════════════════════════════════════════════════

pid_t ProcessTransport::child_pid() const {
    return child_pid_;
}

std::optional<int> ProcessTransport::exit_code() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return exit_code_;
}

std::string ProcessTransport::stderr_output() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return stderr_tail_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Reader Loops
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> ProcessTransport::reader_loop() {
    bool discarding_oversized = false;

    while (!stopped_) {
        auto [ec, n] = co_await asio::async_read_until(
            *stdout_stream_,
            asio::dynamic_buffer(read_buffer_, config_.max_line_size + 1),
            '\n',
            asio::as_tuple(asio::use_awaitable)
        );

        if (ec == asio::error::not_found) {
            MCPHUB_LOG_WARN("[{}] dropping inbound line longer than {} bytes",
                            config_.name, config_.max_line_size);
            read_buffer_.clear();
            discarding_oversized = true;
            continue;
        }
        if (ec) {
            break;
        }

        std::string line = read_buffer_.substr(0, n - 1);
        read_buffer_.erase(0, n);

        if (discarding_oversized) {
            // Tail end of the line dropped above
            discarding_oversized = false;
            continue;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        Json message = Json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            MCPHUB_LOG_WARN("[{}] dropping malformed line: {}", config_.name, preview(line));
            continue;
        }

        auto [send_ec] = co_await message_channel_->async_send(
            asio::error_code{},
            TransportResult<Json>(std::move(message)),
            asio::as_tuple(asio::use_awaitable)
        );
        if (send_ec) {
            break;
        }
    }

    if (!stopped_) {
        running_ = false;
        co_await reap_child();

        const auto code = exit_code();
        const std::string reason = code
            ? std::format("server process exited with code {}", *code)
            : std::string("server process closed its output");
        MCPHUB_LOG_INFO("[{}] {}", config_.name, reason);

        auto [ec] = co_await message_channel_->async_send(
            asio::error_code{},
            TransportResult<Json>(tl::unexpected(make_error(
                TransportError::Category::Closed, reason, code))),
            asio::as_tuple(asio::use_awaitable)
        );
        (void)ec;  // channel closed by async_stop: nobody left to tell
    }
    reader_done_ = true;
}

asio::awaitable<void> ProcessTransport::stderr_reader_loop() {
    if (!stderr_stream_) {
        co_return;
    }

    while (true) {
        auto [ec, n] = co_await asio::async_read_until(
            *stderr_stream_,
            asio::dynamic_buffer(stderr_buffer_, config_.max_line_size + 1),
            '\n',
            asio::as_tuple(asio::use_awaitable)
        );

        if (ec == asio::error::not_found) {
            append_stderr(stderr_buffer_);
            stderr_buffer_.clear();
            continue;
        }
        if (ec) {
            if (!stderr_buffer_.empty()) {
                MCPHUB_LOG_DEBUG("[{}] stderr: {}", config_.name, stderr_buffer_);
                append_stderr(stderr_buffer_);
                stderr_buffer_.clear();
            }
            break;
        }

        std::string line = stderr_buffer_.substr(0, n);
        stderr_buffer_.erase(0, n);
        append_stderr(line);

        line.pop_back();
        MCPHUB_LOG_DEBUG("[{}] stderr: {}", config_.name, line);
    }
}

asio::awaitable<void> ProcessTransport::reap_child() {
    asio::steady_timer timer(executor_);

    for (int attempt = 0; attempt < kReapPollAttempts && !stopped_; ++attempt) {
        pid_t pid = child_pid_.load();
        if (pid <= 0) {
            co_return;
        }

        int status = 0;
        const pid_t result = ::waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            child_pid_.compare_exchange_strong(pid, -1);
            record_exit_status(status);
            co_return;
        }
        if (result < 0) {
            child_pid_.compare_exchange_strong(pid, -1);
            co_return;
        }

        timer.expires_after(kReapPollInterval);
        co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
    }

    // Output closed but the process lingers; it is of no further use.
    if (!stopped_ && child_pid_.load() > 0) {
        kill_process_blocking();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Process Management
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<void> ProcessTransport::spawn_process() {
    // Pre-allocate argv and envp BEFORE fork() to avoid malloc deadlock in
    // the child. execvp takes char*const[], so keep mutable copies.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    for (const auto& arg : config_.args) {
        argv_storage.push_back(arg);
    }

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    if (!config_.env.empty()) {
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            const std::string_view kv(*entry);
            const auto eq = kv.find('=');
            const std::string key(kv.substr(0, eq));
            if (config_.env.find(key) == config_.env.end()) {
                env_storage.emplace_back(kv);
            }
        }
        for (const auto& [key, value] : config_.env) {
            env_storage.push_back(key + "=" + value);
        }
        envp.reserve(env_storage.size() + 1);
        for (auto& str : env_storage) {
            envp.push_back(str.data());
        }
        envp.push_back(nullptr);
    }

    // All descriptors are close-on-exec; dup2 clears the flag on 0/1/2.
    // The error pipe reports an exec failure back to the parent.
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};

    if (!make_cloexec_pipe(stdin_pipe) || !make_cloexec_pipe(stdout_pipe)
        || !make_cloexec_pipe(stderr_pipe) || !make_cloexec_pipe(error_pipe)) {
        const int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(error_pipe);
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            std::string("failed to create pipes: ") + std::strerror(err)
        ));
    }

    const pid_t pid = ::fork();

    if (pid == -1) {
        const int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(error_pipe);
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            std::string("failed to fork: ") + std::strerror(err)
        ));
    }

    if (pid == 0) {
        // Child process - NO ALLOCATIONS ALLOWED
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);

        if (!envp.empty()) {
            environ = envp.data();
        }
        ::execvp(argv[0], argv.data());

        const int err = errno;
        const ssize_t ignored = ::write(error_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent process
    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);
    ::close(error_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(error_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::close(stderr_pipe[0]);
        int status = 0;
        ::waitpid(pid, &status, 0);
        record_exit_status(status);
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            std::format("failed to execute '{}': {}", config_.command, std::strerror(child_errno)),
            exit_code()
        ));
    }

    stdin_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stdin_pipe[1]);
    stdout_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stdout_pipe[0]);
    stderr_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stderr_pipe[0]);

    child_pid_ = pid;
    return {};
}

void ProcessTransport::close_streams() {
    asio::error_code ec;
    if (stdin_stream_ && stdin_stream_->is_open()) {
        stdin_stream_->close(ec);
    }
    if (stdout_stream_ && stdout_stream_->is_open()) {
        stdout_stream_->close(ec);
    }
    if (stderr_stream_ && stderr_stream_->is_open()) {
        stderr_stream_->close(ec);
    }
}

void ProcessTransport::record_exit_status(int status) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -WTERMSIG(status);
    }
}

void ProcessTransport::append_stderr(const std::string& text) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    stderr_tail_ += text;
    if (stderr_tail_.size() > config_.stderr_tail_size) {
        stderr_tail_.erase(0, stderr_tail_.size() - config_.stderr_tail_size);
    }
}

void ProcessTransport::kill_process_blocking() {
    const pid_t pid = child_pid_.exchange(-1);
    if (pid <= 0) {
        return;
    }

    ::kill(pid, SIGTERM);

    int status = 0;
    pid_t result = ::waitpid(pid, &status, WNOHANG);
    if (result == 0) {
        ::usleep(static_cast<useconds_t>(config_.kill_grace.count() * 1000));
        result = ::waitpid(pid, &status, WNOHANG);
        if (result == 0) {
            ::kill(pid, SIGKILL);
            result = ::waitpid(pid, &status, 0);
        }
    }

    if (result == pid) {
        record_exit_status(status);
    }
}

}  // namespace mcphub
