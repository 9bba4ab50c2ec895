#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport
// ═══════════════════════════════════════════════════════════════════════════
// Spawns a capability server and exchanges newline-delimited JSON over its
// stdin/stdout using asio::posix::stream_descriptor.
//
// - One JSON object per line in both directions.
// - Malformed or oversized inbound lines are logged and dropped.
// - stderr is captured line by line: logged at debug level and kept as a
//   bounded tail for diagnostics.
// - Shutdown closes the pipes, sends SIGTERM and escalates to SIGKILL.
//
// Instances must be owned by a std::shared_ptr: the reader coroutines keep the
// transport alive until they finish.

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ProcessTransport is only available on POSIX-compatible systems"
#endif

#include "mcphub/transport/async_transport.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>  // pid_t

namespace mcphub {

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct ProcessConfig {
    std::string command;
    std::vector<std::string> args;

    /// Added to (or replacing entries of) the parent environment
    std::map<std::string, std::string> env;

    /// Label used in log lines
    std::string name{"process"};

    /// Longest accepted inbound line, excluding the newline
    std::size_t max_line_size{1 << 20};  // 1 MiB

    /// Inbound messages buffered before the reader waits for a consumer
    std::size_t channel_capacity{64};

    /// Bytes of stderr kept for stderr_output()
    std::size_t stderr_tail_size{64 * 1024};

    /// Time between SIGTERM and SIGKILL on shutdown
    std::chrono::milliseconds kill_grace{100};
};

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport
// ═══════════════════════════════════════════════════════════════════════════

class ProcessTransport : public IAsyncTransport,
                         public std::enable_shared_from_this<ProcessTransport> {
public:
    ProcessTransport(asio::any_io_executor executor, ProcessConfig config);
    ~ProcessTransport() override;

    // Non-copyable, non-movable
    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;
    ProcessTransport(ProcessTransport&&) = delete;
    ProcessTransport& operator=(ProcessTransport&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // IAsyncTransport interface
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;

    // ─────────────────────────────────────────────────────────────────────────
    // Diagnostics
    // ─────────────────────────────────────────────────────────────────────────

    /// Child process PID (-1 if not running)
    [[nodiscard]] pid_t child_pid() const;

    /// Exit status once reaped; negative values are -signal
    [[nodiscard]] std::optional<int> exit_code() const;

    /// Most recent stderr output, at most stderr_tail_size bytes
    [[nodiscard]] std::string stderr_output() const;

    [[nodiscard]] const ProcessConfig& config() const noexcept { return config_; }

private:
    asio::awaitable<void> reader_loop();
    asio::awaitable<void> stderr_reader_loop();
    asio::awaitable<void> reap_child();

    TransportResult<void> spawn_process();
    void close_streams();
    void record_exit_status(int status);
    void append_stderr(const std::string& line);
    void kill_process_blocking();

    ProcessConfig config_;

    asio::any_io_executor executor_;
    asio::strand<asio::any_io_executor> strand_;

    std::unique_ptr<asio::posix::stream_descriptor> stdin_stream_;
    std::unique_ptr<asio::posix::stream_descriptor> stdout_stream_;
    std::unique_ptr<asio::posix::stream_descriptor> stderr_stream_;

    // Inbound messages (producer: reader_loop, consumer: async_receive)
    using MessageChannel = asio::experimental::channel<
        void(asio::error_code, TransportResult<Json>)
    >;
    std::unique_ptr<MessageChannel> message_channel_;

    // Capacity-1 channel used as an async mutex around writes
    using WriteGate = asio::experimental::channel<void(asio::error_code)>;
    std::unique_ptr<WriteGate> write_gate_;

    std::atomic<pid_t> child_pid_{-1};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> reader_done_{false};

    mutable std::mutex status_mutex_;
    std::optional<int> exit_code_;
    std::string stderr_tail_;

    // Persistent so bytes read past a newline survive to the next line
    std::string read_buffer_;
    std::string stderr_buffer_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Factory
// ═══════════════════════════════════════════════════════════════════════════

inline std::shared_ptr<IAsyncTransport> make_process_transport(
    asio::any_io_executor executor,
    ProcessConfig config
) {
    return std::make_shared<ProcessTransport>(std::move(executor), std::move(config));
}

}  // namespace mcphub
