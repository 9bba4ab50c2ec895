#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// Coroutine-based message transport used by ServerClient. ProcessTransport is
// the production implementation; tests substitute a scripted transport.
//
// Contract:
// - async_send() fails immediately when there is no live peer.
// - async_receive() yields inbound messages in arrival order. When the peer
//   goes away it yields one Closed error, and later calls fail as well.
// - async_stop() is idempotent.

#include "mcphub/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <functional>
#include <memory>

namespace mcphub {

class IAsyncTransport {
public:
    virtual ~IAsyncTransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// Start the transport (spawn the peer, start readers)
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    [[nodiscard]] virtual asio::awaitable<void> async_stop() = 0;

    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(Json message) = 0;

    /// Wait for the next inbound message or the terminal error
    [[nodiscard]] virtual asio::awaitable<TransportResult<Json>> async_receive() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
};

}  // namespace mcphub
