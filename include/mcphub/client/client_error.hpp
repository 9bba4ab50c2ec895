#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Shared error type for ServerClient and ServerRegistry operations.

#include "mcphub/protocol/mcp_types.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcphub {

enum class ClientErrorCode {
    NotConnected,     ///< Server is registered but not connected
    TransportError,   ///< Spawn failure, pipe failure or process exit
    ProtocolError,    ///< Invalid reply or misuse of the connection lifecycle
    Timeout,          ///< No reply within the request timeout
    Cancelled,        ///< Pending request failed by disconnect
    CircuitOpen,      ///< Rejected by the circuit breaker without sending
    ServerError,      ///< Well-formed error reply from the server
    UnknownServer,    ///< No server registered under that name
    DuplicateServer,  ///< A server with that name is already registered
    InvalidConfig     ///< Server configuration failed validation
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::NotConnected:    return "NotConnected";
        case ClientErrorCode::TransportError:  return "TransportError";
        case ClientErrorCode::ProtocolError:   return "ProtocolError";
        case ClientErrorCode::Timeout:         return "Timeout";
        case ClientErrorCode::Cancelled:       return "Cancelled";
        case ClientErrorCode::CircuitOpen:     return "CircuitOpen";
        case ClientErrorCode::ServerError:     return "ServerError";
        case ClientErrorCode::UnknownServer:   return "UnknownServer";
        case ClientErrorCode::DuplicateServer: return "DuplicateServer";
        case ClientErrorCode::InvalidConfig:   return "InvalidConfig";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<McpError> rpc_error;  ///< Original RPC error if from server

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError not_connected(std::string_view server) {
        return {ClientErrorCode::NotConnected,
                "server '" + std::string(server) + "' is not connected", std::nullopt};
    }

    [[nodiscard]] static ClientError transport_error(std::string msg) {
        return {ClientErrorCode::TransportError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError protocol_error(std::string msg) {
        return {ClientErrorCode::ProtocolError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError timeout(std::string msg) {
        return {ClientErrorCode::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError cancelled(std::string msg = "request cancelled by disconnect") {
        return {ClientErrorCode::Cancelled, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError circuit_open(std::string_view server) {
        return {ClientErrorCode::CircuitOpen,
                "circuit breaker is open for server '" + std::string(server) + "'", std::nullopt};
    }

    [[nodiscard]] static ClientError from_rpc_error(const McpError& err) {
        return {ClientErrorCode::ServerError, err.message, err};
    }

    [[nodiscard]] static ClientError unknown_server(std::string_view server) {
        return {ClientErrorCode::UnknownServer,
                "server '" + std::string(server) + "' not found", std::nullopt};
    }

    [[nodiscard]] static ClientError duplicate_server(std::string_view server) {
        return {ClientErrorCode::DuplicateServer,
                "server '" + std::string(server) + "' already exists", std::nullopt};
    }

    [[nodiscard]] static ClientError invalid_config(std::string msg) {
        return {ClientErrorCode::InvalidConfig, std::move(msg), std::nullopt};
    }

    /// JSON-RPC code an outer layer reports for this failure.
    [[nodiscard]] int rpc_code() const noexcept {
        switch (code) {
            case ClientErrorCode::ServerError:
                return rpc_error ? rpc_error->code : ErrorCode::ServerError;
            case ClientErrorCode::Timeout:
                return ErrorCode::Timeout;
            case ClientErrorCode::TransportError:
            case ClientErrorCode::NotConnected:
                return ErrorCode::ConnectionFailed;
            case ClientErrorCode::CircuitOpen:
                return ErrorCode::CircuitBreakerOpen;
            default:
                return ErrorCode::InternalError;
        }
    }

    [[nodiscard]] Json to_json() const {
        Json j = {
            {"code", rpc_code()},
            {"kind", std::string(to_string(code))},
            {"message", message}
        };
        if (rpc_error && rpc_error->data) {
            j["data"] = *rpc_error->data;
        }
        return j;
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

/// Timeouts and server error replies are retried; everything else is final.
[[nodiscard]] inline bool is_retryable(const ClientError& error) noexcept {
    return error.code == ClientErrorCode::Timeout
        || error.code == ClientErrorCode::ServerError;
}

}  // namespace mcphub
