#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcphub {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Spawn,     ///< Child process could not be started
        Io,        ///< Pipe read/write failed or no live process
        Protocol,  ///< Framing violated (oversized line, misuse of the API)
        Closed     ///< Process exited or closed its output
    };

    Category category{};
    std::string message;
    std::optional<int> exit_code{};  ///< Exit status, or -signal when killed
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Spawn:    return "spawn";
        case TransportError::Category::Io:       return "io";
        case TransportError::Category::Protocol: return "protocol";
        case TransportError::Category::Closed:   return "closed";
    }
    return "unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcphub
