#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace mcphub {

using Json = nlohmann::json;

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);
    static JsonResult<JsonRpcId> from_json(const Json& node);

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] std::string to_string() const;
};

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, std::string id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcNotification> from_json(const Json& payload);

private:
    std::string method_;
    std::optional<Json> params_;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonRpcError from_json(const Json& node);
};

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────
// A response carries exactly one of `result` or `error`.

struct JsonRpcResponse {
    JsonRpcId id;
    std::optional<Json> result;
    std::optional<JsonRpcError> error;

    [[nodiscard]] bool is_error() const noexcept { return error.has_value(); }

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcResponse> from_json(const Json& payload);

    static JsonRpcResponse success(JsonRpcId id, Json result);
    static JsonRpcResponse failure(JsonRpcId id, JsonRpcError error);
};

// ─────────────────────────────────────────────────────────────────────────────
// Message classification
// ─────────────────────────────────────────────────────────────────────────────

enum class MessageKind {
    Response,      ///< has id, no method
    Request,       ///< has id and method (server -> client)
    Notification,  ///< has method, no id
    Invalid
};

[[nodiscard]] MessageKind classify_message(const Json& payload) noexcept;

[[nodiscard]] constexpr std::string_view to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Response:     return "response";
        case MessageKind::Request:      return "request";
        case MessageKind::Notification: return "notification";
        case MessageKind::Invalid:      return "invalid";
    }
    return "unknown";
}

}  // namespace mcphub
