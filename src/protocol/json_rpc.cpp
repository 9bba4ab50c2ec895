#include "mcphub/protocol/json_rpc.hpp"

namespace mcphub {
namespace {
constexpr std::string_view kJsonRpcVersion{"2.0"};

bool is_valid_params_type(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

JsonResult<JsonRpcId> parse_id_field(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

// Shared envelope checks: object with jsonrpc == "2.0".
JsonResult<void> check_envelope(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "payload must be a JSON object"});
    }

    const bool has_version_field = payload.contains("jsonrpc");
    if (has_version_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }

    const Json& version_node = payload.at("jsonrpc");
    const bool version_is_string = version_node.is_string();
    if ((version_is_string == false) || (version_node != kJsonRpcVersion)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }
    return {};
}

JsonResult<std::optional<Json>> parse_params(const Json& payload) {
    std::optional<Json> parsed_params;
    const bool has_params_field = payload.contains("params");
    if (has_params_field == true) {
        const Json& params_node = payload.at("params");
        const bool params_are_valid = is_valid_params_type(params_node);
        if (params_are_valid == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "params must be an object or array"});
        }
        parsed_params = params_node;
    }
    return parsed_params;
}

JsonResult<std::string> parse_method(const Json& payload) {
    const bool has_method_field = payload.contains("method");
    if (has_method_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }

    const Json& method_node = payload.at("method");
    if (method_node.is_string() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "method must be a string"});
    }
    return method_node.get<std::string>();
}
}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

JsonResult<JsonRpcId> JsonRpcId::from_json(const Json& node) {
    return parse_id_field(node);
}

Json JsonRpcId::to_json() const {
    Json node;
    std::visit([&](const auto& id_value) { node = id_value; }, value);
    return node;
}

std::string JsonRpcId::to_string() const {
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*number);
    }
    return std::get<std::string>(value);
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::int64_t id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::integer(id), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::string id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::string(std::move(id)), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               JsonRpcId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    payload["id"] = id_.to_json();

    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }

    auto method = parse_method(payload);
    if (method.has_value() == false) {
        return tl::unexpected(method.error());
    }

    const bool has_id_field = payload.contains("id");
    if (has_id_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = parse_id_field(payload.at("id"));
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    auto params = parse_params(payload);
    if (params.has_value() == false) {
        return tl::unexpected(params.error());
    }

    return JsonRpcRequest(std::move(*method), std::move(*parsed_id), std::move(*params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcNotification> JsonRpcNotification::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }

    auto method = parse_method(payload);
    if (method.has_value() == false) {
        return tl::unexpected(method.error());
    }

    auto params = parse_params(payload);
    if (params.has_value() == false) {
        return tl::unexpected(params.error());
    }

    return JsonRpcNotification(std::move(*method), std::move(*params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonRpcError JsonRpcError::from_json(const Json& node) {
    JsonRpcError error;
    if (node.is_object() == false) {
        error.message = node.is_string() ? node.get<std::string>() : node.dump();
        return error;
    }
    if (node.contains("code") && node["code"].is_number_integer()) {
        error.code = node["code"].get<std::int64_t>();
    }
    error.message = node.value("message", "");
    if (node.contains("data")) {
        error.data = node["data"];
    }
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id.to_json();
    if (error.has_value()) {
        payload["error"] = error->to_json();
    } else {
        payload["result"] = result.value_or(Json::object());
    }
    return payload;
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }

    if (payload.contains("id") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = parse_id_field(payload.at("id"));
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if (has_result == has_error) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "response must carry exactly one of result or error"});
    }

    if (has_error == true) {
        return failure(std::move(*parsed_id), JsonRpcError::from_json(payload.at("error")));
    }
    return success(std::move(*parsed_id), payload.at("result"));
}

JsonRpcResponse JsonRpcResponse::success(JsonRpcId id, Json result) {
    return JsonRpcResponse{std::move(id), std::move(result), std::nullopt};
}

JsonRpcResponse JsonRpcResponse::failure(JsonRpcId id, JsonRpcError error) {
    return JsonRpcResponse{std::move(id), std::nullopt, std::move(error)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

MessageKind classify_message(const Json& payload) noexcept {
    if (payload.is_object() == false) {
        return MessageKind::Invalid;
    }
    const bool has_id = payload.contains("id") && (payload["id"].is_null() == false);
    const bool has_method = payload.contains("method") && payload["method"].is_string();

    if (has_id && has_method) {
        return MessageKind::Request;
    }
    if (has_id) {
        return MessageKind::Response;
    }
    if (has_method) {
        return MessageKind::Notification;
    }
    return MessageKind::Invalid;
}

}  // namespace mcphub
