#ifndef MCPHUB_PROTOCOL_MCP_TYPES_HPP
#define MCPHUB_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcphub {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// Reserved method names used by this library.
namespace Method {
    inline constexpr const char* Initialize = "initialize";
    inline constexpr const char* Initialized = "notifications/initialized";
    inline constexpr const char* Ping = "ping";
    inline constexpr const char* ToolsList = "tools/list";
    inline constexpr const char* ToolsCall = "tools/call";
    inline constexpr const char* ResourcesList = "resources/list";
    inline constexpr const char* ResourcesRead = "resources/read";
    inline constexpr const char* PromptsList = "prompts/list";
}

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {
            j.value("name", ""),
            j.value("version", "")
        };
    }
};

// Features a server advertises in the "capabilities" object of its
// initialize result. Only presence matters here.
struct ServerFeatures {
    bool tools{false};
    bool resources{false};
    bool prompts{false};

    static ServerFeatures from_json(const Json& j) {
        ServerFeatures features;
        if (j.is_object()) {
            features.tools = j.contains("tools");
            features.resources = j.contains("resources");
            features.prompts = j.contains("prompts");
        }
        return features;
    }

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (tools) j["tools"] = Json::object();
        if (resources) j["resources"] = Json::object();
        if (prompts) j["prompts"] = Json::object();
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct Tool {
    std::string name;
    std::optional<std::string> description;
    Json input_schema;  // JSON Schema for tool arguments

    static Tool from_json(const Json& j) {
        Tool tool;
        tool.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            tool.description = j["description"].get<std::string>();
        }
        if (j.contains("inputSchema")) {
            tool.input_schema = j["inputSchema"];
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) {
            j["description"] = *description;
        }
        if (!input_schema.is_null()) {
            j["inputSchema"] = input_schema;
        }
        return j;
    }
};

struct CallToolParams {
    std::string name;
    Json arguments;

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (!arguments.is_null()) {
            j["arguments"] = arguments;
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    static Resource from_json(const Json& j) {
        Resource res;
        res.uri = j.value("uri", "");
        res.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            res.description = j["description"].get<std::string>();
        }
        if (j.contains("mimeType") && j["mimeType"].is_string()) {
            res.mime_type = j["mimeType"].get<std::string>();
        }
        return res;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}, {"name", name}};
        if (description) j["description"] = *description;
        if (mime_type) j["mimeType"] = *mime_type;
        return j;
    }
};

struct ReadResourceParams {
    std::string uri;

    [[nodiscard]] Json to_json() const {
        return {{"uri", uri}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Prompts
// ═══════════════════════════════════════════════════════════════════════════

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    static PromptArgument from_json(const Json& j) {
        PromptArgument arg;
        arg.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            arg.description = j["description"].get<std::string>();
        }
        arg.required = j.value("required", false);
        return arg;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) j["description"] = *description;
        if (required) j["required"] = required;
        return j;
    }
};

struct Prompt {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    static Prompt from_json(const Json& j) {
        Prompt prompt;
        prompt.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            prompt.description = j["description"].get<std::string>();
        }
        if (j.contains("arguments") && j["arguments"].is_array()) {
            for (const auto& a : j["arguments"]) {
                prompt.arguments.push_back(PromptArgument::from_json(a));
            }
        }
        return prompt;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) j["description"] = *description;
        if (!arguments.empty()) {
            j["arguments"] = Json::array();
            for (const auto& arg : arguments) {
                j["arguments"].push_back(arg.to_json());
            }
        }
        return j;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Paged list results (tools/list, resources/list, prompts/list)
// ─────────────────────────────────────────────────────────────────────────────

template <typename Item>
struct ListPage {
    std::vector<Item> items;
    std::optional<std::string> next_cursor;

    static ListPage from_json(const Json& j, const char* key) {
        ListPage page;
        if (j.contains(key) && j[key].is_array()) {
            for (const auto& item : j[key]) {
                page.items.push_back(Item::from_json(item));
            }
        }
        if (j.contains("nextCursor") && j["nextCursor"].is_string()) {
            page.next_cursor = j["nextCursor"].get<std::string>();
        }
        return page;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", Json::object()},
            {"clientInfo", client_info.to_json()}
        };
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Capabilities - the manifest a server reports during negotiation
// ─────────────────────────────────────────────────────────────────────────────
// Lists may arrive inline in the initialize result ({tools, resources,
// prompts}) or be discovered afterwards through the */list methods when only
// advertised in `features`.

struct Capabilities {
    std::vector<Tool> tools;
    std::vector<Resource> resources;
    std::vector<Prompt> prompts;

    ServerFeatures features;
    std::optional<Implementation> server_info;
    std::optional<std::string> protocol_version;

    // Which lists were present inline; the rest are candidates for discovery.
    bool has_inline_tools{false};
    bool has_inline_resources{false};
    bool has_inline_prompts{false};

    static Capabilities from_json(const Json& j) {
        Capabilities caps;
        if (!j.is_object()) {
            return caps;
        }
        if (j.contains("tools") && j["tools"].is_array()) {
            caps.has_inline_tools = true;
            for (const auto& t : j["tools"]) {
                caps.tools.push_back(Tool::from_json(t));
            }
        }
        if (j.contains("resources") && j["resources"].is_array()) {
            caps.has_inline_resources = true;
            for (const auto& r : j["resources"]) {
                caps.resources.push_back(Resource::from_json(r));
            }
        }
        if (j.contains("prompts") && j["prompts"].is_array()) {
            caps.has_inline_prompts = true;
            for (const auto& p : j["prompts"]) {
                caps.prompts.push_back(Prompt::from_json(p));
            }
        }
        if (j.contains("capabilities")) {
            caps.features = ServerFeatures::from_json(j["capabilities"]);
        }
        if (j.contains("serverInfo") && j["serverInfo"].is_object()) {
            caps.server_info = Implementation::from_json(j["serverInfo"]);
        }
        if (j.contains("protocolVersion") && j["protocolVersion"].is_string()) {
            caps.protocol_version = j["protocolVersion"].get<std::string>();
        }
        return caps;
    }

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        j["tools"] = Json::array();
        for (const auto& tool : tools) {
            j["tools"].push_back(tool.to_json());
        }
        j["resources"] = Json::array();
        for (const auto& resource : resources) {
            j["resources"].push_back(resource.to_json());
        }
        j["prompts"] = Json::array();
        for (const auto& prompt : prompts) {
            j["prompts"].push_back(prompt.to_json());
        }
        if (server_info) {
            j["serverInfo"] = server_info->to_json();
        }
        if (protocol_version) {
            j["protocolVersion"] = *protocol_version;
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

struct McpError {
    int code{0};
    std::string message;
    std::optional<Json> data;

    static McpError from_json(const Json& j) {
        McpError err;
        if (!j.is_object()) {
            err.message = j.is_string() ? j.get<std::string>() : j.dump();
            return err;
        }
        err.code = j.value("code", 0);
        err.message = j.value("message", "");
        if (j.contains("data")) {
            err.data = j["data"];
        }
        return err;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"code", code}, {"message", message}};
        if (data) j["data"] = *data;
        return j;
    }
};

// JSON-RPC error codes, plus the implementation-defined range used to report
// local failures to outer layers.
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
    inline constexpr int ServerError = -32000;
    inline constexpr int Timeout = -32001;
    inline constexpr int ConnectionFailed = -32002;
    inline constexpr int CircuitBreakerOpen = -32003;
}

}  // namespace mcphub

#endif  // MCPHUB_PROTOCOL_MCP_TYPES_HPP
