#ifndef RGMCP_MCP_SERVER_HPP
#define RGMCP_MCP_SERVER_HPP

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace rgmcp
{
namespace mcp
{

using json = nlohmann::json;

/// MCP protocol revision implemented by this server
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// ============================================================================
// Tool description
// ============================================================================

/// Hints about tool behavior for the client
struct ToolAnnotations
{
    std::optional<bool> read_only_hint = std::nullopt;

    json to_json() const
    {
        json out = json::object();
        if (read_only_hint.has_value())
            out["readOnlyHint"] = *read_only_hint;
        return out;
    }

    bool has_any() const
    {
        return read_only_hint.has_value();
    }
};

/// Entry of a tools/list result
struct ToolDescriptor
{
    std::string name;
    std::string description;
    json input_schema;
    ToolAnnotations annotations;

    json to_json() const
    {
        json tool = {{"name", name}, {"description", description}, {"inputSchema", input_schema}};
        if (annotations.has_any())
            tool["annotations"] = annotations.to_json();
        return tool;
    }
};

/// Build a tool result carrying one text content item
json make_text_result(const std::string& text, bool is_error = false);

// ============================================================================
// Tool handler interface
// ============================================================================

/**
 * Implements the tools/list and tools/call operations.
 *
 * Handlers are shared between concurrently running calls and must not keep
 * per-call state.
 */
class ToolHandler
{
  public:
    virtual ~ToolHandler() = default;

    /// Static list of advertised tools
    virtual std::vector<ToolDescriptor> list_tools() const = 0;

    /**
     * Invoke a tool and return its MCP tool result ({"content": [...]}).
     *
     * @param arguments nullopt when the request carried no arguments
     * @throws ProtocolError (or a subclass) for invocation failures
     */
    virtual json call_tool(const std::string& name, const std::optional<json>& arguments) const = 0;
};

// ============================================================================
// JSON-RPC dispatch
// ============================================================================

/**
 * Routes JSON-RPC requests (initialize, ping, tools/list, tools/call) to a
 * ToolHandler and turns errors into protocol error responses.
 *
 * This is the only place where exception classifications become wire errors.
 */
class Dispatcher
{
  public:
    Dispatcher(std::string server_name, std::string server_version,
               std::shared_ptr<const ToolHandler> handler, std::string instructions = {});

    /// Handle one parsed message. Returns nullopt for notifications.
    std::optional<json> handle(const json& request) const;

    /// True for requests that may take long and should not block the reader
    static bool is_long_running(const json& request);

    static json build_response(const json& id, const json& result);
    static json build_error_response(const json& id, int code, const std::string& message);

  private:
    json build_initialize_response(const json& id) const;
    json build_tools_list_response(const json& id) const;
    json build_tool_call_response(const json& id, const json& params) const;

    std::string server_name_;
    std::string server_version_;
    std::shared_ptr<const ToolHandler> handler_;
    std::string instructions_;
};

} // namespace mcp
} // namespace rgmcp

#endif // RGMCP_MCP_SERVER_HPP
