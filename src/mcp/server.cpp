#include <rgmcp/errors.hpp>
#include <rgmcp/log.hpp>
#include <rgmcp/mcp/server.hpp>

namespace rgmcp
{
namespace mcp
{

json make_text_result(const std::string& text, bool is_error)
{
    json result = {{"content", json::array({json{{"type", "text"}, {"text", text}}})}};
    if (is_error)
        result["isError"] = true;
    return result;
}

Dispatcher::Dispatcher(std::string server_name, std::string server_version,
                       std::shared_ptr<const ToolHandler> handler, std::string instructions)
    : server_name_(std::move(server_name)), server_version_(std::move(server_version)),
      handler_(std::move(handler)), instructions_(std::move(instructions))
{
    if (!handler_)
        throw std::invalid_argument("Dispatcher requires a tool handler");
}

std::optional<json> Dispatcher::handle(const json& request) const
{
    if (!request.is_object())
        return build_error_response(nullptr, jsonrpc::INVALID_REQUEST,
                                    "Invalid Request: expected a JSON object");

    json id = request.value("id", json());

    if (!request.contains("method") || !request["method"].is_string())
    {
        return build_error_response(id, jsonrpc::INVALID_REQUEST,
                                    "Invalid Request: missing 'method' field");
    }

    std::string method = request["method"];

    // Notifications (no id) never get a response
    if (!request.contains("id"))
    {
        log::debug("Notification: " + method);
        return std::nullopt;
    }

    log::debug("Request " + id.dump() + ": " + method);

    if (method == "initialize")
    {
        return build_initialize_response(id);
    }
    else if (method == "ping")
    {
        return build_response(id, json::object());
    }
    else if (method == "tools/list")
    {
        return build_tools_list_response(id);
    }
    else if (method == "tools/call")
    {
        if (!request.contains("params") || !request["params"].is_object())
        {
            return build_error_response(id, jsonrpc::INVALID_PARAMS,
                                        "Invalid params: missing 'params' object");
        }
        return build_tool_call_response(id, request["params"]);
    }

    return build_error_response(id, jsonrpc::METHOD_NOT_FOUND, "Method not found: " + method);
}

bool Dispatcher::is_long_running(const json& request)
{
    return request.is_object() && request.contains("id") && request.contains("method") &&
           request["method"] == "tools/call";
}

json Dispatcher::build_response(const json& id, const json& result)
{
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json Dispatcher::build_error_response(const json& id, int code, const std::string& message)
{
    return json{
        {"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json Dispatcher::build_initialize_response(const json& id) const
{
    json result = {{"protocolVersion", PROTOCOL_VERSION},
                   {"serverInfo", {{"name", server_name_}, {"version", server_version_}}},
                   {"capabilities", {{"tools", {{"listChanged", false}}}}}};
    if (!instructions_.empty())
        result["instructions"] = instructions_;
    return build_response(id, result);
}

json Dispatcher::build_tools_list_response(const json& id) const
{
    json tools_array = json::array();
    for (const auto& tool : handler_->list_tools())
        tools_array.push_back(tool.to_json());

    return build_response(id, json{{"tools", tools_array}});
}

json Dispatcher::build_tool_call_response(const json& id, const json& params) const
{
    if (!params.contains("name") || !params["name"].is_string())
        return build_error_response(id, jsonrpc::INVALID_PARAMS,
                                    "Invalid params: missing 'name' field");

    std::string tool_name = params["name"];

    std::optional<json> arguments;
    if (params.contains("arguments") && !params["arguments"].is_null())
        arguments = params["arguments"];

    try
    {
        return build_response(id, handler_->call_tool(tool_name, arguments));
    }
    catch (const ToolInvocationError& e)
    {
        // Execution failures are tool results the model can see, not protocol errors
        log::warn(e.what());
        return build_response(id, make_text_result(e.what(), true));
    }
    catch (const ProtocolError& e)
    {
        log::warn(e.what());
        return build_error_response(id, e.code(), e.what());
    }
    catch (const std::exception& e)
    {
        log::error(std::string("Unhandled error in tools/call: ") + e.what());
        return build_error_response(id, jsonrpc::INTERNAL_ERROR,
                                    "Internal error: " + std::string(e.what()));
    }
}

} // namespace mcp
} // namespace rgmcp
