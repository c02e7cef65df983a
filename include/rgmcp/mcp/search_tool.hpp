#ifndef RGMCP_MCP_SEARCH_TOOL_HPP
#define RGMCP_MCP_SEARCH_TOOL_HPP

#include <memory>
#include <rgmcp/mcp/schema.hpp>
#include <rgmcp/mcp/server.hpp>
#include <rgmcp/search.hpp>
#include <rgmcp/types.hpp>

namespace rgmcp
{
namespace mcp
{

constexpr const char* SEARCH_TOOL_NAME = "search";

/// Argument schema of the search tool (also used to decode calls)
const ObjectSchema<SearchRequest>& search_request_schema();

/// Decode tool arguments into a SearchRequest.
/// @throws InvalidParamsError naming the offending field
SearchRequest decode_search_request(const json& arguments);

/**
 * Exposes a SearchExecutor as the single "search" tool.
 *
 * Stateless per call; the executor is shared read-only.
 */
class SearchToolHandler : public ToolHandler
{
  public:
    explicit SearchToolHandler(std::shared_ptr<const SearchExecutor> executor);

    std::vector<ToolDescriptor> list_tools() const override;

    /// @throws UnknownToolError, MissingArgumentsError, InvalidParamsError, ToolInvocationError
    json call_tool(const std::string& name, const std::optional<json>& arguments) const override;

  private:
    std::shared_ptr<const SearchExecutor> executor_;
};

} // namespace mcp
} // namespace rgmcp

#endif // RGMCP_MCP_SEARCH_TOOL_HPP
