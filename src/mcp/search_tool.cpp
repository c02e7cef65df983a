#include <rgmcp/errors.hpp>
#include <rgmcp/log.hpp>
#include <rgmcp/mcp/search_tool.hpp>

namespace rgmcp
{
namespace mcp
{

const ObjectSchema<SearchRequest>& search_request_schema()
{
    static const ObjectSchema<SearchRequest> schema =
        ObjectSchema<SearchRequest>()
            .property("pattern", "Search pattern", &SearchRequest::pattern, true)
            .property("path", "Relative path within root directory", &SearchRequest::path)
            .property("fixed_strings", "Use fixed strings instead of regex",
                      &SearchRequest::fixed_strings)
            .property("case_sensitive", "Case-sensitive search (default: case-insensitive)",
                      &SearchRequest::case_sensitive)
            .property("line_numbers", "Include line numbers in output",
                      &SearchRequest::line_numbers)
            .property("context_lines", "Number of context lines to show around each match",
                      &SearchRequest::context_lines)
            .property("file_types", "File types to include (e.g. \"rust\", \"js\")",
                      &SearchRequest::file_types)
            .property("max_depth", "Maximum directory depth to search",
                      &SearchRequest::max_depth);
    return schema;
}

SearchRequest decode_search_request(const json& arguments)
{
    SearchRequest request = search_request_schema().decode(arguments);
    if (request.pattern.empty())
        throw InvalidParamsError("pattern", "must not be empty");
    return request;
}

SearchToolHandler::SearchToolHandler(std::shared_ptr<const SearchExecutor> executor)
    : executor_(std::move(executor))
{
    if (!executor_)
        throw std::invalid_argument("SearchToolHandler requires an executor");
}

std::vector<ToolDescriptor> SearchToolHandler::list_tools() const
{
    ToolDescriptor search;
    search.name = SEARCH_TOOL_NAME;
    search.description = "Search code using ripgrep";
    search.input_schema = search_request_schema().to_json();
    search.annotations.read_only_hint = true;
    return {search};
}

json SearchToolHandler::call_tool(const std::string& name,
                                  const std::optional<json>& arguments) const
{
    if (name != SEARCH_TOOL_NAME)
        throw UnknownToolError(name);

    if (!arguments.has_value())
        throw MissingArgumentsError();

    SearchRequest request = decode_search_request(*arguments);

    SearchResult result;
    try
    {
        result = executor_->search(request);
    }
    catch (const PathTraversalError& e)
    {
        log::warn("Rejected search outside root: " + e.path());
        throw ToolInvocationError(e.what());
    }
    catch (const RgmcpError& e)
    {
        throw ToolInvocationError(e.what());
    }

    return make_text_result(result.to_pretty_string());
}

} // namespace mcp
} // namespace rgmcp
