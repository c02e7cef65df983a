#include <rgmcp/search.hpp>

namespace rgmcp
{

std::vector<std::string> build_search_command(const SearchRequest& request,
                                              const std::filesystem::path& target)
{
    std::vector<std::string> args;

    // Ignore any user-level ripgrep config on the host
    args.push_back("--no-config");

    if (request.fixed_strings)
        args.push_back("-F");

    if (!request.case_sensitive)
        args.push_back("-i");

    if (request.line_numbers)
        args.push_back("-n");

    if (request.context_lines.has_value())
    {
        args.push_back("-C");
        args.push_back(std::to_string(*request.context_lines));
    }

    for (const auto& file_type : request.file_types)
    {
        args.push_back("-t");
        args.push_back(file_type);
    }

    if (request.max_depth.has_value())
    {
        args.push_back("--max-depth");
        args.push_back(std::to_string(*request.max_depth));
    }

    // Pattern goes through -e so one starting with '-' is not parsed as a flag
    args.push_back("-e");
    args.push_back(request.pattern);
    args.push_back(target.string());

    return args;
}

} // namespace rgmcp
