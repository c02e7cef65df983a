#include <rgmcp/types.hpp>

namespace rgmcp
{

std::string SearchResult::to_pretty_string() const
{
    // Engine output is validated UTF-8 before it gets here, so strict dumping is safe
    return to_json().dump(2);
}

} // namespace rgmcp
