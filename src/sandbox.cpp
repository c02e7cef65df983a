#include <rgmcp/sandbox.hpp>

#include <iterator>
#include <rgmcp/errors.hpp>

namespace rgmcp
{

namespace fs = std::filesystem;

PathSandbox::PathSandbox(fs::path root) : root_(std::move(root))
{
    std::error_code ec;
    canonical_root_ = fs::canonical(root_, ec);
    if (ec)
        throw ConfigError("Could not resolve root directory " + root_.string() + ": " +
                          ec.message());
}

fs::path PathSandbox::resolve(const std::string& relative) const
{
    if (relative.empty())
        return root_;

    std::error_code ec;
    fs::path candidate = fs::canonical(root_ / relative, ec);
    if (ec)
        throw InvalidPathError(relative);

    if (!is_within(candidate, canonical_root_))
        throw PathTraversalError(relative);

    return candidate;
}

bool PathSandbox::is_within(const fs::path& candidate, const fs::path& root)
{
    auto root_it = root.begin();
    auto root_end = root.end();
    auto cand_it = candidate.begin();
    auto cand_end = candidate.end();

    for (; root_it != root_end; ++root_it, ++cand_it)
    {
        // A trailing separator shows up as an empty final component
        if (root_it->empty() && std::next(root_it) == root_end)
            break;
        if (cand_it == cand_end || *cand_it != *root_it)
            return false;
    }
    return true;
}

} // namespace rgmcp
