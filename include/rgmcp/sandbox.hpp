#ifndef RGMCP_SANDBOX_HPP
#define RGMCP_SANDBOX_HPP

#include <filesystem>
#include <string>

namespace rgmcp
{

/**
 * Confines caller-supplied relative paths to a fixed root directory.
 *
 * The root is canonicalized once at construction; a root that cannot be
 * resolved is a startup error (ConfigError), never a per-request one.
 * Instances are immutable and safe to share between threads.
 */
class PathSandbox
{
  public:
    explicit PathSandbox(std::filesystem::path root);

    /// Root exactly as configured
    const std::filesystem::path& root() const
    {
        return root_;
    }

    /// Canonical (symlink-free) form of the root
    const std::filesystem::path& canonical_root() const
    {
        return canonical_root_;
    }

    /**
     * Resolve a relative path against the root.
     *
     * An empty path returns root() unchanged. Otherwise returns the canonical
     * absolute path of root/relative.
     *
     * @throws InvalidPathError if the path does not exist or cannot be resolved
     * @throws PathTraversalError if it resolves outside the root
     */
    std::filesystem::path resolve(const std::string& relative) const;

    /// Component-wise prefix test on already-canonical paths, so that
    /// "/data/root-sibling" is not considered inside "/data/root".
    static bool is_within(const std::filesystem::path& candidate,
                          const std::filesystem::path& root);

  private:
    std::filesystem::path root_;
    std::filesystem::path canonical_root_;
};

} // namespace rgmcp

#endif // RGMCP_SANDBOX_HPP
