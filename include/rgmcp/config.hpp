#ifndef RGMCP_CONFIG_HPP
#define RGMCP_CONFIG_HPP

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <rgmcp/log.hpp>
#include <set>
#include <string>

namespace rgmcp
{

/// External search engine and its exit-code convention.
/// ripgrep exits 0 when lines matched and 1 when it ran fine but found nothing;
/// another engine must supply its own set.
struct SearchEngine
{
    std::string executable = "rg";
    std::set<int> success_exit_codes = {0, 1};

    bool is_success(int exit_code) const
    {
        return success_exit_codes.count(exit_code) > 0;
    }
};

/// Process-wide settings, read once at startup
struct ServerConfig
{
    std::filesystem::path files_root;
    log::Level log_level = log::Level::Info;
    SearchEngine engine;

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /// Read FILES_ROOT, LOG_LEVEL and RGMCP_ENGINE through lookup.
    /// Throws ConfigError if the root does not exist or is not a directory.
    static ServerConfig load(const EnvLookup& lookup);

    /// load() against the real process environment
    static ServerConfig from_environment();
};

/// Parse KEY=VALUE lines of a .env file. Blank lines and '#' comments are
/// skipped, an optional "export " prefix is accepted and matching surrounding
/// quotes are removed.
std::map<std::string, std::string> parse_dotenv(const std::string& contents);

/// Load a .env file into the process environment without overriding
/// variables that are already set. Returns false if the file does not exist.
bool load_dotenv(const std::filesystem::path& path = ".env");

} // namespace rgmcp

#endif // RGMCP_CONFIG_HPP
