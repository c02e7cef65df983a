#include <rgmcp/config.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <rgmcp/errors.hpp>
#include <sstream>

namespace rgmcp
{

namespace
{
std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}
} // namespace

ServerConfig ServerConfig::load(const EnvLookup& lookup)
{
    namespace fs = std::filesystem;
    ServerConfig config;

    if (auto root = lookup("FILES_ROOT"); root.has_value() && !root->empty())
    {
        config.files_root = *root;
    }
    else
    {
        // Logging is not configured yet at this point
        std::cerr << "FILES_ROOT not set, using current directory" << std::endl;
        std::error_code ec;
        config.files_root = fs::current_path(ec);
        if (ec)
            throw ConfigError("cannot determine current directory: " + ec.message());
    }

    std::error_code ec;
    if (!fs::exists(config.files_root, ec))
        throw ConfigError("FILES_ROOT directory does not exist: " + config.files_root.string());
    if (!fs::is_directory(config.files_root, ec))
        throw ConfigError("FILES_ROOT is not a directory: " + config.files_root.string());

    if (auto level = lookup("LOG_LEVEL"); level.has_value())
    {
        if (auto parsed = log::parse_level(*level))
            config.log_level = *parsed;
        else
            std::cerr << "Unknown LOG_LEVEL '" << *level << "', using info" << std::endl;
    }

    if (auto engine = lookup("RGMCP_ENGINE"); engine.has_value() && !engine->empty())
        config.engine.executable = *engine;

    return config;
}

ServerConfig ServerConfig::from_environment()
{
    return load(
        [](const std::string& name) -> std::optional<std::string>
        {
            if (const char* value = std::getenv(name.c_str()))
                return std::string(value);
            return std::nullopt;
        });
}

std::map<std::string, std::string> parse_dotenv(const std::string& contents)
{
    std::map<std::string, std::string> vars;
    std::istringstream in(contents);
    std::string line;

    while (std::getline(in, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        if (line.rfind("export ", 0) == 0)
            line = trim(line.substr(7));

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty())
            continue;

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front())
            value = value.substr(1, value.size() - 2);

        vars[key] = value;
    }

    return vars;
}

bool load_dotenv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file)
        return false;

    std::ostringstream contents;
    contents << file.rdbuf();

    for (const auto& [key, value] : parse_dotenv(contents.str()))
        setenv(key.c_str(), value.c_str(), 0); // Existing environment wins

    return true;
}

} // namespace rgmcp
