/**
 * rgmcp.cpp - ripgrep MCP server
 *
 * Speaks line-delimited JSON-RPC on stdin/stdout and exposes a single
 * "search" tool backed by ripgrep, confined to FILES_ROOT.
 *
 * Environment:
 *   FILES_ROOT    root directory searches are confined to (default: cwd)
 *   LOG_LEVEL     trace | debug | info | warn | error (default: info)
 *   RGMCP_ENGINE  search executable (default: rg)
 *
 * A .env file in the working directory is read first; variables already
 * present in the environment win. All diagnostics go to stderr.
 */

#include <csignal>
#include <iostream>
#include <rgmcp/rgmcp.hpp>

int main()
{
    using namespace rgmcp;

    // A vanished client shows up as a failed write instead of killing us
    std::signal(SIGPIPE, SIG_IGN);

    load_dotenv();

    ServerConfig config;
    try
    {
        config = ServerConfig::from_environment();
    }
    catch (const ConfigError& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    log::set_level(config.log_level);
    log::info("Starting ripgrep MCP server " + version_string());
    log::info("Files root directory: " + config.files_root.string());

    auto engine_path = locate_engine(config.engine);
    if (!engine_path)
    {
        log::error(config.engine.executable + " is not installed or not in PATH");
        return 1;
    }
    log::info("Found search engine at " + *engine_path);

    try
    {
        Server server(config);
        server.serve(std::cin, std::cout);
    }
    catch (const ConfigError& e)
    {
        log::error(e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        log::error(std::string("Server error: ") + e.what());
        return 1;
    }

    return 0;
}
