#include <atomic>
#include <list>
#include <mutex>
#include <rgmcp/errors.hpp>
#include <rgmcp/log.hpp>
#include <rgmcp/mcp/search_tool.hpp>
#include <rgmcp/server.hpp>
#include <rgmcp/version.hpp>
#include <string>
#include <system_error>
#include <thread>

namespace rgmcp
{

namespace
{

constexpr const char* SERVER_INSTRUCTIONS = "Ripgrep MCP server for code search";

// Serializes whole responses onto the output stream
class ResponseWriter
{
  public:
    explicit ResponseWriter(std::ostream& out) : out_(out) {}

    void write(const json& response)
    {
        // Replace rather than throw on invalid UTF-8 (e.g. engine stderr in an error message)
        std::string line = response.dump(-1, ' ', false, json::error_handler_t::replace);

        std::lock_guard<std::mutex> lock(mutex_);
        if (!out_)
            return; // Client is gone; result is discarded

        out_ << line << '\n';
        out_.flush();
        if (!out_)
            log::warn("Output stream closed; discarding further responses");
    }

  private:
    std::ostream& out_;
    std::mutex mutex_;
};

struct Worker
{
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

void handle_and_write(const mcp::Dispatcher& dispatcher, const json& request,
                      ResponseWriter& writer)
{
    try
    {
        if (auto response = dispatcher.handle(request))
            writer.write(*response);
    }
    catch (const std::exception& e)
    {
        log::error(std::string("Failed to handle request: ") + e.what());
        json id = request.is_object() ? request.value("id", json()) : json();
        writer.write(mcp::Dispatcher::build_error_response(
            id, jsonrpc::INTERNAL_ERROR,
            "Internal error: " + std::string(e.what())));
    }
}

} // namespace

Server::Server(const ServerConfig& config, std::shared_ptr<const ProcessRunner> runner)
{
    auto executor =
        std::make_shared<const SearchExecutor>(config.files_root, config.engine, std::move(runner));
    auto handler = std::make_shared<const mcp::SearchToolHandler>(std::move(executor));
    dispatcher_ = std::make_shared<const mcp::Dispatcher>(SERVER_NAME, version_string(),
                                                          std::move(handler), SERVER_INSTRUCTIONS);
}

Server::Server(std::shared_ptr<const mcp::Dispatcher> dispatcher)
    : dispatcher_(std::move(dispatcher))
{
    if (!dispatcher_)
        throw std::invalid_argument("Server requires a dispatcher");
}

void Server::serve(std::istream& in, std::ostream& out) const
{
    ResponseWriter writer(out);
    std::list<Worker> workers;

    auto reap_finished = [&workers]()
    {
        for (auto it = workers.begin(); it != workers.end();)
        {
            if (it->done->load())
            {
                it->thread.join();
                it = workers.erase(it);
            }
            else
            {
                ++it;
            }
        }
    };

    log::info("Starting MCP server");

    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos)
            continue;

        json request;
        try
        {
            request = json::parse(line);
        }
        catch (const json::parse_error& e)
        {
            log::warn(std::string("Discarding malformed message: ") + e.what());
            writer.write(mcp::Dispatcher::build_error_response(nullptr, jsonrpc::PARSE_ERROR,
                                                               "Parse error: " +
                                                                   std::string(e.what())));
            continue;
        }

        reap_finished();

        if (!mcp::Dispatcher::is_long_running(request))
        {
            handle_and_write(*dispatcher_, request, writer);
            continue;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        try
        {
            std::thread thread(
                [this, request, &writer, done]()
                {
                    handle_and_write(*dispatcher_, request, writer);
                    done->store(true);
                });
            workers.push_back(Worker{std::move(thread), done});
        }
        catch (const std::system_error& e)
        {
            log::warn(std::string("Could not start worker thread, handling inline: ") + e.what());
            handle_and_write(*dispatcher_, request, writer);
        }
    }

    // End of input: let in-flight calls finish so their processes are reaped
    if (!workers.empty())
        log::debug("Input closed; waiting for " + std::to_string(workers.size()) +
                   " in-flight call(s)");
    for (auto& worker : workers)
        worker.thread.join();

    log::info("Server shutdown");
}

} // namespace rgmcp
