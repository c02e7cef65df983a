#ifndef RGMCP_SERVER_HPP
#define RGMCP_SERVER_HPP

#include <istream>
#include <memory>
#include <ostream>
#include <rgmcp/config.hpp>
#include <rgmcp/mcp/server.hpp>
#include <rgmcp/search.hpp>

namespace rgmcp
{

/**
 * Line-delimited JSON-RPC server over a pair of streams.
 *
 * Owns one SearchExecutor (one fixed root) and the dispatcher built on it.
 * tools/call requests run on worker threads so a slow search never blocks
 * reading further requests; every other request is answered inline.
 * Responses are written one JSON document per line and may complete out of
 * order; clients correlate them by id.
 */
class Server
{
  public:
    /// Compose executor, tool handler and dispatcher from configuration
    explicit Server(const ServerConfig& config,
                    std::shared_ptr<const ProcessRunner> runner = nullptr);

    /// Serve an already-built dispatcher
    explicit Server(std::shared_ptr<const mcp::Dispatcher> dispatcher);

    /**
     * Read requests from in until end of input, writing responses to out.
     * Returns after all in-flight tool calls have finished.
     */
    void serve(std::istream& in, std::ostream& out) const;

    const mcp::Dispatcher& dispatcher() const
    {
        return *dispatcher_;
    }

  private:
    std::shared_ptr<const mcp::Dispatcher> dispatcher_;
};

} // namespace rgmcp

#endif // RGMCP_SERVER_HPP
