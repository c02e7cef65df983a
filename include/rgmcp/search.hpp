#ifndef RGMCP_SEARCH_HPP
#define RGMCP_SEARCH_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <rgmcp/config.hpp>
#include <rgmcp/sandbox.hpp>
#include <rgmcp/types.hpp>
#include <string>
#include <vector>

namespace rgmcp
{

// ============================================================================
// Command building
// ============================================================================

/// Map a validated request and resolved target onto engine arguments (ripgrep flags).
/// Pure; the executable itself is not included.
std::vector<std::string> build_search_command(const SearchRequest& request,
                                              const std::filesystem::path& target);

// ============================================================================
// Process execution seam
// ============================================================================

/// Captured result of one external process run
struct ProcessOutput
{
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
};

/**
 * Runs an external program to completion.
 *
 * SearchExecutor depends only on this interface so tests can substitute a
 * runner that returns scripted output without spawning anything.
 * Implementations must be safe to call from several threads at once.
 */
class ProcessRunner
{
  public:
    virtual ~ProcessRunner() = default;

    /// @throws SpawnError if the program could not be started
    /// @throws IoError if capturing its output failed
    virtual ProcessOutput run(const std::string& executable,
                              const std::vector<std::string>& args) const = 0;
};

/// Real runner: fork/exec with captured stdout/stderr and no controlling terminal
class SubprocessRunner : public ProcessRunner
{
  public:
    ProcessOutput run(const std::string& executable,
                      const std::vector<std::string>& args) const override;
};

// ============================================================================
// Executor
// ============================================================================

/**
 * Runs searches confined to one root directory.
 *
 * Holds no mutable state; a single instance is shared read-only by every
 * concurrent tool call.
 */
class SearchExecutor
{
  public:
    SearchExecutor(std::filesystem::path root, SearchEngine engine = {},
                   std::shared_ptr<const ProcessRunner> runner = nullptr);

    /**
     * Resolve the target, run the engine and collect its output lines.
     *
     * @throws InvalidPathError, PathTraversalError from the sandbox
     * @throws SpawnError if the engine could not be started
     * @throws SearchEngineError on a failing exit code or undecodable output
     * @throws IoError if capturing output failed
     */
    SearchResult search(const SearchRequest& request) const;

    const PathSandbox& sandbox() const
    {
        return sandbox_;
    }

    const SearchEngine& engine() const
    {
        return engine_;
    }

  private:
    PathSandbox sandbox_;
    SearchEngine engine_;
    std::shared_ptr<const ProcessRunner> runner_;
};

/// Locate the engine executable on PATH (or check it directly if it contains a '/').
/// Returns the resolved path, or nullopt if it is missing or not executable.
std::optional<std::string> locate_engine(const SearchEngine& engine);

/// Split engine output into lines: '\n' terminated, a trailing '\r' dropped,
/// no empty entry after a final newline. Content is otherwise kept verbatim.
std::vector<std::string> split_output_lines(const std::string& output);

} // namespace rgmcp

#endif // RGMCP_SEARCH_HPP
