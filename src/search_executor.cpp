#include "internal/subprocess/process.hpp"
#include "internal/utf8.hpp"

#include <chrono>
#include <rgmcp/errors.hpp>
#include <rgmcp/log.hpp>
#include <rgmcp/search.hpp>

namespace rgmcp
{

// ============================================================================
// SubprocessRunner
// ============================================================================

ProcessOutput SubprocessRunner::run(const std::string& executable,
                                    const std::vector<std::string>& args) const
{
    subprocess::Process proc;
    subprocess::ProcessOptions options;
    options.redirect_stdout = true;
    options.redirect_stderr = true;

    // SpawnError propagates as is; everything else here is an I/O failure
    try
    {
        proc.spawn(executable, args, options);
    }
    catch (const SpawnError&)
    {
        throw;
    }
    catch (const std::runtime_error& e)
    {
        throw IoError(e.what());
    }

    ProcessOutput output;
    try
    {
        proc.communicate(output.stdout_data, output.stderr_data);
        output.exit_code = proc.wait();
    }
    catch (const std::runtime_error& e)
    {
        throw IoError(e.what());
    }

    return output;
}

// ============================================================================
// SearchExecutor
// ============================================================================

SearchExecutor::SearchExecutor(std::filesystem::path root, SearchEngine engine,
                               std::shared_ptr<const ProcessRunner> runner)
    : sandbox_(std::move(root)), engine_(std::move(engine)), runner_(std::move(runner))
{
    if (!runner_)
        runner_ = std::make_shared<SubprocessRunner>();
}

SearchResult SearchExecutor::search(const SearchRequest& request) const
{
    if (log::enabled(log::Level::Debug))
    {
        // Quoted and escaped so a multi-line pattern stays on one log line
        log::debug("Starting search for pattern " +
                   json(request.pattern).dump(-1, ' ', false, json::error_handler_t::replace));
    }

    std::filesystem::path target = sandbox_.resolve(request.path);

    auto start = std::chrono::steady_clock::now();
    auto args = build_search_command(request, target);

    if (log::enabled(log::Level::Trace))
    {
        std::string line = engine_.executable;
        for (const auto& arg : args)
            line += " " + arg;
        log::trace("Running: " + line);
    }

    ProcessOutput output = runner_->run(engine_.executable, args);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!engine_.is_success(output.exit_code))
    {
        log::error("Search engine exited with status " + std::to_string(output.exit_code) +
                   ": " + output.stderr_data);
        throw SearchEngineError(output.stderr_data, output.exit_code);
    }

    if (!internal::is_valid_utf8(output.stdout_data))
        throw SearchEngineError("Invalid UTF-8 in output", -1);

    SearchResult result;
    result.matches = split_output_lines(output.stdout_data);
    result.stats.matched_lines = result.matches.size();
    result.stats.elapsed_ms = static_cast<std::uint64_t>(elapsed.count());

    log::debug("Search finished: " + std::to_string(result.stats.matched_lines) + " lines in " +
               std::to_string(result.stats.elapsed_ms) + " ms");
    return result;
}

std::optional<std::string> locate_engine(const SearchEngine& engine)
{
    return subprocess::find_executable(engine.executable);
}

std::vector<std::string> split_output_lines(const std::string& output)
{
    std::vector<std::string> lines;
    size_t start = 0;

    while (start < output.size())
    {
        size_t end = output.find('\n', start);
        if (end == std::string::npos)
            end = output.size();

        std::string line = output.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));

        start = end + 1;
    }

    return lines;
}

} // namespace rgmcp
