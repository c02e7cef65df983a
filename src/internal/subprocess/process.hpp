#ifndef RGMCP_SUBPROCESS_PROCESS_HPP
#define RGMCP_SUBPROCESS_PROCESS_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rgmcp
{
namespace subprocess
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

// Pipe for reading from subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    // No copy, move only
    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Read up to size bytes, returns actual bytes read
    // Returns 0 on EOF, throws on error
    size_t read(char* buffer, size_t size);

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Process configuration
struct ProcessOptions
{
    bool redirect_stdout = true;
    bool redirect_stderr = true;
    // Child reads /dev/null instead of inheriting our stdin (which carries protocol traffic)
    bool null_stdin = true;
    // Start the child in a new session so it has no controlling terminal
    bool new_session = true;
};

// Main Process class
class Process
{
  public:
    Process();
    ~Process();

    // No copy, move only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Spawn a process. Throws SpawnError if the executable could not be
    // started (not found, permission denied), std::runtime_error for pipe/fork failures.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Read stdout and stderr to EOF without letting either pipe fill up
    void communicate(std::string& out, std::string& err);

    // Process control
    bool is_running() const;
    int wait();       // Blocking wait, returns exit code (128 + signal if killed)
    void terminate(); // Graceful termination (SIGTERM)

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// Helper function to find executable in PATH
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace rgmcp

#endif // RGMCP_SUBPROCESS_PROCESS_HPP
