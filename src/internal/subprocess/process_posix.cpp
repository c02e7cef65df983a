// POSIX implementation of subprocess process management (Linux; uses pipe2)

#include "process.hpp"

#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <rgmcp/errors.hpp>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace rgmcp
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

static void close_pair(int fds[2])
{
    if (fds[0] >= 0)
        ::close(fds[0]);
    if (fds[1] >= 0)
        ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

static int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Child side: report errno through the exec-status pipe and exit
[[noreturn]] static void child_fail(int status_fd)
{
    int err = errno;
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
        throw std::runtime_error("Read failed: " + get_errno_message());

    return static_cast<size_t>(bytes_read);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (is_running())
    {
        terminate();
        wait();
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (options.redirect_stdout && pipe2(stdout_pipe, O_CLOEXEC) != 0)
        throw std::runtime_error("Failed to create stdout pipe: " + get_errno_message());

    if (options.redirect_stderr && pipe2(stderr_pipe, O_CLOEXEC) != 0)
    {
        int err = errno;
        close_pair(stdout_pipe);
        throw std::runtime_error("Failed to create stderr pipe: " + get_errno_message(err));
    }

    // Stays silent on a successful exec, carries errno otherwise. All pipes are
    // close-on-exec so concurrently spawned children never hold each other's ends.
    if (pipe2(status_pipe, O_CLOEXEC) != 0)
    {
        int err = errno;
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        throw std::runtime_error("Failed to create status pipe: " + get_errno_message(err));
    }

    // Build argv before forking; only async-signal-safe calls in the child
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        throw std::runtime_error("Failed to fork process: " + get_errno_message(err));
    }

    if (pid == 0)
    {
        // Child process
        ::close(status_pipe[0]);

        if (options.new_session)
            setsid();

        if (options.null_stdin)
        {
            int null_fd = open("/dev/null", O_RDONLY);
            if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0)
                child_fail(status_pipe[1]);
            ::close(null_fd);
        }

        if (options.redirect_stdout)
        {
            ::close(stdout_pipe[0]);
            if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
                child_fail(status_pipe[1]);
            ::close(stdout_pipe[1]);
        }

        if (options.redirect_stderr)
        {
            ::close(stderr_pipe[0]);
            if (dup2(stderr_pipe[1], STDERR_FILENO) < 0)
                child_fail(status_pipe[1]);
            ::close(stderr_pipe[1]);
        }

        execvp(executable.c_str(), argv.data());

        // If execvp returns, it failed
        child_fail(status_pipe[1]);
    }

    // Parent process
    ::close(status_pipe[1]);

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]);
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;

    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        // Reap the failed child so it does not linger as a zombie
        wait();
        stdout_.reset();
        stderr_.reset();
        throw SpawnError(executable + ": " + get_errno_message(child_errno));
    }
}

void Process::communicate(std::string& out, std::string& err)
{
    char buffer[8192];

    // Descriptors may be numbered past FD_SETSIZE when many searches run at once
    struct Stream
    {
        ReadPipe* pipe;
        std::string* sink;
    };
    Stream streams[2] = {{stdout_.get(), &out}, {stderr_.get(), &err}};

    while (true)
    {
        pollfd fds[2];
        Stream* polled[2];
        nfds_t count = 0;

        for (auto& stream : streams)
        {
            if (stream.pipe && stream.pipe->is_open())
            {
                fds[count].fd = stream.pipe->handle_->fd;
                fds[count].events = POLLIN;
                fds[count].revents = 0;
                polled[count] = &stream;
                ++count;
            }
        }
        if (count == 0)
            break;

        int result = ::poll(fds, count, -1);
        if (result < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::runtime_error("poll failed: " + get_errno_message());
        }

        for (nfds_t i = 0; i < count; ++i)
        {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
                continue;

            // POLLHUP with buffered data still reads; EOF shows up as a zero-length read
            size_t n = polled[i]->pipe->read(buffer, sizeof(buffer));
            if (n == 0)
                polled[i]->pipe->close();
            else
                polled[i]->sink->append(buffer, n);
        }
    }
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0)
        return false;

    if (!handle_->running)
        return false;

    // Check process status using kill with signal 0
    int result = ::kill(handle_->pid, 0);
    if (result == 0)
        return true; // Process exists

    if (errno == ESRCH)
        return false; // Process doesn't exist

    // For other errors (EPERM), assume process exists
    return true;
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

// ============================================================================
// Helper functions
// ============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto is_executable_file = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    // Absolute path: check it directly
    fs::path exe_path(name);
    if (exe_path.is_absolute())
    {
        if (is_executable_file(exe_path))
            return name;
        return std::nullopt;
    }

    // If name contains a path separator, treat as relative path
    if (name.find('/') != std::string::npos)
    {
        if (is_executable_file(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;

    // Split PATH by colon; empty entries are skipped
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path test_path = fs::path(dir) / name;
            if (is_executable_file(test_path))
                return test_path.string();
        }

        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace rgmcp
