#include "../../src/internal/subprocess/process.hpp"

#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <rgmcp/errors.hpp>
#include <sys/resource.h>
#include <sys/select.h>
#include <thread>
#include <unistd.h>

using namespace rgmcp::subprocess;

namespace
{
struct Captured
{
    std::string out;
    std::string err;
    int exit_code = -1;
};

Captured run_to_completion(const std::string& executable, const std::vector<std::string>& args)
{
    Process proc;
    proc.spawn(executable, args);

    Captured captured;
    proc.communicate(captured.out, captured.err);
    captured.exit_code = proc.wait();
    return captured;
}
} // namespace

// Test basic process spawn
TEST(ProcessTest, SpawnEcho)
{
    auto captured = run_to_completion("/bin/echo", {"Hello"});
    EXPECT_EQ(captured.out, "Hello\n");
    EXPECT_TRUE(captured.err.empty());
    EXPECT_EQ(captured.exit_code, 0);
}

// Bare names are looked up on PATH
TEST(ProcessTest, SpawnByName)
{
    auto captured = run_to_completion("echo", {"from", "path"});
    EXPECT_EQ(captured.out, "from path\n");
    EXPECT_EQ(captured.exit_code, 0);
}

// Arguments reach the child verbatim, with no shell in between
TEST(ProcessTest, ArgumentsAreNotShellExpanded)
{
    auto captured = run_to_completion("/bin/echo", {"$HOME", "*", "a b"});
    EXPECT_EQ(captured.out, "$HOME * a b\n");
    EXPECT_EQ(captured.exit_code, 0);
}

TEST(ProcessTest, CommunicateCollectsBothStreams)
{
    auto captured =
        run_to_completion("/bin/sh", {"-c", "echo out1; echo err1 >&2; echo out2; exit 3"});

    EXPECT_EQ(captured.out, "out1\nout2\n");
    EXPECT_EQ(captured.err, "err1\n");
    EXPECT_EQ(captured.exit_code, 3);
}

// Output larger than a pipe buffer on both streams must not deadlock
TEST(ProcessTest, CommunicateLargeOutput)
{
    auto captured = run_to_completion(
        "/bin/sh",
        {"-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; i=$((i+1)); done"});

    EXPECT_EQ(captured.exit_code, 0);
    EXPECT_NE(captured.out.find("line19999\n"), std::string::npos);
    EXPECT_NE(captured.err.find("err19999\n"), std::string::npos);
}

// The child gets /dev/null on stdin, so a reader of stdin sees EOF at once
TEST(ProcessTest, StdinIsNull)
{
    auto captured = run_to_completion("/bin/cat", {});
    EXPECT_TRUE(captured.out.empty());
    EXPECT_EQ(captured.exit_code, 0);
}

TEST(ProcessTest, NoOutput)
{
    auto captured = run_to_completion("/bin/true", {});
    EXPECT_TRUE(captured.out.empty());
    EXPECT_TRUE(captured.err.empty());
    EXPECT_EQ(captured.exit_code, 0);
}

TEST(ProcessTest, SpawnMissingExecutableThrowsSpawnError)
{
    Process proc;
    EXPECT_THROW(proc.spawn("this_should_not_exist_12345", {}), rgmcp::SpawnError);
}

TEST(ProcessTest, SpawnErrorNamesExecutable)
{
    Process proc;
    try
    {
        proc.spawn("/nonexistent/dir/engine", {});
        FAIL() << "Expected SpawnError";
    }
    catch (const rgmcp::SpawnError& e)
    {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/dir/engine"), std::string::npos);
    }
}

// Test process termination
TEST(ProcessTest, Terminate)
{
    Process proc;
    proc.spawn("/bin/sleep", {"10"});

    EXPECT_TRUE(proc.is_running());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    proc.terminate();

    int exit_code = proc.wait();
    EXPECT_EQ(exit_code, 128 + SIGTERM);
    EXPECT_FALSE(proc.is_running());
}

// Capture must work when pipe descriptors are numbered beyond FD_SETSIZE
TEST(ProcessTest, CommunicateWithHighDescriptors)
{
    constexpr int kFiller = 1100;
    constexpr rlim_t kNeeded = kFiller + 64;

    rlimit saved{};
    ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &saved), 0);
    if (saved.rlim_max != RLIM_INFINITY && saved.rlim_max < kNeeded)
        GTEST_SKIP() << "Hard open-file limit too low: " << saved.rlim_max;

    rlimit raised = saved;
    if (raised.rlim_cur == RLIM_INFINITY || raised.rlim_cur < kNeeded)
        raised.rlim_cur = kNeeded;
    ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &raised), 0);

    std::vector<int> filler;
    for (int i = 0; i < kFiller; ++i)
    {
        int fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (fd < 0)
            break;
        filler.push_back(fd);
    }
    const bool filled = static_cast<int>(filler.size()) == kFiller;
    const int highest = filler.empty() ? -1 : filler.back();

    Captured captured;
    if (filled)
    {
        EXPECT_NO_THROW(captured =
                            run_to_completion("/bin/sh", {"-c", "echo hello; echo oops >&2"}));
    }

    for (int fd : filler)
        ::close(fd);
    setrlimit(RLIMIT_NOFILE, &saved);

    ASSERT_TRUE(filled) << "Opened only " << filler.size() << " descriptors";
    EXPECT_GE(highest, FD_SETSIZE);
    EXPECT_EQ(captured.out, "hello\n");
    EXPECT_EQ(captured.err, "oops\n");
    EXPECT_EQ(captured.exit_code, 0);
}

TEST(ProcessTest, FindExecutable)
{
    auto sh = find_executable("sh");
    EXPECT_TRUE(sh.has_value());

    auto nonexistent = find_executable("this_should_not_exist_12345");
    EXPECT_FALSE(nonexistent.has_value());
}

TEST(ProcessTest, FindExecutableAcceptsPath)
{
    auto sh = find_executable("/bin/sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(*sh, "/bin/sh");

    // Directories are not executables
    EXPECT_FALSE(find_executable("/bin").has_value());
}

// Test multiple sequential processes
TEST(ProcessTest, SequentialProcesses)
{
    for (int i = 0; i < 3; i++)
    {
        auto captured = run_to_completion("/bin/echo", {"test" + std::to_string(i)});
        EXPECT_EQ(captured.out, "test" + std::to_string(i) + "\n");
        EXPECT_EQ(captured.exit_code, 0);
    }
}

// Concurrent children must each see EOF on their own pipes
TEST(ProcessTest, ConcurrentProcessesSeeEof)
{
    std::vector<std::thread> threads;
    std::vector<Captured> results(4);

    for (size_t i = 0; i < results.size(); ++i)
    {
        threads.emplace_back(
            [i, &results]
            {
                results[i] = run_to_completion(
                    "/bin/sh", {"-c", "sleep 0.1; echo done" + std::to_string(i)});
            });
    }
    for (auto& t : threads)
        t.join();

    for (size_t i = 0; i < results.size(); ++i)
    {
        EXPECT_EQ(results[i].out, "done" + std::to_string(i) + "\n");
        EXPECT_EQ(results[i].exit_code, 0);
    }
}
