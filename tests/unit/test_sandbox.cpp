#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <rgmcp/errors.hpp>
#include <rgmcp/sandbox.hpp>

using namespace rgmcp;
namespace fs = std::filesystem;

class SandboxTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        root_ = dir_.make_dir("root");
        dir_.write_file("root/src/main.rs", "fn main() {}\n");
        dir_.write_file("root/README.md", "# readme\n");
        dir_.write_file("root-sibling/secret.txt", "password\n");
        dir_.write_file("outside.txt", "outside\n");
    }

    test::TempDir dir_;
    fs::path root_;
};

TEST_F(SandboxTest, EmptyPathIsRoot)
{
    PathSandbox sandbox(root_);
    EXPECT_EQ(sandbox.resolve(""), root_);
}

TEST_F(SandboxTest, ResolvesNestedPaths)
{
    PathSandbox sandbox(root_);
    EXPECT_EQ(sandbox.resolve("src"), root_ / "src");
    EXPECT_EQ(sandbox.resolve("src/main.rs"), root_ / "src" / "main.rs");
    EXPECT_EQ(sandbox.resolve("README.md"), root_ / "README.md");
}

TEST_F(SandboxTest, DotDotInsideRootIsAllowed)
{
    PathSandbox sandbox(root_);
    EXPECT_EQ(sandbox.resolve("src/../README.md"), root_ / "README.md");
    EXPECT_EQ(sandbox.resolve("."), root_);
}

TEST_F(SandboxTest, ParentTraversalRejected)
{
    PathSandbox sandbox(root_);
    EXPECT_THROW(sandbox.resolve(".."), PathTraversalError);
    EXPECT_THROW(sandbox.resolve("../outside.txt"), PathTraversalError);
}

TEST_F(SandboxTest, DeepTraversalRejected)
{
    PathSandbox sandbox(root_);
    try
    {
        sandbox.resolve("../../../../../../etc/passwd");
        FAIL() << "Expected PathTraversalError";
    }
    catch (const PathTraversalError& e)
    {
        EXPECT_EQ(e.path(), "../../../../../../etc/passwd");
    }
}

// A sibling sharing the root's name as a string prefix is still outside
TEST_F(SandboxTest, SiblingWithCommonPrefixRejected)
{
    PathSandbox sandbox(root_);
    EXPECT_THROW(sandbox.resolve("../root-sibling"), PathTraversalError);
    EXPECT_THROW(sandbox.resolve("../root-sibling/secret.txt"), PathTraversalError);
}

// An absolute path replaces the root when joined, so it must be checked like any other
TEST_F(SandboxTest, AbsolutePathOutsideRejected)
{
    PathSandbox sandbox(root_);
    EXPECT_THROW(sandbox.resolve((dir_.path() / "outside.txt").string()), PathTraversalError);
}

TEST_F(SandboxTest, AbsolutePathInsideAccepted)
{
    PathSandbox sandbox(root_);
    EXPECT_EQ(sandbox.resolve((root_ / "src").string()), root_ / "src");
}

TEST_F(SandboxTest, MissingPathIsInvalid)
{
    PathSandbox sandbox(root_);
    EXPECT_THROW(sandbox.resolve("does/not/exist"), InvalidPathError);
}

TEST_F(SandboxTest, SymlinkEscapingRootRejected)
{
    std::error_code ec;
    fs::create_directory_symlink(dir_.path() / "root-sibling", root_ / "escape", ec);
    if (ec)
        GTEST_SKIP() << "Cannot create symlinks here: " << ec.message();

    PathSandbox sandbox(root_);
    EXPECT_THROW(sandbox.resolve("escape"), PathTraversalError);
    EXPECT_THROW(sandbox.resolve("escape/secret.txt"), PathTraversalError);
}

TEST_F(SandboxTest, SymlinkInsideRootAccepted)
{
    std::error_code ec;
    fs::create_directory_symlink(root_ / "src", root_ / "alias", ec);
    if (ec)
        GTEST_SKIP() << "Cannot create symlinks here: " << ec.message();

    PathSandbox sandbox(root_);
    EXPECT_EQ(sandbox.resolve("alias"), root_ / "src");
}

// Root reached through a symlink still confines correctly
TEST_F(SandboxTest, SymlinkedRoot)
{
    std::error_code ec;
    fs::create_directory_symlink(root_, dir_.path() / "root-link", ec);
    if (ec)
        GTEST_SKIP() << "Cannot create symlinks here: " << ec.message();

    PathSandbox sandbox(dir_.path() / "root-link");
    EXPECT_EQ(sandbox.canonical_root(), root_);
    EXPECT_EQ(sandbox.resolve("src"), root_ / "src");
    EXPECT_THROW(sandbox.resolve("../outside.txt"), PathTraversalError);
}

TEST_F(SandboxTest, UnresolvableRootIsConfigError)
{
    EXPECT_THROW(PathSandbox(dir_.path() / "absent"), ConfigError);
}

TEST(SandboxIsWithinTest, ComponentWise)
{
    EXPECT_TRUE(PathSandbox::is_within("/data/root", "/data/root"));
    EXPECT_TRUE(PathSandbox::is_within("/data/root/a/b", "/data/root"));
    EXPECT_TRUE(PathSandbox::is_within("/data/root/a", "/data/root/"));
    EXPECT_FALSE(PathSandbox::is_within("/data/root-sibling", "/data/root"));
    EXPECT_FALSE(PathSandbox::is_within("/data", "/data/root"));
    EXPECT_FALSE(PathSandbox::is_within("/etc/passwd", "/data/root"));
    EXPECT_TRUE(PathSandbox::is_within("/etc/passwd", "/"));
}
