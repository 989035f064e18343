/**
 * PathResolver 单元测试: 包含关系必须按路径分量判断,相对/绝对路径都不能逃出允许目录。
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "core/Errors.h"
#include "logs/PathResolver.h"

namespace fs = std::filesystem;

static void createFile(const fs::path& p, const std::string& content) {
  std::ofstream f(p);
  ASSERT_TRUE(f.is_open()) << "create " << p.u8string();
  f << content;
}

class PathResolverTest : public ::testing::Test {
protected:
  void SetUp() override {
    root = fs::canonical(fs::temp_directory_path()) / "loginspector_resolver_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root / "log");
    fs::create_directories(root / "log2");
    fs::create_directories(root / "other");
    createFile(root / "log" / "app.log", "a\n");
    createFile(root / "log2" / "x", "x\n");
    createFile(root / "log2" / "only2.log", "two\n");
    createFile(root / "other" / "secret.log", "s\n");
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  fs::path root;
};

TEST(PathResolverContainment, IsSeparatorAware) {
  EXPECT_TRUE(PathResolver::isWithin("/var/log", "/var/log/x"));
  EXPECT_TRUE(PathResolver::isWithin("/var/log", "/var/log/a/b.log"));
  EXPECT_TRUE(PathResolver::isWithin("/var/log", "/var/log"));
  EXPECT_TRUE(PathResolver::isWithin("/var/log/", "/var/log/x"));
  EXPECT_FALSE(PathResolver::isWithin("/var/log", "/var/log2/x"));
  EXPECT_FALSE(PathResolver::isWithin("/var/log", "/var/lo"));
  EXPECT_FALSE(PathResolver::isWithin("/var/log", "/var"));
  EXPECT_FALSE(PathResolver::isWithin("/var/log", "/etc/passwd"));
}

TEST_F(PathResolverTest, ResolvesRelativeNameInFirstDirectory) {
  PermittedDirectories dirs({root / "log", root / "log2"});
  PathResolver resolver(dirs);

  auto resolved = resolver.resolve("app.log");
  EXPECT_EQ(resolved.directory, root / "log");
  EXPECT_EQ(resolved.path, root / "log" / "app.log");
}

TEST_F(PathResolverTest, SearchesDirectoriesInPriorityOrder) {
  PermittedDirectories dirs({root / "log", root / "log2"});
  PathResolver resolver(dirs);

  auto resolved = resolver.resolve("only2.log");
  EXPECT_EQ(resolved.directory, root / "log2");
  EXPECT_EQ(resolved.path, root / "log2" / "only2.log");
}

TEST_F(PathResolverTest, UnknownRelativeNameFallsBackToFirstDirectory) {
  PermittedDirectories dirs({root / "log", root / "log2"});
  PathResolver resolver(dirs);

  auto resolved = resolver.resolve("missing.log");
  EXPECT_EQ(resolved.directory, root / "log");
  EXPECT_EQ(resolved.path, root / "log" / "missing.log");
  EXPECT_FALSE(fs::exists(resolved.path));
}

TEST_F(PathResolverTest, AcceptsAbsolutePathInsideDirectory) {
  PermittedDirectories dirs({root / "log", root / "log2"});
  PathResolver resolver(dirs);

  auto resolved = resolver.resolve((root / "log2" / "x").u8string());
  EXPECT_EQ(resolved.directory, root / "log2");
  EXPECT_EQ(resolved.path, root / "log2" / "x");
}

TEST_F(PathResolverTest, RejectsSiblingDirectorySharingPrefix) {
  PermittedDirectories dirs({root / "log"});
  PathResolver resolver(dirs);

  EXPECT_THROW(resolver.resolve((root / "log2" / "x").u8string()), InvalidPathError);
}

TEST_F(PathResolverTest, RejectsAbsoluteTraversal) {
  PermittedDirectories dirs({root / "log"});
  PathResolver resolver(dirs);

  std::string sneaky = (root / "log").u8string() + "/../other/secret.log";
  EXPECT_THROW(resolver.resolve(sneaky), InvalidPathError);
  EXPECT_THROW(resolver.resolve("/etc/passwd"), InvalidPathError);
}

TEST_F(PathResolverTest, RejectsRelativeTraversal) {
  PermittedDirectories dirs({root / "log", root / "log2"});
  PathResolver resolver(dirs);

  EXPECT_THROW(resolver.resolve("../other/secret.log"), InvalidPathError);
  EXPECT_THROW(resolver.resolve("../../../../../../etc/passwd"), InvalidPathError);
}

TEST_F(PathResolverTest, RelativeTraversalIntoAnotherPermittedDirectoryStaysContained) {
  PermittedDirectories dirs({root / "log", root / "log2"});
  PathResolver resolver(dirs);

  // ../log2/x 从 log 出发会逃出 log,但从 log2 出发 (../log2/x -> log2/x) 仍在 log2 内
  auto resolved = resolver.resolve("../log2/x");
  EXPECT_EQ(resolved.directory, root / "log2");
  EXPECT_EQ(resolved.path, root / "log2" / "x");
}

TEST_F(PathResolverTest, RejectsSymlinkEscapingDirectory) {
  std::error_code ec;
  fs::create_symlink(root / "other" / "secret.log", root / "log" / "link.log", ec);
  if (ec) {
    GTEST_SKIP() << "symlinks not supported: " << ec.message();
  }
  PermittedDirectories dirs({root / "log"});
  PathResolver resolver(dirs);

  EXPECT_THROW(resolver.resolve("link.log"), InvalidPathError);
  EXPECT_THROW(resolver.resolve((root / "log" / "link.log").u8string()), InvalidPathError);
}

TEST_F(PathResolverTest, ResolvedPathsNeverLeavePermittedDirectories) {
  PermittedDirectories dirs({root / "log", root / "log2"});
  PathResolver resolver(dirs);

  const char* inputs[] = {"app.log", "only2.log", "missing.log", "sub/../app.log", "./x", "a/b/c.log", ".."};
  for (const char* input : inputs) {
    try {
      auto resolved = resolver.resolve(input);
      bool contained = PathResolver::isWithin(root / "log", resolved.path) ||
                       PathResolver::isWithin(root / "log2", resolved.path);
      EXPECT_TRUE(contained) << input << " -> " << resolved.path.u8string();
    } catch (const InvalidPathError&) {
      // 拒绝也满足不变式
    }
  }
}

TEST(PathResolverEmpty, FailsWithConfigurationError) {
  PermittedDirectories dirs;
  PathResolver resolver(dirs);
  EXPECT_THROW(resolver.resolve("app.log"), ConfigurationError);
}
