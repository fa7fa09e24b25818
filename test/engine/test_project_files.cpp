#include <gtest/gtest.h>

#include "engine/project_files.hpp"

using engine::SanitizeFiles;
using engine::SanitizePath;
using engine::SourceFile;

TEST(ProjectFiles, KeepsPlainRelativePaths) {
  EXPECT_EQ(SanitizePath("main.py"), "main.py");
  EXPECT_EQ(SanitizePath("src/pkg/mod.py"), "src/pkg/mod.py");
}

TEST(ProjectFiles, StripsTraversalAndRoot) {
  EXPECT_EQ(SanitizePath("/etc/passwd"), "etc/passwd");
  EXPECT_EQ(SanitizePath("../../secret.py"), "secret.py");
  EXPECT_EQ(SanitizePath("a/../b.py"), "a/b.py");
  EXPECT_EQ(SanitizePath("./a//b/./c.py"), "a/b/c.py");
}

TEST(ProjectFiles, NothingLeftIsEmpty) {
  EXPECT_EQ(SanitizePath(""), "");
  EXPECT_EQ(SanitizePath("/"), "");
  EXPECT_EQ(SanitizePath("../.."), "");
  EXPECT_EQ(SanitizePath("./"), "");
}

TEST(ProjectFiles, DropsFilesWithoutAPath) {
  auto files = SanitizeFiles({SourceFile{"/main.py", "print(1)"},
                              SourceFile{"..", "lost"},
                              SourceFile{"lib/../util.py", "x = 2"}});
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0].path, "main.py");
  EXPECT_EQ(files[0].content, "print(1)");
  EXPECT_EQ(files[1].path, "lib/util.py");
}

TEST(ProjectFiles, SearchDirectories) {
  EXPECT_EQ(engine::ProjectSearchDirs(),
            (std::vector<std::string>{"src", "lib", "utils"}));
}
