#include <gtest/gtest.h>

#include <filesystem>

#include "utils.h"

namespace {

class UtilsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           (std::string("jsunpack_utils_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::filesystem::path dir_;
};

TEST(PathTest, ModifiedPathKeepsDirectoryAndExtension) {
  EXPECT_EQ(modifiedPathFor("game.js"), "game_modified.js");
  EXPECT_EQ(modifiedPathFor("out/bundle.min.js"), "out/bundle.min_modified.js");
  EXPECT_EQ(modifiedPathFor("dir/noext"), "dir/noext_modified");
}

TEST(PathTest, SiblingPath) {
  EXPECT_EQ(siblingPath("a/b/game.js", "Foo.js"), "a/b/Foo.js");
  EXPECT_EQ(siblingPath("game.js", "Foo.js"), "Foo.js");
}

TEST_F(UtilsTest, AtomicWriteThenRead) {
  std::string path = (dir_ / "out.js").string();
  ASSERT_TRUE(writeFileAtomic(path, "first"));
  ASSERT_TRUE(writeFileAtomic(path, "second\n"));

  std::string back;
  ASSERT_TRUE(readFile(path, back));
  EXPECT_EQ(back, "second\n");
  EXPECT_TRUE(fileExists(path));

  // only the target remains, no temp files
  size_t entries = 0;
  for (const auto& e : std::filesystem::directory_iterator(dir_)) {
    (void)e;
    ++entries;
  }
  EXPECT_EQ(entries, 1u);
}

TEST_F(UtilsTest, AtomicWriteIntoMissingDirectoryFails) {
  EXPECT_FALSE(writeFileAtomic((dir_ / "missing" / "x.js").string(), "data"));
}

TEST_F(UtilsTest, MissingFile) {
  std::string out;
  EXPECT_FALSE(readFile((dir_ / "nope.js").string(), out));
  EXPECT_FALSE(fileExists((dir_ / "nope.js").string()));
  EXPECT_FALSE(fileExists(dir_.string()));
}

}  // namespace
