#include "corvid/file.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <array>
#include <cstdio>
#include <filesystem>
#include <string>

namespace corvid {

class FileTest : public ::testing::Test {
 protected:
  std::string dir = std::filesystem::temp_directory_path().string();
  std::string path;

  ~FileTest() override {
    if (!path.empty()) {
      std::filesystem::remove(path);
    }
  }
};

TEST_F(FileTest, CreateWriteThenReadBack) {
  {
    File created = File::CreateUnique(dir, "corvid-file-test-", path);
    ASSERT_TRUE(created);
    EXPECT_TRUE(path.starts_with(dir));
    EXPECT_TRUE(created.writeAll("hello "));
    EXPECT_TRUE(created.writeAll("world"));
    EXPECT_EQ(created.size(), 11U);
  }
  File file(path);
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 11U);

  std::array<char, 5> buf{};
  ASSERT_EQ(file.readAt(buf, 6), 5U);
  EXPECT_EQ(std::string(buf.data(), buf.size()), "world");
  EXPECT_EQ(file.readAt(buf, 11), 0U);
}

TEST_F(FileTest, MissingFileOrDirectoryIsNotOpened) {
  EXPECT_FALSE(File(dir + "/corvid-no-such-file"));
  EXPECT_FALSE(File(dir));
}

TEST_F(FileTest, CreateInMissingDirectoryFails) {
  std::string created;
  EXPECT_FALSE(File::CreateUnique(dir + "/corvid-no-such-dir", "x", created));
  EXPECT_TRUE(created.empty());
}

}  // namespace corvid
