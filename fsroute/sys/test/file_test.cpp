#include "fsroute/file.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "fsroute/temp-file.hpp"

namespace fsroute {

using test::ScopedTempDir;
using test::ScopedTempFile;

TEST(File, DefaultConstructedIsClosed) {
  File file;
  EXPECT_FALSE(file);
  EXPECT_EQ(file.size(), File::kError);
  EXPECT_THROW((void)file.loadAllContent(), std::runtime_error);
}

TEST(File, MissingFileIsNotOpened) {
  ScopedTempDir dir;
  File file((dir.dirPath() / "missing.txt").string());
  EXPECT_FALSE(file);
  EXPECT_EQ(file.size(), File::kError);
}

TEST(File, SizeAndLoadAllContent) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "hello world");
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 11U);
  EXPECT_EQ(file.loadAllContent(), "hello world");
}

TEST(File, EmptyFile) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "");
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 0U);
  EXPECT_TRUE(file.loadAllContent().empty());
}

TEST(File, ReadAtOffset) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "0123456789");
  File file(tmp.filePath().string());
  ASSERT_TRUE(file);

  std::array<std::byte, 4> buf{};
  ASSERT_EQ(file.readAt(buf, 3), 4U);
  EXPECT_EQ(std::string_view(reinterpret_cast<const char*>(buf.data()), buf.size()), "3456");

  // Reading near the end returns the remaining bytes only.
  ASSERT_EQ(file.readAt(buf, 8), 2U);
  EXPECT_EQ(std::string_view(reinterpret_cast<const char*>(buf.data()), 2), "89");

  EXPECT_EQ(file.readAt(buf, 10), 0U);
}

TEST(File, ReadAtOnClosedFileReturnsError) {
  File file;
  std::array<std::byte, 4> buf{};
  EXPECT_EQ(file.readAt(buf, 0), File::kError);
}

TEST(File, OpeningADirectoryFailsToRead) {
  ScopedTempDir dir;
  File file(dir.dirPath().string());
  if (file) {
    std::array<std::byte, 4> buf{};
    EXPECT_EQ(file.readAt(buf, 0), File::kError);
  }
}

}  // namespace fsroute
