#include <fstream>
#include <iterator>

#include <gtest/gtest.h>
#include "codebox/fileio.h"
#include "utils.h"

namespace {

std::string ReadAll(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
}

TEST(DecodeContentTest, Plain) {
  EXPECT_EQ(DecodeContent("print(1)"), "print(1)");
  EXPECT_EQ(DecodeContent(""), "");
  // not a base64 data URL
  EXPECT_EQ(DecodeContent("data:text/plain,hello"), "data:text/plain,hello");
  EXPECT_EQ(DecodeContent("data:text/plain,x;base64,y"), "data:text/plain,x;base64,y");
}

TEST(DecodeContentTest, Base64) {
  EXPECT_EQ(DecodeContent("data:;base64,aGVsbG8="), "hello");
  EXPECT_EQ(DecodeContent("data:application/octet-stream;base64,AAEC"), std::string("\0\1\2", 3));
  EXPECT_EQ(DecodeContent("data:;base64,"), "");
  EXPECT_EQ(DecodeContent("data:;base64,aGVs\nbG8"), "hello");
  EXPECT_FALSE(DecodeContent("data:;base64,a*b"));
}

TEST(IsSafeFileNameTest, Basic) {
  EXPECT_TRUE(IsSafeFileName("main.py"));
  EXPECT_TRUE(IsSafeFileName("src/lib/util.go"));
  EXPECT_TRUE(IsSafeFileName("..hidden"));
  EXPECT_FALSE(IsSafeFileName(""));
  EXPECT_FALSE(IsSafeFileName("/etc/passwd"));
  EXPECT_FALSE(IsSafeFileName("../main.py"));
  EXPECT_FALSE(IsSafeFileName("src/../../main.py"));
}

class FileIOTest : public TempDirTest {};

TEST_F(FileIOTest, StageFiles) {
  Files files{{"", "print(1)"}, {"data/input.txt", "data:;base64,MSAy"}};
  ASSERT_TRUE(StageFiles(temp_dir, files, "main.py"));
  EXPECT_EQ(ReadAll(temp_dir / "main.py"), "print(1)");
  EXPECT_EQ(ReadAll(temp_dir / "data" / "input.txt"), "1 2");
  EXPECT_EQ(fs::status(temp_dir / "main.py").permissions() & fs::perms::all, kPerm444);
}

TEST_F(FileIOTest, StageEntryTwice) {
  Files files{{"", "print(1)"}, {"main.py", "print(2)"}};
  EXPECT_FALSE(StageFiles(temp_dir, files, "main.py"));
}

TEST_F(FileIOTest, StageMalformedBase64) {
  Files files{{"main.py", "data:;base64,!!!"}};
  EXPECT_FALSE(StageFiles(temp_dir, files, "main.py"));
}

TEST_F(FileIOTest, StageUnsafeName) {
  Files files{{"/tmp/evil", "x"}};
  EXPECT_FALSE(StageFiles(temp_dir, files, "main.py"));
  files = Files{{"", "x"}};
  EXPECT_FALSE(StageFiles(temp_dir, files, ""));
}

TEST_F(FileIOTest, CopyFiles) {
  fs::path src = temp_dir / "src", dst = temp_dir / "dst";
  fs::create_directories(src);
  fs::create_directories(dst);
  std::ofstream(src / "a.txt") << "a";
  std::ofstream(src / "b.txt") << "b";
  std::ofstream(src / "c.bin") << "c";
  std::ofstream(dst / "b.txt") << "staged";
  ASSERT_TRUE(CopyFiles((src / "*.txt").string(), dst, kPerm444));
  EXPECT_EQ(ReadAll(dst / "a.txt"), "a");
  EXPECT_EQ(ReadAll(dst / "b.txt"), "staged");
  EXPECT_FALSE(fs::exists(dst / "c.bin"));
  EXPECT_EQ(fs::status(dst / "a.txt").permissions() & fs::perms::all, kPerm444);
  // copying again leaves the existing copies alone
  EXPECT_TRUE(CopyFiles((src / "*.txt").string(), dst, kPerm444));
}

TEST_F(FileIOTest, CopyNoMatch) {
  EXPECT_TRUE(CopyFiles((temp_dir / "missing" / "*.txt").string(), temp_dir, kPerm444));
}

TEST_F(FileIOTest, ScratchDirRemoved) {
  fs::path path;
  {
    auto dir = MakeTempDir(temp_dir / "box");
    ASSERT_TRUE(dir);
    path = *dir;
    ScratchDir scratch(std::move(*dir));
    ASSERT_TRUE(WriteFile(scratch.Path() / "a" / "b.txt", "x", kPerm444));
    EXPECT_TRUE(fs::exists(path / "a" / "b.txt"));
  }
  EXPECT_FALSE(fs::exists(path));
  EXPECT_TRUE(fs::exists(temp_dir / "box"));
}

TEST(RandomHexTest, Basic) {
  std::string hex = RandomHex(16);
  EXPECT_EQ(hex.size(), 16u);
  EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

} // namespace
