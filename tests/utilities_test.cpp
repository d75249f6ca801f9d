#include <gtest/gtest.h>
#include <string>
#include <chrono>
#include "utilities.hpp"
#include "constants.hpp"
#include "test_helpers.hpp"

class UtilitiesTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    dir = makeTempDir();
    ASSERT_FALSE(dir.empty());
  }
  void TearDown() override { removeDir(dir); }

  std::string dir;
};

TEST_F(UtilitiesTest, ChunkerSplitsIntoPayloadSizedPieces)
{
  std::string content = makeContent(3, 100);
  writeFile(dir + "/input", content);

  FileChunker chunker(dir + "/input");
  ASSERT_TRUE(chunker.isOpen());
  std::string chunk, joined;
  int chunks = 0;
  while (chunker.nextChunk(chunk))
  {
    EXPECT_LE((int)chunk.size(), MAX_PAYLOAD_LENGTH);
    joined += chunk;
    ++chunks;
  }
  EXPECT_EQ(3, chunks);
  EXPECT_EQ(content, joined);
  EXPECT_FALSE(chunker.nextChunk(chunk));
}

TEST_F(UtilitiesTest, ChunkerRewindsToTheStart)
{
  std::string content = makeContent(2);
  writeFile(dir + "/input", content);

  FileChunker chunker(dir + "/input");
  std::string chunk;
  while (chunker.nextChunk(chunk))
    ;
  chunker.rewind();
  ASSERT_TRUE(chunker.nextChunk(chunk));
  EXPECT_EQ(content.substr(0, MAX_PAYLOAD_LENGTH), chunk);
}

TEST_F(UtilitiesTest, ChunkerOnEmptyOrMissingFileYieldsNothing)
{
  writeFile(dir + "/empty", "");
  std::string chunk;
  FileChunker empty(dir + "/empty");
  EXPECT_TRUE(empty.isOpen());
  EXPECT_FALSE(empty.nextChunk(chunk));

  FileChunker missing(dir + "/missing");
  EXPECT_FALSE(missing.isOpen());
  EXPECT_FALSE(missing.nextChunk(chunk));
}

TEST_F(UtilitiesTest, ChunkerTellsReadErrorsFromEndOfFile)
{
  writeFile(dir + "/input", "abc");
  std::string chunk;
  FileChunker good(dir + "/input");
  ASSERT_TRUE(good.nextChunk(chunk));
  EXPECT_FALSE(good.nextChunk(chunk));
  EXPECT_FALSE(good.failed());

  FileChunker directory(dir); // opens, but every read fails with EISDIR
  EXPECT_FALSE(directory.nextChunk(chunk));
  EXPECT_TRUE(directory.failed());
}

TEST_F(UtilitiesTest, FileSizeOfRegularFilesOnly)
{
  writeFile(dir + "/five", "12345");
  EXPECT_EQ(5, fileSize(dir + "/five"));
  EXPECT_EQ(-1, fileSize(dir + "/missing"));
  EXPECT_EQ(-1, fileSize(dir));
}

TEST_F(UtilitiesTest, UniqueFileNameCountsFromZero)
{
  EXPECT_EQ(dir + "/photo.jpg", uniqueFileName(dir, "photo.jpg"));

  writeFile(dir + "/photo.jpg", "x");
  EXPECT_EQ(dir + "/photo(0).jpg", uniqueFileName(dir, "photo.jpg"));

  writeFile(dir + "/photo(0).jpg", "x");
  EXPECT_EQ(dir + "/photo(1).jpg", uniqueFileName(dir, "photo.jpg"));
}

TEST_F(UtilitiesTest, UniqueFileNameWithoutExtension)
{
  writeFile(dir + "/README", "x");
  EXPECT_EQ(dir + "/README(0)", uniqueFileName(dir, "README"));

  writeFile(dir + "/.hidden", "x");
  EXPECT_EQ(dir + "/.hidden(0)", uniqueFileName(dir, ".hidden"));

  writeFile(dir + "/archive.tar.gz", "x");
  EXPECT_EQ(dir + "/archive.tar(0).gz", uniqueFileName(dir, "archive.tar.gz"));
}

TEST(Utilities, BaseNameStripsDirectories)
{
  EXPECT_EQ("file.txt", baseName("file.txt"));
  EXPECT_EQ("file.txt", baseName("/tmp/dir/file.txt"));
  EXPECT_EQ("passwd", baseName("../../etc/passwd"));
  EXPECT_EQ("dir", baseName("some/dir/"));
  EXPECT_EQ("received_file", baseName(""));
  EXPECT_EQ("received_file", baseName(".."));
  EXPECT_EQ("received_file", baseName("/"));
}

TEST(Utilities, ThroughputInMegabitsPerSecond)
{
  c_time start = std::chrono::system_clock::now();
  c_time end = start + std::chrono::seconds(2);
  EXPECT_EQ("4.00", throughput(start, end, 1000000));
  EXPECT_EQ("0.00", throughput(start, end, 0));
}

TEST(Utilities, ThroughputSurvivesZeroElapsedTime)
{
  c_time now = std::chrono::system_clock::now();
  EXPECT_FALSE(throughput(now, now, 994).empty());
}

TEST(Utilities, ValidatesAddressesAndPorts)
{
  EXPECT_TRUE(checkIp("127.0.0.1"));
  EXPECT_TRUE(checkIp("10.0.1.2"));
  EXPECT_FALSE(checkIp("256.0.0.1"));
  EXPECT_FALSE(checkIp("localhost"));
  EXPECT_FALSE(checkIp(""));

  EXPECT_TRUE(checkPort(1024));
  EXPECT_TRUE(checkPort(8080));
  EXPECT_TRUE(checkPort(65535));
  EXPECT_FALSE(checkPort(1023));
  EXPECT_FALSE(checkPort(65536));
}

TEST(Utilities, TimeStringHasMicroseconds)
{
  std::string now = timeString();
  ASSERT_EQ(15u, now.size()); // HH:MM:SS.ffffff
  EXPECT_EQ(':', now[2]);
  EXPECT_EQ(':', now[5]);
  EXPECT_EQ('.', now[8]);
}

TEST(Logging, ErrorsCarryTheTimestamp)
{
  testing::internal::CaptureStderr();
  outputToStderr("ERROR: bad port");
  std::string line = testing::internal::GetCapturedStderr();
  ASSERT_EQ(15u + 4 + 15 + 1, line.size());
  EXPECT_EQ(':', line[2]);
  EXPECT_EQ('.', line[8]);
  EXPECT_EQ(" -- ERROR: bad port\n", line.substr(15));
}
