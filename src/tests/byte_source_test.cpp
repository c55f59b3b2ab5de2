#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "io/byte_stream.hpp"
#include "test_utils.hpp"

using namespace dagsync;
using namespace dagsync::io;
namespace fs = std::filesystem;

class ByteSourceTest : public ::testing::Test {
protected:
  fs::path test_dir;

  void SetUp() override {
    test::init_logging();
    test_dir = test::unique_temp_dir("byte_source_test");
    fs::create_directories(test_dir);
  }

  void TearDown() override {
    if (fs::exists(test_dir)) {
      fs::remove_all(test_dir);
    }
  }

  static Bytes drain(ByteStream& stream) {
    Bytes result;
    Bytes piece;
    while (stream.read(piece)) {
      result.insert(result.end(), piece.begin(), piece.end());
    }
    return result;
  }
};

TEST_F(ByteSourceTest, BufferSourceYieldsPieces) {
  Bytes data = test::random_bytes(1000);
  BufferSource source(data, "buffer.bin", "application/octet-stream", 300);

  EXPECT_EQ(source.size(), data.size());
  EXPECT_EQ(source.name(), "buffer.bin");
  EXPECT_EQ(drain(source), data);
}

TEST_F(ByteSourceTest, FileSourceReadsWholeFile) {
  Bytes data = test::random_bytes(1000);
  fs::path path = test_dir / "notes.txt";
  test::write_file(path, data);

  FileSource source(path, 256);
  EXPECT_EQ(source.name(), "notes.txt");
  EXPECT_EQ(source.mime_type(), "text/plain");
  EXPECT_EQ(source.size(), data.size());
  EXPECT_EQ(drain(source), data);

  Bytes piece;
  EXPECT_FALSE(source.read(piece));
}

TEST_F(ByteSourceTest, UnknownExtensionIsOctetStream) {
  EXPECT_EQ(FileSource::guess_mime_type("archive.unknownext"), "application/octet-stream");
}

TEST_F(ByteSourceTest, MissingFileIsRejected) {
  EXPECT_THROW(FileSource source(test_dir / "absent.bin"), SourceError);
}

TEST_F(ByteSourceTest, ShrunkFileIsDetected) {
  fs::path path = test_dir / "shrinks.bin";
  test::write_file(path, test::random_bytes(1000));

  FileSource source(path, 256);
  fs::resize_file(path, 600);

  // The last read is short, so end of file is reached without an empty read
  EXPECT_THROW(drain(source), SourceError);
}

TEST_F(ByteSourceTest, GrownFileIsDetected) {
  fs::path path = test_dir / "grows.bin";
  test::write_file(path, test::random_bytes(512));

  FileSource source(path, 256);
  {
    std::ofstream file(path, std::ios::binary | std::ios::app);
    file << std::string(100, 'x');
  }

  EXPECT_THROW(drain(source), SourceError);
}
