#include <gtest/gtest.h>
#include <algorithm>
#include "compress/compression_stream.hpp"
#include "crypto/crypto_stream.hpp"
#include "test_utils.hpp"

using namespace dagsync;
using namespace dagsync::compress;

class CompressionStreamTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_logging();
  }

  static Bytes run(CompressionStream& stream, const Bytes& input, std::size_t piece_size) {
    Bytes output;
    for (std::size_t offset = 0; offset < input.size(); offset += piece_size) {
      std::size_t length = std::min(piece_size, input.size() - offset);
      stream.update(Bytes(input.begin() + offset, input.begin() + offset + length), output);
    }
    stream.finish(output);
    return output;
  }

  static Bytes compress(const Bytes& input, std::size_t piece_size = 4096) {
    CompressionStream deflater(CompressionStream::Mode::Compress);
    return run(deflater, input, piece_size);
  }

  static Bytes decompress(const Bytes& input, std::size_t piece_size = 4096) {
    CompressionStream inflater(CompressionStream::Mode::Decompress);
    return run(inflater, input, piece_size);
  }

  static Bytes repetitive(std::size_t size) {
    Bytes data(size);
    for (std::size_t i = 0; i < size; ++i) {
      data[i] = static_cast<uint8_t>("the quick brown fox "[i % 20]);
    }
    return data;
  }
};

TEST_F(CompressionStreamTest, RoundTripAcrossPieceSizes) {
  Bytes data = repetitive(100000);
  for (std::size_t piece : {1u, 100u, 16384u, 200000u}) {
    Bytes compressed = compress(data, piece);
    EXPECT_LT(compressed.size(), data.size() / 10);
    EXPECT_EQ(decompress(compressed, piece), data) << "piece size " << piece;
  }
}

TEST_F(CompressionStreamTest, IncompressibleDataRoundTrips) {
  Bytes data = test::random_bytes(50000);
  EXPECT_EQ(decompress(compress(data)), data);
}

TEST_F(CompressionStreamTest, EmptyInput) {
  Bytes compressed = compress(Bytes{});
  EXPECT_FALSE(compressed.empty());
  EXPECT_TRUE(decompress(compressed).empty());
}

TEST_F(CompressionStreamTest, CountsBytes) {
  Bytes data = repetitive(5000);
  CompressionStream deflater(CompressionStream::Mode::Compress);
  Bytes compressed = run(deflater, data, 1000);
  EXPECT_EQ(deflater.total_in(), data.size());
  EXPECT_EQ(deflater.total_out(), compressed.size());
}

TEST_F(CompressionStreamTest, TruncatedStreamFails) {
  Bytes compressed = compress(test::random_bytes(5000));
  compressed.resize(compressed.size() / 2);
  EXPECT_THROW(decompress(compressed), CompressionError);
}

TEST_F(CompressionStreamTest, CorruptStreamFails) {
  EXPECT_THROW(decompress(test::to_bytes("definitely not zlib")), CompressionError);
}

TEST_F(CompressionStreamTest, TrailingDataFails) {
  Bytes compressed = compress(test::to_bytes("payload"));
  compressed.push_back(0x00);
  EXPECT_THROW(decompress(compressed), CompressionError);

  Bytes clean = compress(test::to_bytes("payload"));
  CompressionStream inflater(CompressionStream::Mode::Decompress);
  Bytes output;
  inflater.update(clean, output);
  EXPECT_THROW(inflater.update(Bytes{1}, output), CompressionError);
}

TEST_F(CompressionStreamTest, ChainsWithEncryption) {
  Bytes data = repetitive(70000);
  std::vector<uint8_t> key = test::random_bytes(crypto::CryptoStream::KEY_SIZE, 3);

  test::PieceStream source(data, 5000);
  auto upload = utils::Pipeliner::create(source)
    ->transform(std::make_shared<CompressionStream>(CompressionStream::Mode::Compress))
    ->transform(std::make_shared<crypto::CryptoStream>(key, crypto::CryptoStream::Mode::Encrypt));
  Bytes stored = test::drain_stream(*upload);
  EXPECT_LT(stored.size(), data.size());

  test::PieceStream stored_source(stored, 777);
  auto download = utils::Pipeliner::create(stored_source)
    ->transform(std::make_shared<crypto::CryptoStream>(key, crypto::CryptoStream::Mode::Decrypt))
    ->transform(std::make_shared<CompressionStream>(CompressionStream::Mode::Decompress));
  EXPECT_EQ(test::drain_stream(*download), data);
}
