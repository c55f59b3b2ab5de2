#ifndef DAGSYNC_TEST_UTILS_HPP
#define DAGSYNC_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include "dag/cid.hpp"
#include "dag/node.hpp"
#include "io/byte_stream.hpp"
#include "logger/logger.hpp"

namespace dagsync::test {

// Console logging limited to warnings so test output stays readable
inline void init_logging() {
  logging::init_console_logging(logging::severity_level::warning);
}

// Deterministic pseudo-random payload
inline Bytes random_bytes(std::size_t size, std::uint32_t seed = 42) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dis(0, 255);
  Bytes data(size);
  for (auto& byte : data) {
    byte = static_cast<uint8_t>(dis(gen));
  }
  return data;
}

inline Bytes to_bytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

// A syntactically valid CID for the given codec, addressing nothing real
inline dag::Cid fake_cid(dag::Codec codec, std::uint8_t fill = 0xAB) {
  dag::Cid cid;
  cid.codec = codec;
  cid.hash = dag::HashAlgorithm::Sha2_256;
  cid.digest = Bytes(32, fill);
  return cid;
}

// Stream that hands out a buffer in fixed-size pieces
class PieceStream : public io::ByteStream {
public:
  PieceStream(Bytes data, std::size_t piece_size)
    : data_(std::move(data)), piece_size_(piece_size) {}

  bool read(Bytes& out) override {
    ++reads_;
    if (offset_ >= data_.size()) {
      return false;
    }
    std::size_t length = std::min(piece_size_, data_.size() - offset_);
    out.assign(data_.begin() + offset_, data_.begin() + offset_ + length);
    offset_ += length;
    return true;
  }

  std::size_t reads() const { return reads_; }

private:
  Bytes data_;
  std::size_t piece_size_;
  std::size_t offset_{0};
  std::size_t reads_{0};
};

// Collects a whole stream into memory
inline Bytes drain_stream(io::ByteStream& stream) {
  Bytes result;
  Bytes piece;
  while (stream.read(piece)) {
    result.insert(result.end(), piece.begin(), piece.end());
  }
  return result;
}

inline std::filesystem::path unique_temp_dir(const std::string& prefix) {
  return std::filesystem::temp_directory_path() /
    (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
}

inline void write_file(const std::filesystem::path& path, const Bytes& data) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline Bytes read_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  return Bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace dagsync::test

#endif // DAGSYNC_TEST_UTILS_HPP
