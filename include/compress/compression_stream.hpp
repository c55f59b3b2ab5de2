#ifndef DAGSYNC_COMPRESS_COMPRESSION_STREAM_HPP
#define DAGSYNC_COMPRESS_COMPRESSION_STREAM_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include "utils/pipeliner.hpp"

namespace dagsync::compress {

class CompressionError : public std::runtime_error {
public:
    explicit CompressionError(const std::string& message)
        : std::runtime_error("Compression error: " + message) {}
};

// Forward declaration for the zlib stream state
struct ZStreamContext;

// Incremental zlib deflate/inflate stage
class CompressionStream : public utils::StreamStage {
public:

  enum class Mode {
    Compress,
    Decompress
  };

  static constexpr const char* ALGORITHM = "zlib";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // level is a zlib compression level, ignored when decompressing
  explicit CompressionStream(Mode mode, int level = -1);
  ~CompressionStream() override;


  // ---- STREAM STAGE ----
  void update(const Bytes& input, Bytes& output) override;
  // Throws CompressionError when decompressing a truncated stream
  void finish(Bytes& output) override;


  // ---- GETTERS ----
  Mode mode() const { return mode_; }
  std::uint64_t total_in() const;
  std::uint64_t total_out() const;

private:
  // ---- PARAMETERS ----
  static constexpr size_t BUFFER_SIZE = 16 * 1024;
  Mode mode_;
  std::unique_ptr<ZStreamContext> context_;
  bool stream_end_ = false;
  bool finished_ = false;

  void deflate_input(const Bytes& input, Bytes& output);
  void inflate_input(const Bytes& input, Bytes& output);
};

} // namespace dagsync::compress

#endif // DAGSYNC_COMPRESS_COMPRESSION_STREAM_HPP
