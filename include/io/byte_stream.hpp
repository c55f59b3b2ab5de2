#ifndef DAGSYNC_IO_BYTE_STREAM_HPP
#define DAGSYNC_IO_BYTE_STREAM_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace dagsync {

using Bytes = std::vector<uint8_t>;

namespace io {

class SourceError : public std::runtime_error {
public:
  explicit SourceError(const std::string& message) : std::runtime_error(message) {}
};

// Lazy, finite, forward-only producer of byte pieces.
// read() replaces the contents of out with the next piece and returns false once
// the stream is exhausted. Pieces may have any length, including zero.
class ByteStream {
public:
  virtual ~ByteStream() = default;

  virtual bool read(Bytes& out) = 0;

protected:
  ByteStream() = default;
};

// A ByteStream that also describes the payload it produces
class ByteSource : public ByteStream {
public:
  virtual const std::string& name() const = 0;
  virtual const std::string& mime_type() const = 0;
  // Declared total size in bytes
  virtual std::uint64_t size() const = 0;
};


//==============================================
// BUFFER ADAPTER
//==============================================

class BufferSource : public ByteSource {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BufferSource(Bytes data, std::string name,
               std::string mime_type = "application/octet-stream",
               std::size_t piece_size = 64 * 1024);
  BufferSource(const std::string& data, std::string name,
               std::string mime_type = "text/plain");

  // ---- BYTE STREAM ----
  bool read(Bytes& out) override;

  // ---- GETTERS ----
  const std::string& name() const override { return name_; }
  const std::string& mime_type() const override { return mime_type_; }
  std::uint64_t size() const override { return data_.size(); }

private:
  Bytes data_;
  std::string name_;
  std::string mime_type_;
  std::size_t piece_size_;
  std::size_t offset_{0};
};


//==============================================
// FILESYSTEM ADAPTER
//==============================================

class FileSource : public ByteSource {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileSource(const std::filesystem::path& path, std::size_t piece_size = 64 * 1024);

  // ---- BYTE STREAM ----
  bool read(Bytes& out) override;

  // ---- GETTERS ----
  const std::string& name() const override { return name_; }
  const std::string& mime_type() const override { return mime_type_; }
  std::uint64_t size() const override { return size_; }

  // Maps a file extension to a mime type, defaulting to application/octet-stream
  static std::string guess_mime_type(const std::filesystem::path& path);

private:
  std::filesystem::path path_;
  std::ifstream file_;
  std::string name_;
  std::string mime_type_;
  std::uint64_t size_;
  std::size_t piece_size_;
  std::uint64_t bytes_read_{0};

  // Closes the file and checks the byte count against the declared size
  bool finish_reading();
};

} // namespace io
} // namespace dagsync

#endif // DAGSYNC_IO_BYTE_STREAM_HPP
