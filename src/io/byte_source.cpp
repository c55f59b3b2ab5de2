#include "io/byte_stream.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace dagsync {
namespace io {

//==============================================
// BUFFER ADAPTER
//==============================================

BufferSource::BufferSource(Bytes data, std::string name, std::string mime_type, std::size_t piece_size)
  : data_(std::move(data))
  , name_(std::move(name))
  , mime_type_(std::move(mime_type))
  , piece_size_(piece_size == 0 ? 1 : piece_size) {}

BufferSource::BufferSource(const std::string& data, std::string name, std::string mime_type)
  : BufferSource(Bytes(data.begin(), data.end()), std::move(name), std::move(mime_type)) {}

bool BufferSource::read(Bytes& out) {
  if (offset_ >= data_.size()) {
    return false;
  }

  std::size_t length = std::min(piece_size_, data_.size() - offset_);
  out.assign(data_.begin() + offset_, data_.begin() + offset_ + length);
  offset_ += length;
  return true;
}


//==============================================
// FILESYSTEM ADAPTER
//==============================================

FileSource::FileSource(const std::filesystem::path& path, std::size_t piece_size)
  : path_(path)
  , name_(path.filename().string())
  , mime_type_(guess_mime_type(path))
  , piece_size_(piece_size == 0 ? 1 : piece_size) {
  BOOST_LOG_TRIVIAL(debug) << "File source: Opening " << path_.string();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "File source: Not a regular file: " << path_.string();
    throw SourceError("File source: Not a regular file: " + path_.string());
  }

  size_ = std::filesystem::file_size(path_, ec);
  if (ec) {
    throw SourceError("File source: Failed to stat " + path_.string() + ": " + ec.message());
  }

  // Binary mode so the bytes hashed are exactly the bytes on disk
  file_.open(path_, std::ios::binary);
  if (!file_) {
    throw SourceError("File source: Failed to open file: " + path_.string());
  }
}

bool FileSource::read(Bytes& out) {
  out.clear();
  if (!file_.is_open()) {
    return false;
  }
  if (file_.eof()) {
    return finish_reading();
  }

  out.resize(piece_size_);
  file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  auto count = file_.gcount();

  if (file_.bad()) {
    BOOST_LOG_TRIVIAL(error) << "File source: Read failure on " << path_.string();
    throw SourceError("File source: Failed to read from " + path_.string());
  }

  out.resize(static_cast<std::size_t>(count));
  bytes_read_ += static_cast<std::uint64_t>(count);

  if (count == 0) {
    return finish_reading();
  }
  return true;
}

bool FileSource::finish_reading() {
  file_.close();
  if (bytes_read_ != size_) {
    // The file changed underneath us, the declared size no longer holds
    BOOST_LOG_TRIVIAL(error) << "File source: " << path_.string() << " declared " << size_
                             << " bytes, read " << bytes_read_;
    throw SourceError("File source: Size of " + path_.string() + " changed while reading");
  }
  return false;
}

std::string FileSource::guess_mime_type(const std::filesystem::path& path) {
  static const std::unordered_map<std::string, std::string> types = {
    {".txt", "text/plain"},
    {".md", "text/markdown"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".css", "text/css"},
    {".csv", "text/csv"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".pdf", "application/pdf"},
    {".zip", "application/zip"},
    {".gz", "application/gzip"},
    {".tar", "application/x-tar"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
    {".mp3", "audio/mpeg"},
    {".mp4", "video/mp4"},
    {".js", "text/javascript"}
  };

  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  auto it = types.find(extension);
  return it != types.end() ? it->second : "application/octet-stream";
}

} // namespace io
} // namespace dagsync
