#include "compress/compression_stream.hpp"
#include <zlib.h>
#include <array>
#include <boost/log/trivial.hpp>

namespace dagsync::compress {

//==============================================
// RAII WRAPPER AROUND THE ZLIB STREAM
//==============================================

struct ZStreamContext {
  z_stream strm{};
  bool deflating;

  ZStreamContext(bool deflate_mode, int level) : deflating(deflate_mode) {
    int rc = deflating ? deflateInit(&strm, level) : inflateInit(&strm);
    if (rc != Z_OK) {
      throw CompressionError(std::string("failed to initialize zlib: ") + (strm.msg ? strm.msg : zError(rc)));
    }
  }

  ~ZStreamContext() {
    if (deflating) {
      deflateEnd(&strm);
    } else {
      inflateEnd(&strm);
    }
  }

  ZStreamContext(const ZStreamContext&) = delete;
  ZStreamContext& operator=(const ZStreamContext&) = delete;
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CompressionStream::CompressionStream(Mode mode, int level)
  : mode_(mode)
  , context_(std::make_unique<ZStreamContext>(mode == Mode::Compress, level)) {
  BOOST_LOG_TRIVIAL(debug) << "Compression stream: Created for " << (mode_ == Mode::Compress ? "compression" : "decompression");
}

CompressionStream::~CompressionStream() = default;

std::uint64_t CompressionStream::total_in() const { return context_->strm.total_in; }
std::uint64_t CompressionStream::total_out() const { return context_->strm.total_out; }

//==============================================
// STREAM STAGE
//==============================================

void CompressionStream::update(const Bytes& input, Bytes& output) {
  if (finished_) {
    throw CompressionError("update after finish");
  }
  if (mode_ == Mode::Compress) {
    deflate_input(input, output);
  } else {
    inflate_input(input, output);
  }
}

void CompressionStream::finish(Bytes& output) {
  if (finished_) {
    return;
  }
  finished_ = true;

  if (mode_ == Mode::Decompress) {
    if (!stream_end_) {
      BOOST_LOG_TRIVIAL(error) << "Compression stream: Input ended before the end of the zlib stream";
      throw CompressionError("truncated zlib stream");
    }
    return;
  }

  z_stream& strm = context_->strm;
  strm.next_in = nullptr;
  strm.avail_in = 0;

  std::array<uint8_t, BUFFER_SIZE> buffer;
  int rc;
  do {
    strm.next_out = buffer.data();
    strm.avail_out = static_cast<uInt>(buffer.size());
    rc = deflate(&strm, Z_FINISH);
    if (rc == Z_STREAM_ERROR) {
      throw CompressionError("deflate failed while finishing");
    }
    output.insert(output.end(), buffer.data(), buffer.data() + (buffer.size() - strm.avail_out));
  } while (rc != Z_STREAM_END);

  BOOST_LOG_TRIVIAL(debug) << "Compression stream: Compressed " << strm.total_in << " bytes to " << strm.total_out;
}

void CompressionStream::deflate_input(const Bytes& input, Bytes& output) {
  z_stream& strm = context_->strm;
  strm.next_in = const_cast<Bytef*>(input.data());
  strm.avail_in = static_cast<uInt>(input.size());

  std::array<uint8_t, BUFFER_SIZE> buffer;
  do {
    strm.next_out = buffer.data();
    strm.avail_out = static_cast<uInt>(buffer.size());
    if (deflate(&strm, Z_NO_FLUSH) == Z_STREAM_ERROR) {
      throw CompressionError("deflate failed");
    }
    output.insert(output.end(), buffer.data(), buffer.data() + (buffer.size() - strm.avail_out));
  } while (strm.avail_out == 0);
}

void CompressionStream::inflate_input(const Bytes& input, Bytes& output) {
  if (input.empty()) {
    return;
  }
  if (stream_end_) {
    throw CompressionError("trailing data after end of zlib stream");
  }

  z_stream& strm = context_->strm;
  strm.next_in = const_cast<Bytef*>(input.data());
  strm.avail_in = static_cast<uInt>(input.size());

  std::array<uint8_t, BUFFER_SIZE> buffer;
  for (;;) {
    strm.next_out = buffer.data();
    strm.avail_out = static_cast<uInt>(buffer.size());
    int rc = inflate(&strm, Z_NO_FLUSH);
    output.insert(output.end(), buffer.data(), buffer.data() + (buffer.size() - strm.avail_out));

    if (rc == Z_STREAM_END) {
      stream_end_ = true;
      if (strm.avail_in > 0) {
        throw CompressionError("trailing data after end of zlib stream");
      }
      return;
    }
    if (rc == Z_BUF_ERROR) {
      // No progress possible until more input arrives
      return;
    }
    if (rc != Z_OK) {
      BOOST_LOG_TRIVIAL(error) << "Compression stream: inflate failed: " << (strm.msg ? strm.msg : zError(rc));
      throw CompressionError(std::string("corrupt zlib stream: ") + (strm.msg ? strm.msg : zError(rc)));
    }
    if (strm.avail_in == 0 && strm.avail_out > 0) {
      return;
    }
  }
}

} // namespace dagsync::compress
