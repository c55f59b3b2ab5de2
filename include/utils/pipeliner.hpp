#ifndef DAGSYNC_UTILS_PIPELINER_HPP
#define DAGSYNC_UTILS_PIPELINER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include "io/byte_stream.hpp"

namespace dagsync {
namespace utils {

// Forward declaration
class Pipeliner;

// One incremental transform in a pipeline (compression, encryption, ...)
class StreamStage {
public:
  virtual ~StreamStage() = default;

  // Consumes input and appends whatever output is ready
  virtual void update(const Bytes& input, Bytes& output) = 0;
  // Input is over: appends the remaining output (padding, trailers)
  virtual void finish(Bytes& output) = 0;

protected:
  StreamStage() = default;
};

// Type aliases for clarity
using ProducerFn = std::function<bool(Bytes&)>;
using StagePtr = std::shared_ptr<StreamStage>;
using PipelinerPtr = std::shared_ptr<Pipeliner>;

// Pulls pieces from a producer and pushes them through the stages in the order
// they were added. Lazy: nothing is produced until read() is called.
class Pipeliner : public io::ByteStream,
                  public std::enable_shared_from_this<Pipeliner> {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Pipeliner(ProducerFn producer);


  // ---- PIPELINE CONSTRUCTION METHODS ----
  // Creates pipeline with a producer function
  static PipelinerPtr create(ProducerFn producer);
  // Creates pipeline reading from a stream owned by the caller
  static PipelinerPtr create(io::ByteStream& input);
  // Appends a stage, used in method chaining
  PipelinerPtr transform(StagePtr stage);


  // ---- PIPELINE EXECUTION ----
  // Returns the next transformed buffer of at least buffer_size bytes, except
  // for the last one. Stage errors propagate to the caller.
  bool read(Bytes& out) override;


  // ---- GETTERS AND SETTERS ----
  std::uint64_t bytes_in() const { return bytes_in_; }
  std::uint64_t bytes_out() const { return bytes_out_; }
  std::size_t stage_count() const { return stages_.size(); }
  bool exhausted() const { return eof_ && buffer_.empty(); }

  void set_buffer_size(std::size_t size);

private:
  // ---- PARAMETERS ----
  ProducerFn producer_;
  std::vector<StagePtr> stages_;
  std::size_t buffer_size_;
  bool eof_;
  Bytes buffer_;
  std::uint64_t bytes_in_{0};
  std::uint64_t bytes_out_{0};


  // ---- PIPELINE EXECUTION ----
  // Gets next piece from producer, applies stages,
  // and appends to buffer. False once the producer is done.
  bool process_next_chunk();
  // Flushes every stage in order once the producer is done
  void finish_stages();
};

} // namespace utils
} // namespace dagsync

#endif // DAGSYNC_UTILS_PIPELINER_HPP
