#ifndef DAGSYNC_TRANSFER_PROGRESS_CHANNEL_HPP
#define DAGSYNC_TRANSFER_PROGRESS_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include "dag/cid.hpp"

namespace dagsync::transfer {

enum class EventKind {
    Progress,
    Success,
    Failure
};

enum class Direction {
    Uploading,
    Downloading
};

const char* direction_name(Direction direction);

struct ProgressEvent {
    EventKind kind{EventKind::Progress};
    Direction direction{Direction::Uploading};
    std::uint64_t total_bytes{0};
    std::uint64_t processed_bytes{0};
    // Root CID on success
    std::optional<dag::Cid> cid;
    // Failure description
    std::string error;

    double percent() const;
    bool terminal() const { return kind != EventKind::Progress; }
};

// Pollable event queue between one transfer pipeline and its caller.
// Consecutive progress events are coalesced while unread, so a slow consumer
// never holds back the pipeline; the single terminal event is always kept.
class ProgressChannel {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR
    explicit ProgressChannel(Direction direction);
    ~ProgressChannel() = default;

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;


    // ---- PRODUCER METHODS ----
    void set_total(std::uint64_t total_bytes);
    // Adds to the processed counter and publishes a progress event
    void advance(std::uint64_t bytes);
    // Terminal events; only the first one is published
    void succeed(const std::optional<dag::Cid>& cid = std::nullopt);
    void fail(const std::string& error);


    // ---- CONSUMER METHODS ----
    // Retrieves and removes next event from queue without blocking
    bool consume(ProgressEvent& event);
    // Waits up to timeout for the next event
    bool wait_consume(ProgressEvent& event, std::chrono::milliseconds timeout);
    // Blocks until the terminal event is published and returns it
    ProgressEvent wait_finished();


    // ---- CANCELLATION ----
    void cancel();
    bool cancelled() const { return cancelled_.load(); }


    // ---- QUERY METHODS ----
    Direction direction() const { return direction_; }
    bool finished() const;
    std::uint64_t total_bytes() const;
    std::uint64_t processed_bytes() const;
    bool empty() const;
    std::size_t size() const;

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> queue_;
    Direction direction_;
    std::uint64_t total_bytes_{0};
    std::uint64_t processed_bytes_{0};
    std::optional<ProgressEvent> terminal_;
    std::atomic<bool> cancelled_{false};

    ProgressEvent make_event(EventKind kind) const;
    void publish(ProgressEvent event);
};

} // namespace dagsync::transfer

#endif // DAGSYNC_TRANSFER_PROGRESS_CHANNEL_HPP
