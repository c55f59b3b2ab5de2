#include "transfer/progress_channel.hpp"
#include <boost/log/trivial.hpp>

namespace dagsync::transfer {

const char* direction_name(Direction direction) {
    return direction == Direction::Uploading ? "uploading" : "downloading";
}

double ProgressEvent::percent() const {
    if (total_bytes == 0) {
        return terminal() && kind == EventKind::Success ? 100.0 : 0.0;
    }
    double value = 100.0 * static_cast<double>(processed_bytes) / static_cast<double>(total_bytes);
    return value > 100.0 ? 100.0 : value;
}

ProgressChannel::ProgressChannel(Direction direction) : direction_(direction) {}

//==============================================
// PRODUCER METHODS
//==============================================

void ProgressChannel::set_total(std::uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_bytes_ = total_bytes;
}

void ProgressChannel::advance(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminal_) {
        return;
    }
    processed_bytes_ += bytes;
    publish(make_event(EventKind::Progress));
}

void ProgressChannel::succeed(const std::optional<dag::Cid>& cid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminal_) {
        return;
    }
    ProgressEvent event = make_event(EventKind::Success);
    event.cid = cid;
    terminal_ = event;
    publish(std::move(event));
    BOOST_LOG_TRIVIAL(debug) << "Progress channel: " << direction_name(direction_) << " finished, "
                             << processed_bytes_ << " bytes";
}

void ProgressChannel::fail(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminal_) {
        return;
    }
    ProgressEvent event = make_event(EventKind::Failure);
    event.error = error;
    terminal_ = event;
    publish(std::move(event));
    BOOST_LOG_TRIVIAL(debug) << "Progress channel: " << direction_name(direction_) << " failed: " << error;
}

ProgressEvent ProgressChannel::make_event(EventKind kind) const {
    ProgressEvent event;
    event.kind = kind;
    event.direction = direction_;
    event.total_bytes = total_bytes_;
    event.processed_bytes = processed_bytes_;
    return event;
}

void ProgressChannel::publish(ProgressEvent event) {
    // Unread progress is superseded by newer progress
    if (event.kind == EventKind::Progress && !queue_.empty()
        && queue_.back().kind == EventKind::Progress) {
        queue_.back() = std::move(event);
    } else {
        queue_.push_back(std::move(event));
    }
    cv_.notify_all();
}

//==============================================
// CONSUMER METHODS
//==============================================

bool ProgressChannel::consume(ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

bool ProgressChannel::wait_consume(ProgressEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

ProgressEvent ProgressChannel::wait_finished() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return terminal_.has_value(); });
    return *terminal_;
}

//==============================================
// CANCELLATION
//==============================================

void ProgressChannel::cancel() {
    if (!cancelled_.exchange(true)) {
        BOOST_LOG_TRIVIAL(info) << "Progress channel: Cancellation requested while " << direction_name(direction_);
    }
}

//==============================================
// QUERY METHODS
//==============================================

bool ProgressChannel::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_.has_value();
}

std::uint64_t ProgressChannel::total_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_bytes_;
}

std::uint64_t ProgressChannel::processed_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processed_bytes_;
}

bool ProgressChannel::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

std::size_t ProgressChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace dagsync::transfer
