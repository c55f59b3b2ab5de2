#include "store/memory_store.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>

namespace dagsync::store {

void MemoryStore::put(const dag::Cid& cid, const Bytes& data) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++put_count_;
  if (objects_.emplace(cid, data).second) {
    BOOST_LOG_TRIVIAL(trace) << "Memory store: Stored " << data.size() << " bytes under " << cid;
  }
}

Bytes MemoryStore::get(const dag::Cid& cid) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(cid);
  if (it == objects_.end()) {
    throw transfer::NotFoundError(dag::to_string(cid));
  }
  return it->second;
}

bool MemoryStore::has(const dag::Cid& cid) {
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.count(cid) > 0;
}

std::size_t MemoryStore::put_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return put_count_;
}

std::size_t MemoryStore::object_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.size();
}

std::size_t MemoryStore::stored_bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto& entry : objects_) {
    total += entry.second.size();
  }
  return total;
}

void MemoryStore::replace(const dag::Cid& cid, Bytes data) {
  std::lock_guard<std::mutex> lock(mutex_);
  objects_[cid] = std::move(data);
}

} // namespace dagsync::store
