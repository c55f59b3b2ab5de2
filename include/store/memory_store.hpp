#ifndef DAGSYNC_STORE_MEMORY_STORE_HPP
#define DAGSYNC_STORE_MEMORY_STORE_HPP

#include <map>
#include <mutex>
#include "store/remote_store.hpp"

namespace dagsync::store {

// Thread-safe in-process store
class MemoryStore : public RemoteStore {
public:
  void put(const dag::Cid& cid, const Bytes& data) override;
  Bytes get(const dag::Cid& cid) override;
  bool has(const dag::Cid& cid) override;

  // ---- GETTERS ----
  // Number of put() calls, repeated CIDs included
  std::size_t put_count() const;
  std::size_t object_count() const;
  std::size_t stored_bytes() const;

  // Overwrites the stored bytes without any check
  void replace(const dag::Cid& cid, Bytes data);

private:
  mutable std::mutex mutex_;
  std::map<dag::Cid, Bytes> objects_;
  std::size_t put_count_{0};
};

} // namespace dagsync::store

#endif // DAGSYNC_STORE_MEMORY_STORE_HPP
