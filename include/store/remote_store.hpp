#ifndef DAGSYNC_STORE_REMOTE_STORE_HPP
#define DAGSYNC_STORE_REMOTE_STORE_HPP

#include "dag/cid.hpp"

namespace dagsync::store {

// Append-only object store keyed by CID. Implementations must be safe to call
// from several threads at once.
class RemoteStore {
public:
  virtual ~RemoteStore() = default;

  // Idempotent: storing an existing CID again succeeds without change.
  // Throws transfer::TransferError on I/O failure.
  virtual void put(const dag::Cid& cid, const Bytes& data) = 0;

  // Throws transfer::NotFoundError when nothing is stored under the CID and
  // transfer::TransferError on I/O failure.
  virtual Bytes get(const dag::Cid& cid) = 0;

  virtual bool has(const dag::Cid& cid) = 0;

protected:
  RemoteStore() = default;
};

} // namespace dagsync::store

#endif // DAGSYNC_STORE_REMOTE_STORE_HPP
