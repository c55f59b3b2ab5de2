#ifndef DAGSYNC_STORE_LOCAL_STORE_HPP
#define DAGSYNC_STORE_LOCAL_STORE_HPP

#include <filesystem>
#include <string>
#include "store/remote_store.hpp"

namespace dagsync::store {

// Directory-backed object store. Objects live at
// {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
// where hash is the SHA-256 hex of the CID string.
class LocalStore : public RemoteStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the base directory if needed. Throws transfer::TransferError.
  explicit LocalStore(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Writes through a temporary file and renames it into place
  void put(const dag::Cid& cid, const Bytes& data) override;
  Bytes get(const dag::Cid& cid) override;


  // ---- QUERY OPERATIONS ----
  bool has(const dag::Cid& cid) override;
  // Returns the size of the stored object in bytes
  std::uintmax_t object_size(const dag::Cid& cid) const;
  // Where the object for cid lives, whether or not it exists
  std::filesystem::path path_for(const dag::Cid& cid) const;

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored objects
  std::filesystem::path base_path_;


  // ---- CAS STORAGE SUPPORT ----
  // SHA-256 hex of the CID text form
  std::string hash_key(const dag::Cid& cid) const;
  // Creates a directory structure using parts of the hash
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace dagsync::store

#endif // DAGSYNC_STORE_LOCAL_STORE_HPP
