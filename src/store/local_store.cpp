#include "store/local_store.hpp"
#include "transfer/transfer_error.hpp"
#include <atomic>
#include <fstream>
#include <sstream>
#include <thread>
#include <boost/log/trivial.hpp>

namespace dagsync::store {

namespace {

std::atomic<std::uint64_t> temp_counter{0};

std::filesystem::path temp_path_for(const std::filesystem::path& target) {
  std::ostringstream suffix;
  suffix << ".tmp." << std::hash<std::thread::id>{}(std::this_thread::get_id())
         << "." << temp_counter.fetch_add(1);
  return target.string() + suffix.str();
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
LocalStore::LocalStore(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Initializing with base path: " << base_path_.string();
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Cannot create base directory: " << e.what();
    throw transfer::TransferError("cannot create store directory " + base_path_.string() + ": " + e.what());
  }
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void LocalStore::put(const dag::Cid& cid, const Bytes& data) {
  std::filesystem::path file_path = path_for(cid);

  try {
    if (std::filesystem::exists(file_path)) {
      BOOST_LOG_TRIVIAL(debug) << "Local store: Already holds " << cid;
      return;
    }

    check_directory_exists(file_path.parent_path());
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to prepare " << file_path.string() << ": " << e.what();
    throw transfer::TransferError("failed to prepare " + file_path.string() + ": " + e.what());
  }

  // Readers never see a partially written object
  std::filesystem::path temp_path = temp_path_for(file_path);
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw transfer::TransferError("failed to create file " + temp_path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      BOOST_LOG_TRIVIAL(error) << "Local store: Failed to write " << temp_path.string();
      throw transfer::TransferError("failed to write " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to move object into place: " << ec.message();
    throw transfer::TransferError("failed to store " + dag::to_string(cid) + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Local store: Stored " << data.size() << " bytes for " << cid;
}

Bytes LocalStore::get(const dag::Cid& cid) {
  std::filesystem::path file_path = path_for(cid);

  std::ifstream file(file_path, std::ios::binary | std::ios::ate);
  if (!file) {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
      BOOST_LOG_TRIVIAL(debug) << "Local store: No object for " << cid;
      throw transfer::NotFoundError(dag::to_string(cid));
    }
    throw transfer::TransferError("failed to open " + file_path.string());
  }

  std::streamsize size = file.tellg();
  file.seekg(0, std::ios::beg);
  Bytes data(static_cast<std::size_t>(size));
  if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to read " << file_path.string();
    throw transfer::TransferError("failed to read " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(trace) << "Local store: Read " << data.size() << " bytes for " << cid;
  return data;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool LocalStore::has(const dag::Cid& cid) {
  std::error_code ec;
  bool exists = std::filesystem::exists(path_for(cid), ec);
  if (ec) {
    throw transfer::TransferError("failed to query " + dag::to_string(cid) + ": " + ec.message());
  }
  return exists;
}

std::uintmax_t LocalStore::object_size(const dag::Cid& cid) const {
  std::filesystem::path file_path = path_for(cid);
  std::error_code ec;
  std::uintmax_t size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    throw transfer::NotFoundError(dag::to_string(cid));
  }
  return size;
}

std::filesystem::path LocalStore::path_for(const dag::Cid& cid) const {
  return get_path_for_hash(hash_key(cid));
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string LocalStore::hash_key(const dag::Cid& cid) const {
  std::string key = dag::to_string(cid);
  return dag::to_hex(dag::compute_digest(dag::HashAlgorithm::Sha2_256,
                                         reinterpret_cast<const uint8_t*>(key.data()), key.size()));
}

std::filesystem::path LocalStore::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

void LocalStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace dagsync::store
