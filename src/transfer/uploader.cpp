#include "transfer/uploader.hpp"
#include "transfer/transfer_error.hpp"
#include "utils/pipeliner.hpp"
#include <algorithm>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>

namespace dagsync::transfer {

namespace fs = std::filesystem;

namespace {

std::string display_name(const fs::path& path) {
  fs::path normal = fs::absolute(path).lexically_normal();
  if (normal.filename().empty()) {
    normal = normal.parent_path();
  }
  return normal.filename().string();
}

std::uint64_t scan_total_size(const fs::path& root) {
  std::uint64_t total = 0;
  for (const auto& entry : fs::recursive_directory_iterator(root)) {
    if (entry.is_regular_file() && !entry.is_symlink()) {
      total += entry.file_size();
    }
  }
  return total;
}

// Directory listing sorted by name so folder encodings are reproducible
std::vector<fs::directory_entry> sorted_children(const fs::path& dir) {
  std::vector<fs::directory_entry> children;
  for (const auto& entry : fs::directory_iterator(dir)) {
    children.push_back(entry);
  }
  std::sort(children.begin(), children.end(), [](const auto& a, const auto& b) {
    return a.path().filename().string() < b.path().filename().string();
  });
  return children;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Uploader::Uploader(TransferConfig config)
  : config_(std::move(config))
  , builder_(config_.builder) {
  config_.validate();
}


//==============================================
// UPLOAD OPERATIONS
//==============================================

UploadResult Uploader::upload(io::ByteSource& source, const UploadOptions& options,
                              const std::shared_ptr<ProgressChannel>& channel) {
  ProgressChannel* progress = channel.get();
  BOOST_LOG_TRIVIAL(info) << "Uploader: Uploading '" << source.name() << "' (" << source.size() << " bytes"
                          << (options.compression ? ", compressed" : "")
                          << (options.password ? ", encrypted" : "") << ")";

  try {
    if (progress) {
      progress->set_total(source.size());
    }
    TransformChain transforms = TransformChain::for_upload(options, config_.kdf_iterations);

    boost::asio::thread_pool pool(config_.concurrency);
    UploadResult result;
    {
      BlockUploader sink(*config_.store, pool, config_.concurrency, config_.retry, progress);
      FileUpload data = upload_stream(source, transforms, sink, progress);
      result = finish_upload(source.name(), source.mime_type(), data, transforms, sink);
    }
    pool.join();

    if (progress) {
      progress->succeed(result.metadata_cid);
    }
    BOOST_LOG_TRIVIAL(info) << "Uploader: Uploaded '" << source.name() << "' as " << result.metadata_cid;
    return result;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Uploader: Upload of '" << source.name() << "' failed: " << e.what();
    if (progress) {
      progress->fail(e.what());
    }
    throw;
  }
}

UploadResult Uploader::upload_buffer(const Bytes& data, const std::string& name,
                                     const UploadOptions& options,
                                     const std::shared_ptr<ProgressChannel>& channel) {
  io::BufferSource source(data, name);
  return upload(source, options, channel);
}

UploadResult Uploader::upload_path(const fs::path& path, const UploadOptions& options,
                                   const std::shared_ptr<ProgressChannel>& channel) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    return upload_folder(path, options, channel);
  }

  std::unique_ptr<io::FileSource> source;
  try {
    source = std::make_unique<io::FileSource>(path);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Uploader: Cannot open " << path.string() << ": " << e.what();
    if (channel) {
      channel->fail(e.what());
    }
    throw;
  }
  return upload(*source, options, channel);
}

UploadResult Uploader::upload_folder(const fs::path& root, const UploadOptions& options,
                                     const std::shared_ptr<ProgressChannel>& channel) {
  ProgressChannel* progress = channel.get();
  std::string name = display_name(root);
  BOOST_LOG_TRIVIAL(info) << "Uploader: Uploading folder " << root.string();

  try {
    if (!fs::is_directory(root)) {
      throw io::SourceError("not a directory: " + root.string());
    }
    if (progress) {
      progress->set_total(scan_total_size(root));
    }
    TransformChain transforms = TransformChain::for_upload(options, config_.kdf_iterations);

    boost::asio::thread_pool pool(config_.concurrency);
    UploadResult result;
    {
      BlockUploader sink(*config_.store, pool, config_.concurrency, config_.retry, progress);
      FileUpload tree = upload_folder_tree(root, transforms, sink, progress);
      result = finish_upload(name, "inode/directory", tree, transforms, sink);
    }
    pool.join();

    if (progress) {
      progress->succeed(result.metadata_cid);
    }
    BOOST_LOG_TRIVIAL(info) << "Uploader: Uploaded folder '" << name << "' as " << result.metadata_cid;
    return result;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Uploader: Upload of folder " << root.string() << " failed: " << e.what();
    if (progress) {
      progress->fail(e.what());
    }
    throw;
  }
}


//==============================================
// PIPELINE STAGES
//==============================================

Uploader::FileUpload Uploader::upload_stream(io::ByteStream& input, const TransformChain& transforms,
                                             BlockUploader& sink, ProgressChannel* channel) {
  // Progress counts source bytes, published by the sink as puts are acknowledged
  auto pipeline = utils::Pipeliner::create([&input, &sink, channel](Bytes& piece) {
    if (channel && channel->cancelled()) {
      throw CancelledError("upload cancelled");
    }
    if (!input.read(piece)) {
      return false;
    }
    sink.record_source_bytes(piece.size());
    return true;
  });
  pipeline->set_buffer_size(config_.pipeline_buffer_size);
  transforms.apply_upload(*pipeline);

  FileUpload upload;
  upload.head = builder_.build_file(*pipeline, sink);
  upload.original_size = pipeline->bytes_in();
  return upload;
}

Uploader::FileUpload Uploader::upload_folder_tree(const fs::path& root, const TransformChain& transforms,
                                                  BlockUploader& sink, ProgressChannel* channel) {
  struct Frame {
    std::string name;
    std::vector<fs::directory_entry> children;
    std::size_t next{0};
    std::vector<dag::FolderEntry> entries;
  };

  std::vector<Frame> stack;
  stack.push_back(Frame{display_name(root), sorted_children(root), 0, {}});

  FileUpload tree;
  while (!stack.empty()) {
    Frame& frame = stack.back();

    if (frame.next < frame.children.size()) {
      fs::directory_entry child = frame.children[frame.next++];
      std::string child_name = child.path().filename().string();
      fs::file_status status = child.symlink_status();

      if (fs::is_symlink(status)) {
        BOOST_LOG_TRIVIAL(warning) << "Uploader: Skipping symlink " << child.path().string();
      } else if (fs::is_directory(status)) {
        stack.push_back(Frame{child_name, sorted_children(child.path()), 0, {}});
      } else if (fs::is_regular_file(status)) {
        io::FileSource source(child.path());
        FileUpload file = upload_stream(source, transforms, sink, channel);
        frame.entries.push_back(dag::FolderEntry{child_name, file.head.cid, file.head.size, dag::EntryKind::File});
        tree.original_size += file.original_size;
      } else {
        BOOST_LOG_TRIVIAL(warning) << "Uploader: Skipping special file " << child.path().string();
      }
      continue;
    }

    // Every child is built: the folder node can follow them
    dag::DagHead head = builder_.build_folder(frame.entries, sink);
    std::string name = frame.name;
    stack.pop_back();

    if (stack.empty()) {
      tree.head = std::move(head);
    } else {
      stack.back().entries.push_back(dag::FolderEntry{name, head.cid, head.size, dag::EntryKind::Folder});
    }
  }
  return tree;
}

UploadResult Uploader::finish_upload(const std::string& name, const std::string& mime_type,
                                     const FileUpload& data, const TransformChain& transforms,
                                     BlockUploader& sink) {
  dag::MetadataNode metadata;
  metadata.name = name;
  metadata.mime_type = mime_type;
  metadata.total_size = data.original_size;
  metadata.encryption = transforms.encryption;
  metadata.compression = transforms.compression;
  metadata.data_cid = data.head.cid;

  dag::DagHead root = builder_.build_metadata(metadata, sink);
  sink.drain();

  UploadResult result;
  result.metadata_cid = root.cid;
  result.data_cid = data.head.cid;
  result.original_size = data.original_size;
  result.stored_size = data.head.size;
  result.blocks_sent = sink.blocks_sent();
  return result;
}

} // namespace dagsync::transfer
