#include "transfer/transfer_task.hpp"
#include <boost/log/trivial.hpp>

namespace dagsync::transfer {

namespace {

// Runs fn on a new thread; setup failures still reach the channel
template <typename T, typename Fn>
TransferTask<T> launch(Direction direction, Fn fn) {
  TransferTask<T> task;
  task.channel = std::make_shared<ProgressChannel>(direction);

  auto channel = task.channel;
  task.result = std::async(std::launch::async, [channel, fn = std::move(fn)]() mutable -> T {
    try {
      return fn(channel);
    }
    catch (const std::exception& e) {
      channel->fail(e.what());
      throw;
    }
  });
  return task;
}

} // namespace

TransferTask<UploadResult> start_upload(TransferConfig config, std::shared_ptr<io::ByteSource> source,
                                        UploadOptions options) {
  return launch<UploadResult>(Direction::Uploading,
      [config = std::move(config), source = std::move(source), options = std::move(options)]
      (const std::shared_ptr<ProgressChannel>& channel) {
        Uploader uploader(config);
        return uploader.upload(*source, options, channel);
      });
}

TransferTask<UploadResult> start_upload(TransferConfig config, std::filesystem::path path,
                                        UploadOptions options) {
  return launch<UploadResult>(Direction::Uploading,
      [config = std::move(config), path = std::move(path), options = std::move(options)]
      (const std::shared_ptr<ProgressChannel>& channel) {
        Uploader uploader(config);
        return uploader.upload_path(path, options, channel);
      });
}

TransferTask<Bytes> start_read(TransferConfig config, dag::Cid cid, DownloadOptions options) {
  return launch<Bytes>(Direction::Downloading,
      [config = std::move(config), cid = std::move(cid), options = std::move(options)]
      (const std::shared_ptr<ProgressChannel>& channel) {
        Downloader downloader(config);
        return downloader.read_all(cid, options, channel);
      });
}

TransferTask<void> start_download(TransferConfig config, dag::Cid cid, std::filesystem::path target,
                                  DownloadOptions options) {
  return launch<void>(Direction::Downloading,
      [config = std::move(config), cid = std::move(cid), target = std::move(target), options = std::move(options)]
      (const std::shared_ptr<ProgressChannel>& channel) {
        Downloader downloader(config);
        downloader.download_to(cid, target, options, channel);
      });
}

} // namespace dagsync::transfer
