#ifndef DAGSYNC_TRANSFER_TASK_HPP
#define DAGSYNC_TRANSFER_TASK_HPP

#include <filesystem>
#include <future>
#include <memory>
#include "io/byte_stream.hpp"
#include "transfer/downloader.hpp"
#include "transfer/progress_channel.hpp"
#include "transfer/uploader.hpp"

namespace dagsync::transfer {

// A transfer running on its own thread. Poll or cancel through the channel,
// or just wait on the result; failures surface from result.get().
template <typename T>
struct TransferTask {
    std::shared_ptr<ProgressChannel> channel;
    std::future<T> result;

    void cancel() { channel->cancel(); }
    T get() { return result.get(); }
};

TransferTask<UploadResult> start_upload(TransferConfig config, std::shared_ptr<io::ByteSource> source,
                                        UploadOptions options = {});
TransferTask<UploadResult> start_upload(TransferConfig config, std::filesystem::path path,
                                        UploadOptions options = {});

TransferTask<Bytes> start_read(TransferConfig config, dag::Cid cid, DownloadOptions options = {});
TransferTask<void> start_download(TransferConfig config, dag::Cid cid, std::filesystem::path target,
                                  DownloadOptions options = {});

} // namespace dagsync::transfer

#endif // DAGSYNC_TRANSFER_TASK_HPP
