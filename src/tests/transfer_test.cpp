#include <gtest/gtest.h>
#include <filesystem>
#include "compress/compression_stream.hpp"
#include "crypto/crypto_error.hpp"
#include "dag/node_codec.hpp"
#include "store/local_store.hpp"
#include "store/memory_store.hpp"
#include "transfer/downloader.hpp"
#include "transfer/transfer_error.hpp"
#include "transfer/transfer_task.hpp"
#include "transfer/uploader.hpp"
#include "test_utils.hpp"

using namespace dagsync;
using namespace dagsync::transfer;
namespace fs = std::filesystem;

class TransferTest : public ::testing::Test {
protected:
  std::shared_ptr<store::MemoryStore> store;
  TransferConfig config;
  fs::path test_dir;

  void SetUp() override {
    test::init_logging();
    store = std::make_shared<store::MemoryStore>();
    config.store = store;
    config.builder.chunk_size = 1024;
    config.builder.max_links = 4;
    config.concurrency = 3;
    config.kdf_iterations = 1000;
    config.pipeline_buffer_size = 4096;
    config.retry.initial_backoff = std::chrono::milliseconds(1);
    test_dir = test::unique_temp_dir("transfer_test");
    fs::create_directories(test_dir);
  }

  void TearDown() override {
    if (fs::exists(test_dir)) {
      fs::remove_all(test_dir);
    }
  }

  UploadResult upload(const Bytes& data, const UploadOptions& options = {}) {
    Uploader uploader(config);
    return uploader.upload_buffer(data, "payload.bin", options);
  }

  Bytes download(const dag::Cid& cid, const DownloadOptions& options = {}) {
    Downloader downloader(config);
    return downloader.read_all(cid, options);
  }

  static UploadOptions protected_options(const std::string& password, bool compression) {
    UploadOptions options;
    options.password = password;
    options.compression = compression;
    return options;
  }

  static DownloadOptions with_password(const std::string& password) {
    DownloadOptions options;
    options.password = password;
    return options;
  }

  // Some chunk of the file DAG under data_cid
  dag::Cid first_leaf(const dag::Cid& data_cid) {
    dag::Cid cid = data_cid;
    while (cid.codec == dag::Codec::File) {
      dag::Node node = dag::decode(store->get(cid));
      cid = std::get<dag::FileNode>(node).links.front().cid;
    }
    return cid;
  }
};

TEST_F(TransferTest, InlineRoundTrip) {
  Bytes data = test::to_bytes("hello, dag");
  UploadResult result = upload(data);

  EXPECT_EQ(result.metadata_cid.codec, dag::Codec::Metadata);
  EXPECT_EQ(result.data_cid.codec, dag::Codec::File);
  EXPECT_EQ(result.original_size, data.size());
  EXPECT_EQ(result.blocks_sent, 2u);
  EXPECT_EQ(download(result.metadata_cid), data);
  EXPECT_EQ(download(result.data_cid), data);
}

TEST_F(TransferTest, EmptyFileRoundTrip) {
  UploadResult result = upload(Bytes{});
  EXPECT_EQ(result.original_size, 0u);
  EXPECT_TRUE(download(result.metadata_cid).empty());
}

TEST_F(TransferTest, LayeredFileRoundTrip) {
  Bytes data = test::random_bytes(40 * 1024 + 17);
  UploadResult result = upload(data);

  EXPECT_EQ(result.stored_size, data.size());
  EXPECT_GT(result.blocks_sent, 41u);
  EXPECT_EQ(download(result.metadata_cid), data);

  Downloader downloader(config);
  dag::Node root = downloader.stat(result.data_cid);
  EXPECT_LE(std::get<dag::FileNode>(root).links.size(), config.builder.max_links);
}

TEST_F(TransferTest, StreamReadsIncrementally) {
  Bytes data = test::random_bytes(20000);
  UploadResult result = upload(data);

  Downloader downloader(config);
  auto stream = downloader.open(result.metadata_cid);
  Bytes collected;
  Bytes piece;
  int reads = 0;
  while (stream->read(piece)) {
    ++reads;
    collected.insert(collected.end(), piece.begin(), piece.end());
  }
  EXPECT_GT(reads, 1);
  EXPECT_EQ(collected, data);
  EXPECT_EQ(stream->bytes_read(), data.size());
  EXPECT_FALSE(stream->read(piece));
}

TEST_F(TransferTest, CompressedRoundTrip) {
  Bytes data(30000, 'x');
  UploadOptions options;
  options.compression = true;
  UploadResult result = upload(data, options);

  EXPECT_EQ(result.original_size, data.size());
  EXPECT_LT(result.stored_size, data.size() / 10);
  EXPECT_EQ(download(result.metadata_cid), data);

  Downloader downloader(config);
  auto metadata = std::get<dag::MetadataNode>(downloader.stat(result.metadata_cid));
  ASSERT_TRUE(metadata.compression.has_value());
  EXPECT_EQ(metadata.compression->algorithm, "zlib");
  EXPECT_FALSE(metadata.encryption.has_value());
  EXPECT_EQ(metadata.total_size, data.size());
}

TEST_F(TransferTest, EncryptedAndCompressedRoundTrip) {
  Bytes data = test::random_bytes(10000);
  data.insert(data.end(), 10000, 'a');
  UploadResult result = upload(data, protected_options("s3cret", true));

  EXPECT_EQ(download(result.metadata_cid, with_password("s3cret")), data);

  Downloader downloader(config);
  auto metadata = std::get<dag::MetadataNode>(downloader.stat(result.metadata_cid));
  ASSERT_TRUE(metadata.encryption.has_value());
  EXPECT_EQ(metadata.encryption->algorithm, "aes-256-cbc");
  EXPECT_EQ(metadata.encryption->salt.size(), 16u);
  EXPECT_EQ(metadata.encryption->iterations, config.kdf_iterations);
}

TEST_F(TransferTest, EncryptedUploadsDifferEachTime) {
  Bytes data = test::to_bytes("same secret content");
  UploadResult first = upload(data, protected_options("pw", false));
  UploadResult second = upload(data, protected_options("pw", false));
  EXPECT_NE(first.data_cid, second.data_cid);
  EXPECT_EQ(download(second.metadata_cid, with_password("pw")), data);
}

TEST_F(TransferTest, WrongPasswordFailsBeforeReading) {
  UploadResult result = upload(test::random_bytes(5000), protected_options("right", false));

  try {
    download(result.metadata_cid, with_password("wrong"));
    FAIL() << "wrong password accepted";
  } catch (const crypto::DecryptionError& e) {
    EXPECT_EQ(e.reason(), crypto::DecryptionError::Reason::WrongKey);
  }
}

TEST_F(TransferTest, MissingPasswordIsConfigError) {
  UploadResult result = upload(test::random_bytes(100), protected_options("right", false));
  EXPECT_THROW(download(result.metadata_cid), dag::ConfigError);
}

TEST_F(TransferTest, EmptyPasswordIsRejected) {
  EXPECT_THROW(upload(test::random_bytes(100), protected_options("", false)), dag::ConfigError);
  UploadResult result = upload(test::random_bytes(100));
  EXPECT_THROW(download(result.metadata_cid, with_password("")), dag::ConfigError);
}

TEST_F(TransferTest, UnencryptedIgnoresPassword) {
  Bytes data = test::to_bytes("plain");
  UploadResult result = upload(data);
  EXPECT_EQ(download(result.metadata_cid, with_password("unused")), data);
}

TEST_F(TransferTest, PlainUploadIsIdempotent) {
  Bytes data = test::random_bytes(8000);
  UploadResult first = upload(data);
  std::size_t objects = store->object_count();

  UploadResult second = upload(data);
  EXPECT_EQ(first.metadata_cid, second.metadata_cid);
  EXPECT_EQ(first.data_cid, second.data_cid);
  EXPECT_EQ(store->object_count(), objects);
}

TEST_F(TransferTest, UploadMatchesOfflineCid) {
  Bytes data = test::random_bytes(9000);
  dag::DagBuilder builder(config.builder);
  dag::NullSink sink;
  test::PieceStream input(data, 100);
  dag::Cid offline = builder.build_file(input, sink).cid;

  EXPECT_EQ(upload(data).data_cid, offline);
}

TEST_F(TransferTest, TamperedChunkIsDetected) {
  Bytes data = test::random_bytes(10000);
  UploadResult result = upload(data);

  dag::Cid leaf = first_leaf(result.data_cid);
  store->replace(leaf, dag::encode(dag::ChunkNode{Bytes(1024, 0)}));

  EXPECT_THROW(download(result.metadata_cid), IntegrityError);
}

TEST_F(TransferTest, TamperedDownloadLeavesNoFile) {
  UploadResult result = upload(test::random_bytes(10000));
  store->replace(first_leaf(result.data_cid), test::to_bytes("garbage"));

  fs::path target = test_dir / "out.bin";
  Downloader downloader(config);
  EXPECT_THROW(downloader.download_to(result.metadata_cid, target), IntegrityError);
  EXPECT_FALSE(fs::exists(target));
  EXPECT_FALSE(fs::exists(test_dir / "out.bin.partial"));
}

TEST_F(TransferTest, TamperedFolderDownloadLeavesNothing) {
  fs::path source = test_dir / "pair";
  test::write_file(source / "a.txt", test::to_bytes("written first"));
  test::write_file(source / "b.bin", test::random_bytes(5000, 3));

  Uploader uploader(config);
  UploadResult result = uploader.upload_folder(source);

  Downloader downloader(config);
  auto folder = std::get<dag::FolderNode>(downloader.stat(result.data_cid));
  ASSERT_EQ(folder.entries.size(), 2u);
  ASSERT_EQ(folder.entries[1].name, "b.bin");
  store->replace(first_leaf(folder.entries[1].cid), test::to_bytes("garbage"));

  fs::path target = test_dir / "restored";
  EXPECT_THROW(downloader.download_to(result.metadata_cid, target), IntegrityError);
  EXPECT_FALSE(fs::exists(target));
  EXPECT_FALSE(fs::exists(target / "a.txt"));
  EXPECT_FALSE(fs::exists(test_dir / "restored.partial"));
}

TEST_F(TransferTest, FolderDownloadRefusesNonEmptyTarget) {
  fs::path source = test_dir / "src";
  test::write_file(source / "f", test::to_bytes("content"));

  Uploader uploader(config);
  UploadResult result = uploader.upload_folder(source);

  fs::path target = test_dir / "occupied";
  test::write_file(target / "keep.txt", test::to_bytes("mine"));

  Downloader downloader(config);
  EXPECT_THROW(downloader.download_to(result.metadata_cid, target), TransferError);
  EXPECT_EQ(test::read_file(target / "keep.txt"), test::to_bytes("mine"));
  EXPECT_FALSE(fs::exists(target / "f"));
}

TEST_F(TransferTest, UnknownCidIsNotFound) {
  EXPECT_THROW(download(test::fake_cid(dag::Codec::Metadata)), NotFoundError);
}

TEST_F(TransferTest, ChunkCidDownloadsDirectly) {
  UploadResult result = upload(test::random_bytes(5000));
  dag::Cid leaf = first_leaf(result.data_cid);
  EXPECT_EQ(download(leaf).size(), config.builder.chunk_size);
}

TEST_F(TransferTest, FileRoundTripThroughDisk) {
  Bytes data = test::random_bytes(7777);
  fs::path source = test_dir / "input.dat";
  test::write_file(source, data);

  Uploader uploader(config);
  UploadResult result = uploader.upload_path(source);

  Downloader downloader(config);
  auto metadata = std::get<dag::MetadataNode>(downloader.stat(result.metadata_cid));
  EXPECT_EQ(metadata.name, "input.dat");

  fs::path target = test_dir / "restored" / "output.dat";
  downloader.download_to(result.metadata_cid, target);
  EXPECT_EQ(test::read_file(target), data);
}

TEST_F(TransferTest, FolderRoundTrip) {
  fs::path source = test_dir / "tree";
  Bytes a = test::to_bytes("alpha");
  Bytes b = test::random_bytes(5000, 1);
  Bytes c = test::random_bytes(300, 2);
  test::write_file(source / "a.txt", a);
  test::write_file(source / "sub" / "b.bin", b);
  test::write_file(source / "sub" / "deeper" / "c.bin", c);
  fs::create_directories(source / "empty");

  Uploader uploader(config);
  UploadResult result = uploader.upload_path(source, protected_options("folder pw", true));
  EXPECT_EQ(result.data_cid.codec, dag::Codec::Folder);
  EXPECT_EQ(result.original_size, a.size() + b.size() + c.size());

  fs::path target = test_dir / "restored";
  Downloader downloader(config);
  downloader.download_to(result.metadata_cid, target, with_password("folder pw"));

  EXPECT_EQ(test::read_file(target / "a.txt"), a);
  EXPECT_EQ(test::read_file(target / "sub" / "b.bin"), b);
  EXPECT_EQ(test::read_file(target / "sub" / "deeper" / "c.bin"), c);
  EXPECT_TRUE(fs::is_directory(target / "empty"));

  auto metadata = std::get<dag::MetadataNode>(downloader.stat(result.metadata_cid));
  EXPECT_EQ(metadata.name, "tree");
  EXPECT_EQ(metadata.mime_type, "inode/directory");
}

TEST_F(TransferTest, FolderEntriesAreSortedByName) {
  fs::path source = test_dir / "sorted";
  test::write_file(source / "zeta", test::to_bytes("z"));
  test::write_file(source / "alpha", test::to_bytes("a"));
  test::write_file(source / "mid", test::to_bytes("m"));

  Uploader uploader(config);
  UploadResult result = uploader.upload_folder(source);

  Downloader downloader(config);
  auto folder = std::get<dag::FolderNode>(downloader.stat(result.data_cid));
  ASSERT_EQ(folder.entries.size(), 3u);
  EXPECT_EQ(folder.entries[0].name, "alpha");
  EXPECT_EQ(folder.entries[1].name, "mid");
  EXPECT_EQ(folder.entries[2].name, "zeta");
  EXPECT_EQ(folder.total_size, 3u);
}

TEST_F(TransferTest, FolderCannotBeOpenedAsStream) {
  fs::path source = test_dir / "dir";
  test::write_file(source / "f", test::to_bytes("content"));

  Uploader uploader(config);
  UploadResult result = uploader.upload_folder(source);

  Downloader downloader(config);
  EXPECT_THROW(downloader.open(result.metadata_cid), dag::ValidationError);
}

TEST_F(TransferTest, UploadProgressReachesSuccess) {
  Bytes data = test::random_bytes(12000);
  auto channel = std::make_shared<ProgressChannel>(Direction::Uploading);

  Uploader uploader(config);
  UploadResult result = uploader.upload_buffer(data, "progress.bin", UploadOptions{}, channel);

  ProgressEvent event;
  std::uint64_t last = 0;
  while (channel->consume(event)) {
    EXPECT_GE(event.processed_bytes, last);
    last = event.processed_bytes;
  }
  EXPECT_EQ(event.kind, EventKind::Success);
  ASSERT_TRUE(event.cid.has_value());
  EXPECT_EQ(*event.cid, result.metadata_cid);
  EXPECT_EQ(event.processed_bytes, data.size());
  EXPECT_EQ(event.total_bytes, data.size());
}

TEST_F(TransferTest, DownloadProgressCountsPlaintext) {
  Bytes data(50000, 'q');
  UploadOptions options;
  options.compression = true;
  UploadResult result = upload(data, options);

  auto channel = std::make_shared<ProgressChannel>(Direction::Downloading);
  Downloader downloader(config);
  downloader.read_all(result.metadata_cid, {}, channel);

  ProgressEvent event = channel->wait_finished();
  EXPECT_EQ(event.kind, EventKind::Success);
  EXPECT_EQ(event.direction, Direction::Downloading);
  EXPECT_EQ(event.processed_bytes, data.size());
  EXPECT_EQ(event.total_bytes, data.size());
}

TEST_F(TransferTest, FailurePublishesOneTerminalEvent) {
  auto channel = std::make_shared<ProgressChannel>(Direction::Uploading);
  Uploader uploader(config);
  EXPECT_THROW(uploader.upload_path(test_dir / "does-not-exist", UploadOptions{}, channel), io::SourceError);

  ProgressEvent event = channel->wait_finished();
  EXPECT_EQ(event.kind, EventKind::Failure);
  EXPECT_FALSE(event.error.empty());
}

TEST_F(TransferTest, CancelledUploadFails) {
  auto channel = std::make_shared<ProgressChannel>(Direction::Uploading);
  channel->cancel();

  Uploader uploader(config);
  EXPECT_THROW(uploader.upload_buffer(test::random_bytes(5000), "x", UploadOptions{}, channel), CancelledError);
  EXPECT_EQ(channel->wait_finished().kind, EventKind::Failure);
  EXPECT_EQ(store->object_count(), 0u);
}

TEST_F(TransferTest, CancelledDownloadFails) {
  UploadResult result = upload(test::random_bytes(20000));
  auto channel = std::make_shared<ProgressChannel>(Direction::Downloading);

  Downloader downloader(config);
  auto stream = downloader.open(result.metadata_cid, {}, channel);
  Bytes piece;
  ASSERT_TRUE(stream->read(piece));
  channel->cancel();
  EXPECT_THROW(stream->read(piece), CancelledError);
  EXPECT_EQ(channel->wait_finished().kind, EventKind::Failure);
}

TEST_F(TransferTest, BackgroundTasks) {
  Bytes data = test::random_bytes(15000);
  auto source = std::make_shared<io::BufferSource>(data, "task.bin");

  auto upload_task = start_upload(config, source, protected_options("task", true));
  UploadResult result = upload_task.get();
  EXPECT_EQ(upload_task.channel->wait_finished().kind, EventKind::Success);

  auto read_task = start_read(config, result.metadata_cid, with_password("task"));
  EXPECT_EQ(read_task.get(), data);
  EXPECT_EQ(read_task.channel->wait_finished().kind, EventKind::Success);

  fs::path target = test_dir / "task_out.bin";
  auto download_task = start_download(config, result.metadata_cid, target, with_password("task"));
  download_task.get();
  EXPECT_EQ(test::read_file(target), data);
}

TEST_F(TransferTest, BackgroundTaskFailureReachesBothSides) {
  auto task = start_read(config, test::fake_cid(dag::Codec::File));
  EXPECT_THROW(task.get(), NotFoundError);
  EXPECT_EQ(task.channel->wait_finished().kind, EventKind::Failure);
}

TEST_F(TransferTest, LocalStoreBackend) {
  fs::path store_dir = test_dir / "objects";
  config.store = std::make_shared<store::LocalStore>(store_dir);

  Bytes data = test::random_bytes(6000);
  UploadResult result = upload(data, protected_options("disk", false));
  EXPECT_EQ(download(result.metadata_cid, with_password("disk")), data);
}

TEST_F(TransferTest, InvalidConfigIsRejected) {
  TransferConfig broken = config;
  broken.store.reset();
  EXPECT_THROW(Uploader uploader(broken), dag::ConfigError);
  EXPECT_THROW(Downloader downloader(broken), dag::ConfigError);

  broken = config;
  broken.concurrency = 0;
  EXPECT_THROW(Uploader uploader(broken), dag::ConfigError);

  broken = config;
  broken.builder.max_links = 1;
  EXPECT_THROW(Uploader uploader(broken), dag::ConfigError);
}
