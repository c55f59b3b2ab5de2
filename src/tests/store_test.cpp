#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>
#include "store/local_store.hpp"
#include "store/memory_store.hpp"
#include "transfer/transfer_error.hpp"
#include "test_utils.hpp"

using namespace dagsync;
using namespace dagsync::store;

class LocalStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<LocalStore> store;

  void SetUp() override {
    test::init_logging();
    test_dir = test::unique_temp_dir("local_store_test");
    store = std::make_unique<LocalStore>(test_dir);
    ASSERT_TRUE(std::filesystem::exists(test_dir));
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Helper methods to reduce repetition
  void store_and_verify(const dag::Cid& cid, const Bytes& data) {
    ASSERT_NO_THROW(store->put(cid, data)) << "Failed to store " << cid;
    ASSERT_TRUE(store->has(cid)) << "Object should exist after storing: " << cid;
    ASSERT_EQ(store->get(cid), data) << "Data mismatch for " << cid;
  }
};

TEST_F(LocalStoreTest, StoreAndRetrieve) {
  store_and_verify(test::fake_cid(dag::Codec::Chunk, 1), test::to_bytes("hello world"));
  store_and_verify(test::fake_cid(dag::Codec::File, 2), test::random_bytes(100000));
  store_and_verify(test::fake_cid(dag::Codec::Folder, 3), Bytes{});
}

TEST_F(LocalStoreTest, MissingObjectIsNotFound) {
  dag::Cid cid = test::fake_cid(dag::Codec::Chunk, 9);
  EXPECT_FALSE(store->has(cid));
  EXPECT_THROW(store->get(cid), transfer::NotFoundError);
  EXPECT_THROW(store->object_size(cid), transfer::NotFoundError);
}

TEST_F(LocalStoreTest, ShardedLayout) {
  dag::Cid cid = test::fake_cid(dag::Codec::Chunk, 4);
  store->put(cid, test::to_bytes("sharded"));

  std::filesystem::path path = store->path_for(cid);
  EXPECT_TRUE(std::filesystem::exists(path));
  EXPECT_EQ(store->object_size(cid), 7u);

  // base / aa / bb / cc / rest
  std::filesystem::path relative = std::filesystem::relative(path, test_dir);
  std::vector<std::string> parts;
  for (const auto& part : relative) {
    parts.push_back(part.string());
  }
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(parts[0].size(), 2u);
  EXPECT_EQ(parts[1].size(), 2u);
  EXPECT_EQ(parts[2].size(), 2u);
  EXPECT_EQ(parts[3].size(), 58u);
}

TEST_F(LocalStoreTest, PutIsIdempotent) {
  dag::Cid cid = test::fake_cid(dag::Codec::Chunk, 5);
  store->put(cid, test::to_bytes("first"));
  store->put(cid, test::to_bytes("first"));
  EXPECT_EQ(store->get(cid), test::to_bytes("first"));

  std::size_t files = 0;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
    if (entry.is_regular_file()) {
      ++files;
    }
  }
  EXPECT_EQ(files, 1u);
}

TEST_F(LocalStoreTest, SurvivesReopen) {
  dag::Cid cid = test::fake_cid(dag::Codec::File, 6);
  store->put(cid, test::to_bytes("persistent"));
  store = std::make_unique<LocalStore>(test_dir);
  EXPECT_EQ(store->get(cid), test::to_bytes("persistent"));
}

TEST_F(LocalStoreTest, ConcurrentPutsOfSameObject) {
  dag::Cid cid = test::fake_cid(dag::Codec::Chunk, 7);
  Bytes data = test::random_bytes(50000);
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      try {
        store->put(cid, data);
      } catch (const transfer::TransferError&) {
        ++failures;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(store->get(cid), data);
}


class MemoryStoreTest : public ::testing::Test {
protected:
  MemoryStore store;

  void SetUp() override {
    test::init_logging();
  }
};

TEST_F(MemoryStoreTest, StoreAndRetrieve) {
  dag::Cid cid = test::fake_cid(dag::Codec::Chunk);
  EXPECT_FALSE(store.has(cid));
  EXPECT_THROW(store.get(cid), transfer::NotFoundError);

  store.put(cid, test::to_bytes("abc"));
  EXPECT_TRUE(store.has(cid));
  EXPECT_EQ(store.get(cid), test::to_bytes("abc"));
}

TEST_F(MemoryStoreTest, Counters) {
  store.put(test::fake_cid(dag::Codec::Chunk, 1), Bytes(10));
  store.put(test::fake_cid(dag::Codec::Chunk, 1), Bytes(10));
  store.put(test::fake_cid(dag::Codec::Chunk, 2), Bytes(5));

  EXPECT_EQ(store.put_count(), 3u);
  EXPECT_EQ(store.object_count(), 2u);
  EXPECT_EQ(store.stored_bytes(), 15u);
}

TEST_F(MemoryStoreTest, ReplaceOverwrites) {
  dag::Cid cid = test::fake_cid(dag::Codec::Chunk);
  store.put(cid, test::to_bytes("original"));
  store.replace(cid, test::to_bytes("tampered"));
  EXPECT_EQ(store.get(cid), test::to_bytes("tampered"));
}
