#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <thread>
#include <vector>
#include "store/tenant_store.hpp"
#include "test_utils.hpp"

using namespace cfs::store;
using ::testing::ElementsAre;

class TenantStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
    store = std::make_unique<TenantStore>("alice");
  }

  std::unique_ptr<TenantStore> store;

  // Helper to append a chunk built from text
  bool append(const std::string& name, uint64_t index, const std::string& data, const std::string& type) {
    return store->append_chunk(name, Chunk{index, to_bytes(data)}, type);
  }

  FileSummary summary_of(const std::string& name) {
    for (const auto& summary : store->list_files()) {
      if (summary.name == name) {
        return summary;
      }
    }
    ADD_FAILURE() << "No summary for " << name;
    return FileSummary{};
  }
};

TEST_F(TenantStoreTest, EmptyStore) {
  EXPECT_FALSE(store->exists("missing"));
  EXPECT_TRUE(store->list_files().empty());
  EXPECT_EQ(store->chunk_count("missing"), 0u);
  EXPECT_FALSE(store->get_chunk("missing", 0).has_value());
  EXPECT_FALSE(store->get_file_type("missing").has_value());
  EXPECT_EQ(store->file_count(), 0u);
  EXPECT_EQ(store->tenant(), "alice");
}

TEST_F(TenantStoreTest, FirstChunkCreatesFile) {
  EXPECT_TRUE(append("doc.txt", 0, "hello", "text/plain"));

  EXPECT_TRUE(store->exists("doc.txt"));
  EXPECT_EQ(store->chunk_count("doc.txt"), 1u);
  EXPECT_EQ(store->get_chunk("doc.txt", 0), to_bytes("hello"));
  EXPECT_EQ(store->get_file_type("doc.txt"), std::string("text/plain"));
  EXPECT_THAT(store->list_files(), ElementsAre(FileSummary{"doc.txt", 5, "text/plain"}));
}

TEST_F(TenantStoreTest, ChunksAccumulate) {
  append("a", 0, "abc", "bin");
  append("a", 1, "defgh", "bin");
  append("a", 2, "ij", "bin");

  EXPECT_EQ(store->chunk_count("a"), 3u);
  EXPECT_EQ(summary_of("a").size, 10u);
  EXPECT_EQ(store->get_chunk("a", 1), to_bytes("defgh"));
}

TEST_F(TenantStoreTest, ChunksOutOfOrderAreFoundByIndex) {
  append("video", 7, "seven", "video/mp4");
  append("video", 2, "two", "video/mp4");
  append("video", 100, "hundred", "video/mp4");

  EXPECT_EQ(store->get_chunk("video", 2), to_bytes("two"));
  EXPECT_EQ(store->get_chunk("video", 7), to_bytes("seven"));
  EXPECT_EQ(store->get_chunk("video", 100), to_bytes("hundred"));
  EXPECT_FALSE(store->get_chunk("video", 0).has_value());
  EXPECT_FALSE(store->get_chunk("video", 3).has_value());

  // Insertion order is kept
  auto files = store->export_files();
  ASSERT_EQ(files.size(), 1u);
  const auto& chunks = files[0].second.chunks;
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].index, 7u);
  EXPECT_EQ(chunks[1].index, 2u);
  EXPECT_EQ(chunks[2].index, 100u);
}

TEST_F(TenantStoreTest, FileTypeIsLastWriteWins) {
  append("report", 0, "part1", "application/octet-stream");
  append("report", 1, "part2", "application/pdf");

  EXPECT_EQ(store->get_file_type("report"), std::string("application/pdf"));
  EXPECT_EQ(summary_of("report").file_type, "application/pdf");
}

TEST_F(TenantStoreTest, DuplicateIndexKeepsFirstChunk) {
  EXPECT_TRUE(append("a", 0, "first", "text/plain"));
  EXPECT_FALSE(append("a", 0, "second!", "text/markdown"));

  EXPECT_EQ(store->chunk_count("a"), 1u);
  EXPECT_EQ(store->get_chunk("a", 0), to_bytes("first"));
  EXPECT_EQ(summary_of("a").size, 5u);
  // The type label still follows the latest call
  EXPECT_EQ(store->get_file_type("a"), std::string("text/markdown"));
}

TEST_F(TenantStoreTest, EmptyPayloadCreatesPresentFile) {
  EXPECT_TRUE(append("empty", 0, "", "text/plain"));
  EXPECT_TRUE(store->exists("empty"));
  EXPECT_EQ(store->chunk_count("empty"), 1u);
  EXPECT_EQ(store->get_chunk("empty", 0), std::vector<uint8_t>{});
  EXPECT_EQ(summary_of("empty").size, 0u);
}

TEST_F(TenantStoreTest, RemoveIsIdempotent) {
  append("a", 0, "abc", "bin");

  EXPECT_TRUE(store->remove("a"));
  EXPECT_FALSE(store->exists("a"));
  EXPECT_FALSE(store->remove("a"));
  EXPECT_EQ(store->chunk_count("a"), 0u);
  EXPECT_FALSE(store->get_chunk("a", 0).has_value());
}

TEST_F(TenantStoreTest, RemoveThenUploadStartsFresh) {
  append("a", 0, "old", "v1");
  append("a", 1, "older", "v1");
  store->remove("a");

  append("a", 0, "new", "v2");
  EXPECT_EQ(store->chunk_count("a"), 1u);
  EXPECT_EQ(store->get_chunk("a", 0), to_bytes("new"));
  EXPECT_EQ(summary_of("a").size, 3u);
  EXPECT_EQ(store->get_file_type("a"), std::string("v2"));
}

TEST_F(TenantStoreTest, ListFilesIsSortedByName) {
  append("charlie", 0, "c", "t");
  append("alpha", 0, "a", "t");
  append("bravo", 0, "b", "t");

  auto files = store->list_files();
  ASSERT_EQ(files.size(), 3u);
  EXPECT_EQ(files[0].name, "alpha");
  EXPECT_EQ(files[1].name, "bravo");
  EXPECT_EQ(files[2].name, "charlie");
}

TEST_F(TenantStoreTest, ImportFileReplacesVerbatim) {
  append("a", 0, "abc", "bin");

  ChunkedFile imported;
  imported.name = "a";
  imported.chunks = {Chunk{5, to_bytes("xy")}, Chunk{5, to_bytes("zz")}};
  imported.total_size = 4;
  imported.file_type = "restored";
  store->import_file("a", imported);

  EXPECT_EQ(store->chunk_count("a"), 2u);
  // First match in insertion order wins for duplicate indices
  EXPECT_EQ(store->get_chunk("a", 5), to_bytes("xy"));
  EXPECT_FALSE(store->get_chunk("a", 0).has_value());
  EXPECT_EQ(store->get_file_type("a"), std::string("restored"));
}

TEST_F(TenantStoreTest, ConcurrentAppendsKeepTotals) {
  const size_t num_threads = 8;
  const size_t chunks_per_thread = 100;
  std::vector<std::thread> threads;

  for (size_t t = 0; t < num_threads; ++t) {
    threads.emplace_back([this, t, chunks_per_thread]() {
      for (size_t j = 0; j < chunks_per_thread; ++j) {
        const uint64_t index = t * chunks_per_thread + j;
        store->append_chunk("shared", Chunk{index, std::vector<uint8_t>(3, 0x2a)}, "bin");
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(store->chunk_count("shared"), num_threads * chunks_per_thread);
  EXPECT_EQ(summary_of("shared").size, num_threads * chunks_per_thread * 3);
}
