#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include "service/file_service.hpp"
#include "persistence/persistence_error.hpp"
#include "test_utils.hpp"

using namespace cfs::service;
using namespace cfs::store;
using ::testing::Contains;
using ::testing::UnorderedElementsAre;

class FileServiceTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  StoreRegistry registry;
  std::unique_ptr<FileService> service;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("file_service_test");
    service = std::make_unique<FileService>(registry);
  }

  void TearDown() override {
    service.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  void upload(const TenantId& tenant, const std::string& name, uint64_t index,
              const std::string& data, const std::string& type) {
    service->upload_file_chunk(tenant, name, to_bytes(data), index, type);
  }

  // Every observable value of tenant/name on two services must match
  static void expect_same_file(FileService& expected, FileService& actual, const TenantId& tenant,
                               const std::string& name, const std::vector<uint64_t>& indices) {
    EXPECT_EQ(actual.check_file_exists(tenant, name), expected.check_file_exists(tenant, name));
    EXPECT_EQ(actual.get_file_type(tenant, name), expected.get_file_type(tenant, name));
    EXPECT_EQ(actual.get_total_chunks(tenant, name), expected.get_total_chunks(tenant, name));
    for (uint64_t index : indices) {
      EXPECT_EQ(actual.get_file_chunk(tenant, name, index), expected.get_file_chunk(tenant, name, index))
        << tenant << "/" << name << " chunk " << index;
    }
  }
};

TEST_F(FileServiceTest, SingleChunkScenario) {
  upload("alice", "doc.txt", 0, "hello", "text/plain");

  EXPECT_TRUE(service->check_file_exists("alice", "doc.txt"));
  EXPECT_EQ(service->get_total_chunks("alice", "doc.txt"), 1u);
  EXPECT_EQ(service->get_file_chunk("alice", "doc.txt", 0), to_bytes("hello"));
  EXPECT_THAT(service->get_files("alice"), Contains(FileSummary{"doc.txt", 5, "text/plain"}));
}

TEST_F(FileServiceTest, MultiChunkAccumulation) {
  upload("alice", "a", 0, "abc", "bin");
  upload("alice", "a", 1, "defgh", "bin");
  upload("alice", "a", 2, "ij", "bin");

  EXPECT_EQ(service->get_total_chunks("alice", "a"), 3u);
  EXPECT_THAT(service->get_files("alice"), UnorderedElementsAre(FileSummary{"a", 10, "bin"}));
}

TEST_F(FileServiceTest, FileTypeFollowsLatestUpload) {
  upload("alice", "a", 0, "abc", "text/plain");
  upload("alice", "a", 1, "def", "text/csv");
  upload("alice", "a", 2, "ghi", "application/json");

  EXPECT_EQ(service->get_file_type("alice", "a"), std::string("application/json"));
  EXPECT_FALSE(service->get_file_type("alice", "missing").has_value());
}

TEST_F(FileServiceTest, UploadReportsDiscardedDuplicate) {
  EXPECT_TRUE(service->upload_file_chunk("alice", "a", to_bytes("abc"), 0, "bin"));
  EXPECT_TRUE(service->upload_file_chunk("alice", "a", to_bytes("def"), 1, "bin"));
  EXPECT_FALSE(service->upload_file_chunk("alice", "a", to_bytes("xyz"), 0, "text/plain"));

  EXPECT_EQ(service->get_file_chunk("alice", "a", 0), to_bytes("abc"));
  EXPECT_EQ(service->get_total_chunks("alice", "a"), 2u);
  EXPECT_THAT(service->get_files("alice"), UnorderedElementsAre(FileSummary{"a", 6, "text/plain"}));
}

TEST_F(FileServiceTest, MissingChunksAreAbsent) {
  upload("alice", "a", 0, "abc", "bin");
  upload("alice", "a", 2, "def", "bin");

  EXPECT_FALSE(service->get_file_chunk("alice", "a", 1).has_value());
  EXPECT_FALSE(service->get_file_chunk("alice", "a", 3).has_value());
  EXPECT_FALSE(service->get_file_chunk("alice", "nope", 0).has_value());
  EXPECT_EQ(service->get_total_chunks("alice", "nope"), 0u);
}

TEST_F(FileServiceTest, DeleteIsIdempotent) {
  upload("alice", "a", 0, "abc", "bin");

  EXPECT_TRUE(service->delete_file("alice", "a"));
  EXPECT_FALSE(service->check_file_exists("alice", "a"));
  EXPECT_FALSE(service->delete_file("alice", "a"));
  EXPECT_TRUE(service->get_files("alice").empty());
}

TEST_F(FileServiceTest, TenantsNeverSeeEachOther) {
  upload("alice", "private.txt", 0, "alice only", "text/plain");

  EXPECT_FALSE(service->check_file_exists("bob", "private.txt"));
  EXPECT_TRUE(service->get_files("bob").empty());
  EXPECT_EQ(service->get_total_chunks("bob", "private.txt"), 0u);
  EXPECT_FALSE(service->get_file_chunk("bob", "private.txt", 0).has_value());
  EXPECT_FALSE(service->get_file_type("bob", "private.txt").has_value());
  EXPECT_FALSE(service->delete_file("bob", "private.txt"));

  EXPECT_TRUE(service->check_file_exists("alice", "private.txt"));
}

TEST_F(FileServiceTest, QueriesCreateTenantLazily) {
  EXPECT_FALSE(registry.has_tenant("carol"));
  service->get_files("carol");
  EXPECT_TRUE(registry.has_tenant("carol"));
}

TEST_F(FileServiceTest, SnapshotRestoreRoundTrip) {
  upload("alice", "doc.txt", 0, "hello", "text/plain");
  upload("alice", "movie", 4, "four", "video/mp4");
  upload("alice", "movie", 1, "one", "video/webm");
  upload("bob", "doc.txt", 0, "bob", "text/markdown");
  upload("bob", "tmp", 0, "tmp", "t");
  service->delete_file("bob", "tmp");

  StoreRegistry other_registry;
  FileService other(other_registry);
  other.restore(service->snapshot());

  EXPECT_EQ(other.get_files("alice"), service->get_files("alice"));
  EXPECT_EQ(other.get_files("bob"), service->get_files("bob"));
  expect_same_file(*service, other, "alice", "doc.txt", {0, 1});
  expect_same_file(*service, other, "alice", "movie", {0, 1, 4});
  expect_same_file(*service, other, "bob", "doc.txt", {0});
  expect_same_file(*service, other, "bob", "tmp", {0});
}

TEST_F(FileServiceTest, SaveAndLoadThroughFile) {
  const auto path = test_dir / "store.snap";
  upload("alice", "doc.txt", 0, "hello", "text/plain");
  upload("bob", "data.bin", 0, std::string("\0\x01\x02", 3), "application/octet-stream");

  service->save(path);

  StoreRegistry other_registry;
  FileService other(other_registry);
  ASSERT_TRUE(other.load(path));

  expect_same_file(*service, other, "alice", "doc.txt", {0});
  expect_same_file(*service, other, "bob", "data.bin", {0});
  EXPECT_EQ(other_registry.size(), 2u);
}

TEST_F(FileServiceTest, LoadWithoutFileKeepsState) {
  upload("alice", "a", 0, "abc", "bin");
  EXPECT_FALSE(service->load(test_dir / "missing.snap"));
  EXPECT_TRUE(service->check_file_exists("alice", "a"));
}

TEST_F(FileServiceTest, LoadCorruptFileThrowsAndKeepsState) {
  const auto path = test_dir / "store.snap";
  upload("alice", "a", 0, "abc", "bin");
  service->save(path);

  {
    std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
    file.seekp(25);
    file.put('\x7f');
  }

  upload("alice", "b", 0, "newer", "bin");
  EXPECT_THROW(service->load(path), cfs::persistence::SnapshotError);
  EXPECT_TRUE(service->check_file_exists("alice", "b"));
}

TEST_F(FileServiceTest, ConcurrentUploadsAndSnapshots) {
  const size_t num_threads = 4;
  const size_t chunks_per_thread = 200;
  std::atomic<bool> done{false};
  std::atomic<size_t> snapshots_taken{0};
  std::vector<std::thread> writers;

  // Every snapshot must satisfy the size invariant of each file
  std::thread reader([this, &done, &snapshots_taken]() {
    do {
      for (const auto& entry : service->snapshot()) {
        for (const auto& [name, file] : entry.files) {
          uint64_t sum = 0;
          for (const auto& chunk : file.chunks) {
            sum += chunk.payload.size();
          }
          EXPECT_EQ(sum, file.total_size) << entry.tenant << "/" << name;
        }
      }
      ++snapshots_taken;
    } while (!done);
  });

  for (size_t t = 0; t < num_threads; ++t) {
    writers.emplace_back([this, t, chunks_per_thread]() {
      const TenantId tenant = "tenant" + std::to_string(t % 2);
      for (size_t j = 0; j < chunks_per_thread; ++j) {
        const uint64_t index = t * chunks_per_thread + j;
        service->upload_file_chunk(tenant, "shared", std::vector<uint8_t>(j % 7 + 1, 0x01), index, "bin");
      }
    });
  }

  for (auto& writer : writers) {
    writer.join();
  }
  done = true;
  reader.join();

  EXPECT_GT(snapshots_taken.load(), 0u);
  EXPECT_EQ(service->get_total_chunks("tenant0", "shared"), 2 * chunks_per_thread);
  EXPECT_EQ(service->get_total_chunks("tenant1", "shared"), 2 * chunks_per_thread);
}
