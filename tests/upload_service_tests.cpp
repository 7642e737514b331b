#include "gtest/gtest.h"
#include "test_utils.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "core/Errors.hpp"
#include "core/Time.hpp"
#include "core/metadata/ArtifactCatalog.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/upload/SessionSweeper.hpp"
#include "core/upload/SqliteSessionStore.hpp"
#include "core/upload/UploadService.hpp"

using namespace uds;

namespace {

// Fails the first publish, then behaves normally.
class FlakyCatalog : public SqliteArtifactCatalog {
public:
  using SqliteArtifactCatalog::SqliteArtifactCatalog;
  ArtifactRecord publish(const ArtifactRecord& rec) override {
    if (failNext) {
      failNext = false;
      throw StorageFailure("disk full");
    }
    return SqliteArtifactCatalog::publish(rec);
  }
  bool failNext = true;
};

// Reports a session that no longer exists as expired.
class GhostSessionStore : public SqliteSessionStore {
public:
  using SqliteSessionStore::SqliteSessionStore;
  std::vector<std::string> listExpired(int64_t cutoffMillis) override {
    auto ids = SqliteSessionStore::listExpired(cutoffMillis);
    ids.push_back("0000aaaa-0000-4000-8000-000000000000");
    return ids;
  }
};

class UploadServiceTest : public ::testing::Test {
protected:
  TestWorkspace ws;
  SqliteSessionStore sessions{ws.dbPath(), {".exe"}};
  SqliteArtifactCatalog catalog{ws.dbPath()};
  LocalFSBackend fs{ws.uploadRoot(), ws.tempRoot()};
  UploadService uploads{sessions, catalog, fs, 1024};

  std::string start(int64_t chunks, const std::string& version = "2.0.0",
                    int64_t size = 3) {
    UploadRequest r;
    r.fileName = "Setup.exe";
    r.fileSize = size;
    r.totalChunks = chunks;
    r.currentVersion = version;
    r.minVersion = "1.5.0";
    return uploads.init(r);
  }

  std::string publish(const std::string& version, const std::string& content) {
    auto id = start(1, version, static_cast<int64_t>(content.size()));
    uploads.uploadChunk(id, 0, content);
    return uploads.finalize(id).storedFilename;
  }
};

} // namespace

TEST_F(UploadServiceTest, EndToEndThreeChunks) {
  auto id = start(3);
  EXPECT_EQ(uploads.uploadChunk(id, 0, "A").progress.received, 1);
  EXPECT_EQ(uploads.uploadChunk(id, 1, "B").progress.received, 2);
  auto last = uploads.uploadChunk(id, 2, "C");
  EXPECT_EQ(last.chunkIndex, 2);
  EXPECT_EQ(last.progress.received, 3);
  EXPECT_EQ(last.progress.total, 3);

  auto rec = uploads.finalize(id);
  EXPECT_EQ(rec.currentVersion, "2.0.0");
  EXPECT_EQ(rec.minVersion, "1.5.0");
  EXPECT_EQ(rec.originalName, "Setup.exe");
  EXPECT_EQ(rec.fileSize, 3);
  EXPECT_NE(rec.storedFilename.find("Setup.exe"), std::string::npos);

  auto cur = catalog.current();
  ASSERT_TRUE(cur.has_value());
  EXPECT_EQ(cur->storedFilename, rec.storedFilename);
  EXPECT_EQ(read_file(fs.artifactPath(cur->storedFilename)), "ABC");

  // the session is gone, chunks included
  EXPECT_THROW(uploads.finalize(id), SessionNotFound);
  EXPECT_THROW(uploads.status(id), SessionNotFound);
  EXPECT_FALSE(fs.hasChunk(id, 0));
}

TEST_F(UploadServiceTest, OutOfOrderUploadMatchesInOrder) {
  auto a = start(3);
  uploads.uploadChunk(a, 2, "C");
  uploads.uploadChunk(a, 0, "A");
  uploads.uploadChunk(a, 1, "B");
  auto ra = uploads.finalize(a);
  const std::string outOfOrder = read_file(fs.artifactPath(ra.storedFilename));

  auto b = start(3);
  uploads.uploadChunk(b, 0, "A");
  uploads.uploadChunk(b, 1, "B");
  uploads.uploadChunk(b, 2, "C");
  auto rb = uploads.finalize(b);
  EXPECT_EQ(read_file(fs.artifactPath(rb.storedFilename)), outOfOrder);
  EXPECT_EQ(outOfOrder, "ABC");
}

TEST_F(UploadServiceTest, ReuploadedChunkKeepsCountAndLastBytes) {
  auto id = start(2);
  uploads.uploadChunk(id, 0, "first");
  EXPECT_EQ(uploads.uploadChunk(id, 0, "again").progress.received, 1);
  uploads.uploadChunk(id, 1, "!");
  auto rec = uploads.finalize(id);
  EXPECT_EQ(read_file(fs.artifactPath(rec.storedFilename)), "again!");
}

TEST_F(UploadServiceTest, IncompleteFinalizeLeavesCatalogAlone) {
  auto id = start(3);
  uploads.uploadChunk(id, 0, "A");
  uploads.uploadChunk(id, 2, "C");
  try {
    uploads.finalize(id);
    FAIL() << "expected IncompleteUpload";
  } catch (const IncompleteUpload& e) {
    EXPECT_EQ(e.received(), 2);
    EXPECT_EQ(e.total(), 3);
  }
  EXPECT_FALSE(catalog.current().has_value());

  // the client keeps going
  uploads.uploadChunk(id, 1, "B");
  EXPECT_NO_THROW(uploads.finalize(id));
}

TEST_F(UploadServiceTest, LostChunkIsCorruptAndRetryable) {
  const std::string before = publish("1.0.0", "old");

  auto id = start(2);
  uploads.uploadChunk(id, 0, "A");
  uploads.uploadChunk(id, 1, "B");
  std::filesystem::remove(fs.chunkPath(id, 1));

  EXPECT_THROW(uploads.finalize(id), CorruptSession);
  EXPECT_EQ(catalog.current()->storedFilename, before);
  EXPECT_TRUE(fs.hasArtifact(before));
  ASSERT_TRUE(sessions.find(id).has_value());

  uploads.uploadChunk(id, 1, "B");
  auto rec = uploads.finalize(id);
  EXPECT_EQ(read_file(fs.artifactPath(rec.storedFilename)), "AB");
}

TEST_F(UploadServiceTest, PublishingReplacesPreviousFile) {
  const std::string first = publish("1.0.0", "one");
  EXPECT_TRUE(fs.hasArtifact(first));
  const std::string second = publish("1.1.0", "two");
  EXPECT_NE(first, second);
  EXPECT_FALSE(fs.hasArtifact(first));
  EXPECT_TRUE(fs.hasArtifact(second));
  EXPECT_FALSE(catalog.findByStoredFilename(first).has_value());
  EXPECT_EQ(catalog.history(10).size(), 2u);
}

TEST_F(UploadServiceTest, RecordedSizeIsMergedLength) {
  auto id = start(1, "2.0.0", /*declared*/ 999);
  uploads.uploadChunk(id, 0, "12345");
  EXPECT_EQ(uploads.finalize(id).fileSize, 5);
}

TEST_F(UploadServiceTest, ChunkValidation) {
  auto id = start(2);
  EXPECT_THROW(uploads.uploadChunk(id, 0, ""), ValidationError);
  EXPECT_THROW(uploads.uploadChunk(id, 0, std::string(1025, 'x')), ValidationError);
  EXPECT_THROW(uploads.uploadChunk(id, 2, "x"), ValidationError);
  EXPECT_THROW(uploads.uploadChunk("0000-unknown", 0, "x"), SessionNotFound);
  EXPECT_THROW(uploads.uploadChunk("../../etc", 0, "x"), SessionNotFound);
  EXPECT_EQ(uploads.status(id).received, 0);
}

TEST_F(UploadServiceTest, StatusReportsProgress) {
  auto id = start(4);
  uploads.uploadChunk(id, 3, "d");
  auto p = uploads.status(id);
  EXPECT_EQ(p.received, 1);
  EXPECT_EQ(p.total, 4);
  EXPECT_DOUBLE_EQ(p.progressPercent(), 25.0);
}

TEST_F(UploadServiceTest, ParallelChunksForOneSession) {
  const int total = 40;
  auto id = start(total, "2.0.0", total);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = t; i < total; i += 4) {
        uploads.uploadChunk(id, i, std::string(1, static_cast<char>('a' + i % 26)));
      }
    });
  }
  for (auto& th : threads) th.join();

  auto rec = uploads.finalize(id);
  std::string expected;
  for (int i = 0; i < total; ++i) expected.push_back(static_cast<char>('a' + i % 26));
  EXPECT_EQ(read_file(fs.artifactPath(rec.storedFilename)), expected);
}

TEST_F(UploadServiceTest, ConcurrentDoubleFinalizePublishesOnce) {
  auto id = start(1);
  uploads.uploadChunk(id, 0, "x");
  std::atomic<int> ok{0}, notFound{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 2; ++i) {
    threads.emplace_back([&] {
      try {
        uploads.finalize(id);
        ++ok;
      } catch (const SessionNotFound&) {
        ++notFound;
      }
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_EQ(ok.load(), 1);
  EXPECT_EQ(notFound.load(), 1);
  EXPECT_EQ(catalog.history(10).size(), 1u);
}

TEST_F(UploadServiceTest, SweepRemovesIdleSessions) {
  auto idle = start(2);
  uploads.uploadChunk(idle, 0, "A");
  const int64_t later = now_millis() + 60 * 1000;

  EXPECT_EQ(uploads.sweepExpired(std::chrono::minutes(5), later), 0u);
  EXPECT_EQ(uploads.sweepExpired(std::chrono::seconds(30), later), 1u);
  EXPECT_FALSE(sessions.find(idle).has_value());
  EXPECT_FALSE(fs.hasChunk(idle, 0));
  EXPECT_THROW(uploads.uploadChunk(idle, 1, "B"), SessionNotFound);
}

TEST_F(UploadServiceTest, SweeperThreadStopsCleanly) {
  auto id = start(1);
  {
    SessionSweeper sweeper(uploads, std::chrono::milliseconds(0), std::chrono::milliseconds(10));
    sweeper.start();
    for (int i = 0; i < 200 && sessions.find(id).has_value(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  EXPECT_FALSE(sessions.find(id).has_value());
}

TEST(UploadServicePublishFailureTest, FailedPublishKeepsSessionForRetry) {
  TestWorkspace ws;
  SqliteSessionStore sessions(ws.dbPath(), {".exe"});
  FlakyCatalog catalog(ws.dbPath());
  LocalFSBackend fs(ws.uploadRoot(), ws.tempRoot());
  UploadService uploads(sessions, catalog, fs, 1024);

  UploadRequest r;
  r.fileName = "Setup.exe";
  r.fileSize = 2;
  r.totalChunks = 2;
  r.currentVersion = "2.0.0";
  r.minVersion = "1.0.0";
  auto id = uploads.init(r);
  uploads.uploadChunk(id, 1, "B");
  uploads.uploadChunk(id, 0, "A");

  EXPECT_THROW(uploads.finalize(id), StorageFailure);
  EXPECT_FALSE(catalog.current().has_value());
  EXPECT_TRUE(std::filesystem::is_empty(ws.uploadRoot()));
  EXPECT_TRUE(fs.hasChunk(id, 0));
  EXPECT_TRUE(fs.hasChunk(id, 1));
  EXPECT_TRUE(sessions.find(id).has_value());

  auto rec = uploads.finalize(id);
  EXPECT_EQ(read_file(fs.artifactPath(rec.storedFilename)), "AB");
  EXPECT_EQ(catalog.current()->storedFilename, rec.storedFilename);
  EXPECT_FALSE(sessions.find(id).has_value());
}

TEST(UploadServiceSweepTest, VanishedSessionDropsItsLock) {
  TestWorkspace ws;
  GhostSessionStore sessions(ws.dbPath(), {".exe"});
  SqliteArtifactCatalog catalog(ws.dbPath());
  LocalFSBackend fs(ws.uploadRoot(), ws.tempRoot());
  UploadService uploads(sessions, catalog, fs, 1024);

  EXPECT_EQ(uploads.sweepExpired(std::chrono::seconds(1), now_millis()), 0u);
  EXPECT_EQ(uploads.lockedSessionCount(), 0u);
}

TEST_F(UploadServiceTest, LocksAreReleasedAfterFinalize) {
  auto id = start(1);
  uploads.uploadChunk(id, 0, "x");
  EXPECT_EQ(uploads.lockedSessionCount(), 1u);
  uploads.finalize(id);
  EXPECT_EQ(uploads.lockedSessionCount(), 0u);
}
