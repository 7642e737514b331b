#include "gtest/gtest.h"
#include "test_utils.hpp"

#include "core/Errors.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/upload/ChunkReassembler.hpp"

using namespace uds;

namespace {

class ChunkReassemblerTest : public ::testing::Test {
protected:
  TestWorkspace ws;
  LocalFSBackend fs{ws.uploadRoot(), ws.tempRoot()};
  ChunkReassembler reassembler{fs};
};

} // namespace

TEST_F(ChunkReassemblerTest, MergesInIndexOrderNotArrivalOrder) {
  fs.putChunk("s1", 2, "C");
  fs.putChunk("s1", 0, "A");
  fs.putChunk("s1", 1, "B");

  fs.putChunk("s2", 0, "A");
  fs.putChunk("s2", 1, "B");
  fs.putChunk("s2", 2, "C");

  EXPECT_EQ(reassembler.merge("s1", {2, 0, 1}, "out1.exe"), 3);
  EXPECT_EQ(reassembler.merge("s2", {0, 1, 2}, "out2.exe"), 3);
  EXPECT_EQ(read_file(fs.artifactPath("out1.exe")), "ABC");
  EXPECT_EQ(read_file(fs.artifactPath("out1.exe")), read_file(fs.artifactPath("out2.exe")));
}

TEST_F(ChunkReassemblerTest, MergeDeletesChunkFiles) {
  fs.putChunk("s1", 0, "hello ");
  fs.putChunk("s1", 1, "world");
  reassembler.merge("s1", {0, 1}, "out.exe");
  EXPECT_FALSE(fs.hasChunk("s1", 0));
  EXPECT_FALSE(fs.hasChunk("s1", 1));
  EXPECT_FALSE(std::filesystem::exists(std::filesystem::path(ws.tempRoot()) / "s1"));
}

TEST_F(ChunkReassemblerTest, RewrittenChunkUsesLastBytes) {
  fs.putChunk("s1", 0, "A");
  fs.putChunk("s1", 1, "old");
  fs.putChunk("s1", 1, "new");
  reassembler.merge("s1", {0, 1}, "out.exe");
  EXPECT_EQ(read_file(fs.artifactPath("out.exe")), "Anew");
}

TEST_F(ChunkReassemblerTest, MissingChunkIsCorruptAndLeavesNoOutput) {
  fs.putChunk("s1", 0, "A");
  fs.putChunk("s1", 2, "C");
  EXPECT_THROW(reassembler.merge("s1", {0, 1, 2}, "out.exe"), CorruptSession);

  EXPECT_FALSE(fs.hasArtifact("out.exe"));
  EXPECT_FALSE(std::filesystem::exists(fs.artifactPath("out.exe").string() + ".part"));
  // chunks stay for a retry
  EXPECT_TRUE(fs.hasChunk("s1", 0));
  EXPECT_TRUE(fs.hasChunk("s1", 2));

  fs.putChunk("s1", 1, "B");
  EXPECT_EQ(reassembler.merge("s1", {0, 1, 2}, "out.exe"), 3);
  EXPECT_EQ(read_file(fs.artifactPath("out.exe")), "ABC");
}

TEST_F(ChunkReassemblerTest, AssembleKeepsChunks) {
  fs.putChunk("s1", 0, "x");
  EXPECT_EQ(reassembler.assemble("s1", {0}, "out.exe"), 1);
  EXPECT_TRUE(fs.hasChunk("s1", 0));
  reassembler.discardChunks("s1", {0});
  EXPECT_FALSE(fs.hasChunk("s1", 0));
}

TEST_F(ChunkReassemblerTest, LargeChunksSurviveByteForByte) {
  std::string a(200 * 1024, '\0');
  std::string b(130 * 1024 + 7, '\0');
  for (size_t i = 0; i < a.size(); ++i) a[i] = static_cast<char>(i * 31);
  for (size_t i = 0; i < b.size(); ++i) b[i] = static_cast<char>(i * 17 + 3);
  fs.putChunk("s1", 1, b);
  fs.putChunk("s1", 0, a);
  EXPECT_EQ(reassembler.merge("s1", {1, 0}, "big.exe"), static_cast<int64_t>(a.size() + b.size()));
  EXPECT_EQ(read_file(fs.artifactPath("big.exe")), a + b);
}
