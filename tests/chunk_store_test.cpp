// ============================================================
// chunk_store_test.cpp -- Chunk staging
// ============================================================

#include "server/chunk_store.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace {

const std::string SID = "0123456789abcdef0123456789abcdef";

struct ChunkStoreTest : ::testing::Test {
    TempDir       tmp;
    StorageLayout layout{tmp.path()};

    void SetUp() override { layout.ensure(); }
};

} // namespace

TEST_F(ChunkStoreTest, PutThenGetReturnsSameBytes) {
    ChunkStore store(layout, false);
    auto data = bytes("AAA");
    store.put(SID, 0, data.data(), data.size());

    EXPECT_EQ(store.get(SID, 0), data);
    EXPECT_TRUE(fs::exists(fs::path(store.session_dir(SID)) / "chunk-0.part"));
}

TEST_F(ChunkStoreTest, OverwriteReplacesPriorContent) {
    ChunkStore store(layout, false);
    auto first = bytes("first");
    auto second = bytes("2nd");
    store.put(SID, 4, first.data(), first.size());
    store.put(SID, 4, second.data(), second.size());
    EXPECT_EQ(store.get(SID, 4), second);
}

TEST_F(ChunkStoreTest, MissingChunkIsNotFound) {
    ChunkStore store(layout, false);
    try {
        store.get(SID, 3);
        FAIL() << "expected NotFound";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NOT_FOUND);
    }
}

TEST_F(ChunkStoreTest, EmptyChunkIsStored) {
    ChunkStore store(layout, true);
    u8 dummy = 0;
    store.put(SID, 1, &dummy, 0, "notes.txt");
    EXPECT_TRUE(store.has(SID, 1));
    EXPECT_TRUE(store.get(SID, 1).empty());
}

TEST_F(ChunkStoreTest, CompressedStagingIsTransparent) {
    ChunkStore store(layout, true);
    std::string text(64 * 1024, 'z');
    store.put(SID, 0, reinterpret_cast<const u8*>(text.data()), text.size(), "log.txt");

    fs::path dir = store.session_dir(SID);
    EXPECT_TRUE(fs::exists(dir / "chunk-0.part.zst"));
    EXPECT_FALSE(fs::exists(dir / "chunk-0.part"));
    EXPECT_LT(fs::file_size(dir / "chunk-0.part.zst"), text.size());

    auto back = store.get(SID, 0);
    EXPECT_EQ(std::string(back.begin(), back.end()), text);
}

TEST_F(ChunkStoreTest, MediaNamesStayRawEvenWithCompression) {
    ChunkStore store(layout, true);
    std::string text(64 * 1024, 'z');
    store.put(SID, 0, reinterpret_cast<const u8*>(text.data()), text.size(), "clip.mp4");

    fs::path dir = store.session_dir(SID);
    EXPECT_TRUE(fs::exists(dir / "chunk-0.part"));
    EXPECT_FALSE(fs::exists(dir / "chunk-0.part.zst"));
}

TEST_F(ChunkStoreTest, SwitchingEncodingLeavesOneFile) {
    std::string text(64 * 1024, 'q');
    const u8* p = reinterpret_cast<const u8*>(text.data());
    {
        ChunkStore packed(layout, true);
        packed.put(SID, 2, p, text.size(), "a.txt");
    }
    ChunkStore raw(layout, false);
    auto small = bytes("xy");
    raw.put(SID, 2, small.data(), small.size(), "a.txt");

    fs::path dir = raw.session_dir(SID);
    EXPECT_TRUE(fs::exists(dir / "chunk-2.part"));
    EXPECT_FALSE(fs::exists(dir / "chunk-2.part.zst"));
    EXPECT_EQ(raw.get(SID, 2), small);
}

TEST_F(ChunkStoreTest, CorruptCompressedChunkIsIoFailure) {
    ChunkStore store(layout, true);
    write_text((fs::path(store.session_dir(SID)) / "chunk-0.part.zst").string(), "garbage");
    try {
        store.get(SID, 0);
        FAIL() << "expected IOFailure";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IO_FAILURE);
    }
}

TEST_F(ChunkStoreTest, PurgeRemovesSessionArea) {
    ChunkStore store(layout, false);
    auto data = bytes("x");
    store.put(SID, 0, data.data(), data.size());
    store.put(SID, 1, data.data(), data.size());
    ASSERT_EQ(store.list_sessions().size(), 1u);

    store.purge(SID);
    EXPECT_FALSE(fs::exists(store.session_dir(SID)));
    EXPECT_TRUE(store.list_sessions().empty());
}
