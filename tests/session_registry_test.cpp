// ============================================================
// session_registry_test.cpp -- Session state and snapshots
// ============================================================

#include "server/session_registry.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <mutex>

namespace {

struct SessionRegistryTest : ::testing::Test {
    TempDir       tmp;
    StorageLayout layout{tmp.path()};

    void SetUp() override { layout.ensure(); }
};

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const StoreError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "no StoreError thrown";
    return ErrorKind::IO_FAILURE;
}

} // namespace

TEST_F(SessionRegistryTest, CreateSanitizesAndSnapshots) {
    SessionRegistry reg(layout);
    auto slot = reg.create("my clip.mp4", 6, 3, "");

    const UploadSession& s = slot->state;
    EXPECT_TRUE(utils::is_token(s.id));
    EXPECT_EQ(s.original_name, "my_clip.mp4");
    EXPECT_EQ(s.total_chunks, 3u);
    EXPECT_EQ(s.mime_type, "application/octet-stream");
    EXPECT_TRUE(s.received.empty());

    std::string meta = read_text(reg.meta_path(s.id));
    EXPECT_NE(meta.find("id " + s.id + "\n"), std::string::npos);
    EXPECT_NE(meta.find("total_chunks 3\n"), std::string::npos);
}

TEST_F(SessionRegistryTest, EmptyFilenameIsInvalid) {
    SessionRegistry reg(layout);
    EXPECT_EQ(kind_of([&] { reg.create("", 0, 1, ""); }), ErrorKind::INVALID_ARGUMENT);
    EXPECT_EQ(reg.size(), 0u);
}

TEST_F(SessionRegistryTest, WhitespaceIsSanitizedNotTrimmed) {
    SessionRegistry reg(layout);
    EXPECT_EQ(reg.create(" clip.mp4", 0, 1, "")->state.original_name, "_clip.mp4");
    EXPECT_EQ(reg.create(" ", 0, 1, "")->state.original_name, "_");
}

TEST_F(SessionRegistryTest, MimeTypeCannotAddSnapshotLines) {
    std::string id;
    {
        SessionRegistry reg(layout);
        auto slot = reg.create("a.bin", 0, 3, "video/mp4\nreceived 0 1\rid x");
        id = slot->state.id;
        EXPECT_EQ(slot->state.mime_type.find('\n'), std::string::npos);
        EXPECT_EQ(slot->state.mime_type.find('\r'), std::string::npos);
    }

    SessionRegistry fresh(layout);
    auto slot = fresh.get(id);
    EXPECT_TRUE(slot->state.received.empty());
    EXPECT_EQ(slot->state.mime_type, "video/mp4_received 0 1_id x");
}

TEST_F(SessionRegistryTest, RepeatedSnapshotKeyIsIoFailure) {
    SessionRegistry reg(layout);
    std::string id = utils::generate_token();
    write_text(reg.meta_path(id), "id " + id + "\ntotal_chunks 3\nreceived\nreceived 0 1\n");
    EXPECT_EQ(kind_of([&] { reg.get(id); }), ErrorKind::IO_FAILURE);
}

TEST_F(SessionRegistryTest, UnknownOrMalformedIdsAreNotFound) {
    SessionRegistry reg(layout);
    EXPECT_EQ(kind_of([&] { reg.get("nope"); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(kind_of([&] { reg.get("../../etc"); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(kind_of([&] { reg.get(utils::generate_token()); }), ErrorKind::NOT_FOUND);
}

TEST_F(SessionRegistryTest, RecordChunkIsIdempotentAndSorted) {
    SessionRegistry reg(layout);
    auto slot = reg.create("a.bin", 0, 3, "");
    std::lock_guard<std::mutex> lk(slot->mutex);

    EXPECT_TRUE(reg.record_chunk(*slot, 2, true));
    EXPECT_TRUE(reg.record_chunk(*slot, 0, true));
    EXPECT_FALSE(reg.record_chunk(*slot, 2, true));

    std::vector<u64> got(slot->state.received.begin(), slot->state.received.end());
    EXPECT_EQ(got, (std::vector<u64>{0, 2}));
    EXPECT_FALSE(SessionRegistry::is_complete(slot->state));

    EXPECT_EQ(kind_of([&] { reg.record_chunk(*slot, -1, true); }), ErrorKind::INVALID_ARGUMENT);
    EXPECT_EQ(slot->state.received.size(), 2u);
}

TEST_F(SessionRegistryTest, CompletionNeedsEveryIndexInRange) {
    UploadSession s;
    s.total_chunks = 3;
    s.received = {0, 1, 7};
    EXPECT_FALSE(SessionRegistry::is_complete(s));
    s.received.insert(2);
    EXPECT_TRUE(SessionRegistry::is_complete(s));

    UploadSession empty;
    empty.total_chunks = 0;
    EXPECT_TRUE(SessionRegistry::is_complete(empty));
}

TEST_F(SessionRegistryTest, StrayIndicesDoNotCountTowardCompletion) {
    UploadSession s;
    s.total_chunks = 3;
    s.received = {0, 1, 5, 6, 7};
    EXPECT_FALSE(SessionRegistry::is_complete(s));
    s.received.insert(2);
    EXPECT_TRUE(SessionRegistry::is_complete(s));

    UploadSession big;
    big.total_chunks = 100000;
    for (u64 i = 0; i + 1 < big.total_chunks; ++i) big.received.insert(i);
    EXPECT_FALSE(SessionRegistry::is_complete(big));
    big.received.insert(big.total_chunks - 1);
    EXPECT_TRUE(SessionRegistry::is_complete(big));
}

TEST_F(SessionRegistryTest, MissReloadsFromSnapshot) {
    std::string id;
    {
        SessionRegistry reg(layout);
        auto slot = reg.create("clip.mp4", 6, 3, "video/mp4; codecs=avc1");
        id = slot->state.id;
        std::lock_guard<std::mutex> lk(slot->mutex);
        reg.record_chunk(*slot, 1, true);
        reg.record_chunk(*slot, 0, true);
    }

    SessionRegistry fresh(layout);
    EXPECT_FALSE(fresh.is_registered(id));
    auto slot = fresh.get(id);
    EXPECT_TRUE(fresh.is_registered(id));

    const UploadSession& s = slot->state;
    EXPECT_EQ(s.original_name, "clip.mp4");
    EXPECT_EQ(s.total_size, 6u);
    EXPECT_EQ(s.total_chunks, 3u);
    EXPECT_EQ(s.mime_type, "video/mp4; codecs=avc1");
    EXPECT_EQ(std::vector<u64>(s.received.begin(), s.received.end()), (std::vector<u64>{0, 1}));

    // Same slot on the next lookup
    EXPECT_EQ(fresh.get(id).get(), slot.get());
}

TEST_F(SessionRegistryTest, SkippedSnapshotIsNotVisibleAfterRestart) {
    std::string id;
    {
        SessionRegistry reg(layout);
        auto slot = reg.create("a.bin", 0, 2, "");
        id = slot->state.id;
        std::lock_guard<std::mutex> lk(slot->mutex);
        reg.record_chunk(*slot, 0, true);
        reg.record_chunk(*slot, 1, false);
        EXPECT_EQ(slot->state.received.size(), 2u);
    }
    SessionRegistry fresh(layout);
    EXPECT_EQ(fresh.get(id)->state.received.size(), 1u);
}

TEST_F(SessionRegistryTest, CorruptSnapshotIsIoFailure) {
    SessionRegistry reg(layout);
    std::string id = utils::generate_token();
    write_text(reg.meta_path(id), "id " + id + "\ntotal_chunks banana\n");
    EXPECT_EQ(kind_of([&] { reg.get(id); }), ErrorKind::IO_FAILURE);
}

TEST_F(SessionRegistryTest, RemoveDropsMemoryAndSnapshot) {
    SessionRegistry reg(layout);
    auto slot = reg.create("a.bin", 0, 1, "");
    std::string id = slot->state.id;
    {
        std::lock_guard<std::mutex> lk(slot->mutex);
        reg.remove(*slot);
    }
    EXPECT_TRUE(slot->removed);
    EXPECT_FALSE(reg.is_registered(id));
    EXPECT_FALSE(fs::exists(reg.meta_path(id)));
    EXPECT_EQ(kind_of([&] { reg.get(id); }), ErrorKind::NOT_FOUND);
}

TEST_F(SessionRegistryTest, ExpireIdleDropsOnlyStaleSessions) {
    SessionRegistry reg(layout);
    auto old_slot = reg.create("old.bin", 0, 2, "");
    auto new_slot = reg.create("new.bin", 0, 2, "");
    old_slot->last_touch = std::chrono::steady_clock::now() - std::chrono::hours(2);

    auto expired = reg.expire_idle(std::chrono::hours(1));
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0], old_slot->state.id);
    EXPECT_TRUE(old_slot->removed);
    EXPECT_FALSE(new_slot->removed);
    EXPECT_TRUE(reg.is_registered(new_slot->state.id));
}

TEST_F(SessionRegistryTest, ExpiredSessionCannotBeReloaded) {
    SessionRegistry reg(layout);
    auto slot = reg.create("old.bin", 0, 2, "");
    std::string id = slot->state.id;
    {
        std::lock_guard<std::mutex> lk(slot->mutex);
        reg.record_chunk(*slot, 0, true);
    }
    slot->last_touch = std::chrono::steady_clock::now() - std::chrono::hours(2);

    ASSERT_EQ(reg.expire_idle(std::chrono::hours(1)).size(), 1u);
    EXPECT_FALSE(fs::exists(reg.meta_path(id)));
    EXPECT_EQ(kind_of([&] { reg.get(id); }), ErrorKind::NOT_FOUND);
    EXPECT_FALSE(reg.is_registered(id));
}

TEST_F(SessionRegistryTest, ReleaseOrphanSkipsRegisteredAndRecentSessions) {
    SessionRegistry reg(layout);
    auto live = reg.create("live.bin", 0, 2, "");
    std::string live_id = live->state.id;
    fs::last_write_time(reg.meta_path(live_id), fs::file_time_type::clock::now() - std::chrono::hours(3));
    EXPECT_FALSE(reg.release_orphan(live_id, 0));
    EXPECT_TRUE(fs::exists(reg.meta_path(live_id)));

    std::string orphan = utils::generate_token();
    write_text(reg.meta_path(orphan), "id " + orphan + "\ntotal_chunks 1\n");
    const u64 hour_ns = 3600ull * 1000000000ull;
    EXPECT_FALSE(reg.release_orphan(orphan, hour_ns));

    fs::last_write_time(reg.meta_path(orphan), fs::file_time_type::clock::now() - std::chrono::hours(3));
    EXPECT_TRUE(reg.release_orphan(orphan, hour_ns));
    EXPECT_FALSE(fs::exists(reg.meta_path(orphan)));
    EXPECT_EQ(kind_of([&] { reg.get(orphan); }), ErrorKind::NOT_FOUND);
}
