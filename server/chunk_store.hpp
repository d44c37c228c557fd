#pragma once

// ============================================================
// chunk_store.hpp -- Durable per-session chunk staging
//   Chunks are addressed directly as
//     <staging>/<session>/chunk-<index>.part      (raw)
//     <staging>/<session>/chunk-<index>.part.zst  (zstd frame)
//   Exactly one encoding exists per address at any time.
// ============================================================

#include "../common/platform.hpp"
#include "storage_layout.hpp"
#include <string>
#include <vector>

class ChunkStore {
public:
    // compress_staging: store compressible chunks as zstd frames
    ChunkStore(const StorageLayout& layout, bool compress_staging);

    // Write (or overwrite) one chunk. 'name' is the session's original
    // file name and only decides whether compression is worthwhile.
    // Throws StoreError(IO_FAILURE) on write failure.
    void put(const std::string& session_id, i64 index,
             const u8* data, size_t len, const std::string& name = "");

    // Read a chunk back in its original form.
    // NOT_FOUND if never written, IO_FAILURE if unreadable or undecodable.
    std::vector<u8> get(const std::string& session_id, i64 index) const;

    bool has(const std::string& session_id, i64 index) const;

    // Remove the session's staging directory with everything in it
    void purge(const std::string& session_id);

    std::string session_dir(const std::string& session_id) const;

    // Ids of all staging directories currently on disk
    std::vector<std::string> list_sessions() const;

private:
    std::string raw_path(const std::string& session_id, i64 index) const;
    std::string zst_path(const std::string& session_id, i64 index) const;

    std::string staging_dir_;
    bool        compress_staging_;
};
