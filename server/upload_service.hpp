#pragma once

// ============================================================
// upload_service.hpp -- Owner of all upload state
//   One instance per server (or per test). Wires the chunk store,
//   session registry, merge engine, live writer and catalog
//   together behind the seven client-facing operations.
// ============================================================

#include "../common/platform.hpp"
#include "../common/hash.hpp"
#include "storage_layout.hpp"
#include "chunk_store.hpp"
#include "session_registry.hpp"
#include "merge_engine.hpp"
#include "live_writer.hpp"
#include "artifact_catalog.hpp"
#include <string>
#include <vector>
#include <chrono>

struct InitUploadResult {
    std::string   session_id;
    // Only a zero-chunk upload is complete at init
    bool          complete{false};
    std::string   artifact_name;
    u64           artifact_size{0};
    hash::Hash128 digest{};
};

struct UploadStatus {
    u32              total_chunks{0};
    std::vector<u64> received;   // ascending
    bool             complete{false};
};

struct ChunkResult {
    i64           index{0};
    u32           received{0};
    u32           total_chunks{0};
    bool          complete{false};
    std::string   artifact_name;
    u64           artifact_size{0};
    hash::Hash128 digest{};
};

struct ReapStats {
    size_t sessions{0};   // idle in-memory sessions dropped
    size_t orphans{0};    // staging dirs with no live session
    size_t streams{0};    // idle live streams closed
};

class UploadService {
public:
    UploadService(const std::string& data_dir, bool compress_staging = false);

    // ---- Staged uploads ----
    InitUploadResult init_upload(const std::string& filename, u64 total_size,
                                 u32 total_chunks, const std::string& mime_type);

    UploadStatus status(const std::string& session_id);

    // data == nullptr models a request without a chunk payload
    ChunkResult submit_chunk(const std::string& session_id, i64 index,
                             const u8* data, size_t len);

    // ---- Live capture ----
    LiveInitResult   init_stream(const std::string& filename, const std::string& mime_type);
    LiveAppendResult append_stream(const std::string& stream_id, const u8* data, size_t len);
    LiveFinishResult finish_stream(const std::string& stream_id);

    // ---- Catalog ----
    std::vector<ArtifactInfo> list_artifacts() const;

    // Expire idle sessions/streams and purge orphaned staging dirs
    ReapStats reap_idle(std::chrono::steady_clock::duration max_idle);

    const StorageLayout& layout() const { return layout_; }
    SessionRegistry&     registry()     { return registry_; }
    ChunkStore&          chunk_store()  { return store_; }
    LiveWriter&          live_writer()  { return live_; }

    UploadService(const UploadService&) = delete;
    UploadService& operator=(const UploadService&) = delete;

private:
    // Merge a complete session and tear it down on success.
    // Caller holds slot.mutex. Throws StoreError if the merge failed.
    MergeOutcome finalize(SessionSlot& slot);

    StorageLayout   layout_;
    ChunkStore      store_;
    SessionRegistry registry_;
    ArtifactCatalog catalog_;
    MergeEngine     merger_;
    LiveWriter      live_;
};
