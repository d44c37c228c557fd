// ============================================================
// upload_service.cpp -- UploadService implementation
// ============================================================

#include "upload_service.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

static StorageLayout prepared_layout(const std::string& data_dir) {
    StorageLayout layout(data_dir);
    layout.ensure();
    return layout;
}

UploadService::UploadService(const std::string& data_dir, bool compress_staging)
    : layout_(prepared_layout(data_dir))
    , store_(layout_, compress_staging)
    , registry_(layout_)
    , catalog_(layout_)
    , merger_(store_, catalog_)
    , live_(catalog_)
{}

// ---------------------------------------------------------------
// Staged uploads
// ---------------------------------------------------------------

InitUploadResult UploadService::init_upload(const std::string& filename, u64 total_size,
                                            u32 total_chunks, const std::string& mime_type) {
    auto slot = registry_.create(filename, total_size, total_chunks, mime_type);

    InitUploadResult r;
    r.session_id = slot->state.id;
    if (total_chunks > 0) return r;

    // Nothing to wait for: an empty upload is complete on arrival.
    // The caller never learned the id, so a failed merge leaves nothing behind.
    std::lock_guard<std::mutex> lk(slot->mutex);
    MergeOutcome m;
    try {
        m = finalize(*slot);
    } catch (const StoreError&) {
        registry_.remove(*slot);
        store_.purge(r.session_id);
        throw;
    }
    r.complete      = true;
    r.artifact_name = m.artifact_name;
    r.artifact_size = m.bytes_written;
    r.digest        = m.digest;
    return r;
}

UploadStatus UploadService::status(const std::string& session_id) {
    auto slot = registry_.get(session_id);
    std::lock_guard<std::mutex> lk(slot->mutex);
    if (slot->removed) {
        throw not_found("Unknown session: " + session_id);
    }

    UploadStatus st;
    st.total_chunks = slot->state.total_chunks;
    st.received.assign(slot->state.received.begin(), slot->state.received.end());
    st.complete = SessionRegistry::is_complete(slot->state);
    return st;
}

ChunkResult UploadService::submit_chunk(const std::string& session_id, i64 index,
                                        const u8* data, size_t len) {
    if (!data) {
        throw invalid_argument("Chunk data is required");
    }
    if (index < 0) {
        throw invalid_argument("Invalid chunk index " + std::to_string(index));
    }

    auto slot = registry_.get(session_id);
    std::lock_guard<std::mutex> lk(slot->mutex);
    if (slot->removed) {
        // Merged (or expired) while we waited for the lock
        throw not_found("Unknown session: " + session_id);
    }

    UploadSession& s = slot->state;
    store_.put(s.id, index, data, len, s.original_name);

    // The snapshot is skipped only for the chunk that triggers the merge
    registry_.record_chunk(*slot, index, false);
    bool complete = SessionRegistry::is_complete(s);
    if (!complete) registry_.persist(s);

    ChunkResult r;
    r.index        = index;
    r.received     = (u32)s.received.size();
    r.total_chunks = s.total_chunks;
    r.complete     = complete;
    LOG_DEBUG("Session " + s.id + ": chunk " + std::to_string(index) + " (" +
              utils::format_percent(r.received, s.total_chunks) + ")");

    if (complete) {
        MergeOutcome m = finalize(*slot);
        r.artifact_name = m.artifact_name;
        r.artifact_size = m.bytes_written;
        r.digest        = m.digest;
    }
    return r;
}

MergeOutcome UploadService::finalize(SessionSlot& slot) {
    UploadSession& s = slot.state;
    MergeOutcome m = merger_.merge(s);
    if (!m.merged()) {
        // Keep everything so a resubmitted chunk can retry the merge
        try {
            registry_.persist(s);
        } catch (const StoreError& e) {
            LOG_ERROR("Session " + s.id + " snapshot after failed merge: " + e.what());
        }
        throw StoreError(m.error_kind, "Merge failed for " + s.id + ": " + m.message);
    }

    registry_.remove(slot);
    store_.purge(s.id);
    return m;
}

// ---------------------------------------------------------------
// Live capture
// ---------------------------------------------------------------

LiveInitResult UploadService::init_stream(const std::string& filename, const std::string& mime_type) {
    return live_.init(filename, mime_type);
}

LiveAppendResult UploadService::append_stream(const std::string& stream_id, const u8* data, size_t len) {
    return live_.append(stream_id, data, len);
}

LiveFinishResult UploadService::finish_stream(const std::string& stream_id) {
    return live_.finish(stream_id);
}

// ---------------------------------------------------------------
// Catalog / housekeeping
// ---------------------------------------------------------------

std::vector<ArtifactInfo> UploadService::list_artifacts() const {
    return catalog_.list();
}

ReapStats UploadService::reap_idle(std::chrono::steady_clock::duration max_idle) {
    ReapStats stats;

    for (const auto& id : registry_.expire_idle(max_idle)) {
        store_.purge(id);
        LOG_INFO("Session " + id + " expired; staging purged");
        ++stats.sessions;
    }

    // Staging dirs nobody holds in memory: drop them once their
    // snapshot (or the dir itself) is older than the idle limit
    i64 limit   = (i64)std::chrono::duration_cast<std::chrono::nanoseconds>(max_idle).count();
    u64 idle_ns = limit > 0 ? (u64)limit : 0;
    for (const auto& id : store_.list_sessions()) {
        if (!registry_.release_orphan(id, idle_ns)) continue;
        store_.purge(id);
        LOG_INFO("Orphaned staging " + id + " purged");
        ++stats.orphans;
    }

    stats.streams = live_.expire_idle(max_idle).size();
    return stats;
}
