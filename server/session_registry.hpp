#pragma once

// ============================================================
// session_registry.hpp -- In-memory upload sessions with
//   durable text snapshots for restart recovery.
//
// Locking:
//   map_mutex_      guards the id -> slot map only
//   SessionSlot::mutex  guards one session's state; callers hold
//                       it across store/record/merge so a session
//                       is merged at most once.
// ============================================================

#include "../common/platform.hpp"
#include "storage_layout.hpp"
#include <string>
#include <set>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <unordered_map>

struct UploadSession {
    std::string   id;
    std::string   original_name;   // sanitized
    u64           total_size{0};   // advisory
    u32           total_chunks{1};
    std::string   mime_type;
    u64           created_at_ms{0};
    std::set<u64> received;        // ascending, idempotent
};

struct SessionSlot {
    std::mutex    mutex;
    UploadSession state;
    bool          removed{false};  // set under 'mutex' once the session is torn down
    std::chrono::steady_clock::time_point last_touch{std::chrono::steady_clock::now()};
};

class SessionRegistry {
public:
    explicit SessionRegistry(const StorageLayout& layout);

    // Create, snapshot and register a new session.
    // INVALID_ARGUMENT if the name is empty. Control bytes in the mime
    // type are replaced so the snapshot stays one value per line.
    std::shared_ptr<SessionSlot> create(const std::string& filename, u64 total_size,
                                        u32 total_chunks, const std::string& mime_type);

    // In-memory slot, or reload from snapshot. NOT_FOUND if neither exists.
    std::shared_ptr<SessionSlot> get(const std::string& session_id);

    // Mark 'index' received. Caller holds slot->mutex.
    // Returns true if the index was new. INVALID_ARGUMENT if index < 0.
    bool record_chunk(SessionSlot& slot, i64 index, bool persist_snapshot);

    static bool is_complete(const UploadSession& s);

    // Write the snapshot for 's' (temp file + rename); IO_FAILURE on error
    void persist(const UploadSession& s);

    // Drop in-memory and durable state. Caller holds slot->mutex.
    void remove(SessionSlot& slot);

    // Remove sessions untouched for longer than max_idle, snapshots
    // included; returns their ids. Staging is the caller's to purge.
    std::vector<std::string> expire_idle(std::chrono::steady_clock::duration max_idle);

    // For a staging dir with no registered session: if its snapshot (or
    // the dir) is older than max_idle_ns, delete the snapshot under the
    // map lock and return true; the dir can then be purged safely.
    bool release_orphan(const std::string& session_id, u64 max_idle_ns);

    bool is_registered(const std::string& session_id) const;
    size_t size() const;

    std::string meta_path(const std::string& session_id) const;

private:
    UploadSession load_snapshot(const std::string& session_id) const;

    std::string staging_dir_;

    mutable std::mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionSlot>> sessions_;
};
