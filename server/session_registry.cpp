// ============================================================
// session_registry.cpp -- SessionRegistry implementation
// ============================================================

#include "session_registry.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

// Snapshot values are single lines; control bytes never reach the file
static std::string snapshot_safe(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        unsigned char uc = (unsigned char)c;
        if (uc < 0x20 || uc == 0x7f) c = '_';
    }
    return out;
}

SessionRegistry::SessionRegistry(const StorageLayout& layout)
    : staging_dir_(layout.staging_dir)
{}

std::string SessionRegistry::meta_path(const std::string& session_id) const {
    return (fs::path(staging_dir_) / session_id / "meta").string();
}

std::shared_ptr<SessionSlot> SessionRegistry::create(const std::string& filename, u64 total_size,
                                                     u32 total_chunks, const std::string& mime_type) {
    if (filename.empty()) {
        throw invalid_argument("filename is required");
    }

    auto slot = std::make_shared<SessionSlot>();
    UploadSession& s = slot->state;
    s.original_name = utils::sanitize_name(filename);
    s.total_size    = total_size;
    s.total_chunks  = total_chunks;
    s.mime_type     = mime_type.empty() ? std::string("application/octet-stream")
                                        : snapshot_safe(mime_type);
    s.created_at_ms = utils::now_ms();

    std::lock_guard<std::mutex> lk(map_mutex_);
    std::error_code ec;
    do {
        s.id = utils::generate_token();
    } while (sessions_.count(s.id) || fs::exists(fs::path(staging_dir_) / s.id, ec));

    try {
        file_io::ensure_dir((fs::path(staging_dir_) / s.id).string());
    } catch (const std::runtime_error& e) {
        throw io_failure(std::string("Cannot create session staging: ") + e.what());
    }
    persist(s);
    sessions_[s.id] = slot;

    LOG_INFO("Session " + s.id + " created: " + s.original_name + " (" +
             std::to_string(s.total_chunks) + " chunks, " +
             utils::format_bytes(s.total_size) + ")");
    return slot;
}

std::shared_ptr<SessionSlot> SessionRegistry::get(const std::string& session_id) {
    if (!utils::is_token(session_id)) {
        throw not_found("Unknown session: " + session_id);
    }

    std::lock_guard<std::mutex> lk(map_mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) return it->second;

    // Registry miss: recover from the snapshot and re-register
    auto slot = std::make_shared<SessionSlot>();
    slot->state = load_snapshot(session_id);
    sessions_[session_id] = slot;
    LOG_INFO("Session " + session_id + " restored from snapshot (" +
             std::to_string(slot->state.received.size()) + "/" +
             std::to_string(slot->state.total_chunks) + " chunks)");
    return slot;
}

bool SessionRegistry::record_chunk(SessionSlot& slot, i64 index, bool persist_snapshot) {
    if (index < 0) {
        throw invalid_argument("Invalid chunk index " + std::to_string(index));
    }
    bool inserted = slot.state.received.insert((u64)index).second;
    slot.last_touch = std::chrono::steady_clock::now();
    if (persist_snapshot) persist(slot.state);
    return inserted;
}

bool SessionRegistry::is_complete(const UploadSession& s) {
    if (s.total_chunks == 0) return true;
    if (s.received.size() < s.total_chunks) return false;
    // The set is ordered and unique: with no stray index above the range,
    // N entries are exactly 0..N-1
    if (*s.received.rbegin() < s.total_chunks) return s.received.size() == s.total_chunks;
    auto in_range = std::distance(s.received.begin(), s.received.lower_bound(s.total_chunks));
    return (u64)in_range == s.total_chunks;
}

void SessionRegistry::persist(const UploadSession& s) {
    std::ostringstream out;
    out << "# streamsaver session snapshot\n";
    out << "id " << s.id << "\n";
    out << "name " << s.original_name << "\n";
    out << "total_size " << s.total_size << "\n";
    out << "total_chunks " << s.total_chunks << "\n";
    out << "mime " << s.mime_type << "\n";
    out << "created_at " << s.created_at_ms << "\n";
    out << "received";
    for (u64 idx : s.received) out << ' ' << idx;
    out << "\n";

    std::string text = out.str();
    try {
        file_io::write_file_atomic(meta_path(s.id), text.data(), text.size());
    } catch (const std::runtime_error& e) {
        throw io_failure("Cannot persist session " + s.id + ": " + e.what());
    }
}

UploadSession SessionRegistry::load_snapshot(const std::string& session_id) const {
    std::string path = meta_path(session_id);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw not_found("Unknown session: " + session_id);
    }

    std::string text;
    try {
        std::vector<u8> raw = file_io::read_file(path);
        text.assign(raw.begin(), raw.end());
    } catch (const std::runtime_error& e) {
        throw io_failure("Cannot read snapshot of " + session_id + ": " + e.what());
    }

    UploadSession s;
    try {
        std::istringstream in(text);
        std::string line;
        std::set<std::string> seen;
        while (std::getline(in, line)) {
            if (line.empty() || line[0] == '#') continue;
            size_t sp = line.find(' ');
            std::string key = line.substr(0, sp);
            std::string val = (sp == std::string::npos) ? "" : line.substr(sp + 1);
            if (!seen.insert(key).second) {
                throw std::invalid_argument("duplicate key '" + key + "'");
            }

            if (key == "id") {
                s.id = val;
            } else if (key == "name") {
                s.original_name = val;
            } else if (key == "total_size") {
                s.total_size = std::stoull(val);
            } else if (key == "total_chunks") {
                s.total_chunks = (u32)std::stoul(val);
            } else if (key == "mime") {
                s.mime_type = val;
            } else if (key == "created_at") {
                s.created_at_ms = std::stoull(val);
            } else if (key == "received") {
                std::istringstream nums(val);
                u64 idx;
                while (nums >> idx) s.received.insert(idx);
            }
        }
    } catch (const std::logic_error& e) {
        throw io_failure("Corrupt snapshot for " + session_id + ": " + e.what());
    }

    if (s.id != session_id) {
        throw io_failure("Snapshot id mismatch for " + session_id);
    }
    return s;
}

void SessionRegistry::remove(SessionSlot& slot) {
    const std::string& id = slot.state.id;
    std::lock_guard<std::mutex> lk(map_mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end() && it->second.get() == &slot) {
        sessions_.erase(it);
    }
    slot.removed = true;

    std::error_code ec;
    fs::remove(meta_path(id), ec);
    if (ec) {
        LOG_WARN("Cannot delete snapshot of " + id + ": " + ec.message());
    }
}

std::vector<std::string> SessionRegistry::expire_idle(std::chrono::steady_clock::duration max_idle) {
    std::vector<std::string> expired;
    auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lk(map_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        SessionSlot& slot = *it->second;
        // A locked slot is in use, hence not idle
        std::unique_lock<std::mutex> slot_lk(slot.mutex, std::try_to_lock);
        if (!slot_lk.owns_lock() || now - slot.last_touch <= max_idle) {
            ++it;
            continue;
        }
        // Drop the snapshot while both locks are held so get() cannot
        // resurrect a session whose staging is about to be purged
        std::error_code ec;
        fs::remove(meta_path(it->first), ec);
        if (ec) {
            LOG_WARN("Cannot delete snapshot of " + it->first + ": " + ec.message());
        }
        slot.removed = true;
        expired.push_back(it->first);
        it = sessions_.erase(it);
    }
    return expired;
}

bool SessionRegistry::release_orphan(const std::string& session_id, u64 max_idle_ns) {
    std::lock_guard<std::mutex> lk(map_mutex_);
    if (sessions_.count(session_id)) return false;

    std::string meta = meta_path(session_id);
    u64 mtime = file_io::get_mtime_ns(meta);
    if (mtime == 0) mtime = file_io::get_mtime_ns((fs::path(staging_dir_) / session_id).string());
    u64 now = utils::now_ns();
    if (mtime == 0 || now < mtime || now - mtime <= max_idle_ns) return false;

    std::error_code ec;
    fs::remove(meta, ec);
    if (ec) {
        LOG_WARN("Cannot delete snapshot of orphan " + session_id + ": " + ec.message());
        return false;
    }
    return true;
}

bool SessionRegistry::is_registered(const std::string& session_id) const {
    std::lock_guard<std::mutex> lk(map_mutex_);
    return sessions_.count(session_id) != 0;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lk(map_mutex_);
    return sessions_.size();
}
