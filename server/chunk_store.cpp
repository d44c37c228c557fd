// ============================================================
// chunk_store.cpp -- ChunkStore implementation
// ============================================================

#include "chunk_store.hpp"
#include "../common/errors.hpp"
#include "../common/compress.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <system_error>

ChunkStore::ChunkStore(const StorageLayout& layout, bool compress_staging)
    : staging_dir_(layout.staging_dir)
    , compress_staging_(compress_staging)
{}

std::string ChunkStore::session_dir(const std::string& session_id) const {
    return (fs::path(staging_dir_) / session_id).string();
}

std::string ChunkStore::raw_path(const std::string& session_id, i64 index) const {
    return (fs::path(staging_dir_) / session_id /
            ("chunk-" + std::to_string(index) + ".part")).string();
}

std::string ChunkStore::zst_path(const std::string& session_id, i64 index) const {
    return raw_path(session_id, index) + ".zst";
}

void ChunkStore::put(const std::string& session_id, i64 index,
                     const u8* data, size_t len, const std::string& name) {
    std::string raw = raw_path(session_id, index);
    std::string zst = zst_path(session_id, index);
    try {
        file_io::ensure_dir(session_dir(session_id));

        // Incompressible payloads stay raw even when compression is on
        std::vector<u8> packed;
        if (compress_staging_ && len > 0 && compress::should_compress(name)) {
            packed = compress::compress_to_vec(data, len);
            if (packed.size() >= len) packed.clear();
        }

        std::error_code ec;
        if (!packed.empty()) {
            file_io::write_file_atomic(zst, packed.data(), packed.size());
            fs::remove(raw, ec);
        } else {
            file_io::write_file_atomic(raw, data, len);
            fs::remove(zst, ec);
        }
        if (ec) {
            throw std::runtime_error("Cannot remove stale chunk encoding: " + ec.message());
        }
    } catch (const std::runtime_error& e) {
        throw io_failure("Chunk " + std::to_string(index) + " of " + session_id +
                         " not stored: " + e.what());
    }
    LOG_DEBUG("Stored chunk " + std::to_string(index) + " of " + session_id +
              " (" + utils::format_bytes(len) + ")");
}

std::vector<u8> ChunkStore::get(const std::string& session_id, i64 index) const {
    std::string raw = raw_path(session_id, index);
    std::string zst = zst_path(session_id, index);

    std::error_code ec;
    bool have_raw = fs::is_regular_file(raw, ec);
    bool have_zst = !have_raw && fs::is_regular_file(zst, ec);
    if (!have_raw && !have_zst) {
        throw not_found("Chunk " + std::to_string(index) + " of " + session_id + " is missing");
    }

    try {
        if (have_raw) return file_io::read_file(raw);
        file_io::MmapReader reader(zst);
        if (reader.size() == 0) {
            throw std::runtime_error("empty zstd chunk file");
        }
        return compress::decompress_to_vec(reader.data(), (size_t)reader.size());
    } catch (const std::runtime_error& e) {
        throw io_failure("Chunk " + std::to_string(index) + " of " + session_id +
                         " unreadable: " + e.what());
    }
}

bool ChunkStore::has(const std::string& session_id, i64 index) const {
    std::error_code ec;
    return fs::is_regular_file(raw_path(session_id, index), ec) ||
           fs::is_regular_file(zst_path(session_id, index), ec);
}

void ChunkStore::purge(const std::string& session_id) {
    if (!utils::is_token(session_id)) return;
    std::error_code ec;
    fs::remove_all(session_dir(session_id), ec);
    if (ec) {
        LOG_WARN("Cannot purge staging for " + session_id + ": " + ec.message());
    }
}

std::vector<std::string> ChunkStore::list_sessions() const {
    std::vector<std::string> out;
    std::error_code ec;
    for (fs::directory_iterator it(staging_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code ec2;
        if (!it->is_directory(ec2)) continue;
        std::string name = it->path().filename().string();
        if (utils::is_token(name)) out.push_back(name);
    }
    return out;
}
