// ============================================================
// merge_engine.cpp -- MergeEngine implementation
// ============================================================

#include "merge_engine.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cstdio>
#include <system_error>

MergeEngine::MergeEngine(ChunkStore& store, ArtifactCatalog& catalog)
    : store_(store)
    , catalog_(catalog)
{}

MergeOutcome MergeEngine::merge(const UploadSession& session) {
    MergeOutcome out;
    std::string tmp = (fs::path(store_.session_dir(session.id)) / "merge.tmp").string();

    file_io::FileWriter writer;
    hash::StreamHasher128 hasher;
    try {
        file_io::ensure_dir(store_.session_dir(session.id));
        writer.open(tmp, file_io::FileWriter::Mode::TRUNCATE);

        for (u64 i = 0; i < session.total_chunks; ++i) {
            std::vector<u8> chunk = store_.get(session.id, (i64)i);
            if (!chunk.empty()) {
                writer.write(chunk.data(), chunk.size());
                hasher.update(chunk.data(), chunk.size());
            }
        }
        u64 written = writer.bytes_written();
        writer.close();

        // Name is taken only once the bytes are durable
        std::string name = catalog_.allocate_name(session.original_name);
        std::string dest = catalog_.path_for(name);
        if (::rename(tmp.c_str(), dest.c_str()) != 0) {
            throw std::runtime_error("rename " + tmp + " -> " + dest + " failed: " + errno_str(errno));
        }

        out.status        = MergeOutcome::Status::MERGED;
        out.artifact_name = name;
        out.artifact_path = dest;
        out.bytes_written = written;
        out.digest        = hasher.digest();
    } catch (const StoreError& e) {
        out.error_kind = e.kind();
        out.message    = e.what();
    } catch (const std::runtime_error& e) {
        out.error_kind = ErrorKind::IO_FAILURE;
        out.message    = e.what();
    }

    if (!out.merged()) {
        writer.abandon();
        std::error_code ec;
        fs::remove(tmp, ec);
        Logger::get().merge_error("Session " + session.id + " (" + session.original_name + "): " +
                                  error_kind_str(out.error_kind) + ": " + out.message);
        return out;
    }

    try {
        file_io::sync_dir(catalog_.output_dir());
    } catch (const std::runtime_error& e) {
        // The artifact is complete; only the directory entry may lag
        LOG_WARN(std::string("Output area sync failed: ") + e.what());
    }

    LOG_INFO("Merged " + session.id + " -> " + out.artifact_name + " (" +
             utils::format_bytes(out.bytes_written) + ", xxh3 " + hash::to_hex(out.digest) + ")");
    return out;
}
