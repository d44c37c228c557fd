// ============================================================
// client_app.cpp -- StreamSaver client implementation
// ============================================================

#include "client_app.hpp"
#include "../common/protocol_io.hpp"
#include "../common/errors.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>
#include <system_error>

ClientApp::ClientApp(ClientOptions opts)
    : opts_(std::move(opts))
{}

u32 ClientApp::chunk_count(u64 size, u32 chunk_size) {
    if (chunk_size == 0) return 0;
    return (u32)((size + chunk_size - 1) / chunk_size);
}

std::string ClientApp::guess_mime(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    for (auto& c : ext) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }
    if (ext == ".webm") return "video/webm";
    if (ext == ".mp4" || ext == ".m4v") return "video/mp4";
    if (ext == ".mkv") return "video/x-matroska";
    if (ext == ".mov") return "video/quicktime";
    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".ogg" || ext == ".opus") return "audio/ogg";
    if (ext == ".wav") return "audio/wav";
    return "application/octet-stream";
}

// ---------------------------------------------------------------
// connect_with_retry
// ---------------------------------------------------------------

bool ClientApp::connect_with_retry() {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() +
                    std::chrono::seconds(opts_.retry_secs > 0 ? opts_.retry_secs : 1);

    int delay_ms = 500;
    const int max_delay_ms = 8000;

    while (!stop_.load()) {
        try {
            client_.connect(opts_.server_ip, opts_.server_port);
            return true;
        } catch (const std::exception& e) {
            if (clock::now() >= deadline) {
                LOG_ERROR("connect_with_retry: timed out (" + std::string(e.what()) + ")");
                return false;
            }
            std::cerr << "[streamsaver] server not ready, retry in "
                      << delay_ms / 1000.0 << "s\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            delay_ms = std::min(delay_ms * 2, max_delay_ms);
        }
    }
    return false;
}

// ---------------------------------------------------------------
// Chunk sending
// ---------------------------------------------------------------

UploadChunkReply ClientApp::send_chunk_with_retry(const file_io::MmapReader& file,
                                                  const std::string& session_id, u32 index) {
    u64 off = (u64)index * opts_.chunk_size;
    u32 len = (u32)std::min<u64>(opts_.chunk_size, file.size() - off);
    const u8* data = reinterpret_cast<const u8*>(file.data()) + off;

    int delay_ms = 250;
    const int max_delay_ms = 8000;
    int attempts = opts_.retries > 0 ? opts_.retries : 1;

    for (int attempt = 1; ; ++attempt) {
        if (stop_.load()) throw std::runtime_error("Interrupted");
        try {
            if (!client_.connected() && !connect_with_retry()) {
                throw std::runtime_error("Cannot reach server");
            }
            return client_.upload_chunk(session_id, (i64)index, data, len);
        } catch (const StoreError& e) {
            // The session is gone; retrying cannot help
            if (e.kind() == ErrorKind::NOT_FOUND || attempt >= attempts) throw;
            LOG_WARN("Chunk " + std::to_string(index) + " rejected (" +
                     error_kind_str(e.kind()) + ": " + e.what() + "), attempt " +
                     std::to_string(attempt) + "/" + std::to_string(attempts));
        } catch (const proto::ProtocolError&) {
            throw;
        } catch (const std::runtime_error& e) {
            client_.close();
            if (attempt >= attempts) throw;
            LOG_WARN("Chunk " + std::to_string(index) + " transport error (" + e.what() +
                     "), attempt " + std::to_string(attempt) + "/" + std::to_string(attempts));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        delay_ms = std::min(delay_ms * 2, max_delay_ms);
    }
}

int ClientApp::send_chunks(const file_io::MmapReader& file, const std::string& session_id,
                           const std::vector<u32>& indices) {
    size_t done = 0;
    u64 last_bucket = 0;
    try {
        for (u32 idx : indices) {
            UploadChunkReply r = send_chunk_with_retry(file, session_id, idx);
            ++done;

            u64 bucket = (u64)done * 20 / indices.size();
            if (bucket != last_bucket) {
                last_bucket = bucket;
                LOG_INFO("Uploaded " + std::to_string(r.received) + "/" +
                         std::to_string(r.total_chunks) + " chunks (" +
                         utils::format_percent(r.received, r.total_chunks) + ")");
            }

            if (r.complete) {
                clear_state();
                return report_complete(file, r.artifact_name, r.artifact_size, r.digest);
            }
        }
    } catch (const StoreError& e) {
        LOG_ERROR(std::string("Upload failed: ") + error_kind_str(e.kind()) + ": " + e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        LOG_ERROR(std::string("Upload failed: ") + e.what());
        LOG_INFO("Run 'resume' to send the remaining chunks of " + session_id);
        return 1;
    }

    LOG_ERROR("All chunks sent but the server did not report completion; "
              "run 'status " + session_id + "'");
    return 1;
}

int ClientApp::report_complete(const file_io::MmapReader& file, const std::string& artifact,
                               u64 artifact_size, const hash::Hash128& digest) {
    hash::Hash128 local = hash::xxh3_128(file.data(), (size_t)file.size());
    if (local != digest || artifact_size != file.size()) {
        LOG_ERROR("Artifact " + artifact + " does not match the local file (xxh3 " +
                  hash::to_hex(digest) + " vs " + hash::to_hex(local) + ")");
        return 1;
    }
    std::cout << "Upload complete: " << artifact << " ("
              << utils::format_bytes(artifact_size) << ", xxh3 " << hash::to_hex(digest) << ")\n";
    return 0;
}

// ---------------------------------------------------------------
// Commands
// ---------------------------------------------------------------

int ClientApp::upload(const std::string& path) {
    file_io::MmapReader file(path);
    u32 n = chunk_count(file.size(), opts_.chunk_size);
    std::string name = fs::path(path).filename().string();

    if (!connect_with_retry()) {
        LOG_ERROR("Failed to connect to server");
        return 1;
    }

    UploadInitReply init = client_.init_upload(name, file.size(), n, guess_mime(path));
    LOG_INFO("Session " + init.session_id + ": " + name + " (" +
             utils::format_bytes(file.size()) + ", " + std::to_string(n) + " chunks)");
    if (init.complete) {
        return report_complete(file, init.artifact_name, 0, init.digest);
    }

    save_state(init.session_id, path);

    std::vector<u32> all(n);
    for (u32 i = 0; i < n; ++i) all[i] = i;
    return send_chunks(file, init.session_id, all);
}

int ClientApp::resume(const std::string& path, const std::string& session_id) {
    std::string id = session_id;
    if (id.empty()) {
        std::string saved_path;
        if (!load_state(id, saved_path)) {
            LOG_ERROR("No session id given and no " + opts_.state_file + " found");
            return 1;
        }
        if (saved_path != path) {
            LOG_WARN("Last upload was " + saved_path + ", resuming it with " + path);
        }
    }

    file_io::MmapReader file(path);
    if (!connect_with_retry()) {
        LOG_ERROR("Failed to connect to server");
        return 1;
    }

    UploadStatusReply st;
    try {
        st = client_.upload_status(id);
    } catch (const StoreError& e) {
        LOG_ERROR("Session " + id + ": " + error_kind_str(e.kind()) + ": " + e.what());
        if (e.kind() == ErrorKind::NOT_FOUND) clear_state();
        return 1;
    }

    u32 n = chunk_count(file.size(), opts_.chunk_size);
    if (n != st.total_chunks) {
        LOG_ERROR("Session expects " + std::to_string(st.total_chunks) + " chunks, " + path +
                  " splits into " + std::to_string(n) + " (check --chunk-kb)");
        return 1;
    }

    std::vector<u32> missing;
    size_t j = 0;
    for (u32 i = 0; i < n; ++i) {
        while (j < st.received.size() && st.received[j] < i) ++j;
        if (j < st.received.size() && st.received[j] == i) continue;
        missing.push_back(i);
    }
    LOG_INFO("Session " + id + ": " + std::to_string(n - missing.size()) + "/" +
             std::to_string(n) + " chunks on server, sending " + std::to_string(missing.size()));

    // Everything arrived but the merge did not go through: any chunk retries it
    if (missing.empty() && n > 0) missing.push_back(0);
    return send_chunks(file, id, missing);
}

int ClientApp::live(const std::string& path) {
    file_io::MmapReader file(path);
    std::string name = fs::path(path).filename().string();

    if (!connect_with_retry()) {
        LOG_ERROR("Failed to connect to server");
        return 1;
    }

    StreamInitReply init = client_.stream_init(name, guess_mime(path));
    LOG_INFO("Live stream " + init.stream_id + " -> " + init.artifact_name);

    // No per-chunk retry here: an append whose reply was lost may
    // already be in the artifact, and the live path never reorders
    int rc = 0;
    u32 n = chunk_count(file.size(), opts_.chunk_size);
    try {
        for (u32 i = 0; i < n && !stop_.load(); ++i) {
            u64 off = (u64)i * opts_.chunk_size;
            u32 len = (u32)std::min<u64>(opts_.chunk_size, file.size() - off);
            StreamChunkReply r = client_.stream_chunk(
                init.stream_id, reinterpret_cast<const u8*>(file.data()) + off, len);
            LOG_DEBUG("Appended chunk " + std::to_string(r.chunk_count) + " (" +
                      utils::format_bytes(r.bytes_written) + " total)");
        }
    } catch (const StoreError& e) {
        LOG_ERROR(std::string("Live append failed: ") + error_kind_str(e.kind()) + ": " + e.what());
        rc = 1;
    }

    StreamFinishReply fin = client_.stream_finish(init.stream_id);
    std::cout << "Live stream finished: " << fin.artifact_name << " ("
              << fin.chunk_count << " chunks, " << utils::format_bytes(fin.bytes_written) << ")\n";
    return rc;
}

int ClientApp::status(const std::string& session_id) {
    if (!connect_with_retry()) {
        LOG_ERROR("Failed to connect to server");
        return 1;
    }
    UploadStatusReply st;
    try {
        st = client_.upload_status(session_id);
    } catch (const StoreError& e) {
        LOG_ERROR("Session " + session_id + ": " + error_kind_str(e.kind()) + ": " + e.what());
        return 1;
    }

    std::cout << "Session:  " << session_id << "\n"
              << "Received: " << st.received.size() << "/" << st.total_chunks
              << " (" << utils::format_percent(st.received.size(), st.total_chunks) << ")\n"
              << "Complete: " << (st.complete ? "yes" : "no") << "\n";
    if (!st.received.empty()) {
        std::cout << "Chunks:  ";
        for (u64 idx : st.received) std::cout << ' ' << idx;
        std::cout << "\n";
    }
    return 0;
}

int ClientApp::list() {
    if (!connect_with_retry()) {
        LOG_ERROR("Failed to connect to server");
        return 1;
    }
    std::vector<ArtifactEntry> items = client_.list();
    if (items.empty()) {
        std::cout << "(no artifacts)\n";
        return 0;
    }
    for (const auto& a : items) {
        std::cout << utils::format_iso8601(a.mtime_ns) << "  "
                  << std::setw(12) << utils::format_bytes(a.size_bytes) << "  "
                  << a.name << "\n";
    }
    return 0;
}

// ---------------------------------------------------------------
// Last-upload state file: "<session_id>\t<path>\n"
// ---------------------------------------------------------------

void ClientApp::save_state(const std::string& session_id, const std::string& path) {
    std::string line = session_id + "\t" + path + "\n";
    try {
        file_io::write_file_atomic(opts_.state_file, line.data(), line.size());
    } catch (const std::runtime_error& e) {
        LOG_WARN(std::string("Cannot save ") + opts_.state_file + ": " + e.what());
    }
}

bool ClientApp::load_state(std::string& session_id, std::string& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(opts_.state_file, ec)) return false;

    std::vector<u8> raw = file_io::read_file(opts_.state_file);
    std::string text(raw.begin(), raw.end());
    size_t tab = text.find('\t');
    if (tab == std::string::npos) return false;
    size_t nl = text.find('\n', tab);
    session_id = text.substr(0, tab);
    path       = text.substr(tab + 1, nl == std::string::npos ? std::string::npos : nl - tab - 1);
    return utils::is_token(session_id);
}

void ClientApp::clear_state() {
    std::error_code ec;
    fs::remove(opts_.state_file, ec);
}
