#pragma once

// ============================================================
// live_writer.hpp -- Append-only live capture streams
//   One open append handle per stream, written directly in the
//   output area. Appends are applied in call order; a per-stream
//   lock keeps concurrent appends from interleaving.
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include "artifact_catalog.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <unordered_map>

struct LiveStream {
    std::mutex            mutex;
    file_io::FileWriter   writer;
    std::string           id;
    std::string           artifact_name;
    std::string           mime_type;
    u64                   chunk_count{0};
    u64                   bytes_written{0};
    u64                   started_at_ms{0};
    std::chrono::steady_clock::time_point last_touch{std::chrono::steady_clock::now()};
    bool                  failed{false};  // an append hit an I/O error
    bool                  closed{false};  // finished or expired
};

struct LiveInitResult {
    std::string stream_id;
    std::string artifact_name;
};

struct LiveAppendResult {
    u64 chunk_count{0};
    u64 bytes_written{0};
};

struct LiveFinishResult {
    std::string artifact_name;
    u64         bytes_written{0};
    u64         chunk_count{0};
};

class LiveWriter {
public:
    explicit LiveWriter(ArtifactCatalog& catalog);
    ~LiveWriter();

    // Empty filename -> "live.webm", empty mime -> "video/webm".
    // IO_FAILURE if the artifact cannot be opened.
    LiveInitResult init(const std::string& filename, const std::string& mime_type);

    // data == nullptr -> INVALID_ARGUMENT; unknown stream -> NOT_FOUND;
    // failed stream or write error -> IO_FAILURE
    LiveAppendResult append(const std::string& stream_id, const u8* data, size_t len);

    // fsync + close + forget. NOT_FOUND for unknown streams; IO_FAILURE
    // if the artifact could not be made durable (the stream is forgotten
    // either way).
    LiveFinishResult finish(const std::string& stream_id);

    // Close streams idle longer than max_idle; partial artifacts stay
    std::vector<std::string> expire_idle(std::chrono::steady_clock::duration max_idle);

    size_t size() const;

    LiveWriter(const LiveWriter&) = delete;
    LiveWriter& operator=(const LiveWriter&) = delete;

private:
    std::shared_ptr<LiveStream> find(const std::string& stream_id) const;
    static void close_stream(LiveStream& s);

    ArtifactCatalog& catalog_;

    mutable std::mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<LiveStream>> streams_;
};
