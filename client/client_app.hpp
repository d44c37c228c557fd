#pragma once

// ============================================================
// client_app.hpp -- StreamSaver client commands: resumable
//   upload with per-chunk retry, live streaming, status, list
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/file_io.hpp"
#include "stream_client.hpp"
#include <string>
#include <vector>
#include <atomic>

struct ClientOptions {
    std::string server_ip;
    u16         server_port{9999};
    u32         chunk_size{DEFAULT_CHUNK_SIZE};
    int         retries{5};         // attempts per chunk
    int         retry_secs{30};     // give up connecting after this long
    std::string state_file{".streamsaver_last_upload"};
};

class ClientApp {
public:
    explicit ClientApp(ClientOptions opts);

    // Each command returns 0 on success, nonzero on error
    int upload(const std::string& path);
    int resume(const std::string& path, const std::string& session_id);
    int live(const std::string& path);
    int status(const std::string& session_id);
    int list();

    // Signal stop from a signal handler
    void stop() { stop_.store(true); }

    // ceil(size / chunk_size); 0 for an empty file
    static u32 chunk_count(u64 size, u32 chunk_size);

    // Advisory mime type from the file extension
    static std::string guess_mime(const std::string& path);

private:
    ClientOptions     opts_;
    StreamClient      client_;
    std::atomic<bool> stop_{false};

    // Connect (or reconnect) with exponential back-off
    bool connect_with_retry();

    // Send the given chunk indices; returns 0 once the server reports
    // the upload complete, nonzero on failure
    int send_chunks(const file_io::MmapReader& file, const std::string& session_id,
                    const std::vector<u32>& indices);

    // One chunk with up to opts_.retries attempts
    UploadChunkReply send_chunk_with_retry(const file_io::MmapReader& file,
                                           const std::string& session_id, u32 index);

    // Compare the server's digest against the local file
    int report_complete(const file_io::MmapReader& file, const std::string& artifact,
                        u64 artifact_size, const hash::Hash128& digest);

    void save_state(const std::string& session_id, const std::string& path);
    bool load_state(std::string& session_id, std::string& path) const;
    void clear_state();
};
