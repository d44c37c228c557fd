#pragma once

// ============================================================
// stream_client.hpp -- Blocking request/response client for
//   one StreamSaver connection.
//
// Errors:
//   server MT_ERROR_MSG      -> StoreError with the server's kind
//   malformed reply          -> proto::ProtocolError
//   transport failure/close  -> std::runtime_error
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/hash.hpp"
#include <string>
#include <vector>

struct UploadInitReply {
    std::string   session_id;
    bool          complete{false};
    std::string   artifact_name;
    hash::Hash128 digest{};
};

struct UploadStatusReply {
    u32              total_chunks{0};
    std::vector<u64> received;
    bool             complete{false};
};

struct UploadChunkReply {
    i64           index{0};
    u32           received{0};
    u32           total_chunks{0};
    bool          complete{false};
    std::string   artifact_name;
    u64           artifact_size{0};
    hash::Hash128 digest{};
};

struct StreamInitReply {
    std::string stream_id;
    std::string artifact_name;
};

struct StreamChunkReply {
    u64 chunk_count{0};
    u64 bytes_written{0};
};

struct StreamFinishReply {
    std::string artifact_name;
    u64         bytes_written{0};
    u64         chunk_count{0};
};

struct ArtifactEntry {
    std::string name;
    u64         size_bytes{0};
    u64         mtime_ns{0};
};

class StreamClient {
public:
    StreamClient() = default;

    void connect(const std::string& ip, u16 port);
    bool connected() const { return sock_.is_valid(); }
    void close() { sock_.close(); }

    UploadInitReply   init_upload(const std::string& filename, u64 total_size,
                                  u32 total_chunks, const std::string& mime_type);
    UploadStatusReply upload_status(const std::string& session_id);

    // data == nullptr sends a request without a payload part
    UploadChunkReply  upload_chunk(const std::string& session_id, i64 index,
                                   const u8* data, u32 len);

    StreamInitReply   stream_init(const std::string& filename, const std::string& mime_type);
    StreamChunkReply  stream_chunk(const std::string& stream_id, const u8* data, u32 len);
    StreamFinishReply stream_finish(const std::string& stream_id);

    std::vector<ArtifactEntry> list();

    // Round trip with no server-side effect
    void ping();

private:
    // Send one request and wait for its reply; throws on MT_ERROR_MSG
    // or if the reply type is not 'expect'
    FrameHeader call(MsgType type, const std::vector<u8>& req,
                     MsgType expect, std::vector<u8>& reply);

    TcpSocket sock_{SSV_INVALID_SOCKET};
};
