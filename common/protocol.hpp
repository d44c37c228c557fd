#pragma once

// ============================================================
// protocol.hpp -- Wire protocol definitions for StreamSaver
// ============================================================

#include "platform.hpp"
#include <cstring>

// Largest chunk accepted on either path
static constexpr u32 MAX_CHUNK_LEN      = 64u * 1024u * 1024u;
// Chunk data plus headers, ids and names
static constexpr u32 MAX_PAYLOAD_LEN    = MAX_CHUNK_LEN + 64u * 1024u;
static constexpr u32 DEFAULT_CHUNK_SIZE = 4u * 1024u * 1024u;
// Longest file name / mime type accepted in a request
static constexpr u16 MAX_NAME_LEN       = 1024;
// List responses above this size are sent zstd-compressed
static constexpr u32 LIST_COMPRESS_THRESHOLD = 4096;

// ---- Frame flags ----
static constexpr u16 FLAG_COMPRESSED = 0x0001;  // payload is one zstd frame

// ---- Message Types (all prefixed MT_ to avoid macro collisions) ----
enum class MsgType : u16 {
    MT_UPLOAD_INIT_REQ    = 0x0010,
    MT_UPLOAD_INIT_RESP   = 0x0011,
    MT_UPLOAD_STATUS_REQ  = 0x0012,
    MT_UPLOAD_STATUS_RESP = 0x0013,
    MT_UPLOAD_CHUNK_REQ   = 0x0014,
    MT_UPLOAD_CHUNK_RESP  = 0x0015,

    MT_STREAM_INIT_REQ    = 0x0020,
    MT_STREAM_INIT_RESP   = 0x0021,
    MT_STREAM_CHUNK_REQ   = 0x0022,
    MT_STREAM_CHUNK_RESP  = 0x0023,
    MT_STREAM_FINISH_REQ  = 0x0024,
    MT_STREAM_FINISH_RESP = 0x0025,

    MT_LIST_REQ           = 0x0030,
    MT_LIST_RESP          = 0x0031,

    MT_PING               = 0x0070,
    MT_PONG               = 0x0071,
    MT_ERROR_MSG          = 0x00FF,
};

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// ============================================================
// Packed structures (wire format, big-endian)
// Strings and data follow each struct in field order.
// ============================================================
#pragma pack(push, 1)

// IdReq: 8 bytes + id (status, stream finish)
struct IdReq {
    u16 id_len;
    u8  pad[6];
};
static_assert(sizeof(IdReq) == 8, "IdReq size mismatch");

// UploadInitReq: 16 bytes + name + mime
struct UploadInitReq {
    u64 total_size;
    u32 total_chunks;
    u16 name_len;
    u16 mime_len;
};
static_assert(sizeof(UploadInitReq) == 16, "UploadInitReq size mismatch");

// UploadInitResp: 24 bytes + id + artifact name
// complete=1 only for a zero-chunk upload, which is merged immediately.
struct UploadInitResp {
    u16 id_len;
    u16 artifact_len;
    u8  complete;
    u8  pad[3];
    u8  xxh3_128[16];
};
static_assert(sizeof(UploadInitResp) == 24, "UploadInitResp size mismatch");

// UploadStatusResp: 16 bytes + received_count x u64 (ascending)
struct UploadStatusResp {
    u32 total_chunks;
    u32 received_count;
    u8  complete;
    u8  pad[7];
};
static_assert(sizeof(UploadStatusResp) == 16, "UploadStatusResp size mismatch");

// UploadChunkReq: 24 bytes + id + data
// has_data=0 models a request without a payload part.
struct UploadChunkReq {
    i64 index;
    u32 data_len;
    u32 xxh3_32;
    u16 id_len;
    u8  has_data;
    u8  pad[5];
};
static_assert(sizeof(UploadChunkReq) == 24, "UploadChunkReq size mismatch");

// UploadChunkResp: 48 bytes + artifact name (only when complete)
struct UploadChunkResp {
    i64 index;
    u32 received;
    u32 total_chunks;
    u64 artifact_size;
    u8  xxh3_128[16];
    u16 artifact_len;
    u8  complete;
    u8  pad[5];
};
static_assert(sizeof(UploadChunkResp) == 48, "UploadChunkResp size mismatch");

// StreamInitReq: 8 bytes + name + mime (either may be empty -> defaults)
struct StreamInitReq {
    u16 name_len;
    u16 mime_len;
    u8  pad[4];
};
static_assert(sizeof(StreamInitReq) == 8, "StreamInitReq size mismatch");

// StreamInitResp: 8 bytes + id + artifact name
struct StreamInitResp {
    u16 id_len;
    u16 artifact_len;
    u8  pad[4];
};
static_assert(sizeof(StreamInitResp) == 8, "StreamInitResp size mismatch");

// StreamChunkReq: 16 bytes + id + data
struct StreamChunkReq {
    u32 data_len;
    u32 xxh3_32;
    u16 id_len;
    u8  has_data;
    u8  pad[5];
};
static_assert(sizeof(StreamChunkReq) == 16, "StreamChunkReq size mismatch");

// StreamChunkResp: 16 bytes
struct StreamChunkResp {
    u64 chunk_count;
    u64 bytes_written;
};
static_assert(sizeof(StreamChunkResp) == 16, "StreamChunkResp size mismatch");

// StreamFinishResp: 24 bytes + artifact name
struct StreamFinishResp {
    u64 bytes_written;
    u64 chunk_count;
    u16 artifact_len;
    u8  pad[6];
};
static_assert(sizeof(StreamFinishResp) == 24, "StreamFinishResp size mismatch");

// ListRespHdr: 8 bytes, followed by count x (ArtifactEntryHdr + name)
struct ListRespHdr {
    u32 count;
    u8  pad[4];
};
static_assert(sizeof(ListRespHdr) == 8, "ListRespHdr size mismatch");

// ArtifactEntryHdr: 24 bytes + name
struct ArtifactEntryHdr {
    u64 size_bytes;
    u64 mtime_ns;
    u16 name_len;
    u8  pad[6];
};
static_assert(sizeof(ArtifactEntryHdr) == 24, "ArtifactEntryHdr size mismatch");

// ErrorMsg: 8 bytes + message; error_code is an ErrorKind value
struct ErrorMsg {
    u32 error_code;
    u16 msg_len;
    u8  pad[2];
};
static_assert(sizeof(ErrorMsg) == 8, "ErrorMsg size mismatch");

#pragma pack(pop)
