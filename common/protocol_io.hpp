#pragma once

// ============================================================
// protocol_io.hpp -- Payload encode/decode with byte-order handling
// ============================================================

#include "protocol.hpp"
#include <vector>
#include <string>
#include <stdexcept>
#include <type_traits>

// Linux: htobe16/32/64 and be16/32/64toh live in <endian.h>
#include <endian.h>

namespace proto {

// Raised for malformed or truncated payloads
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) { return htobe16(v); }
inline u32 hton32(u32 v) { return htobe32(v); }
inline u64 hton64(u64 v) { return htobe64(v); }
inline u16 ntoh16(u16 v) { return be16toh(v); }
inline u32 ntoh32(u32 v) { return be32toh(v); }
inline u64 ntoh64(u64 v) { return be64toh(v); }

inline i64 hton_i64(i64 v) { return (i64)htobe64((u64)v); }
inline i64 ntoh_i64(i64 v) { return (i64)be64toh((u64)v); }

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Encode individual struct fields (in-place, host<->network) ----

inline void encode_id_req(IdReq& r) { r.id_len = hton16(r.id_len); }
inline void decode_id_req(IdReq& r) { r.id_len = ntoh16(r.id_len); }

inline void encode_upload_init_req(UploadInitReq& r) {
    r.total_size   = hton64(r.total_size);
    r.total_chunks = hton32(r.total_chunks);
    r.name_len     = hton16(r.name_len);
    r.mime_len     = hton16(r.mime_len);
}

inline void decode_upload_init_req(UploadInitReq& r) {
    r.total_size   = ntoh64(r.total_size);
    r.total_chunks = ntoh32(r.total_chunks);
    r.name_len     = ntoh16(r.name_len);
    r.mime_len     = ntoh16(r.mime_len);
}

inline void encode_upload_init_resp(UploadInitResp& r) {
    r.id_len       = hton16(r.id_len);
    r.artifact_len = hton16(r.artifact_len);
}

inline void decode_upload_init_resp(UploadInitResp& r) {
    r.id_len       = ntoh16(r.id_len);
    r.artifact_len = ntoh16(r.artifact_len);
}

inline void encode_upload_status_resp(UploadStatusResp& r) {
    r.total_chunks   = hton32(r.total_chunks);
    r.received_count = hton32(r.received_count);
}

inline void decode_upload_status_resp(UploadStatusResp& r) {
    r.total_chunks   = ntoh32(r.total_chunks);
    r.received_count = ntoh32(r.received_count);
}

inline void encode_upload_chunk_req(UploadChunkReq& r) {
    r.index    = hton_i64(r.index);
    r.data_len = hton32(r.data_len);
    r.xxh3_32  = hton32(r.xxh3_32);
    r.id_len   = hton16(r.id_len);
}

inline void decode_upload_chunk_req(UploadChunkReq& r) {
    r.index    = ntoh_i64(r.index);
    r.data_len = ntoh32(r.data_len);
    r.xxh3_32  = ntoh32(r.xxh3_32);
    r.id_len   = ntoh16(r.id_len);
}

inline void encode_upload_chunk_resp(UploadChunkResp& r) {
    r.index         = hton_i64(r.index);
    r.received      = hton32(r.received);
    r.total_chunks  = hton32(r.total_chunks);
    r.artifact_size = hton64(r.artifact_size);
    r.artifact_len  = hton16(r.artifact_len);
}

inline void decode_upload_chunk_resp(UploadChunkResp& r) {
    r.index         = ntoh_i64(r.index);
    r.received      = ntoh32(r.received);
    r.total_chunks  = ntoh32(r.total_chunks);
    r.artifact_size = ntoh64(r.artifact_size);
    r.artifact_len  = ntoh16(r.artifact_len);
}

inline void encode_stream_init_req(StreamInitReq& r) {
    r.name_len = hton16(r.name_len);
    r.mime_len = hton16(r.mime_len);
}

inline void decode_stream_init_req(StreamInitReq& r) {
    r.name_len = ntoh16(r.name_len);
    r.mime_len = ntoh16(r.mime_len);
}

inline void encode_stream_init_resp(StreamInitResp& r) {
    r.id_len       = hton16(r.id_len);
    r.artifact_len = hton16(r.artifact_len);
}

inline void decode_stream_init_resp(StreamInitResp& r) {
    r.id_len       = ntoh16(r.id_len);
    r.artifact_len = ntoh16(r.artifact_len);
}

inline void encode_stream_chunk_req(StreamChunkReq& r) {
    r.data_len = hton32(r.data_len);
    r.xxh3_32  = hton32(r.xxh3_32);
    r.id_len   = hton16(r.id_len);
}

inline void decode_stream_chunk_req(StreamChunkReq& r) {
    r.data_len = ntoh32(r.data_len);
    r.xxh3_32  = ntoh32(r.xxh3_32);
    r.id_len   = ntoh16(r.id_len);
}

inline void encode_stream_chunk_resp(StreamChunkResp& r) {
    r.chunk_count   = hton64(r.chunk_count);
    r.bytes_written = hton64(r.bytes_written);
}

inline void decode_stream_chunk_resp(StreamChunkResp& r) {
    r.chunk_count   = ntoh64(r.chunk_count);
    r.bytes_written = ntoh64(r.bytes_written);
}

inline void encode_stream_finish_resp(StreamFinishResp& r) {
    r.bytes_written = hton64(r.bytes_written);
    r.chunk_count   = hton64(r.chunk_count);
    r.artifact_len  = hton16(r.artifact_len);
}

inline void decode_stream_finish_resp(StreamFinishResp& r) {
    r.bytes_written = ntoh64(r.bytes_written);
    r.chunk_count   = ntoh64(r.chunk_count);
    r.artifact_len  = ntoh16(r.artifact_len);
}

inline void encode_list_resp_hdr(ListRespHdr& h) { h.count = hton32(h.count); }
inline void decode_list_resp_hdr(ListRespHdr& h) { h.count = ntoh32(h.count); }

inline void encode_artifact_entry_hdr(ArtifactEntryHdr& e) {
    e.size_bytes = hton64(e.size_bytes);
    e.mtime_ns   = hton64(e.mtime_ns);
    e.name_len   = hton16(e.name_len);
}

inline void decode_artifact_entry_hdr(ArtifactEntryHdr& e) {
    e.size_bytes = ntoh64(e.size_bytes);
    e.mtime_ns   = ntoh64(e.mtime_ns);
    e.name_len   = ntoh16(e.name_len);
}

inline void encode_error_msg(ErrorMsg& m) {
    m.error_code = hton32(m.error_code);
    m.msg_len    = hton16(m.msg_len);
}

inline void decode_error_msg(ErrorMsg& m) {
    m.error_code = ntoh32(m.error_code);
    m.msg_len    = ntoh16(m.msg_len);
}

// ---- Payload assembly ----

// Appends already-encoded structs and raw bytes into one payload buffer
class PayloadBuilder {
public:
    template<typename T>
    void put(const T& s) {
        static_assert(std::is_trivially_copyable<T>::value, "wire structs only");
        const u8* p = reinterpret_cast<const u8*>(&s);
        buf_.insert(buf_.end(), p, p + sizeof(T));
    }

    void put_bytes(const void* data, size_t len) {
        if (len == 0) return;
        const u8* p = static_cast<const u8*>(data);
        buf_.insert(buf_.end(), p, p + len);
    }

    void put_string(const std::string& s) { put_bytes(s.data(), s.size()); }

    std::vector<u8>& data() { return buf_; }
    u32 size() const { return (u32)buf_.size(); }

private:
    std::vector<u8> buf_;
};

// Bounds-checked cursor over a received payload
class PayloadReader {
public:
    PayloadReader(const u8* data, size_t len) : data_(data), len_(len) {}
    explicit PayloadReader(const std::vector<u8>& buf) : data_(buf.data()), len_(buf.size()) {}

    // Copies the next sizeof(T) bytes into s (still in network order)
    template<typename T>
    void get(T& s) {
        static_assert(std::is_trivially_copyable<T>::value, "wire structs only");
        need(sizeof(T));
        std::memcpy(&s, data_ + pos_, sizeof(T));
        pos_ += sizeof(T);
    }

    std::string get_string(size_t len) {
        need(len);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len;
        return s;
    }

    // Pointer to the next len bytes without copying
    const u8* get_bytes(size_t len) {
        need(len);
        const u8* p = data_ + pos_;
        pos_ += len;
        return p;
    }

    size_t remaining() const { return len_ - pos_; }

private:
    void need(size_t n) const {
        if (len_ - pos_ < n) {
            throw ProtocolError("Truncated payload: need " + std::to_string(n) +
                                " bytes, have " + std::to_string(len_ - pos_));
        }
    }

    const u8* data_;
    size_t    len_;
    size_t    pos_{0};
};

} // namespace proto
