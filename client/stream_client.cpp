// ============================================================
// stream_client.cpp -- StreamClient implementation
// ============================================================

#include "stream_client.hpp"
#include "../common/protocol_io.hpp"
#include "../common/compress.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"

using proto::PayloadBuilder;
using proto::PayloadReader;

static void put_id_req(PayloadBuilder& b, const std::string& id) {
    IdReq req{};
    req.id_len = (u16)id.size();
    proto::encode_id_req(req);
    b.put(req);
    b.put_string(id);
}

static hash::Hash128 read_digest(const u8 raw[16]) {
    hash::Hash128 h;
    std::memcpy(h.data(), raw, 16);
    return h;
}

void StreamClient::connect(const std::string& ip, u16 port) {
    TcpSocket s;
    s.connect(ip, port);
    sock_ = std::move(s);
}

FrameHeader StreamClient::call(MsgType type, const std::vector<u8>& req,
                               MsgType expect, std::vector<u8>& reply) {
    if (!sock_.is_valid()) {
        throw std::runtime_error("Not connected");
    }
    sock_.write_frame(type, 0, req.empty() ? nullptr : req.data(), (u32)req.size());

    FrameHeader hdr{};
    if (!sock_.read_frame(hdr, reply)) {
        sock_.close();
        throw std::runtime_error("Connection closed by server");
    }

    if (static_cast<MsgType>(hdr.msg_type) == MsgType::MT_ERROR_MSG) {
        PayloadReader rd(reply);
        ErrorMsg em{};
        rd.get(em);
        proto::decode_error_msg(em);
        std::string msg = rd.get_string(em.msg_len);
        switch (static_cast<ErrorKind>(em.error_code)) {
            case ErrorKind::INVALID_ARGUMENT:
            case ErrorKind::NOT_FOUND:
            case ErrorKind::IO_FAILURE:
                throw StoreError(static_cast<ErrorKind>(em.error_code), msg);
        }
        throw proto::ProtocolError("Unknown error code " + std::to_string(em.error_code) + ": " + msg);
    }
    if (static_cast<MsgType>(hdr.msg_type) != expect) {
        throw proto::ProtocolError("Unexpected reply type " + std::to_string(hdr.msg_type));
    }
    return hdr;
}

// ---------------------------------------------------------------
// Staged uploads
// ---------------------------------------------------------------

UploadInitReply StreamClient::init_upload(const std::string& filename, u64 total_size,
                                          u32 total_chunks, const std::string& mime_type) {
    UploadInitReq req{};
    req.total_size   = total_size;
    req.total_chunks = total_chunks;
    req.name_len     = (u16)filename.size();
    req.mime_len     = (u16)mime_type.size();
    proto::encode_upload_init_req(req);

    PayloadBuilder b;
    b.put(req);
    b.put_string(filename);
    b.put_string(mime_type);

    std::vector<u8> reply;
    call(MsgType::MT_UPLOAD_INIT_REQ, b.data(), MsgType::MT_UPLOAD_INIT_RESP, reply);

    PayloadReader rd(reply);
    UploadInitResp resp{};
    rd.get(resp);
    proto::decode_upload_init_resp(resp);

    UploadInitReply out;
    out.session_id    = rd.get_string(resp.id_len);
    out.artifact_name = rd.get_string(resp.artifact_len);
    out.complete      = resp.complete != 0;
    out.digest        = read_digest(resp.xxh3_128);
    return out;
}

UploadStatusReply StreamClient::upload_status(const std::string& session_id) {
    PayloadBuilder b;
    put_id_req(b, session_id);

    std::vector<u8> reply;
    call(MsgType::MT_UPLOAD_STATUS_REQ, b.data(), MsgType::MT_UPLOAD_STATUS_RESP, reply);

    PayloadReader rd(reply);
    UploadStatusResp resp{};
    rd.get(resp);
    proto::decode_upload_status_resp(resp);

    UploadStatusReply out;
    out.total_chunks = resp.total_chunks;
    out.complete     = resp.complete != 0;
    out.received.reserve(resp.received_count);
    for (u32 i = 0; i < resp.received_count; ++i) {
        u64 be;
        rd.get(be);
        out.received.push_back(proto::ntoh64(be));
    }
    return out;
}

UploadChunkReply StreamClient::upload_chunk(const std::string& session_id, i64 index,
                                            const u8* data, u32 len) {
    UploadChunkReq req{};
    req.index    = index;
    req.data_len = data ? len : 0;
    req.xxh3_32  = data ? hash::xxh3_32(data, len) : 0;
    req.id_len   = (u16)session_id.size();
    req.has_data = data ? 1 : 0;
    proto::encode_upload_chunk_req(req);

    PayloadBuilder b;
    b.put(req);
    b.put_string(session_id);
    if (data) b.put_bytes(data, len);

    std::vector<u8> reply;
    call(MsgType::MT_UPLOAD_CHUNK_REQ, b.data(), MsgType::MT_UPLOAD_CHUNK_RESP, reply);

    PayloadReader rd(reply);
    UploadChunkResp resp{};
    rd.get(resp);
    proto::decode_upload_chunk_resp(resp);

    UploadChunkReply out;
    out.index         = resp.index;
    out.received      = resp.received;
    out.total_chunks  = resp.total_chunks;
    out.complete      = resp.complete != 0;
    out.artifact_size = resp.artifact_size;
    out.digest        = read_digest(resp.xxh3_128);
    out.artifact_name = rd.get_string(resp.artifact_len);
    return out;
}

// ---------------------------------------------------------------
// Live capture
// ---------------------------------------------------------------

StreamInitReply StreamClient::stream_init(const std::string& filename, const std::string& mime_type) {
    StreamInitReq req{};
    req.name_len = (u16)filename.size();
    req.mime_len = (u16)mime_type.size();
    proto::encode_stream_init_req(req);

    PayloadBuilder b;
    b.put(req);
    b.put_string(filename);
    b.put_string(mime_type);

    std::vector<u8> reply;
    call(MsgType::MT_STREAM_INIT_REQ, b.data(), MsgType::MT_STREAM_INIT_RESP, reply);

    PayloadReader rd(reply);
    StreamInitResp resp{};
    rd.get(resp);
    proto::decode_stream_init_resp(resp);

    StreamInitReply out;
    out.stream_id     = rd.get_string(resp.id_len);
    out.artifact_name = rd.get_string(resp.artifact_len);
    return out;
}

StreamChunkReply StreamClient::stream_chunk(const std::string& stream_id, const u8* data, u32 len) {
    StreamChunkReq req{};
    req.data_len = data ? len : 0;
    req.xxh3_32  = data ? hash::xxh3_32(data, len) : 0;
    req.id_len   = (u16)stream_id.size();
    req.has_data = data ? 1 : 0;
    proto::encode_stream_chunk_req(req);

    PayloadBuilder b;
    b.put(req);
    b.put_string(stream_id);
    if (data) b.put_bytes(data, len);

    std::vector<u8> reply;
    call(MsgType::MT_STREAM_CHUNK_REQ, b.data(), MsgType::MT_STREAM_CHUNK_RESP, reply);

    PayloadReader rd(reply);
    StreamChunkResp resp{};
    rd.get(resp);
    proto::decode_stream_chunk_resp(resp);
    return StreamChunkReply{resp.chunk_count, resp.bytes_written};
}

StreamFinishReply StreamClient::stream_finish(const std::string& stream_id) {
    PayloadBuilder b;
    put_id_req(b, stream_id);

    std::vector<u8> reply;
    call(MsgType::MT_STREAM_FINISH_REQ, b.data(), MsgType::MT_STREAM_FINISH_RESP, reply);

    PayloadReader rd(reply);
    StreamFinishResp resp{};
    rd.get(resp);
    proto::decode_stream_finish_resp(resp);

    StreamFinishReply out;
    out.bytes_written = resp.bytes_written;
    out.chunk_count   = resp.chunk_count;
    out.artifact_name = rd.get_string(resp.artifact_len);
    return out;
}

// ---------------------------------------------------------------
// Catalog / misc
// ---------------------------------------------------------------

std::vector<ArtifactEntry> StreamClient::list() {
    std::vector<u8> reply;
    FrameHeader hdr = call(MsgType::MT_LIST_REQ, {}, MsgType::MT_LIST_RESP, reply);
    if (hdr.flags & FLAG_COMPRESSED) {
        reply = compress::decompress_to_vec(reply.data(), reply.size());
    }

    PayloadReader rd(reply);
    ListRespHdr lh{};
    rd.get(lh);
    proto::decode_list_resp_hdr(lh);

    std::vector<ArtifactEntry> out;
    out.reserve(lh.count);
    for (u32 i = 0; i < lh.count; ++i) {
        ArtifactEntryHdr e{};
        rd.get(e);
        proto::decode_artifact_entry_hdr(e);
        ArtifactEntry a;
        a.size_bytes = e.size_bytes;
        a.mtime_ns   = e.mtime_ns;
        a.name       = rd.get_string(e.name_len);
        out.push_back(std::move(a));
    }
    return out;
}

void StreamClient::ping() {
    std::vector<u8> reply;
    call(MsgType::MT_PING, {}, MsgType::MT_PONG, reply);
}
