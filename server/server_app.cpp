// ============================================================
// server_app.cpp -- StreamSaver server daemon implementation
// ============================================================

#include "server_app.hpp"
#include "../common/protocol_io.hpp"
#include "../common/hash.hpp"
#include "../common/compress.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <chrono>
#include <cstdio>

using proto::PayloadBuilder;
using proto::PayloadReader;

static std::string hex16(u16 v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%04x", (unsigned)v);
    return buf;
}

Reply make_error_reply(ErrorKind kind, const std::string& msg) {
    std::string text = msg.size() > 0xFFFF ? msg.substr(0, 0xFFFF) : msg;
    ErrorMsg em{};
    em.error_code = (u32)kind;
    em.msg_len    = (u16)text.size();
    proto::encode_error_msg(em);

    PayloadBuilder b;
    b.put(em);
    b.put_string(text);

    Reply r;
    r.type    = MsgType::MT_ERROR_MSG;
    r.payload = std::move(b.data());
    return r;
}

// Names and mime types share the same length cap
static std::string read_name(PayloadReader& rd, u16 len) {
    if (len > MAX_NAME_LEN) {
        throw proto::ProtocolError("name too long: " + std::to_string(len));
    }
    return rd.get_string(len);
}

static std::string read_id(PayloadReader& rd, u16 len) {
    if (len > MAX_NAME_LEN) {
        throw proto::ProtocolError("id too long: " + std::to_string(len));
    }
    return rd.get_string(len);
}

// Returns the chunk bytes, or nullptr when the request carries none.
// The checksum is verified before anything touches storage.
static const u8* read_chunk_data(PayloadReader& rd, u8 has_data, u32 data_len, u32 checksum) {
    if (!has_data) return nullptr;
    if (data_len > MAX_CHUNK_LEN) {
        throw invalid_argument("Chunk too large: " + utils::format_bytes(data_len));
    }
    const u8* data = rd.get_bytes(data_len);
    u32 actual = hash::xxh3_32(data, data_len);
    if (actual != checksum) {
        throw invalid_argument("Chunk checksum mismatch");
    }
    return data;
}

// ============================================================
// ServerApp
// ============================================================

ServerApp::ServerApp(ServerConfig config)
    : config_(std::move(config))
    , service_(new UploadService(config_.data_dir, config_.compress_staging))
{}

ServerApp::~ServerApp() {
    stop();
    if (reaper_.joinable()) reaper_.join();
    pool_.reset();
}

void ServerApp::start() {
    if (listening_) return;
    listen_sock_.bind_and_listen(config_.listen_ip, config_.listen_port);
    listening_ = true;
    running_.store(true);
}

u16 ServerApp::port() const {
    return listen_sock_.local_port();
}

int ServerApp::run() {
    start();
    pool_.reset(new ThreadPool((size_t)config_.workers));

    LOG_INFO("StreamSaver server listening on " +
             config_.listen_ip + ":" + std::to_string(port()) +
             "  (data: " + config_.data_dir + ", workers: " + std::to_string(config_.workers) + ")");

    if (config_.session_ttl_s > 0) {
        reaper_ = std::thread([this] { reaper_loop(); });
    }

    accept_loop();

    // Unblock connections that are still waiting for a request
    {
        std::lock_guard<std::mutex> lk(active_mutex_);
        for (TcpSocket* s : active_) s->shutdown();
    }
    pool_.reset();

    reaper_cv_.notify_all();
    if (reaper_.joinable()) reaper_.join();

    LOG_INFO("Server stopped");
    return 0;
}

void ServerApp::stop() {
    if (!running_.exchange(false)) return;
    listen_sock_.shutdown();
    {
        std::lock_guard<std::mutex> lk(active_mutex_);
        for (TcpSocket* s : active_) s->shutdown();
    }
    // Taking the lock orders this wakeup after the reaper's predicate check
    {
        std::lock_guard<std::mutex> lk(reaper_mutex_);
    }
    reaper_cv_.notify_all();
}

// ---------------------------------------------------------------
// accept_loop
//   Pure accept() loop; each socket is handed to the worker pool.
// ---------------------------------------------------------------
void ServerApp::accept_loop() {
    while (running_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept();
            if (!running_.load()) break;
            sock.tune();
            LOG_DEBUG("Accepted connection from " + sock.peer_addr());

            auto conn = std::make_shared<TcpSocket>(std::move(sock));
            pool_->post([this, conn] { serve_connection(*conn); });
        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
        }
    }
}

// ---------------------------------------------------------------
// serve_connection
//   Request/response loop for one client socket.
// ---------------------------------------------------------------
void ServerApp::serve_connection(TcpSocket& sock) {
    {
        std::lock_guard<std::mutex> lk(active_mutex_);
        if (!running_.load()) return;
        active_.insert(&sock);
    }

    std::string peer = sock.peer_addr();
    FrameHeader hdr{};
    std::vector<u8> payload;
    try {
        while (sock.read_frame(hdr, payload)) {
            Reply r = dispatch(hdr, payload);
            sock.write_frame(r.type, r.flags,
                             r.payload.empty() ? nullptr : r.payload.data(),
                             (u32)r.payload.size());
        }
        LOG_DEBUG("Connection closed by " + peer);
    } catch (const std::exception& e) {
        if (running_.load()) {
            LOG_WARN("Connection " + peer + ": " + e.what());
        }
    }

    std::lock_guard<std::mutex> lk(active_mutex_);
    active_.erase(&sock);
}

Reply ServerApp::dispatch(const FrameHeader& hdr, const std::vector<u8>& payload) {
    try {
        if (hdr.flags & FLAG_COMPRESSED) {
            throw proto::ProtocolError("compressed requests are not accepted");
        }
        switch (static_cast<MsgType>(hdr.msg_type)) {
            case MsgType::MT_UPLOAD_INIT_REQ:   return on_upload_init(payload);
            case MsgType::MT_UPLOAD_STATUS_REQ: return on_upload_status(payload);
            case MsgType::MT_UPLOAD_CHUNK_REQ:  return on_upload_chunk(payload);
            case MsgType::MT_STREAM_INIT_REQ:   return on_stream_init(payload);
            case MsgType::MT_STREAM_CHUNK_REQ:  return on_stream_chunk(payload);
            case MsgType::MT_STREAM_FINISH_REQ: return on_stream_finish(payload);
            case MsgType::MT_LIST_REQ:          return on_list();
            case MsgType::MT_PING: {
                Reply r;
                r.type    = MsgType::MT_PONG;
                r.payload = payload;
                return r;
            }
            default:
                throw proto::ProtocolError("Unknown message type " + hex16(hdr.msg_type));
        }
    } catch (const StoreError& e) {
        LOG_DEBUG(std::string("Request ") + hex16(hdr.msg_type) + " rejected: " +
                  error_kind_str(e.kind()) + ": " + e.what());
        return make_error_reply(e.kind(), e.what());
    } catch (const proto::ProtocolError& e) {
        LOG_WARN(std::string("Malformed request ") + hex16(hdr.msg_type) + ": " + e.what());
        return make_error_reply(ErrorKind::INVALID_ARGUMENT, e.what());
    } catch (const std::runtime_error& e) {
        LOG_ERROR(std::string("Request ") + hex16(hdr.msg_type) + " failed: " + e.what());
        return make_error_reply(ErrorKind::IO_FAILURE, e.what());
    }
}

// ---------------------------------------------------------------
// Staged uploads
// ---------------------------------------------------------------

Reply ServerApp::on_upload_init(const std::vector<u8>& payload) {
    PayloadReader rd(payload);
    UploadInitReq req{};
    rd.get(req);
    proto::decode_upload_init_req(req);
    std::string name = read_name(rd, req.name_len);
    std::string mime = read_name(rd, req.mime_len);

    InitUploadResult res = service_->init_upload(name, req.total_size, req.total_chunks, mime);

    UploadInitResp resp{};
    resp.id_len       = (u16)res.session_id.size();
    resp.artifact_len = (u16)res.artifact_name.size();
    resp.complete     = res.complete ? 1 : 0;
    std::memcpy(resp.xxh3_128, res.digest.data(), 16);
    proto::encode_upload_init_resp(resp);

    PayloadBuilder b;
    b.put(resp);
    b.put_string(res.session_id);
    b.put_string(res.artifact_name);

    Reply r;
    r.type    = MsgType::MT_UPLOAD_INIT_RESP;
    r.payload = std::move(b.data());
    return r;
}

Reply ServerApp::on_upload_status(const std::vector<u8>& payload) {
    PayloadReader rd(payload);
    IdReq req{};
    rd.get(req);
    proto::decode_id_req(req);
    std::string id = read_id(rd, req.id_len);

    UploadStatus st = service_->status(id);

    UploadStatusResp resp{};
    resp.total_chunks   = st.total_chunks;
    resp.received_count = (u32)st.received.size();
    resp.complete       = st.complete ? 1 : 0;
    proto::encode_upload_status_resp(resp);

    PayloadBuilder b;
    b.put(resp);
    for (u64 idx : st.received) {
        u64 be = proto::hton64(idx);
        b.put(be);
    }

    Reply r;
    r.type    = MsgType::MT_UPLOAD_STATUS_RESP;
    r.payload = std::move(b.data());
    return r;
}

Reply ServerApp::on_upload_chunk(const std::vector<u8>& payload) {
    PayloadReader rd(payload);
    UploadChunkReq req{};
    rd.get(req);
    proto::decode_upload_chunk_req(req);
    std::string id = read_id(rd, req.id_len);
    const u8* data = read_chunk_data(rd, req.has_data, req.data_len, req.xxh3_32);

    ChunkResult res = service_->submit_chunk(id, req.index, data, data ? req.data_len : 0);

    UploadChunkResp resp{};
    resp.index         = res.index;
    resp.received      = res.received;
    resp.total_chunks  = res.total_chunks;
    resp.artifact_size = res.artifact_size;
    std::memcpy(resp.xxh3_128, res.digest.data(), 16);
    resp.artifact_len  = (u16)res.artifact_name.size();
    resp.complete      = res.complete ? 1 : 0;
    proto::encode_upload_chunk_resp(resp);

    PayloadBuilder b;
    b.put(resp);
    b.put_string(res.artifact_name);

    Reply r;
    r.type    = MsgType::MT_UPLOAD_CHUNK_RESP;
    r.payload = std::move(b.data());
    return r;
}

// ---------------------------------------------------------------
// Live capture
// ---------------------------------------------------------------

Reply ServerApp::on_stream_init(const std::vector<u8>& payload) {
    PayloadReader rd(payload);
    StreamInitReq req{};
    rd.get(req);
    proto::decode_stream_init_req(req);
    std::string name = read_name(rd, req.name_len);
    std::string mime = read_name(rd, req.mime_len);

    LiveInitResult res = service_->init_stream(name, mime);

    StreamInitResp resp{};
    resp.id_len       = (u16)res.stream_id.size();
    resp.artifact_len = (u16)res.artifact_name.size();
    proto::encode_stream_init_resp(resp);

    PayloadBuilder b;
    b.put(resp);
    b.put_string(res.stream_id);
    b.put_string(res.artifact_name);

    Reply r;
    r.type    = MsgType::MT_STREAM_INIT_RESP;
    r.payload = std::move(b.data());
    return r;
}

Reply ServerApp::on_stream_chunk(const std::vector<u8>& payload) {
    PayloadReader rd(payload);
    StreamChunkReq req{};
    rd.get(req);
    proto::decode_stream_chunk_req(req);
    std::string id = read_id(rd, req.id_len);
    const u8* data = read_chunk_data(rd, req.has_data, req.data_len, req.xxh3_32);

    LiveAppendResult res = service_->append_stream(id, data, data ? req.data_len : 0);

    StreamChunkResp resp{};
    resp.chunk_count   = res.chunk_count;
    resp.bytes_written = res.bytes_written;
    proto::encode_stream_chunk_resp(resp);

    Reply r;
    r.type = MsgType::MT_STREAM_CHUNK_RESP;
    r.payload.resize(sizeof(resp));
    std::memcpy(r.payload.data(), &resp, sizeof(resp));
    return r;
}

Reply ServerApp::on_stream_finish(const std::vector<u8>& payload) {
    PayloadReader rd(payload);
    IdReq req{};
    rd.get(req);
    proto::decode_id_req(req);
    std::string id = read_id(rd, req.id_len);

    LiveFinishResult res = service_->finish_stream(id);

    StreamFinishResp resp{};
    resp.bytes_written = res.bytes_written;
    resp.chunk_count   = res.chunk_count;
    resp.artifact_len  = (u16)res.artifact_name.size();
    proto::encode_stream_finish_resp(resp);

    PayloadBuilder b;
    b.put(resp);
    b.put_string(res.artifact_name);

    Reply r;
    r.type    = MsgType::MT_STREAM_FINISH_RESP;
    r.payload = std::move(b.data());
    return r;
}

// ---------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------

Reply ServerApp::on_list() {
    std::vector<ArtifactInfo> items = service_->list_artifacts();

    ListRespHdr hdr{};
    hdr.count = (u32)items.size();
    proto::encode_list_resp_hdr(hdr);

    PayloadBuilder b;
    b.put(hdr);
    for (const auto& a : items) {
        std::string name = a.name.size() > 0xFFFF ? a.name.substr(0, 0xFFFF) : a.name;
        ArtifactEntryHdr e{};
        e.size_bytes = a.size_bytes;
        e.mtime_ns   = a.mtime_ns;
        e.name_len   = (u16)name.size();
        proto::encode_artifact_entry_hdr(e);
        b.put(e);
        b.put_string(name);
    }

    Reply r;
    r.type = MsgType::MT_LIST_RESP;
    if (b.size() > LIST_COMPRESS_THRESHOLD) {
        r.flags   = FLAG_COMPRESSED;
        r.payload = compress::compress_to_vec(b.data().data(), b.data().size());
    } else {
        r.payload = std::move(b.data());
    }
    return r;
}

// ---------------------------------------------------------------
// reaper_loop
//   Wakes every reap_interval; exits promptly on stop().
// ---------------------------------------------------------------
void ServerApp::reaper_loop() {
    auto ttl      = std::chrono::seconds(config_.session_ttl_s);
    auto interval = std::chrono::seconds(config_.reap_interval_s > 0 ? config_.reap_interval_s : 1);

    std::unique_lock<std::mutex> lk(reaper_mutex_);
    while (running_.load()) {
        reaper_cv_.wait_for(lk, interval, [this] { return !running_.load(); });
        if (!running_.load()) break;

        lk.unlock();
        try {
            ReapStats st = service_->reap_idle(ttl);
            if (st.sessions || st.orphans || st.streams) {
                LOG_INFO("Reaper: " + std::to_string(st.sessions) + " sessions, " +
                         std::to_string(st.orphans) + " orphaned staging dirs, " +
                         std::to_string(st.streams) + " live streams expired");
            }
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Reaper pass failed: ") + e.what());
        }
        lk.lock();
    }
}
