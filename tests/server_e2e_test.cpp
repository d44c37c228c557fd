// ============================================================
// server_e2e_test.cpp -- Real sockets against an in-process server
// ============================================================

#include "server/server_app.hpp"
#include "client/stream_client.hpp"
#include "common/protocol_io.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <thread>

namespace {

struct ServerE2ETest : ::testing::Test {
    TempDir                    tmp;
    std::unique_ptr<ServerApp> server;
    std::thread                runner;
    StreamClient               client;

    void SetUp() override {
        Logger::get().set_error_log_dir(tmp.path());

        ServerConfig cfg;
        cfg.data_dir      = tmp.path();
        cfg.listen_ip     = "127.0.0.1";
        cfg.listen_port   = 0;
        cfg.workers       = 4;
        cfg.session_ttl_s = 0;
        server.reset(new ServerApp(cfg));
        server->start();
        runner = std::thread([this] { server->run(); });

        client.connect("127.0.0.1", server->port());
    }

    void TearDown() override {
        client.close();
        server->stop();
        if (runner.joinable()) runner.join();
        server.reset();
    }

    UploadChunkReply send(const std::string& id, i64 index, const std::string& body) {
        return client.upload_chunk(id, index, reinterpret_cast<const u8*>(body.data()), (u32)body.size());
    }

    std::string artifact_text(const std::string& name) {
        return read_text((fs::path(server->service().layout().output_dir) / name).string());
    }

    static ErrorKind error_of(const Reply& r) {
        EXPECT_EQ(r.type, MsgType::MT_ERROR_MSG);
        proto::PayloadReader rd(r.payload);
        ErrorMsg em{};
        rd.get(em);
        proto::decode_error_msg(em);
        return static_cast<ErrorKind>(em.error_code);
    }
};

} // namespace

TEST_F(ServerE2ETest, PingEchoes) {
    EXPECT_NO_THROW(client.ping());
}

TEST_F(ServerE2ETest, StagedUploadOverTheWire) {
    UploadInitReply init = client.init_upload("clip.mp4", 6, 3, "video/mp4");
    EXPECT_TRUE(utils::is_token(init.session_id));
    EXPECT_FALSE(init.complete);

    send(init.session_id, 0, "AAA");
    UploadChunkReply r1 = send(init.session_id, 1, "BB");
    EXPECT_FALSE(r1.complete);
    EXPECT_EQ(r1.received, 2u);

    UploadStatusReply st = client.upload_status(init.session_id);
    EXPECT_EQ(st.total_chunks, 3u);
    EXPECT_EQ(st.received, (std::vector<u64>{0, 1}));
    EXPECT_FALSE(st.complete);

    UploadChunkReply last = send(init.session_id, 2, "C");
    ASSERT_TRUE(last.complete);
    EXPECT_EQ(last.artifact_size, 6u);
    EXPECT_EQ(last.digest, hash::xxh3_128("AAABBC", 6));
    EXPECT_EQ(artifact_text(last.artifact_name), "AAABBC");

    std::vector<ArtifactEntry> items = client.list();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].name, last.artifact_name);
    EXPECT_EQ(items[0].size_bytes, 6u);
}

TEST_F(ServerE2ETest, ErrorsArriveAsTypedFrames) {
    try {
        client.upload_status(utils::generate_token());
        FAIL();
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NOT_FOUND);
    }

    try {
        client.init_upload("", 0, 1, "");
        FAIL();
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_ARGUMENT);
    }

    UploadInitReply init = client.init_upload("a.bin", 1, 1, "");
    try {
        client.upload_chunk(init.session_id, 0, nullptr, 0);
        FAIL();
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_ARGUMENT);
    }

    // The connection survives request-level errors
    EXPECT_TRUE(send(init.session_id, 0, "x").complete);
}

TEST_F(ServerE2ETest, CorruptChunkIsRejectedBeforeStorage) {
    UploadInitReply init = client.init_upload("a.bin", 4, 2, "");

    std::string body = "data";
    UploadChunkReq req{};
    req.index    = 0;
    req.data_len = (u32)body.size();
    req.xxh3_32  = hash::xxh3_32(body.data(), body.size()) ^ 1u;
    req.id_len   = (u16)init.session_id.size();
    req.has_data = 1;
    proto::encode_upload_chunk_req(req);

    proto::PayloadBuilder b;
    b.put(req);
    b.put_string(init.session_id);
    b.put_string(body);

    FrameHeader hdr{};
    hdr.msg_type    = (u16)MsgType::MT_UPLOAD_CHUNK_REQ;
    hdr.payload_len = (u32)b.size();
    Reply r = server->dispatch(hdr, b.data());
    EXPECT_EQ(error_of(r), ErrorKind::INVALID_ARGUMENT);
    EXPECT_TRUE(client.upload_status(init.session_id).received.empty());
}

TEST_F(ServerE2ETest, MalformedFramesAreInvalidArgument) {
    FrameHeader hdr{};
    hdr.msg_type = (u16)MsgType::MT_UPLOAD_INIT_REQ;
    std::vector<u8> truncated = {0, 1, 2};
    EXPECT_EQ(error_of(server->dispatch(hdr, truncated)), ErrorKind::INVALID_ARGUMENT);

    hdr.msg_type = 0x7777;
    EXPECT_EQ(error_of(server->dispatch(hdr, {})), ErrorKind::INVALID_ARGUMENT);

    hdr.msg_type = (u16)MsgType::MT_LIST_REQ;
    hdr.flags    = FLAG_COMPRESSED;
    EXPECT_EQ(error_of(server->dispatch(hdr, {})), ErrorKind::INVALID_ARGUMENT);
}

TEST_F(ServerE2ETest, LiveStreamOverTheWire) {
    StreamInitReply init = client.stream_init("", "");
    EXPECT_NE(init.artifact_name.find("-live.webm"), std::string::npos);

    std::string a = "header", b = "cluster";
    client.stream_chunk(init.stream_id, reinterpret_cast<const u8*>(a.data()), (u32)a.size());
    StreamChunkReply r = client.stream_chunk(init.stream_id, reinterpret_cast<const u8*>(b.data()), (u32)b.size());
    EXPECT_EQ(r.chunk_count, 2u);
    EXPECT_EQ(r.bytes_written, 13u);

    StreamFinishReply fin = client.stream_finish(init.stream_id);
    EXPECT_EQ(fin.artifact_name, init.artifact_name);
    EXPECT_EQ(fin.bytes_written, 13u);
    EXPECT_EQ(artifact_text(fin.artifact_name), "headercluster");

    try {
        client.stream_finish(init.stream_id);
        FAIL();
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NOT_FOUND);
    }
}

TEST_F(ServerE2ETest, LargeListingIsCompressedTransparently) {
    const int n = 200;
    std::string out = server->service().layout().output_dir;
    for (int i = 0; i < n; ++i) {
        write_text((fs::path(out) / ("recording-number-" + std::to_string(i) + ".webm")).string(), "x");
    }

    FrameHeader hdr{};
    hdr.msg_type = (u16)MsgType::MT_LIST_REQ;
    Reply raw = server->dispatch(hdr, {});
    EXPECT_EQ(raw.type, MsgType::MT_LIST_RESP);
    EXPECT_TRUE(raw.flags & FLAG_COMPRESSED);

    std::vector<ArtifactEntry> items = client.list();
    EXPECT_EQ(items.size(), (size_t)n);
}

TEST_F(ServerE2ETest, ParallelClientsShareOneSession) {
    UploadInitReply init = client.init_upload("par.bin", 8, 8, "");

    std::vector<std::thread> pool;
    for (int t = 0; t < 4; ++t) {
        pool.emplace_back([&, t] {
            StreamClient c;
            c.connect("127.0.0.1", server->port());
            for (int i = t; i < 8; i += 4) {
                std::string body(1, (char)('a' + i));
                c.upload_chunk(init.session_id, i, reinterpret_cast<const u8*>(body.data()), 1);
            }
            c.close();
        });
    }
    for (auto& th : pool) th.join();

    std::vector<ArtifactEntry> items = client.list();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(artifact_text(items[0].name), "abcdefgh");
}
