// ============================================================
// client_app_test.cpp -- Client commands against a local server
// ============================================================

#include "client/client_app.hpp"
#include "server/server_app.hpp"
#include "common/logger.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <thread>

TEST(ClientHelpers, ChunkCountRoundsUp) {
    EXPECT_EQ(ClientApp::chunk_count(0, 4), 0u);
    EXPECT_EQ(ClientApp::chunk_count(1, 4), 1u);
    EXPECT_EQ(ClientApp::chunk_count(4, 4), 1u);
    EXPECT_EQ(ClientApp::chunk_count(5, 4), 2u);
    EXPECT_EQ(ClientApp::chunk_count(10ull * 1024 * 1024, DEFAULT_CHUNK_SIZE), 3u);
}

TEST(ClientHelpers, GuessMimeFromExtension) {
    EXPECT_EQ(ClientApp::guess_mime("a/b/clip.WEBM"), "video/webm");
    EXPECT_EQ(ClientApp::guess_mime("clip.mp4"), "video/mp4");
    EXPECT_EQ(ClientApp::guess_mime("notes"), "application/octet-stream");
}

namespace {

struct ClientAppTest : ::testing::Test {
    TempDir                    tmp;
    std::unique_ptr<ServerApp> server;
    std::thread                runner;

    void SetUp() override {
        Logger::get().set_error_log_dir(tmp.path());

        ServerConfig cfg;
        cfg.data_dir      = tmp.join("data");
        cfg.listen_ip     = "127.0.0.1";
        cfg.listen_port   = 0;
        cfg.workers       = 2;
        cfg.session_ttl_s = 0;
        server.reset(new ServerApp(cfg));
        server->start();
        runner = std::thread([this] { server->run(); });
    }

    void TearDown() override {
        server->stop();
        if (runner.joinable()) runner.join();
        server.reset();
    }

    ClientOptions options() {
        ClientOptions o;
        o.server_ip   = "127.0.0.1";
        o.server_port = server->port();
        o.chunk_size  = 4;
        o.retries     = 2;
        o.retry_secs  = 2;
        o.state_file  = tmp.join("last_upload");
        return o;
    }

    std::vector<ArtifactInfo> artifacts() { return server->service().list_artifacts(); }

    std::string artifact_text(const std::string& name) {
        return read_text((fs::path(server->service().layout().output_dir) / name).string());
    }
};

} // namespace

TEST_F(ClientAppTest, UploadSendsEveryChunk) {
    std::string src = tmp.join("clip.bin");
    write_text(src, "0123456789");

    ClientApp app(options());
    EXPECT_EQ(app.upload(src), 0);

    auto items = artifacts();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_NE(items[0].name.find("-clip.bin"), std::string::npos);
    EXPECT_EQ(artifact_text(items[0].name), "0123456789");
    // State is cleared once the upload completes
    EXPECT_FALSE(fs::exists(tmp.join("last_upload")));
}

TEST_F(ClientAppTest, EmptyFileCompletesAtInit) {
    std::string src = tmp.join("empty.bin");
    write_text(src, "");

    ClientApp app(options());
    EXPECT_EQ(app.upload(src), 0);
    auto items = artifacts();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].size_bytes, 0u);
}

TEST_F(ClientAppTest, ResumeSendsOnlyMissingChunks) {
    std::string src = tmp.join("clip.bin");
    write_text(src, "0123456789");

    // A first attempt that only got the middle chunk through
    StreamClient c;
    c.connect("127.0.0.1", server->port());
    UploadInitReply init = c.init_upload("clip.bin", 10, 3, "");
    c.upload_chunk(init.session_id, 1, reinterpret_cast<const u8*>("4567"), 4);
    c.close();

    ClientApp app(options());
    EXPECT_EQ(app.resume(src, init.session_id), 0);

    auto items = artifacts();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(artifact_text(items[0].name), "0123456789");
}

TEST_F(ClientAppTest, ResumeOfUnknownSessionFails) {
    std::string src = tmp.join("clip.bin");
    write_text(src, "0123456789");

    ClientApp app(options());
    EXPECT_NE(app.resume(src, utils::generate_token()), 0);
    EXPECT_NE(app.resume(src, ""), 0);
}

TEST_F(ClientAppTest, LiveAppendsFileInOrder) {
    std::string src = tmp.join("cam.webm");
    write_text(src, "abcdefghij");

    ClientApp app(options());
    EXPECT_EQ(app.live(src), 0);

    auto items = artifacts();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_NE(items[0].name.find("-cam.webm"), std::string::npos);
    EXPECT_EQ(artifact_text(items[0].name), "abcdefghij");
}
