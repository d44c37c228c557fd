#pragma once

// ============================================================
// server_app.hpp -- StreamSaver server: persistent daemon
//   Listens on a port and serves any number of clients.
//
// Concurrency model:
//   accept_loop()   -> accepts one socket at a time and queues it
//                      on the worker pool.
//   worker threads  -> one connection each; frames on a connection
//                      are handled strictly in order, one response
//                      per request.
//   reaper thread   -> every reap_interval expires idle sessions
//                      and live streams.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/errors.hpp"
#include "../common/socket.hpp"
#include "../common/thread_pool.hpp"
#include "upload_service.hpp"
#include <string>
#include <vector>
#include <set>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>

struct ServerConfig {
    std::string data_dir;
    std::string listen_ip;           // e.g. "0.0.0.0"
    u16         listen_port{9999};   // 0 = ephemeral (tests)
    int         workers{16};         // concurrent connections served
    u64         session_ttl_s{86400};// idle limit; 0 disables the reaper
    u64         reap_interval_s{60};
    bool        compress_staging{false};
};

// One response frame, built before anything is written to the socket
struct Reply {
    MsgType         type{MsgType::MT_ERROR_MSG};
    u16             flags{0};
    std::vector<u8> payload;
};

class ServerApp {
public:
    explicit ServerApp(ServerConfig config);
    ~ServerApp();

    // Bind and listen; safe to call before run() to learn the port
    void start();

    // Blocks until stop() is called (or fatal error)
    int run();

    // Call from signal handler to shut down gracefully
    void stop();

    u16 port() const;

    UploadService& service() { return *service_; }

    // Translate one request frame into its reply (never throws for
    // request-level faults; those become MT_ERROR_MSG)
    Reply dispatch(const FrameHeader& hdr, const std::vector<u8>& payload);

private:
    ServerConfig                   config_;
    std::unique_ptr<UploadService> service_;
    TcpSocket                      listen_sock_;
    bool                           listening_{false};
    std::atomic<bool>              running_{false};

    std::unique_ptr<ThreadPool>    pool_;

    // Sockets currently being served, so stop() can unblock them
    std::set<TcpSocket*>           active_;
    std::mutex                     active_mutex_;

    std::thread                    reaper_;
    std::mutex                     reaper_mutex_;
    std::condition_variable        reaper_cv_;

    void accept_loop();
    void serve_connection(TcpSocket& sock);
    void reaper_loop();

    Reply on_upload_init(const std::vector<u8>& payload);
    Reply on_upload_status(const std::vector<u8>& payload);
    Reply on_upload_chunk(const std::vector<u8>& payload);
    Reply on_stream_init(const std::vector<u8>& payload);
    Reply on_stream_chunk(const std::vector<u8>& payload);
    Reply on_stream_finish(const std::vector<u8>& payload);
    Reply on_list();
};

// Build an MT_ERROR_MSG reply
Reply make_error_reply(ErrorKind kind, const std::string& msg);
