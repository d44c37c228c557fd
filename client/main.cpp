// ============================================================
// client/main.cpp -- StreamSaver client entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>
#include <csignal>

static ClientApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <ip> <port> <command> [args] [options]\n"
        << "\n"
        << "Commands:\n"
        << "  upload <file>               resumable chunked upload\n"
        << "  resume <file> [session_id]  send only the chunks the server is missing\n"
        << "                              (session id defaults to the last upload)\n"
        << "  live <file>                 stream the file through the live append path\n"
        << "  status <session_id>         show received chunks of a session\n"
        << "  list                        list finished artifacts, newest first\n"
        << "\nOptions:\n"
        << "  --chunk-kb N    chunk size in KB (default: 4096)\n"
        << "  --retries N     attempts per chunk (default: 5)\n"
        << "  --retry N       seconds to retry connecting if server not ready (default: 30)\n"
        << "  --verbose       enable debug logging\n"
        << "\nExamples:\n"
        << "  " << prog << " 192.168.1.1 9999 upload clip.mp4\n"
        << "  " << prog << " 192.168.1.1 9999 resume clip.mp4\n"
        << "  " << prog << " 192.168.1.1 9999 list\n";
}

int main(int argc, char* argv[]) {
    // Prevent SIGPIPE from terminating the process when writing to a broken
    // socket.  We rely on errno/EPIPE instead.
    std::signal(SIGPIPE, SIG_IGN);

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ClientOptions opts;
    opts.server_ip   = argv[1];
    int port_int     = std::atoi(argv[2]);
    std::string cmd  = argv[3];
    int chunk_kb     = (int)(DEFAULT_CHUNK_SIZE / 1024);
    bool verbose     = false;
    std::vector<std::string> args;

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--chunk-kb") == 0 && i + 1 < argc) {
            chunk_kb = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--retries") == 0 && i + 1 < argc) {
            opts.retries = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--retry") == 0 && i + 1 < argc) {
            opts.retry_secs = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            args.push_back(argv[i]);
        }
    }

    if (!utils::validate_ip(opts.server_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << opts.server_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (chunk_kb < 1 || (u64)chunk_kb * 1024 > MAX_CHUNK_LEN) {
        std::cerr << "ERROR: --chunk-kb must be 1-" << MAX_CHUNK_LEN / 1024 << "\n";
        return 1;
    }
    if (opts.retries < 1) {
        std::cerr << "ERROR: --retries must be >= 1\n";
        return 1;
    }

    size_t want_min = 0, want_max = 0;
    if (cmd == "upload" || cmd == "live") {
        want_min = want_max = 1;
    } else if (cmd == "resume") {
        want_min = 1; want_max = 2;
    } else if (cmd == "status") {
        want_min = want_max = 1;
    } else if (cmd != "list") {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (args.size() < want_min || args.size() > want_max) {
        std::cerr << "ERROR: wrong number of arguments for '" << cmd << "'\n";
        print_usage(argv[0]);
        return 1;
    }
    for (const auto& a : args) {
        if (!utils::validate_path(a)) {
            std::cerr << "ERROR: Invalid argument\n";
            return 1;
        }
    }

    opts.server_port = (u16)port_int;
    opts.chunk_size  = (u32)chunk_kb * 1024;
    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        ClientApp app(std::move(opts));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc;
        if (cmd == "upload")      rc = app.upload(args[0]);
        else if (cmd == "resume") rc = app.resume(args[0], args.size() > 1 ? args[1] : "");
        else if (cmd == "live")   rc = app.live(args[0]);
        else if (cmd == "status") rc = app.status(args[0]);
        else                      rc = app.list();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
