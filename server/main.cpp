// ============================================================
// server/main.cpp -- StreamSaver server entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "server_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static ServerApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <data_dir> <ip> <port> [options]\n"
        << "\n"
        << "  data_dir            staging (tmp/) and artifact (final/) root\n"
        << "  ip                  IP address to listen on (use 0.0.0.0 for all interfaces)\n"
        << "  port                TCP port (e.g. 9999)\n"
        << "\nOptions:\n"
        << "  --workers N         concurrent connections served (default: 16)\n"
        << "  --session-ttl S     expire sessions/streams idle for S seconds (default: 86400, 0 = never)\n"
        << "  --reap-interval S   seconds between expiry passes (default: 60)\n"
        << "  --compress-staging  store compressible chunks zstd-compressed\n"
        << "  --log-file F        also append log lines to F\n"
        << "  --verbose           enable debug logging\n"
        << "\nExample:\n"
        << "  " << prog << " /srv/streamsaver 0.0.0.0 9999\n";
}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ServerConfig cfg;
    cfg.data_dir  = argv[1];
    cfg.listen_ip = argv[2];
    int port_int  = std::atoi(argv[3]);
    long long ttl      = (long long)cfg.session_ttl_s;
    long long interval = (long long)cfg.reap_interval_s;
    std::string log_file;
    bool verbose = false;

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            cfg.workers = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--session-ttl") == 0 && i + 1 < argc) {
            ttl = std::atoll(argv[++i]);
        } else if (std::strcmp(argv[i], "--reap-interval") == 0 && i + 1 < argc) {
            interval = std::atoll(argv[++i]);
        } else if (std::strcmp(argv[i], "--compress-staging") == 0) {
            cfg.compress_staging = true;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.data_dir)) {
        std::cerr << "ERROR: Invalid data_dir\n";
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (cfg.workers < 1 || cfg.workers > 1024) {
        std::cerr << "ERROR: --workers must be 1-1024\n";
        return 1;
    }
    if (ttl < 0) {
        std::cerr << "ERROR: --session-ttl must be >= 0\n";
        return 1;
    }
    if (interval < 1) {
        std::cerr << "ERROR: --reap-interval must be >= 1\n";
        return 1;
    }

    cfg.listen_port     = (u16)port_int;
    cfg.session_ttl_s   = (u64)ttl;
    cfg.reap_interval_s = (u64)interval;

    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::INFO);
    Logger::get().set_error_log_dir(cfg.data_dir);
    if (!log_file.empty() && !Logger::get().set_log_file(log_file)) {
        std::cerr << "ERROR: Cannot open log file: " << log_file << "\n";
        return 1;
    }

    // Peers that vanish mid-reply must not kill the daemon
    std::signal(SIGPIPE, SIG_IGN);

    try {
        ServerApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
