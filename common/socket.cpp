// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>

#include <sys/uio.h>

// Buffer size for SO_SNDBUF / SO_RCVBUF = 4 MB
static constexpr int SOCKET_BUF_SIZE = 4 * 1024 * 1024;

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd_ == SSV_INVALID_SOCKET) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != SSV_INVALID_SOCKET) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = SSV_INVALID_SOCKET;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = SSV_INVALID_SOCKET;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;

    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &rcvbuf,    sizeof(rcvbuf));
}

void TcpSocket::connect(const std::string& ip, u16 port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    int rc;
    do {
        rc = ::connect(fd_, (sockaddr*)&addr, sizeof(addr));
    } while (rc == SSV_SOCKET_ERROR && errno == EINTR);
    if (rc == SSV_SOCKET_ERROR) {
        throw std::runtime_error("connect() failed: " + socket_error_str(last_socket_error()));
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SSV_SOCKET_ERROR) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SSV_SOCKET_ERROR) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    socket_t client;
    do {
        peer_len = sizeof(peer);
        client = ::accept4(fd_, (sockaddr*)&peer, &peer_len, SOCK_CLOEXEC);
    } while (client == SSV_INVALID_SOCKET && errno == EINTR);
    if (client == SSV_INVALID_SOCKET) {
        throw std::runtime_error("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent == 0) {
                throw std::runtime_error("Connection closed during send");
            }
            int err = last_socket_error();
            if (err == EINTR || would_block(err)) continue;
            throw std::runtime_error("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

size_t TcpSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t got = 0;
    while (got < len) {
        ssize_t received = ::recv(fd_, p + got, len - got, 0);
        if (received == 0) break; // peer closed
        if (received < 0) {
            int err = last_socket_error();
            if (err == EINTR) continue;
            throw std::runtime_error("recv() failed: " + socket_error_str(err));
        }
        got += static_cast<size_t>(received);
    }
    return got;
}

void TcpSocket::write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len) {
    u8 hdr_buf[8];
    FrameHeader hdr;
    hdr.msg_type    = static_cast<u16>(type);
    hdr.flags       = flags;
    hdr.payload_len = payload_len;
    proto::encode_header(hdr, hdr_buf);

    if (payload_len == 0 || !payload) {
        send_all(hdr_buf, 8);
        return;
    }

    // writev: merge header + payload into one syscall, handle partial sends
    size_t total = 8 + (size_t)payload_len;
    size_t sent_total = 0;
    while (sent_total < total) {
        struct iovec cur[2];
        int cur_cnt = 0;
        size_t skip = sent_total;
        for (int i = 0; i < 2; ++i) {
            size_t seg_len = (i == 0) ? 8 : (size_t)payload_len;
            const char* seg_base = (i == 0) ? reinterpret_cast<const char*>(hdr_buf)
                                             : static_cast<const char*>(payload);
            if (skip >= seg_len) { skip -= seg_len; continue; }
            cur[cur_cnt].iov_base = const_cast<char*>(seg_base + skip);
            cur[cur_cnt].iov_len  = seg_len - skip;
            skip = 0;
            ++cur_cnt;
        }
        msghdr msg{};
        msg.msg_iov    = cur;
        msg.msg_iovlen = (size_t)cur_cnt;
        ssize_t n = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("sendmsg failed: " + socket_error_str(errno));
        }
        sent_total += (size_t)n;
    }
}

bool TcpSocket::read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf) {
    u8 hdr_buf[8];
    size_t got = recv_all(hdr_buf, 8);
    if (got == 0) return false;
    if (got < 8) {
        throw std::runtime_error("Connection closed inside a frame header");
    }
    hdr = proto::decode_header(hdr_buf);
    if (hdr.payload_len > MAX_PAYLOAD_LEN) {
        throw std::runtime_error("Payload too large: " + std::to_string(hdr.payload_len));
    }
    payload_buf.resize(hdr.payload_len);
    if (hdr.payload_len > 0 &&
        recv_all(payload_buf.data(), hdr.payload_len) < hdr.payload_len) {
        throw std::runtime_error("Connection closed inside a frame payload (" +
                                 std::to_string(hdr.payload_len) + " bytes announced)");
    }
    return true;
}

void TcpSocket::shutdown() {
    if (fd_ != SSV_INVALID_SOCKET) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void TcpSocket::close() {
    if (fd_ != SSV_INVALID_SOCKET) {
        SSV_CLOSE_SOCKET(fd_);
        fd_ = SSV_INVALID_SOCKET;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in self{};
    socklen_t len = sizeof(self);
    if (getsockname(fd_, (sockaddr*)&self, &len) != 0) {
        throw std::runtime_error("getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(self.sin_port);
}
