#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket carrying StreamSaver frames
//   One request frame is answered by one reply frame; a peer
//   that closes between frames is a normal disconnect, one that
//   closes inside a frame is an error.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote
    void connect(const std::string& ip, u16 port);

    // Server: bind + listen (port 0 picks an ephemeral port, see local_port())
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 128);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send a complete frame (header + payload)
    void write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len);

    // Read next frame: fills header, resizes payload_buf and reads payload.
    // Returns false if the peer closed before the header; throws if it
    // closed mid-frame or announced more than MAX_PAYLOAD_LEN
    bool read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf);

    // Apply TCP tuning (nodelay, keepalive)
    void tune();

    bool is_valid() const { return fd_ != SSV_INVALID_SOCKET; }

    // Wake up any thread blocked in accept()/recv() on this socket
    void shutdown();

    void close();

    // Get peer address as string
    std::string peer_addr() const;

    // Port this socket is bound to (host order)
    u16 local_port() const;

private:
    socket_t fd_{SSV_INVALID_SOCKET};

    void apply_socket_opts();

    void send_all(const void* buf, size_t len);

    // Returns the number of bytes read before EOF (len on success)
    size_t recv_all(void* buf, size_t len);
};
