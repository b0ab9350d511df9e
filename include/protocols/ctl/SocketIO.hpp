#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <nlohmann/json_fwd.hpp>

namespace wtc::protocols::ctl {

// Frames larger than this are rejected.
inline constexpr uint32_t MAX_FRAME_BYTES = 1u << 20;

// Peer closed the connection (or the socket failed) mid-frame.
class ConnectionClosed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

bool readn(int fd, void* buf, size_t n);
bool writen(int fd, const void* buf, size_t n);

// Frames are a 4-byte big-endian length followed by a JSON document.
class SocketIO {
public:
    static void send_json(int fd, const nlohmann::json& j);
    static nlohmann::json recv_json(int fd);

    // Waits up to timeout for the fd to become readable or hung up.
    [[nodiscard]] static bool readable(int fd, std::chrono::milliseconds timeout);
};

}
