#include "protocols/ctl/SocketIO.hpp"

#include <cerrno>
#include <string>
#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace wtc::protocols::ctl {

bool readn(const int fd, void* buf, size_t n) {
    auto* p = static_cast<unsigned char*>(buf);
    while (n) {
        const ssize_t r = ::read(fd, p, n);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        p += r;
        n -= static_cast<size_t>(r);
    }
    return true;
}

bool writen(const int fd, const void* buf, size_t n) {
    auto* p = static_cast<const unsigned char*>(buf);
    while (n) {
        const ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}

void SocketIO::send_json(const int fd, const nlohmann::json& j) {
    const auto s = j.dump();
    if (s.size() > MAX_FRAME_BYTES) throw std::runtime_error("frame too large");
    const uint32_t len = htonl(static_cast<uint32_t>(s.size()));
    if (!writen(fd, &len, 4) || !writen(fd, s.data(), s.size()))
        throw ConnectionClosed("peer closed connection while writing");
}

nlohmann::json SocketIO::recv_json(const int fd) {
    uint32_t len_be = 0;
    if (!readn(fd, &len_be, 4)) throw ConnectionClosed("EOF reading length");
    const uint32_t len = ntohl(len_be);
    if (len > MAX_FRAME_BYTES) throw std::runtime_error("frame of " + std::to_string(len) + " bytes exceeds limit");

    std::string body(len, '\0');
    if (!readn(fd, body.data(), len)) throw ConnectionClosed("EOF reading body");
    return nlohmann::json::parse(body);
}

bool SocketIO::readable(const int fd, const std::chrono::milliseconds timeout) {
    pollfd p{fd, POLLIN, 0};
    const int rc = ::poll(&p, 1, static_cast<int>(timeout.count()));
    if (rc < 0) return errno != EINTR;
    return rc > 0;
}

}
