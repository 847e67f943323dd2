// busq++ contributors

#include <busq++/stream.hpp>

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace Busq {

namespace {
Error socket_error(const char* what) {
    return Error(MobileDeviceError::Unknown, std::string(what) + ": " + std::strerror(errno));
}
} // namespace

#if defined(__unix__) || defined(__APPLE__)
Result<std::unique_ptr<SocketStream>, Error> SocketStream::connect_unix(const std::string& path) {
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
        return Err(Error::InvalidArgument("socket path too long: " + path));
    }
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        return Err(socket_error("socket"));
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        Error e = socket_error(("connect " + path).c_str());
        ::close(fd);
        return Err(e);
    }
    return Ok(std::unique_ptr<SocketStream>(new SocketStream(fd)));
}
#endif

Result<std::unique_ptr<SocketStream>, Error> SocketStream::connect_tcp(const std::string& host,
                                                                       uint16_t           port) {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo*   res   = nullptr;
    std::string service = std::to_string(port);
    int         rc      = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        return Err(Error(MobileDeviceError::NoDevice, host + ": " + ::gai_strerror(rc)));
    }
    int fd = -1;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    if (fd < 0) {
        return Err(socket_error(("connect " + host + ":" + service).c_str()));
    }
    int yes = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
    return Ok(std::unique_ptr<SocketStream>(new SocketStream(fd)));
}

std::unique_ptr<SocketStream> SocketStream::adopt(int fd) noexcept {
    return std::unique_ptr<SocketStream>(new SocketStream(fd));
}

SocketStream::~SocketStream() {
    close();
}

void SocketStream::close() noexcept {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
}

Result<size_t, Error> SocketStream::send(const uint8_t* data, size_t len) {
    if (fd_ < 0) {
        return Err(Error::Disconnected());
    }
    for (;;) {
        ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
        if (n >= 0) {
            return Ok(static_cast<size_t>(n));
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EPIPE || errno == ECONNRESET) {
            return Err(Error(MobileDeviceError::Disconnected, std::strerror(errno)));
        }
        return Err(socket_error("send"));
    }
}

Result<size_t, Error>
SocketStream::receive(uint8_t* buf, size_t len, std::optional<uint32_t> timeout_ms) {
    if (fd_ < 0) {
        return Err(Error::Disconnected());
    }
    if (timeout_ms) {
        pollfd pfd{};
        pfd.fd     = fd_;
        pfd.events = POLLIN;
        int rc;
        do {
            rc = ::poll(&pfd, 1, static_cast<int>(*timeout_ms));
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            return Err(socket_error("poll"));
        }
        if (rc == 0) {
            return Ok(size_t{0});
        }
    }
    for (;;) {
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n > 0) {
            return Ok(static_cast<size_t>(n));
        }
        if (n == 0) {
            return Err(Error(MobileDeviceError::Disconnected, "peer closed the connection"));
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == ECONNRESET) {
            return Err(Error(MobileDeviceError::Disconnected, std::strerror(errno)));
        }
        return Err(socket_error("recv"));
    }
}

} // namespace Busq
