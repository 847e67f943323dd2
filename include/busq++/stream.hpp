// busq++ contributors

#pragma once

#include <busq++/error.hpp>
#include <busq++/result.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace Busq {

// Raw duplex byte stream handed out by the transport collaborator.
// receive() with no timeout blocks until at least one byte arrives; with a
// timeout it may return 0 bytes. A closed peer is MobileDeviceError::Disconnected.
class Stream {
  public:
    virtual ~Stream() = default;

    virtual Result<size_t, Error> send(const uint8_t* data, size_t len) = 0;
    virtual Result<size_t, Error>
                 receive(uint8_t* buf, size_t len, std::optional<uint32_t> timeout_ms) = 0;
    // -1 when the stream is not backed by a descriptor
    virtual int  fd() const noexcept = 0;
    virtual void close() noexcept    = 0;
};

class SocketStream : public Stream {
  public:
#if defined(__unix__) || defined(__APPLE__)
    static Result<std::unique_ptr<SocketStream>, Error> connect_unix(const std::string& path);
#endif
    static Result<std::unique_ptr<SocketStream>, Error> connect_tcp(const std::string& host,
                                                                    uint16_t           port);
    static std::unique_ptr<SocketStream>                adopt(int fd) noexcept;

    ~SocketStream() override;
    SocketStream(const SocketStream&)            = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    Result<size_t, Error> send(const uint8_t* data, size_t len) override;
    Result<size_t, Error>
         receive(uint8_t* buf, size_t len, std::optional<uint32_t> timeout_ms) override;
    int  fd() const noexcept override { return fd_; }
    void close() noexcept override;

  private:
    explicit SocketStream(int fd) noexcept : fd_(fd) {}
    int fd_ = -1;
};

} // namespace Busq
