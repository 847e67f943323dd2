// busq++ contributors

#ifndef BUSQ_CONNECTION_HPP
#define BUSQ_CONNECTION_HPP

#include <busq++/error.hpp>
#include <busq++/result.hpp>
#include <busq++/secure_channel.hpp>
#include <busq++/stream.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace Busq {

// Generic "bind a free function" deleter
template <class T, void (*FreeFn)(T*)> struct FnDeleter {
    void operator()(T* p) const noexcept {
        if (p) {
            FreeFn(p);
        }
    }
};

// A device connection: the raw stream from the transport plus an optional
// session-security layer. disconnect() is terminal.
class Connection {
  public:
    static Connection adopt(std::unique_ptr<Stream>        stream,
                            std::unique_ptr<SecureChannel> security = nullptr) noexcept {
        return Connection(std::move(stream), std::move(security));
    }

    // Bytes actually written; may be fewer than len
    Result<size_t, Error>               send(const uint8_t* data, size_t len);
    Result<void, Error>                 send_all(const uint8_t* data, size_t len);
    Result<void, Error>                 send_all(const std::vector<uint8_t>& data);

    // Up to max bytes. Without a timeout blocks for at least one byte; with one,
    // returns what arrived (possibly nothing) without error.
    Result<std::vector<uint8_t>, Error> receive(size_t                  max,
                                                std::optional<uint32_t> timeout_ms = std::nullopt);
    // Exactly n bytes, or Timeout/NotEnoughData
    Result<std::vector<uint8_t>, Error>
    receive_exact(size_t n, std::optional<uint32_t> timeout_ms = std::nullopt);

    // Installs the channel used by enable_security(); replaces any disabled one
    void                                set_security(std::unique_ptr<SecureChannel> security);
    Result<void, Error>                 enable_security();
    Result<void, Error>                 disable_security();
    bool                                security_enabled() const noexcept;

    Result<int, Error>                  fd() const;
    bool                                connected() const noexcept { return stream_ != nullptr; }
    void                                disconnect() noexcept;

    // Ownership/RAII
    ~Connection() noexcept                         = default;
    Connection(Connection&&) noexcept              = default;
    Connection& operator=(Connection&&) noexcept   = default;
    Connection(const Connection&)                  = delete;
    Connection& operator=(const Connection&)       = delete;

  private:
    Connection(std::unique_ptr<Stream> stream, std::unique_ptr<SecureChannel> security) noexcept
        : stream_(std::move(stream)), security_(std::move(security)) {}

    std::unique_ptr<Stream>        stream_;
    std::unique_ptr<SecureChannel> security_;
};

} // namespace Busq
#endif
