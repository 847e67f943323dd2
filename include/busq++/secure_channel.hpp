// busq++ contributors

#pragma once

#include <busq++/error.hpp>
#include <busq++/result.hpp>
#include <busq++/stream.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace Busq {

// Session-security collaborator: once enabled over a raw stream, send/receive
// are encrypted transparently. Failures surface as SslError.
class SecureChannel {
  public:
    virtual ~SecureChannel() = default;

    virtual Result<void, Error>   enable(Stream& raw) = 0;
    virtual Result<void, Error>   disable()           = 0;
    virtual bool                  enabled() const noexcept = 0;

    virtual Result<size_t, Error> send(const uint8_t* data, size_t len) = 0;
    virtual Result<size_t, Error>
    receive(uint8_t* buf, size_t len, std::optional<uint32_t> timeout_ms) = 0;
};

} // namespace Busq
