// busq++ contributors

#include <busq++/log.hpp>
#include <busq++/property_list_service.hpp>

namespace Busq {

namespace {
constexpr uint32_t kMaxPlistSize = 64 * 1024 * 1024;
}

Result<void, Error> PropertyListService::send(const Value& message, Format format) {
    BUSQ_TRY(body, message.encode(format));
    uint32_t             n = static_cast<uint32_t>(body.size());
    std::vector<uint8_t> packet;
    packet.reserve(4 + body.size());
    packet.push_back(static_cast<uint8_t>(n >> 24));
    packet.push_back(static_cast<uint8_t>(n >> 16));
    packet.push_back(static_cast<uint8_t>(n >> 8));
    packet.push_back(static_cast<uint8_t>(n));
    packet.insert(packet.end(), body.begin(), body.end());
    logger()->trace("plist: sending {} bytes", packet.size());
    return conn_.send_all(packet);
}

Result<Value, Error> PropertyListService::receive(std::optional<uint32_t> timeout_ms) {
    // Only the wait for a new message may time out; once its first byte is in,
    // the rest is read to completion so the stream never loses its framing.
    BUSQ_TRY(prefix, conn_.receive_exact(1, timeout_ms));
    BUSQ_TRY(rest, conn_.receive_exact(3, std::nullopt));
    prefix.insert(prefix.end(), rest.begin(), rest.end());
    uint32_t n = (static_cast<uint32_t>(prefix[0]) << 24) | (static_cast<uint32_t>(prefix[1]) << 16) |
                 (static_cast<uint32_t>(prefix[2]) << 8) | static_cast<uint32_t>(prefix[3]);
    if (n == 0 || n > kMaxPlistSize) {
        return Err(Error(PlistError::FormatError, "bad plist length " + std::to_string(n)));
    }
    BUSQ_TRY(body, conn_.receive_exact(n, std::nullopt));
    logger()->trace("plist: received {} bytes", n + 4);
    return Value::decode_auto(body);
}

} // namespace Busq
