// busq++ contributors

#include <busq++/provider.hpp>
#include <busq++/tls.hpp>

namespace Busq {

std::string ConnectionType::to_string() const {
    switch (_value) {
    case Value::Usb:
        return "USB";
    case Value::Network:
        return "Network";
    case Value::Unknown:
        return "Unknown";
    default:
        return "UnknownEnumValue";
    }
}

Result<std::unique_ptr<SecureChannel>, Error> Provider::new_secure_channel(const PairRecord& record) {
    auto tls = TlsChannel::create(record);
    if (tls.is_err()) {
        return Err(std::move(tls).unwrap_err());
    }
    return Ok(std::unique_ptr<SecureChannel>(std::move(tls).unwrap()));
}

} // namespace Busq
