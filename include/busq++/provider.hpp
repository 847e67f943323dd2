// busq++ contributors

#ifndef BUSQ_PROVIDER_HPP
#define BUSQ_PROVIDER_HPP

#include <busq++/disposable.hpp>
#include <busq++/error.hpp>
#include <busq++/pair_record.hpp>
#include <busq++/result.hpp>
#include <busq++/secure_channel.hpp>
#include <busq++/stream.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Busq {

class ConnectionType {
  public:
    enum class Value : uint8_t { Usb = 1, Network = 2, Unknown = 3 };
    ConnectionType() noexcept = default;
    explicit ConnectionType(uint8_t v) : _value(static_cast<Value>(v)) {}
    ConnectionType(Value v) noexcept : _value(v) {}

    std::string to_string() const;
    Value       value() const noexcept { return _value; }
    bool        operator==(Value other) const noexcept { return _value == other; }
    bool        operator!=(Value other) const noexcept { return _value != other; }

  private:
    Value _value{Value::Unknown};
};

// Which transports a device lookup may use
enum class LookupOptions : uint32_t {
    None          = 0,
    Usbmux        = 1 << 1,
    Network       = 1 << 2,
    PreferNetwork = 1 << 3,
};

inline LookupOptions operator|(LookupOptions a, LookupOptions b) noexcept {
    return static_cast<LookupOptions>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}
inline bool has_flag(LookupOptions set, LookupOptions flag) noexcept {
    return (static_cast<uint32_t>(set) & static_cast<uint32_t>(flag)) != 0;
}

struct DeviceInfo {
    std::string    udid;
    ConnectionType type;
    uint32_t       handle = 0;
};

enum class DeviceEventType : uint8_t { Add = 1, Remove = 2, Paired = 3 };

struct DeviceEvent {
    DeviceEventType type;
    DeviceInfo      device;
};

using DeviceEventCallback = std::function<void(const DeviceEvent&)>;

// Transport collaborator: enumerates devices, opens raw streams to device
// ports and stores pair records on the host.
class Provider {
  public:
    virtual ~Provider() = default;

    virtual Result<std::vector<DeviceInfo>, Error>    list_devices()                         = 0;
    // Events are delivered on a provider thread until the token is disposed
    virtual Result<Disposable, Error>                 subscribe(DeviceEventCallback callback) = 0;
    virtual Result<std::unique_ptr<Stream>, Error>    connect(const DeviceInfo& device,
                                                              uint16_t          port)        = 0;

    virtual Result<PairRecord, Error>                 read_pair_record(const std::string& udid) = 0;
    virtual Result<void, Error>                       save_pair_record(const DeviceInfo& device,
                                                                       const PairRecord& record) = 0;
    virtual Result<void, Error>                       delete_pair_record(const std::string& udid) = 0;
    virtual Result<std::string, Error>                read_buid()                                = 0;

    // Session security for connections to the device; OpenSSL by default
    virtual Result<std::unique_ptr<SecureChannel>, Error>
    new_secure_channel(const PairRecord& record);
};

} // namespace Busq
#endif
