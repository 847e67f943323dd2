// busq++ contributors

#ifndef BUSQ_DEVICE_HPP
#define BUSQ_DEVICE_HPP

#include <busq++/connection.hpp>
#include <busq++/provider.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Busq {

// A device found through a Provider. release() is terminal: every later call
// fails with MobileDeviceError::DeallocatedDevice.
class Device {
  public:
    static Result<Device, Error> create(std::shared_ptr<Provider> provider,
                                        const std::string&        udid,
                                        LookupOptions             options = LookupOptions::None);
    static Result<Device, Error> adopt(std::shared_ptr<Provider> provider, DeviceInfo info);

    static Result<std::vector<DeviceInfo>, Error> list(Provider& provider);
    static Result<Disposable, Error> subscribe(Provider& provider, DeviceEventCallback callback);

    // Raw (unencrypted) connection to a device port
    Result<Connection, Error>        connect(uint16_t port);

    Result<std::string, Error>       udid() const;
    Result<uint32_t, Error>          handle() const;
    Result<ConnectionType, Error>    connection_type() const;
    Result<std::shared_ptr<Provider>, Error> provider() const;
    Result<DeviceInfo, Error>        info() const;

    bool                             released() const noexcept { return !info_.has_value(); }
    void                             release() noexcept;

    // RAII / moves
    ~Device() noexcept                       = default;
    Device(Device&&) noexcept                = default;
    Device& operator=(Device&&) noexcept     = default;
    Device(const Device&)                    = delete;
    Device& operator=(const Device&)         = delete;

  private:
    Device(std::shared_ptr<Provider> provider, DeviceInfo info) noexcept
        : provider_(std::move(provider)), info_(std::move(info)) {}

    std::shared_ptr<Provider> provider_;
    std::optional<DeviceInfo> info_;
};

} // namespace Busq
#endif
