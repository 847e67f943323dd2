// busq++ contributors

#include <busq++/device.hpp>
#include <busq++/log.hpp>

namespace Busq {

namespace {

Error deallocated() {
    return Error(MobileDeviceError::DeallocatedDevice, "device handle was released");
}

bool allowed(const DeviceInfo& d, LookupOptions options) {
    bool usb = has_flag(options, LookupOptions::Usbmux);
    bool net = has_flag(options, LookupOptions::Network) ||
               has_flag(options, LookupOptions::PreferNetwork);
    if (!usb && !net) {
        return true;
    }
    return (usb && d.type == ConnectionType::Value::Usb) ||
           (net && d.type == ConnectionType::Value::Network);
}

} // namespace

// -------- Factory Methods --------

Result<Device, Error> Device::create(std::shared_ptr<Provider> provider,
                                     const std::string&        udid,
                                     LookupOptions             options) {
    if (!provider) {
        return Err(Error::InvalidArgument("no provider"));
    }
    if (udid.empty()) {
        return Err(Error::InvalidArgument("empty udid"));
    }
    BUSQ_TRY(devices, provider->list_devices());

    const DeviceInfo* chosen = nullptr;
    bool prefer_network      = has_flag(options, LookupOptions::PreferNetwork);
    for (const auto& d : devices) {
        if (d.udid != udid || !allowed(d, options)) {
            continue;
        }
        if (!chosen) {
            chosen = &d;
            continue;
        }
        // Several transports for the same device: USB wins unless told otherwise
        auto wanted = prefer_network ? ConnectionType::Value::Network : ConnectionType::Value::Usb;
        if (d.type == wanted && chosen->type != wanted) {
            chosen = &d;
        }
    }
    if (!chosen) {
        return Err(Error(MobileDeviceError::NoDevice, "no device " + udid));
    }
    logger()->debug("device: {} via {} (handle {})", udid, chosen->type.to_string(),
                    chosen->handle);
    return Ok(Device(std::move(provider), *chosen));
}

Result<Device, Error> Device::adopt(std::shared_ptr<Provider> provider, DeviceInfo info) {
    if (!provider) {
        return Err(Error::InvalidArgument("no provider"));
    }
    return Ok(Device(std::move(provider), std::move(info)));
}

Result<std::vector<DeviceInfo>, Error> Device::list(Provider& provider) {
    return provider.list_devices();
}

Result<Disposable, Error> Device::subscribe(Provider& provider, DeviceEventCallback callback) {
    if (!callback) {
        return Err(Error::InvalidArgument("no event callback"));
    }
    return provider.subscribe(std::move(callback));
}

// -------- Ops --------

Result<Connection, Error> Device::connect(uint16_t port) {
    if (released()) {
        return Err(deallocated());
    }
    BUSQ_TRY(stream, provider_->connect(*info_, port));
    return Ok(Connection::adopt(std::move(stream)));
}

Result<std::string, Error> Device::udid() const {
    if (released()) {
        return Err(deallocated());
    }
    return Ok(info_->udid);
}

Result<uint32_t, Error> Device::handle() const {
    if (released()) {
        return Err(deallocated());
    }
    return Ok(info_->handle);
}

Result<ConnectionType, Error> Device::connection_type() const {
    if (released()) {
        return Err(deallocated());
    }
    return Ok(info_->type);
}

Result<std::shared_ptr<Provider>, Error> Device::provider() const {
    if (released()) {
        return Err(deallocated());
    }
    return Ok(provider_);
}

Result<DeviceInfo, Error> Device::info() const {
    if (released()) {
        return Err(deallocated());
    }
    return Ok(*info_);
}

void Device::release() noexcept {
    info_.reset();
    provider_.reset();
}

} // namespace Busq
