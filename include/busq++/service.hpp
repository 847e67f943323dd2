// busq++ contributors

#ifndef BUSQ_SERVICE_HPP
#define BUSQ_SERVICE_HPP

#include <busq++/connection.hpp>
#include <busq++/device.hpp>
#include <busq++/error.hpp>
#include <busq++/secure_channel.hpp>

#include <memory>
#include <string>

namespace Busq {

enum class ServiceIdentifier : uint8_t {
    Afc,
    DebugServer,
    DiagnosticsRelay,
    FileRelay,
    SyslogRelay,
    Heartbeat,
    HouseArrest,
    InstallationProxy,
    Misagent,
    MobileImageMounter,
    MobileActivationd,
    MobileBackup,
    MobileBackup2,
    MobileSync,
    NotificationProxy,
    Preboard,
    Springboard,
    Screenshot,
    WebInspector,
};

// "com.apple.afc", ...
const char* service_name(ServiceIdentifier id) noexcept;

// Result of a lockdown StartService. Single use: consumed by exactly one
// client constructor.
struct ServiceDescriptor {
    uint16_t                       port = 0;
    bool                           ssl_enabled = false;
    std::string                    identifier;
    bool                           escrow_bag_attached = false;
    // Ready to enable when ssl_enabled
    std::unique_ptr<SecureChannel> security;

    ServiceDescriptor() = default;
    ServiceDescriptor(ServiceDescriptor&&) noexcept            = default;
    ServiceDescriptor& operator=(ServiceDescriptor&&) noexcept = default;
    ServiceDescriptor(const ServiceDescriptor&)                = delete;
    ServiceDescriptor& operator=(const ServiceDescriptor&)     = delete;
};

// Connects to the descriptor's port and turns on service TLS when requested
Result<Connection, Error> open_service_connection(Device& device, ServiceDescriptor&& descriptor);

// Re-homes transport and codec failures into a service taxonomy. Errors from
// any other domain (lockdown, the service's own) pass through unchanged.
template <typename E>
Error remap_error(const Error& e, E mux, E ssl, E timeout, E plist, E invalid) {
    E kind = mux;
    if (e.in(ErrorDomain::Plist)) {
        kind = plist;
    } else if (!e.in(ErrorDomain::MobileDevice)) {
        return e;
    } else if (e.is(MobileDeviceError::SslError)) {
        kind = ssl;
    } else if (e.is(MobileDeviceError::Timeout)) {
        kind = timeout;
    } else if (e.is(MobileDeviceError::InvalidArgument)) {
        kind = invalid;
    }
    return Error(kind, e.to_string());
}

} // namespace Busq
#endif
