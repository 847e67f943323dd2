// busq++ contributors

#include <busq++/log.hpp>
#include <busq++/service.hpp>

namespace Busq {

const char* service_name(ServiceIdentifier id) noexcept {
    switch (id) {
    case ServiceIdentifier::Afc:
        return "com.apple.afc";
    case ServiceIdentifier::DebugServer:
        return "com.apple.debugserver";
    case ServiceIdentifier::DiagnosticsRelay:
        return "com.apple.diagnostics_relay";
    case ServiceIdentifier::FileRelay:
        return "com.apple.mobile.file_relay";
    case ServiceIdentifier::SyslogRelay:
        return "com.apple.syslog_relay";
    case ServiceIdentifier::Heartbeat:
        return "com.apple.mobile.heartbeat";
    case ServiceIdentifier::HouseArrest:
        return "com.apple.mobile.house_arrest";
    case ServiceIdentifier::InstallationProxy:
        return "com.apple.mobile.installation_proxy";
    case ServiceIdentifier::Misagent:
        return "com.apple.misagent";
    case ServiceIdentifier::MobileImageMounter:
        return "com.apple.mobile.mobile_image_mounter";
    case ServiceIdentifier::MobileActivationd:
        return "com.apple.mobileactivationd";
    case ServiceIdentifier::MobileBackup:
        return "com.apple.mobilebackup";
    case ServiceIdentifier::MobileBackup2:
        return "com.apple.mobilebackup2";
    case ServiceIdentifier::MobileSync:
        return "com.apple.mobileSync";
    case ServiceIdentifier::NotificationProxy:
        return "com.apple.mobile.notification_proxy";
    case ServiceIdentifier::Preboard:
        return "com.apple.preboard_service_v2";
    case ServiceIdentifier::Springboard:
        return "com.apple.springboardservices";
    case ServiceIdentifier::Screenshot:
        return "com.apple.mobile.screenshotr";
    case ServiceIdentifier::WebInspector:
        return "com.apple.webinspector";
    }
    return "";
}

Result<Connection, Error> open_service_connection(Device& device, ServiceDescriptor&& descriptor) {
    ServiceDescriptor d = std::move(descriptor);
    if (d.port == 0) {
        return Err(Error(LockdownError::NotStartService, d.identifier + " has no port"));
    }
    BUSQ_TRY(conn, device.connect(d.port));
    if (d.ssl_enabled) {
        if (!d.security) {
            return Err(Error(MobileDeviceError::SslError, d.identifier + " wants TLS without a channel"));
        }
        conn.set_security(std::move(d.security));
        BUSQ_TRY_VOID(conn.enable_security());
    }
    logger()->debug("service: {} connected on port {}{}", d.identifier, d.port,
                    d.ssl_enabled ? " (tls)" : "");
    return Ok(std::move(conn));
}

} // namespace Busq
