// busq++ contributors

#include <busq++/file_relay.hpp>
#include <busq++/lockdown.hpp>
#include <busq++/log.hpp>

namespace Busq {

namespace {

Error remap(const Error& e) {
    return remap_error(e, FileRelayError::MuxError, FileRelayError::MuxError, FileRelayError::MuxError,
                       FileRelayError::PlistError, FileRelayError::InvalidArgument);
}

FileRelayError relay_error_from_string(const std::string& name) {
    if (name == "InvalidSource") {
        return FileRelayError::InvalidSource;
    }
    if (name == "StagingEmpty") {
        return FileRelayError::StagingEmpty;
    }
    if (name == "PermissionDenied") {
        return FileRelayError::PermissionDenied;
    }
    return FileRelayError::Unknown;
}

} // namespace

const char* to_string(FileRelaySource source) noexcept {
    switch (source) {
    case FileRelaySource::AppleSupport:
        return "AppleSupport";
    case FileRelaySource::Network:
        return "Network";
    case FileRelaySource::Vpn:
        return "VPN";
    case FileRelaySource::WiFi:
        return "WiFi";
    case FileRelaySource::UserDatabases:
        return "UserDatabases";
    case FileRelaySource::CrashReporter:
        return "CrashReporter";
    case FileRelaySource::Tmp:
        return "tmp";
    case FileRelaySource::SystemConfiguration:
        return "SystemConfiguration";
    }
    return "";
}

Result<FileRelayClient, Error> FileRelayClient::connect(Device& device, ServiceDescriptor&& descriptor) {
    auto conn = open_service_connection(device, std::move(descriptor));
    if (conn.is_err()) {
        return Err(remap(conn.unwrap_err()));
    }
    return Ok(FileRelayClient(std::move(conn).unwrap()));
}

Result<FileRelayClient, Error> FileRelayClient::start(Device& device, const std::string& label) {
    return start_service_client<FileRelayClient>(device, label);
}

FileRelayClient& FileRelayClient::operator=(FileRelayClient&& other) noexcept {
    if (this != &other) {
        free();
        service_ = std::move(other.service_);
        other.service_.reset();
    }
    return *this;
}

void FileRelayClient::free() noexcept {
    if (service_) {
        service_->connection().disconnect();
        service_.reset();
    }
}

Result<Connection, Error> FileRelayClient::request_sources(const std::vector<FileRelaySource>& sources,
                                                           uint32_t                            timeout_ms) {
    if (!service_) {
        return Err(Error(FileRelayError::DeallocatedClient, "file relay client was released"));
    }
    if (sources.empty()) {
        return Err(Error(FileRelayError::InvalidArgument, "at least one source is required"));
    }

    Value names = Value::new_array();
    for (FileRelaySource source : sources) {
        names.append(Value::from_string(to_string(source))).unwrap();
    }
    Value request = Value::new_dict();
    request.set("Sources", std::move(names)).unwrap();
    request.set("Request", Value::from_string("Copy")).unwrap();
    logger()->debug("file_relay: requesting {} sources", sources.size());

    auto sent = service_->send(request);
    if (sent.is_err()) {
        return Err(remap(sent.unwrap_err()));
    }
    auto received = service_->receive(timeout_ms);
    if (received.is_err()) {
        return Err(remap(received.unwrap_err()));
    }
    Value reply = std::move(received).unwrap();

    if (auto err = reply["Error"].as_string()) {
        logger()->warn("file_relay: device refused: {}", *err);
        return Err(Error(relay_error_from_string(*err), *err));
    }
    if (reply["Status"].as_string() != std::optional<std::string>("Acknowledged")) {
        return Err(Error(FileRelayError::Unknown, "request was not acknowledged"));
    }

    Connection conn = std::move(*service_).into_connection();
    service_.reset();
    return Ok(std::move(conn));
}

} // namespace Busq
