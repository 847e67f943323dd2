// busq++ contributors

#include <busq++/lockdown.hpp>
#include <busq++/log.hpp>
#include <busq++/screenshot.hpp>

namespace Busq {

namespace {

Error remap(const Error& e) {
    return remap_error(e, ScreenshotError::MuxError, ScreenshotError::SslError,
                       ScreenshotError::ReceiveTimeout, ScreenshotError::PlistError,
                       ScreenshotError::InvalidArgument);
}

Value dl_message(const char* name) {
    Value message = Value::new_array();
    message.append(Value::from_string(name)).unwrap();
    return message;
}

} // namespace

// -------- Factory Methods --------

Result<ScreenshotClient, Error> ScreenshotClient::connect(Device& device, ServiceDescriptor&& descriptor) {
    auto conn = open_service_connection(device, std::move(descriptor));
    if (conn.is_err()) {
        return Err(remap(conn.unwrap_err()));
    }
    return from_connection(std::move(conn).unwrap());
}

Result<ScreenshotClient, Error> ScreenshotClient::start(Device& device, const std::string& label) {
    return start_service_client<ScreenshotClient>(device, label);
}

Result<ScreenshotClient, Error> ScreenshotClient::from_connection(Connection&& conn) {
    ScreenshotClient client(std::move(conn));
    auto             exchanged = client.version_exchange();
    if (exchanged.is_err()) {
        client.service_->connection().disconnect();
        client.service_.reset();
        return Err(std::move(exchanged).unwrap_err());
    }
    return Ok(std::move(client));
}

ScreenshotClient& ScreenshotClient::operator=(ScreenshotClient&& other) noexcept {
    if (this != &other) {
        free();
        service_ = std::move(other.service_);
        other.service_.reset();
    }
    return *this;
}

void ScreenshotClient::free() noexcept {
    if (!service_) {
        return;
    }
    Value bye = dl_message("DLMessageDisconnect");
    bye.append(Value::from_string("___EmptyParameterString___")).unwrap();
    auto sent = service_->send(bye, Format::Binary);
    if (sent.is_err()) {
        logger()->debug("screenshot: disconnect message: {}", sent.unwrap_err().to_string());
    }
    service_->connection().disconnect();
    service_.reset();
}

// -------- DeviceLink --------

Result<void, Error> ScreenshotClient::send_message(Value&& message) {
    if (!service_) {
        return Err(Error(ScreenshotError::DeallocatedService, "screenshot client was released"));
    }
    auto sent = service_->send(message, Format::Binary);
    if (sent.is_err()) {
        return Err(remap(sent.unwrap_err()));
    }
    return Ok();
}

Result<Value, Error> ScreenshotClient::receive_message() {
    if (!service_) {
        return Err(Error(ScreenshotError::DeallocatedService, "screenshot client was released"));
    }
    auto reply = service_->receive();
    if (reply.is_err()) {
        return Err(remap(reply.unwrap_err()));
    }
    Value message = std::move(reply).unwrap();
    if (message.type() != ValueType::Array || message.size() == 0) {
        return Err(Error(ScreenshotError::PlistError, "DeviceLink message is not an array"));
    }
    return Ok(std::move(message));
}

Result<void, Error> ScreenshotClient::version_exchange() {
    BUSQ_TRY(offer, receive_message());
    if (offer[0].as_string() != std::optional<std::string>("DLMessageVersionExchange")) {
        return Err(Error(ScreenshotError::PlistError, "expected DLMessageVersionExchange"));
    }
    auto major = offer[1].as_uint();
    auto minor = offer[2].as_uint();
    if (!major || !minor) {
        return Err(Error(ScreenshotError::PlistError, "version exchange carries no version"));
    }
    if (*major > kVersionMajor || (*major == kVersionMajor && *minor > kVersionMinor)) {
        return Err(Error(ScreenshotError::BadVersion, "device speaks DeviceLink " + std::to_string(*major) +
                                                          "." + std::to_string(*minor)));
    }

    Value answer = dl_message("DLMessageVersionExchange");
    answer.append(Value::from_string("DLVersionsOk")).unwrap();
    answer.append(Value::from_uint(kVersionMajor)).unwrap();
    BUSQ_TRY_VOID(send_message(std::move(answer)));

    BUSQ_TRY(ready, receive_message());
    if (ready[0].as_string() != std::optional<std::string>("DLMessageDeviceReady")) {
        return Err(Error(ScreenshotError::BadVersion, "device did not report ready"));
    }
    logger()->debug("screenshot: DeviceLink {}.{} ready", *major, *minor);
    return Ok();
}

// -------- Ops --------

Result<std::vector<uint8_t>, Error> ScreenshotClient::take_screenshot() {
    Value request = dl_message("DLMessageProcessMessage");
    Value body    = Value::new_dict();
    body.set("MessageType", Value::from_string("ScreenShotRequest")).unwrap();
    request.append(std::move(body)).unwrap();
    BUSQ_TRY_VOID(send_message(std::move(request)));

    BUSQ_TRY(reply, receive_message());
    if (reply[0].as_string() != std::optional<std::string>("DLMessageProcessMessage")) {
        return Err(Error(ScreenshotError::PlistError, "unexpected DeviceLink message"));
    }
    ValueRef payload = reply[1];
    if (payload["MessageType"].as_string() != std::optional<std::string>("ScreenShotReply")) {
        return Err(Error(ScreenshotError::PlistError, "reply is not a ScreenShotReply"));
    }
    auto data = payload["ScreenShotData"].as_data();
    if (!data) {
        return Err(Error(ScreenshotError::PlistError, "reply carries no ScreenShotData"));
    }
    logger()->debug("screenshot: {} bytes", data->size());
    return Ok(std::move(*data));
}

} // namespace Busq
