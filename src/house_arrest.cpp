// busq++ contributors

#include <busq++/house_arrest.hpp>
#include <busq++/lockdown.hpp>
#include <busq++/log.hpp>

namespace Busq {

namespace {
Error remap(const Error& e) {
    return remap_error(e, HouseArrestError::ConnectionFailed, HouseArrestError::ConnectionFailed,
                       HouseArrestError::ConnectionFailed, HouseArrestError::PlistError,
                       HouseArrestError::InvalidArgument);
}
} // namespace

Result<HouseArrestClient, Error> HouseArrestClient::connect(Device& device, ServiceDescriptor&& descriptor) {
    auto conn = open_service_connection(device, std::move(descriptor));
    if (conn.is_err()) {
        return Err(remap(conn.unwrap_err()));
    }
    return Ok(HouseArrestClient(std::move(conn).unwrap()));
}

Result<HouseArrestClient, Error> HouseArrestClient::start(Device& device, const std::string& label) {
    return start_service_client<HouseArrestClient>(device, label);
}

void HouseArrestClient::free() noexcept {
    if (service_) {
        service_->connection().disconnect();
        service_.reset();
    }
    afc_mode_ = false;
}

Result<void, Error> HouseArrestClient::ensure_usable() const {
    if (afc_mode_) {
        return Err(Error(HouseArrestError::InvalidMode, "connection was handed to AFC"));
    }
    if (!service_) {
        return Err(Error(HouseArrestError::DeallocatedClient, "house arrest client was released"));
    }
    return Ok();
}

Result<void, Error> HouseArrestClient::send_request(const Value& request) {
    BUSQ_TRY_VOID(ensure_usable());
    if (request.type() != ValueType::Dictionary) {
        return Err(Error(HouseArrestError::InvalidArgument, "request must be a dictionary"));
    }
    auto sent = service_->send(request);
    if (sent.is_err()) {
        return Err(remap(sent.unwrap_err()));
    }
    return Ok();
}

Result<void, Error> HouseArrestClient::send_command(const std::string& command, const std::string& app_id) {
    if (command.empty() || app_id.empty()) {
        return Err(Error(HouseArrestError::InvalidArgument, "command and app id are required"));
    }
    Value request = Value::new_dict();
    request.set("Command", Value::from_string(command)).unwrap();
    request.set("Identifier", Value::from_string(app_id)).unwrap();
    logger()->debug("house_arrest: {} {}", command, app_id);
    return send_request(request);
}

Result<Value, Error> HouseArrestClient::get_result() {
    BUSQ_TRY_VOID(ensure_usable());
    auto reply = service_->receive();
    if (reply.is_err()) {
        return Err(remap(reply.unwrap_err()));
    }
    return Ok(std::move(reply).unwrap());
}

Result<void, Error> HouseArrestClient::vend(const char* command, const std::string& app_id) {
    BUSQ_TRY_VOID(send_command(command, app_id));
    BUSQ_TRY(result, get_result());
    if (auto err = result["Error"].as_string()) {
        return Err(Error(HouseArrestError::Unknown, std::string(command) + " " + app_id + ": " + *err));
    }
    if (result["Status"].as_string() != std::optional<std::string>("Complete")) {
        return Err(Error(HouseArrestError::Unknown, std::string(command) + " did not complete"));
    }
    return Ok();
}

Result<void, Error> HouseArrestClient::vend_container(const std::string& app_id) {
    return vend("VendContainer", app_id);
}

Result<void, Error> HouseArrestClient::vend_documents(const std::string& app_id) {
    return vend("VendDocuments", app_id);
}

Result<Connection, Error> HouseArrestClient::into_afc_connection() {
    BUSQ_TRY_VOID(ensure_usable());
    Connection conn = std::move(*service_).into_connection();
    service_.reset();
    afc_mode_ = true;
    return Ok(std::move(conn));
}

} // namespace Busq
