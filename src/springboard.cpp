// busq++ contributors

#include <busq++/lockdown.hpp>
#include <busq++/log.hpp>
#include <busq++/springboard.hpp>

namespace Busq {

namespace {

Error remap(const Error& e) {
    return remap_error(e, SpringboardError::ConnectionFailed, SpringboardError::ConnectionFailed,
                       SpringboardError::ConnectionFailed, SpringboardError::PlistError,
                       SpringboardError::InvalidArgument);
}

Value command(const char* name) {
    Value request = Value::new_dict();
    request.set("command", Value::from_string(name)).unwrap();
    return request;
}

} // namespace

const char* to_string(InterfaceOrientation orientation) noexcept {
    switch (orientation) {
    case InterfaceOrientation::Unknown:
        return "Unknown";
    case InterfaceOrientation::Portrait:
        return "Portrait";
    case InterfaceOrientation::PortraitUpsideDown:
        return "PortraitUpsideDown";
    case InterfaceOrientation::LandscapeRight:
        return "LandscapeRight";
    case InterfaceOrientation::LandscapeLeft:
        return "LandscapeLeft";
    }
    return "Unknown";
}

Result<SpringboardClient, Error> SpringboardClient::connect(Device& device, ServiceDescriptor&& descriptor) {
    auto conn = open_service_connection(device, std::move(descriptor));
    if (conn.is_err()) {
        return Err(remap(conn.unwrap_err()));
    }
    return Ok(SpringboardClient(std::move(conn).unwrap()));
}

Result<SpringboardClient, Error> SpringboardClient::start(Device& device, const std::string& label) {
    return start_service_client<SpringboardClient>(device, label);
}

SpringboardClient& SpringboardClient::operator=(SpringboardClient&& other) noexcept {
    if (this != &other) {
        free();
        service_ = std::move(other.service_);
        other.service_.reset();
    }
    return *this;
}

void SpringboardClient::free() noexcept {
    if (service_) {
        service_->connection().disconnect();
        service_.reset();
    }
}

Result<Value, Error> SpringboardClient::call(Value&& request) {
    if (!service_) {
        return Err(Error(SpringboardError::DeallocatedService, "springboard client was released"));
    }
    logger()->debug("springboard: {}", request["command"].as_string().value_or("?"));
    auto sent = service_->send(request, Format::Binary);
    if (sent.is_err()) {
        return Err(remap(sent.unwrap_err()));
    }
    auto reply = service_->receive();
    if (reply.is_err()) {
        return Err(remap(reply.unwrap_err()));
    }
    return Ok(std::move(reply).unwrap());
}

Result<std::vector<uint8_t>, Error> SpringboardClient::png(Value&& request) {
    BUSQ_TRY(reply, call(std::move(request)));
    auto data = reply["pngData"].as_data();
    if (!data) {
        return Err(Error(SpringboardError::Unknown, "reply carries no pngData"));
    }
    return Ok(std::move(*data));
}

Result<std::vector<uint8_t>, Error> SpringboardClient::get_icon_png_data(const std::string& bundle_id) {
    if (bundle_id.empty()) {
        return Err(Error(SpringboardError::InvalidArgument, "bundle id is required"));
    }
    Value request = command("getIconPNGData");
    request.set("bundleId", Value::from_string(bundle_id)).unwrap();
    return png(std::move(request));
}

Result<std::vector<uint8_t>, Error> SpringboardClient::get_home_screen_wallpaper_png_data() {
    return png(command("getHomeScreenWallpaperPNGData"));
}

Result<InterfaceOrientation, Error> SpringboardClient::get_interface_orientation() {
    BUSQ_TRY(reply, call(command("getInterfaceOrientation")));
    auto value = reply["interfaceOrientation"].as_uint();
    if (!value) {
        return Err(Error(SpringboardError::Unknown, "reply carries no interfaceOrientation"));
    }
    if (*value > static_cast<uint64_t>(InterfaceOrientation::LandscapeLeft)) {
        return Ok(InterfaceOrientation::Unknown);
    }
    return Ok(static_cast<InterfaceOrientation>(*value));
}

Result<Value, Error> SpringboardClient::get_icon_state(const std::optional<std::string>& format_version) {
    Value request = command("getIconState");
    if (format_version) {
        request.set("formatVersion", Value::from_string(*format_version)).unwrap();
    }
    return call(std::move(request));
}

} // namespace Busq
