// busq++ contributors

#ifndef BUSQ_SPRINGBOARD_HPP
#define BUSQ_SPRINGBOARD_HPP

#include <busq++/device.hpp>
#include <busq++/property_list_service.hpp>
#include <busq++/service.hpp>

#include <optional>
#include <string>
#include <vector>

namespace Busq {

enum class InterfaceOrientation : uint8_t {
    Unknown            = 0,
    Portrait           = 1,
    PortraitUpsideDown = 2,
    LandscapeRight     = 3,
    LandscapeLeft      = 4,
};

const char* to_string(InterfaceOrientation orientation) noexcept;

class SpringboardClient {
  public:
    static constexpr const char* kServiceName = "com.apple.springboardservices";

    static Result<SpringboardClient, Error> connect(Device& device, ServiceDescriptor&& descriptor);
    static Result<SpringboardClient, Error> start(Device& device, const std::string& label = "busq");
    static SpringboardClient                adopt(Connection&& conn) noexcept {
        return SpringboardClient(std::move(conn));
    }

    Result<std::vector<uint8_t>, Error> get_icon_png_data(const std::string& bundle_id);
    Result<std::vector<uint8_t>, Error> get_home_screen_wallpaper_png_data();
    Result<InterfaceOrientation, Error> get_interface_orientation();
    // Home screen layout; format_version "2" includes folders
    Result<Value, Error>                get_icon_state(const std::optional<std::string>& format_version = "2");

    bool                                released() const noexcept { return !service_.has_value(); }
    void                                free() noexcept;

    ~SpringboardClient() noexcept { free(); }
    SpringboardClient(SpringboardClient&& other) noexcept : service_(std::move(other.service_)) {
        other.service_.reset();
    }
    SpringboardClient& operator=(SpringboardClient&& other) noexcept;
    SpringboardClient(const SpringboardClient&)            = delete;
    SpringboardClient& operator=(const SpringboardClient&) = delete;

  private:
    explicit SpringboardClient(Connection&& conn) noexcept : service_(PropertyListService(std::move(conn))) {}

    Result<Value, Error>                call(Value&& request);
    Result<std::vector<uint8_t>, Error> png(Value&& request);

    std::optional<PropertyListService> service_;
};

} // namespace Busq
#endif
