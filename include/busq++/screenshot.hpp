// busq++ contributors

#ifndef BUSQ_SCREENSHOT_HPP
#define BUSQ_SCREENSHOT_HPP

#include <busq++/device.hpp>
#include <busq++/property_list_service.hpp>
#include <busq++/service.hpp>

#include <optional>
#include <string>
#include <vector>

namespace Busq {

// screenshotr over the DeviceLink message protocol. connect() performs the
// version exchange, so a constructed client is ready to take screenshots.
class ScreenshotClient {
  public:
    static constexpr const char* kServiceName  = "com.apple.mobile.screenshotr";
    static constexpr uint64_t    kVersionMajor = 300;
    static constexpr uint64_t    kVersionMinor = 0;

    static Result<ScreenshotClient, Error> connect(Device& device, ServiceDescriptor&& descriptor);
    static Result<ScreenshotClient, Error> start(Device& device, const std::string& label = "busq");
    // Runs the version exchange on an already connected stream
    static Result<ScreenshotClient, Error> from_connection(Connection&& conn);

    // TIFF on older devices, PNG on newer ones
    Result<std::vector<uint8_t>, Error> take_screenshot();

    bool                                released() const noexcept { return !service_.has_value(); }
    // Sends DLMessageDisconnect before closing
    void                                free() noexcept;

    // RAII / moves
    ~ScreenshotClient() noexcept { free(); }
    ScreenshotClient(ScreenshotClient&& other) noexcept : service_(std::move(other.service_)) {
        other.service_.reset();
    }
    ScreenshotClient& operator=(ScreenshotClient&& other) noexcept;
    ScreenshotClient(const ScreenshotClient&)                = delete;
    ScreenshotClient& operator=(const ScreenshotClient&)     = delete;

  private:
    explicit ScreenshotClient(Connection&& conn) noexcept : service_(PropertyListService(std::move(conn))) {}

    Result<void, Error>  version_exchange();
    Result<void, Error>  send_message(Value&& message);
    Result<Value, Error> receive_message();

    std::optional<PropertyListService> service_;
};

} // namespace Busq
#endif
