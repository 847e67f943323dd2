// busq++ contributors

#ifndef BUSQ_FILE_RELAY_HPP
#define BUSQ_FILE_RELAY_HPP

#include <busq++/device.hpp>
#include <busq++/property_list_service.hpp>
#include <busq++/service.hpp>

#include <optional>
#include <string>
#include <vector>

namespace Busq {

enum class FileRelaySource : uint8_t {
    AppleSupport,
    Network,
    Vpn,
    WiFi,
    UserDatabases,
    CrashReporter,
    Tmp,
    SystemConfiguration,
};

// Wire name: "AppleSupport", "VPN", "tmp", ...
const char* to_string(FileRelaySource source) noexcept;

// One-shot: after request_sources the connection carries a cpio.gz archive
// and belongs to the caller.
class FileRelayClient {
  public:
    static constexpr const char* kServiceName      = "com.apple.mobile.file_relay";
    static constexpr uint32_t    kDefaultTimeoutMs = 60000;

    static Result<FileRelayClient, Error> connect(Device& device, ServiceDescriptor&& descriptor);
    static Result<FileRelayClient, Error> start(Device& device, const std::string& label = "busq");
    static FileRelayClient                adopt(Connection&& conn) noexcept { return FileRelayClient(std::move(conn)); }

    Result<Connection, Error> request_sources(const std::vector<FileRelaySource>& sources,
                                              uint32_t                            timeout_ms = kDefaultTimeoutMs);

    bool                      released() const noexcept { return !service_.has_value(); }
    void                      free() noexcept;

    ~FileRelayClient() noexcept { free(); }
    FileRelayClient(FileRelayClient&& other) noexcept : service_(std::move(other.service_)) {
        other.service_.reset();
    }
    FileRelayClient& operator=(FileRelayClient&& other) noexcept;
    FileRelayClient(const FileRelayClient&)            = delete;
    FileRelayClient& operator=(const FileRelayClient&) = delete;

  private:
    explicit FileRelayClient(Connection&& conn) noexcept : service_(PropertyListService(std::move(conn))) {}

    std::optional<PropertyListService> service_;
};

} // namespace Busq
#endif
