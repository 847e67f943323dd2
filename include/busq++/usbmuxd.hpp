// busq++ contributors

#ifndef BUSQ_USBMUXD_HPP
#define BUSQ_USBMUXD_HPP

#include <busq++/provider.hpp>
#include <busq++/value.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Busq {

// Where the multiplexer listens: a unix socket path or host:port
class UsbmuxdAddr {
  public:
#if defined(__unix__) || defined(__APPLE__)
    static UsbmuxdAddr                 unix_new(std::string path);
#endif
    static UsbmuxdAddr                 tcp_new(std::string host, uint16_t port);
    // "UNIX:/path" or "host:port"
    static Result<UsbmuxdAddr, Error>  parse(const std::string& address);
    // USBMUXD_SOCKET_ADDRESS when set, otherwise /var/run/usbmuxd
    static UsbmuxdAddr                 default_new();

    Result<std::unique_ptr<Stream>, Error> connect() const;
    std::string                        to_string() const;

  private:
    UsbmuxdAddr(bool is_unix, std::string target, uint16_t port)
        : is_unix_(is_unix), target_(std::move(target)), port_(port) {}

    bool        is_unix_ = true;
    std::string target_;
    uint16_t    port_ = 0;
};

// One request/response session with usbmuxd (plist protocol, version 1)
class UsbmuxdConnection {
  public:
    static Result<UsbmuxdConnection, Error> connect(const UsbmuxdAddr& addr, uint32_t tag = 0);

    ~UsbmuxdConnection() noexcept                                = default;
    UsbmuxdConnection(UsbmuxdConnection&&) noexcept              = default;
    UsbmuxdConnection& operator=(UsbmuxdConnection&&) noexcept   = default;
    UsbmuxdConnection(const UsbmuxdConnection&)                  = delete;
    UsbmuxdConnection& operator=(const UsbmuxdConnection&)       = delete;

    Result<std::vector<DeviceInfo>, Error>   get_devices();
    Result<std::string, Error>               get_buid();
    Result<std::vector<uint8_t>, Error>      get_pair_record(const std::string& udid);
    Result<void, Error>                      save_pair_record(const std::string&          udid,
                                                              uint32_t                    device_id,
                                                              const std::vector<uint8_t>& record);
    Result<void, Error>                      delete_pair_record(const std::string& udid);

    // Turns this connection into an event stream
    Result<void, Error>                      listen();
    // nullopt when nothing arrived within the timeout
    Result<std::optional<Value>, Error>      next_message(std::optional<uint32_t> timeout_ms);

    // Consumes the connection: on success the socket is a tunnel to the device port
    Result<std::unique_ptr<Stream>, Error>   connect_to_device(uint32_t device_id, uint16_t port) &&;
    Result<std::unique_ptr<Stream>, Error>   connect_to_device(uint32_t, uint16_t) & = delete;

  private:
    UsbmuxdConnection(std::unique_ptr<Stream> stream, uint32_t tag) noexcept
        : stream_(std::move(stream)), tag_(tag) {}

    Result<void, Error>  send_message(const Value& message);
    Result<Value, Error> request(Value&& message);

    std::unique_ptr<Stream> stream_;
    uint32_t                tag_ = 0;
};

// Parses a usbmuxd device record ({DeviceID, Properties{SerialNumber, ConnectionType}})
std::optional<DeviceInfo> device_info_from_record(ValueRef record);

class UsbmuxdProvider : public Provider {
  public:
    explicit UsbmuxdProvider(UsbmuxdAddr addr = UsbmuxdAddr::default_new()) : addr_(std::move(addr)) {}

    Result<std::vector<DeviceInfo>, Error> list_devices() override;
    Result<Disposable, Error>              subscribe(DeviceEventCallback callback) override;
    Result<std::unique_ptr<Stream>, Error> connect(const DeviceInfo& device, uint16_t port) override;
    Result<PairRecord, Error>              read_pair_record(const std::string& udid) override;
    Result<void, Error>                    save_pair_record(const DeviceInfo& device,
                                                            const PairRecord& record) override;
    Result<void, Error>                    delete_pair_record(const std::string& udid) override;
    Result<std::string, Error>             read_buid() override;

    const UsbmuxdAddr&                     addr() const noexcept { return addr_; }

  private:
    UsbmuxdAddr addr_;
};

} // namespace Busq
#endif
