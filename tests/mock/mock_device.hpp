#ifndef BUSQ_TESTS_MOCK_DEVICE_HPP
#define BUSQ_TESTS_MOCK_DEVICE_HPP

#include <busq++/device.hpp>
#include <busq++/provider.hpp>
#include <busq++/value.hpp>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace BusqTest {

constexpr const char* kMockUdid = "ABC123";

// Device side of one connection: takes the host's bytes, answers with bytes
class Endpoint {
  public:
    virtual ~Endpoint() = default;

    // Sent to the host as soon as the connection opens
    virtual std::vector<uint8_t> on_open() { return {}; }
    virtual std::vector<uint8_t> on_data(const uint8_t* data, size_t len) = 0;
};

// In-memory duplex connection between a MockStream and an Endpoint
class Pipe {
  public:
    explicit Pipe(std::shared_ptr<Endpoint> endpoint);

    // Host to device; false once closed
    bool                 write(const uint8_t* data, size_t len);
    // Device to host, outside of any request
    void                 push(const std::vector<uint8_t>& bytes);
    void                 push(const std::string& text);
    // Bytes copied; nullopt when the pipe is closed and drained
    std::optional<size_t> read(uint8_t* buf, size_t len, std::optional<uint32_t> timeout_ms);

    void                 close();
    bool                 closed() const;
    std::vector<uint8_t> written() const;
    std::string          written_text() const;

  private:
    mutable std::mutex        mutex_;
    std::condition_variable   cv_;
    std::shared_ptr<Endpoint> endpoint_;
    std::deque<uint8_t>       inbound_;
    std::vector<uint8_t>      written_;
    bool                      closed_ = false;
};

class MockStream : public Busq::Stream {
  public:
    explicit MockStream(std::shared_ptr<Pipe> pipe) : pipe_(std::move(pipe)) {}
    ~MockStream() override { close(); }

    Busq::Result<size_t, Busq::Error> send(const uint8_t* data, size_t len) override;
    Busq::Result<size_t, Busq::Error>
         receive(uint8_t* buf, size_t len, std::optional<uint32_t> timeout_ms) override;
    int  fd() const noexcept override { return -1; }
    void close() noexcept override { pipe_->close(); }

  private:
    std::shared_ptr<Pipe> pipe_;
};

// Hands bytes through unchanged once enabled
class PassthroughChannel : public Busq::SecureChannel {
  public:
    Busq::Result<void, Busq::Error>   enable(Busq::Stream& raw) override;
    Busq::Result<void, Busq::Error>   disable() override;
    bool                              enabled() const noexcept override { return raw_ != nullptr; }

    Busq::Result<size_t, Busq::Error> send(const uint8_t* data, size_t len) override;
    Busq::Result<size_t, Busq::Error>
    receive(uint8_t* buf, size_t len, std::optional<uint32_t> timeout_ms) override;

  private:
    Busq::Stream* raw_ = nullptr;
};

// Length-prefixed plist messages in, replies out
class PlistEndpoint : public Endpoint {
  public:
    std::vector<uint8_t> on_open() override;
    std::vector<uint8_t> on_data(const uint8_t* data, size_t len) override;

    static std::vector<uint8_t> frame(const Busq::Value& message, Busq::Format format);

  protected:
    virtual std::vector<Busq::Value> greeting() { return {}; }
    virtual std::vector<Busq::Value> handle(Busq::ValueRef request) = 0;

    Busq::Format reply_format_ = Busq::Format::Xml;

  private:
    std::vector<uint8_t> buffer_;
};

// lockdownd: sessions, values and StartService
class MockLockdown : public PlistEndpoint {
  public:
    MockLockdown();

    Busq::Value                             values;
    std::map<std::string, Busq::Value>      domains;
    std::map<std::string, uint16_t>         services;
    // Request name -> device Error string
    std::map<std::string, std::string>      forced_errors;
    bool                                    session_ssl = false;
    bool                                    service_ssl = false;

    std::vector<std::string>                requests;
    std::optional<std::string>              session;

    // Sessions belong to one connection
    std::vector<uint8_t>                    on_open() override;

  protected:
    std::vector<Busq::Value> handle(Busq::ValueRef request) override;

  private:
    Busq::Value reply_to(Busq::ValueRef request, const std::string& name);
    int         session_count_ = 0;
};

// installation_proxy with a fixed application list
class MockInstallationProxy : public PlistEndpoint {
  public:
    MockInstallationProxy();

    void                       add_app(const std::string& bundle_id,
                                       const std::string& type,
                                       const std::string& display_name);

    std::vector<Busq::Value>   apps;
    size_t                     page_size = 2;
    // PackagePath whose install fails with APIInternalError
    std::string                failing_package;
    // Install never reaches Complete
    bool                       stall_install = false;

    std::vector<std::string>   commands;
    Busq::Value                last_options;

  protected:
    std::vector<Busq::Value> handle(Busq::ValueRef request) override;

  private:
    bool                       matches_type(Busq::ValueRef app, Busq::ValueRef options) const;
    Busq::Value                project(Busq::ValueRef app, Busq::ValueRef options) const;
    std::vector<Busq::Value>   browse(Busq::ValueRef options);
    std::vector<Busq::Value>   progress(const std::vector<std::string>& steps);
};

class AfcEmulator;

// house_arrest: vends a container, after which the connection speaks AFC
class MockHouseArrest : public PlistEndpoint {
  public:
    explicit MockHouseArrest(std::shared_ptr<AfcEmulator> afc) : afc_(std::move(afc)) {}

    std::set<std::string> apps;

    std::vector<uint8_t>  on_open() override;
    std::vector<uint8_t>  on_data(const uint8_t* data, size_t len) override;

  protected:
    std::vector<Busq::Value> handle(Busq::ValueRef request) override;

  private:
    std::shared_ptr<AfcEmulator> afc_;
    bool                         vended_ = false;
};

struct DeviceEventSink;

class MockProvider : public Busq::Provider {
  public:
    MockProvider();
    ~MockProvider() override;

    void                          add_device(const Busq::DeviceInfo& info);
    void                          set_pair_record(const std::string& udid, Busq::Value&& record);
    bool                          has_pair_record(const std::string& udid) const;
    void                          route(uint16_t port, std::shared_ptr<Endpoint> endpoint);
    std::shared_ptr<Pipe>         last_pipe(uint16_t port) const;
    void                          emit(const Busq::DeviceEvent& event);
    size_t                        subscribers() const;

    size_t                        connects          = 0;
    size_t                        secure_channels   = 0;

    Busq::Result<std::vector<Busq::DeviceInfo>, Busq::Error> list_devices() override;
    Busq::Result<Busq::Disposable, Busq::Error> subscribe(Busq::DeviceEventCallback callback) override;
    Busq::Result<std::unique_ptr<Busq::Stream>, Busq::Error> connect(const Busq::DeviceInfo& device,
                                                                     uint16_t                port) override;
    Busq::Result<Busq::PairRecord, Busq::Error> read_pair_record(const std::string& udid) override;
    Busq::Result<void, Busq::Error>             save_pair_record(const Busq::DeviceInfo& device,
                                                                 const Busq::PairRecord& record) override;
    Busq::Result<void, Busq::Error>             delete_pair_record(const std::string& udid) override;
    Busq::Result<std::string, Busq::Error>      read_buid() override;
    Busq::Result<std::unique_ptr<Busq::SecureChannel>, Busq::Error>
    new_secure_channel(const Busq::PairRecord& record) override;

  private:
    mutable std::mutex                               mutex_;
    std::vector<Busq::DeviceInfo>                    devices_;
    std::map<std::string, std::vector<uint8_t>>      records_;
    std::map<uint16_t, std::shared_ptr<Endpoint>>    routes_;
    std::map<uint16_t, std::shared_ptr<Pipe>>        pipes_;
    std::shared_ptr<DeviceEventSink>                 sink_;
};

// Pair record the mock lockdown accepts
Busq::Value sample_pair_record();

// One USB device "ABC123" with a paired host and lockdown on its port
struct MockEnvironment {
    std::shared_ptr<MockProvider> provider;
    std::shared_ptr<MockLockdown> lockdown;
    uint16_t                      next_port = 49152;

    static MockEnvironment create();

    // Routes a fresh port and registers it with lockdown under name
    uint16_t               add_service(const std::string& name, std::shared_ptr<Endpoint> endpoint);
    Busq::Device           device();
};

} // namespace BusqTest
#endif
