// busq++ contributors

#ifndef BUSQ_SYSLOG_RELAY_HPP
#define BUSQ_SYSLOG_RELAY_HPP

#include <busq++/device.hpp>
#include <busq++/disposable.hpp>
#include <busq++/service.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Busq {

// One syslog line. Lines that do not follow
// "MMM dd HH:mm:ss name process[pid] <Level>: message" only carry raw.
struct SyslogMessage {
    std::string                raw;
    std::optional<std::string> timestamp;
    std::optional<std::string> device_name;
    std::optional<std::string> process;
    std::optional<uint32_t>    pid;
    std::optional<std::string> level;
    std::string                message;

    bool                       parsed() const noexcept { return timestamp.has_value(); }
};

// Turns the relay's character stream into lines. A line is emitted when its
// newline arrives; the unterminated tail waits for the next feed.
class SyslogLineAssembler {
  public:
    std::optional<SyslogMessage> feed(char c);
    std::vector<SyslogMessage>   feed(const std::string& chunk);

    const std::string&           pending() const noexcept { return buffer_; }
    void                         reset() noexcept { buffer_.clear(); }

    static SyslogMessage         parse_line(const std::string& line);

  private:
    std::string buffer_;
};

using SyslogCharCallback    = std::function<void(char)>;
using SyslogMessageCallback = std::function<void(const SyslogMessage&)>;

class SyslogRelayClient {
  public:
    static constexpr const char* kServiceName = "com.apple.syslog_relay";

    static Result<SyslogRelayClient, Error> connect(Device& device, ServiceDescriptor&& descriptor);
    static Result<SyslogRelayClient, Error> start(Device& device, const std::string& label = "busq");
    static SyslogRelayClient                adopt(Connection&& conn);

    // Characters arrive on a library thread, NULs dropped
    Result<Disposable, Error> start_capture(SyslogCharCallback callback);
    Result<Disposable, Error> start_capture_messages(SyslogMessageCallback callback);
    Result<void, Error>       stop_capture();
    bool                      capturing() const noexcept;

    // Whatever arrived within the timeout, NULs dropped; not while capturing
    Result<std::string, Error> receive(std::optional<uint32_t> timeout_ms = std::nullopt);

    bool                      released() const noexcept { return state_ == nullptr; }
    void                      free() noexcept;

    // RAII / moves
    ~SyslogRelayClient() noexcept { free(); }
    SyslogRelayClient(SyslogRelayClient&&) noexcept            = default;
    SyslogRelayClient& operator=(SyslogRelayClient&& other) noexcept;
    SyslogRelayClient(const SyslogRelayClient&)                = delete;
    SyslogRelayClient& operator=(const SyslogRelayClient&)     = delete;

    struct State;

  private:
    explicit SyslogRelayClient(std::shared_ptr<State> state) noexcept : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

} // namespace Busq
#endif
