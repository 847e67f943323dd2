// busq++ contributors

#ifndef BUSQ_DEBUG_SERVER_HPP
#define BUSQ_DEBUG_SERVER_HPP

#include <busq++/connection.hpp>
#include <busq++/device.hpp>
#include <busq++/service.hpp>

#include <optional>
#include <string>
#include <vector>

namespace Busq {

// A GDB remote serial protocol command: the packet body is the name followed
// by the arguments, unseparated.
class DebugServerCommand {
  public:
    explicit DebugServerCommand(std::string name, std::vector<std::string> arguments = {})
        : name_(std::move(name)), arguments_(std::move(arguments)) {}

    const std::string&              name() const noexcept { return name_; }
    const std::vector<std::string>& arguments() const noexcept { return arguments_; }
    std::string                     body() const;

  private:
    std::string              name_;
    std::vector<std::string> arguments_;
};

class DebugServerClient {
  public:
    static constexpr const char* kServiceName       = "com.apple.debugserver";
    static constexpr const char* kSecureServiceName = "com.apple.debugserver.DVTSecureSocketProxy";
    static constexpr size_t      kReceiveChunk      = 131072;

    static Result<DebugServerClient, Error> connect(Device& device, ServiceDescriptor&& descriptor);
    // Prefers the TLS proxy service, falling back to the plain one on older devices
    static Result<DebugServerClient, Error> start(Device& device, const std::string& label = "busq");
    static DebugServerClient                adopt(Connection&& conn) noexcept {
        return DebugServerClient(std::move(conn));
    }

    // -------- Packet helpers --------
    // Lowercase hex of every byte
    static std::string                  encode_string(const std::string& text);
    static Result<std::string, Error>   decode_string(const std::string& hex);
    // Modulo-256 sum of the body as two hex digits
    static std::string                  checksum(const std::string& body);
    // "$<escaped body>#<checksum>"
    static std::string                  format_packet(const std::string& body);

    // -------- Raw stream --------
    Result<size_t, Error>               send(const uint8_t* data, size_t len);
    Result<std::vector<uint8_t>, Error> receive(size_t size, std::optional<uint32_t> timeout_ms = std::nullopt);
    // Reads chunks until one comes back empty
    Result<std::vector<uint8_t>, Error> receive_all(std::optional<uint32_t> timeout_ms = std::nullopt);

    // -------- Commands --------
    Result<std::string, Error>          send_command(const DebugServerCommand& command);
    Result<std::string, Error>          receive_response();
    // Disabling sends QStartNoAckMode; acks cannot be turned back on
    Result<void, Error>                 set_ack_mode(bool enabled);
    Result<std::string, Error>          set_argv(const std::vector<std::string>& argv);
    Result<std::string, Error>          set_environment_hex_encoded(const std::string& env);

    bool                                ack_mode() const noexcept { return ack_mode_; }
    bool                                released() const noexcept { return !conn_.has_value(); }
    void                                free() noexcept;

    // RAII / moves
    ~DebugServerClient() noexcept { free(); }
    DebugServerClient(DebugServerClient&& other) noexcept
        : conn_(std::move(other.conn_)), ack_mode_(other.ack_mode_) {
        other.conn_.reset();
    }
    DebugServerClient& operator=(DebugServerClient&& other) noexcept;
    DebugServerClient(const DebugServerClient&)            = delete;
    DebugServerClient& operator=(const DebugServerClient&) = delete;

  private:
    explicit DebugServerClient(Connection&& conn) noexcept : conn_(std::move(conn)) {}

    Result<void, Error> ensure_open() const;
    Result<char, Error> read_char();
    Result<void, Error> send_text(const std::string& text);

    std::optional<Connection> conn_;
    bool                      ack_mode_ = true;
};

} // namespace Busq
#endif
