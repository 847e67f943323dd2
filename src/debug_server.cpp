// busq++ contributors

#include <busq++/debug_server.hpp>
#include <busq++/lockdown.hpp>
#include <busq++/log.hpp>

namespace Busq {

// -------- Anonymous Namespace for Helpers --------
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

Error remap(const Error& e) {
    return remap_error(e, DebugServerError::MuxError, DebugServerError::SslError,
                       DebugServerError::Timeout, DebugServerError::MuxError,
                       DebugServerError::InvalidArgument);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool needs_escape(char c) {
    return c == '$' || c == '#' || c == '}' || c == '*';
}

// "E" followed by two hex digits
bool is_error_reply(const std::string& response) {
    return response.size() == 3 && response[0] == 'E' && hex_value(response[1]) >= 0 &&
           hex_value(response[2]) >= 0;
}

} // namespace

std::string DebugServerCommand::body() const {
    std::string out = name_;
    for (const auto& arg : arguments_) {
        out += arg;
    }
    return out;
}

// -------- Factory Methods --------

Result<DebugServerClient, Error> DebugServerClient::connect(Device& device, ServiceDescriptor&& descriptor) {
    auto conn = open_service_connection(device, std::move(descriptor));
    if (conn.is_err()) {
        return Err(remap(conn.unwrap_err()));
    }
    return Ok(DebugServerClient(std::move(conn).unwrap()));
}

Result<DebugServerClient, Error> DebugServerClient::start(Device& device, const std::string& label) {
    BUSQ_TRY(lockdown, Lockdown::connect_with_handshake(device, label));
    auto descriptor = lockdown.start_service(kSecureServiceName);
    if (descriptor.is_err() && descriptor.unwrap_err().is(LockdownError::InvalidService)) {
        logger()->debug("debug_server: {} unavailable, trying {}", kSecureServiceName, kServiceName);
        descriptor = lockdown.start_service(kServiceName);
    }
    if (descriptor.is_err()) {
        return Err(std::move(descriptor).unwrap_err());
    }
    auto closed = lockdown.close();
    if (closed.is_err()) {
        logger()->debug("lockdown: close after StartService: {}", closed.unwrap_err().to_string());
    }
    return connect(device, std::move(descriptor).unwrap());
}

DebugServerClient& DebugServerClient::operator=(DebugServerClient&& other) noexcept {
    if (this != &other) {
        free();
        conn_     = std::move(other.conn_);
        ack_mode_ = other.ack_mode_;
        other.conn_.reset();
    }
    return *this;
}

void DebugServerClient::free() noexcept {
    if (conn_) {
        conn_->disconnect();
        conn_.reset();
    }
}

// -------- Packet helpers --------

std::string DebugServerClient::encode_string(const std::string& text) {
    std::string out;
    out.reserve(text.size() * 2);
    for (unsigned char c : text) {
        out.push_back(kHexDigits[c >> 4]);
        out.push_back(kHexDigits[c & 0x0f]);
    }
    return out;
}

Result<std::string, Error> DebugServerClient::decode_string(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return Err(Error(DebugServerError::InvalidArgument, "odd length hex string"));
    }
    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Err(Error(DebugServerError::InvalidArgument, "not a hex string"));
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return Ok(std::move(out));
}

std::string DebugServerClient::checksum(const std::string& body) {
    uint8_t sum = 0;
    for (unsigned char c : body) {
        sum = static_cast<uint8_t>(sum + c);
    }
    std::string out;
    out.push_back(kHexDigits[sum >> 4]);
    out.push_back(kHexDigits[sum & 0x0f]);
    return out;
}

std::string DebugServerClient::format_packet(const std::string& body) {
    std::string escaped;
    escaped.reserve(body.size());
    for (char c : body) {
        if (needs_escape(c)) {
            escaped.push_back('}');
            escaped.push_back(static_cast<char>(c ^ 0x20));
        } else {
            escaped.push_back(c);
        }
    }
    return "$" + escaped + "#" + checksum(escaped);
}

// -------- Raw stream --------

Result<void, Error> DebugServerClient::ensure_open() const {
    if (!conn_) {
        return Err(Error(DebugServerError::DeallocatedClient, "debugserver client was released"));
    }
    return Ok();
}

Result<size_t, Error> DebugServerClient::send(const uint8_t* data, size_t len) {
    BUSQ_TRY_VOID(ensure_open());
    auto sent = conn_->send(data, len);
    if (sent.is_err()) {
        return Err(remap(sent.unwrap_err()));
    }
    return Ok(sent.unwrap());
}

Result<void, Error> DebugServerClient::send_text(const std::string& text) {
    BUSQ_TRY_VOID(ensure_open());
    auto sent = conn_->send_all(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    if (sent.is_err()) {
        return Err(remap(sent.unwrap_err()));
    }
    return Ok();
}

Result<std::vector<uint8_t>, Error> DebugServerClient::receive(size_t size, std::optional<uint32_t> timeout_ms) {
    BUSQ_TRY_VOID(ensure_open());
    auto data = conn_->receive(size, timeout_ms);
    if (data.is_err()) {
        return Err(remap(data.unwrap_err()));
    }
    return Ok(std::move(data).unwrap());
}

Result<std::vector<uint8_t>, Error> DebugServerClient::receive_all(std::optional<uint32_t> timeout_ms) {
    std::vector<uint8_t> out;
    for (;;) {
        BUSQ_TRY(chunk, receive(kReceiveChunk, timeout_ms));
        if (chunk.empty()) {
            break;
        }
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    return Ok(std::move(out));
}

Result<char, Error> DebugServerClient::read_char() {
    BUSQ_TRY_VOID(ensure_open());
    auto byte = conn_->receive_exact(1);
    if (byte.is_err()) {
        return Err(remap(byte.unwrap_err()));
    }
    return Ok(static_cast<char>(byte.unwrap()[0]));
}

// -------- Commands --------

Result<std::string, Error> DebugServerClient::receive_response() {
    char c = 0;
    // Acks for our own packet and notification noise come first
    do {
        BUSQ_TRY(next, read_char());
        c = next;
        if (c == '-') {
            return Err(Error(DebugServerError::ResponseError, "packet was rejected"));
        }
    } while (c != '$');

    std::string body;
    std::string raw;
    for (;;) {
        BUSQ_TRY(next, read_char());
        if (next == '#') {
            break;
        }
        raw.push_back(next);
        if (next == '}') {
            BUSQ_TRY(escaped, read_char());
            raw.push_back(escaped);
            body.push_back(static_cast<char>(escaped ^ 0x20));
        } else {
            body.push_back(next);
        }
    }
    BUSQ_TRY(hi, read_char());
    BUSQ_TRY(lo, read_char());
    std::string expected = checksum(raw);
    bool        valid    = hex_value(hi) == hex_value(expected[0]) && hex_value(lo) == hex_value(expected[1]);

    if (ack_mode_) {
        BUSQ_TRY_VOID(send_text(valid ? "+" : "-"));
    }
    if (!valid) {
        return Err(Error(DebugServerError::ResponseError, "response checksum mismatch"));
    }
    logger()->trace("debug_server: <- {}", body);
    return Ok(std::move(body));
}

Result<std::string, Error> DebugServerClient::send_command(const DebugServerCommand& command) {
    logger()->debug("debug_server: {}", command.name());
    BUSQ_TRY_VOID(send_text(format_packet(command.body())));
    BUSQ_TRY(response, receive_response());
    if (is_error_reply(response)) {
        return Err(Error(DebugServerError::ResponseError, command.name() + ": " + response));
    }
    return Ok(std::move(response));
}

Result<void, Error> DebugServerClient::set_ack_mode(bool enabled) {
    BUSQ_TRY_VOID(ensure_open());
    if (enabled == ack_mode_) {
        return Ok();
    }
    if (enabled) {
        return Err(Error(DebugServerError::InvalidArgument, "acks cannot be re-enabled"));
    }
    BUSQ_TRY(response, send_command(DebugServerCommand("QStartNoAckMode")));
    if (response != "OK") {
        return Err(Error(DebugServerError::ResponseError, "QStartNoAckMode: " + response));
    }
    ack_mode_ = false;
    return Ok();
}

Result<std::string, Error> DebugServerClient::set_argv(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return Err(Error(DebugServerError::InvalidArgument, "argv is empty"));
    }
    // A<hexlen>,<index>,<hex>,...
    std::string packet = "A";
    for (size_t i = 0; i < argv.size(); ++i) {
        std::string hex = encode_string(argv[i]);
        if (i > 0) {
            packet += ",";
        }
        packet += std::to_string(hex.size()) + "," + std::to_string(i) + "," + hex;
    }
    return send_command(DebugServerCommand(packet));
}

Result<std::string, Error> DebugServerClient::set_environment_hex_encoded(const std::string& env) {
    if (env.empty()) {
        return Err(Error(DebugServerError::InvalidArgument, "environment entry is empty"));
    }
    return send_command(DebugServerCommand("QEnvironmentHexEncoded:", {encode_string(env)}));
}

} // namespace Busq
