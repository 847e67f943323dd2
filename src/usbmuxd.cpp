// busq++ contributors

#include <busq++/log.hpp>
#include <busq++/usbmuxd.hpp>

#include <cstdlib>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>

namespace Busq {

namespace {

constexpr const char* kDefaultSocket     = "/var/run/usbmuxd";
constexpr const char* kSocketEnv         = "USBMUXD_SOCKET_ADDRESS";
constexpr uint32_t    kProtocolVersion   = 1;
constexpr uint32_t    kMessagePlist      = 8;
constexpr size_t      kHeaderSize        = 16;
constexpr uint32_t    kMaxMessageSize    = 16 * 1024 * 1024;
constexpr uint32_t    kEventPollMs       = 500;

// Result codes carried in {MessageType: Result, Number: n}
enum MuxResult : uint64_t {
    ResultOk          = 0,
    ResultBadCommand  = 1,
    ResultBadDevice   = 2,
    ResultConnRefused = 3,
    ResultBadVersion  = 6,
};

void put_le32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
}

uint32_t get_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

Result<void, Error> read_exact(Stream& s, uint8_t* buf, size_t n) {
    size_t got = 0;
    while (got < n) {
        auto r = s.receive(buf + got, n - got, std::nullopt);
        if (r.is_err()) {
            return Err(std::move(r).unwrap_err());
        }
        got += r.unwrap();
    }
    return Ok();
}

Value request_dict(const char* message_type) {
    Value msg = Value::new_dict();
    msg.set("MessageType", Value::from_string(message_type)).unwrap();
    msg.set("ClientVersionString", Value::from_string("busq")).unwrap();
    msg.set("ProgName", Value::from_string("busq")).unwrap();
    msg.set("kLibUSBMuxVersion", Value::from_uint(3)).unwrap();
    return msg;
}

Error mux_result_error(uint64_t number, const std::string& what) {
    switch (number) {
    case ResultBadDevice:
        return Error(MobileDeviceError::NoDevice, what + ": no such device");
    case ResultConnRefused:
        return Error(MobileDeviceError::Unknown, what + ": connection refused by device");
    case ResultBadVersion:
        return Error(MobileDeviceError::Unknown, what + ": protocol version rejected");
    case ResultBadCommand:
        return Error(MobileDeviceError::InvalidArgument, what + ": bad command");
    default:
        return Error(MobileDeviceError::Unknown, what + ": usbmuxd result " + std::to_string(number));
    }
}

Result<void, Error> check_result(const Value& reply, const std::string& what) {
    if (reply["MessageType"].as_string() != std::optional<std::string>("Result")) {
        return Err(Error(MobileDeviceError::Unknown, what + ": unexpected usbmuxd reply"));
    }
    uint64_t number = reply["Number"].as_uint().value_or(ResultBadCommand);
    if (number != ResultOk) {
        return Err(mux_result_error(number, what));
    }
    return Ok();
}

uint16_t swap16(uint16_t v) {
    return static_cast<uint16_t>((v << 8) | (v >> 8));
}

} // namespace

// ---------- UsbmuxdAddr ----------

#if defined(__unix__) || defined(__APPLE__)
UsbmuxdAddr UsbmuxdAddr::unix_new(std::string path) {
    return UsbmuxdAddr(true, std::move(path), 0);
}
#endif

UsbmuxdAddr UsbmuxdAddr::tcp_new(std::string host, uint16_t port) {
    return UsbmuxdAddr(false, std::move(host), port);
}

Result<UsbmuxdAddr, Error> UsbmuxdAddr::parse(const std::string& address) {
    static const std::string unix_prefix = "UNIX:";
    if (address.compare(0, unix_prefix.size(), unix_prefix) == 0) {
        std::string path = address.substr(unix_prefix.size());
        if (path.empty()) {
            return Err(Error::InvalidArgument("empty usbmuxd socket path"));
        }
        return Ok(UsbmuxdAddr(true, std::move(path), 0));
    }
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
        return Err(Error::InvalidArgument("bad usbmuxd address: " + address));
    }
    char*         end  = nullptr;
    unsigned long port = std::strtoul(address.c_str() + colon + 1, &end, 10);
    if (*end != '\0' || port == 0 || port > 0xFFFF) {
        return Err(Error::InvalidArgument("bad usbmuxd port: " + address));
    }
    return Ok(UsbmuxdAddr(false, address.substr(0, colon), static_cast<uint16_t>(port)));
}

UsbmuxdAddr UsbmuxdAddr::default_new() {
    if (const char* env = std::getenv(kSocketEnv)) {
        auto parsed = parse(env);
        if (parsed.is_ok()) {
            return std::move(parsed).unwrap();
        }
        logger()->warn("usbmuxd: ignoring {}: {}", kSocketEnv, parsed.unwrap_err().message);
    }
    return UsbmuxdAddr(true, kDefaultSocket, 0);
}

Result<std::unique_ptr<Stream>, Error> UsbmuxdAddr::connect() const {
    if (is_unix_) {
#if defined(__unix__) || defined(__APPLE__)
        auto s = SocketStream::connect_unix(target_);
        if (s.is_err()) {
            return Err(std::move(s).unwrap_err());
        }
        return Ok(std::unique_ptr<Stream>(std::move(s).unwrap()));
#else
        return Err(Error::InvalidArgument("unix sockets unsupported on this platform"));
#endif
    }
    auto s = SocketStream::connect_tcp(target_, port_);
    if (s.is_err()) {
        return Err(std::move(s).unwrap_err());
    }
    return Ok(std::unique_ptr<Stream>(std::move(s).unwrap()));
}

std::string UsbmuxdAddr::to_string() const {
    return is_unix_ ? "UNIX:" + target_ : target_ + ":" + std::to_string(port_);
}

// ---------- UsbmuxdConnection ----------

Result<UsbmuxdConnection, Error> UsbmuxdConnection::connect(const UsbmuxdAddr& addr, uint32_t tag) {
    auto s = addr.connect();
    if (s.is_err()) {
        return Err(std::move(s).unwrap_err());
    }
    return Ok(UsbmuxdConnection(std::move(s).unwrap(), tag));
}

Result<void, Error> UsbmuxdConnection::send_message(const Value& message) {
    BUSQ_TRY(body, message.encode(Format::Xml));
    std::vector<uint8_t> packet(kHeaderSize + body.size());
    put_le32(&packet[0], static_cast<uint32_t>(packet.size()));
    put_le32(&packet[4], kProtocolVersion);
    put_le32(&packet[8], kMessagePlist);
    put_le32(&packet[12], ++tag_);
    std::memcpy(packet.data() + kHeaderSize, body.data(), body.size());

    size_t sent = 0;
    while (sent < packet.size()) {
        auto n = stream_->send(packet.data() + sent, packet.size() - sent);
        if (n.is_err()) {
            return Err(std::move(n).unwrap_err());
        }
        sent += n.unwrap();
    }
    logger()->trace("usbmuxd: sent {} bytes (tag {})", packet.size(), tag_);
    return Ok();
}

Result<std::optional<Value>, Error> UsbmuxdConnection::next_message(std::optional<uint32_t> timeout_ms) {
    uint8_t header[kHeaderSize];
    auto    first = stream_->receive(header, kHeaderSize, timeout_ms);
    if (first.is_err()) {
        return Err(std::move(first).unwrap_err());
    }
    if (first.unwrap() == 0) {
        return Ok(std::optional<Value>());
    }
    BUSQ_TRY_VOID(read_exact(*stream_, header + first.unwrap(), kHeaderSize - first.unwrap()));

    uint32_t length = get_le32(header);
    if (length < kHeaderSize || length > kMaxMessageSize) {
        return Err(Error(MobileDeviceError::Unknown, "usbmuxd: bad message length " +
                                                         std::to_string(length)));
    }
    if (get_le32(header + 8) != kMessagePlist) {
        return Err(Error(MobileDeviceError::Unknown, "usbmuxd: unexpected message type"));
    }
    std::vector<uint8_t> body(length - kHeaderSize);
    BUSQ_TRY_VOID(read_exact(*stream_, body.data(), body.size()));
    BUSQ_TRY(value, Value::decode_auto(body));
    return Ok(std::optional<Value>(std::move(value)));
}

Result<Value, Error> UsbmuxdConnection::request(Value&& message) {
    BUSQ_TRY_VOID(send_message(message));
    BUSQ_TRY(reply, next_message(std::nullopt));
    if (!reply) {
        return Err(Error(MobileDeviceError::Timeout, "usbmuxd: no reply"));
    }
    return Ok(std::move(*reply));
}

Result<std::vector<DeviceInfo>, Error> UsbmuxdConnection::get_devices() {
    logger()->debug("usbmuxd: ListDevices");
    BUSQ_TRY(reply, request(request_dict("ListDevices")));
    ValueRef list = reply["DeviceList"];
    if (list.type() != ValueType::Array) {
        return Err(Error(MobileDeviceError::Unknown, "usbmuxd: ListDevices without DeviceList"));
    }
    std::vector<DeviceInfo> out;
    for (size_t i = 0; i < list.size(); ++i) {
        if (auto info = device_info_from_record(list[i])) {
            out.push_back(std::move(*info));
        }
    }
    return Ok(std::move(out));
}

Result<std::string, Error> UsbmuxdConnection::get_buid() {
    BUSQ_TRY(reply, request(request_dict("ReadBUID")));
    auto buid = reply["BUID"].as_string();
    if (!buid) {
        return Err(Error(MobileDeviceError::Unknown, "usbmuxd: ReadBUID without BUID"));
    }
    return Ok(std::move(*buid));
}

Result<std::vector<uint8_t>, Error> UsbmuxdConnection::get_pair_record(const std::string& udid) {
    Value msg = request_dict("ReadPairRecord");
    msg.set("PairRecordID", Value::from_string(udid)).unwrap();
    BUSQ_TRY(reply, request(std::move(msg)));
    auto data = reply["PairRecordData"].as_data();
    if (!data) {
        return Err(Error(LockdownError::MissingPairRecord, "no pair record for " + udid));
    }
    return Ok(std::move(*data));
}

Result<void, Error> UsbmuxdConnection::save_pair_record(const std::string&          udid,
                                                        uint32_t                    device_id,
                                                        const std::vector<uint8_t>& record) {
    Value msg = request_dict("SavePairRecord");
    msg.set("PairRecordID", Value::from_string(udid)).unwrap();
    msg.set("PairRecordData", Value::from_data(record)).unwrap();
    msg.set("DeviceID", Value::from_uint(device_id)).unwrap();
    BUSQ_TRY(reply, request(std::move(msg)));
    auto checked = check_result(reply, "SavePairRecord");
    if (checked.is_err()) {
        return Err(Error(LockdownError::SavePairRecordFailed, checked.unwrap_err().message));
    }
    return Ok();
}

Result<void, Error> UsbmuxdConnection::delete_pair_record(const std::string& udid) {
    Value msg = request_dict("DeletePairRecord");
    msg.set("PairRecordID", Value::from_string(udid)).unwrap();
    BUSQ_TRY(reply, request(std::move(msg)));
    return check_result(reply, "DeletePairRecord");
}

Result<void, Error> UsbmuxdConnection::listen() {
    BUSQ_TRY(reply, request(request_dict("Listen")));
    return check_result(reply, "Listen");
}

Result<std::unique_ptr<Stream>, Error> UsbmuxdConnection::connect_to_device(uint32_t device_id,
                                                                            uint16_t port) && {
    Value msg = request_dict("Connect");
    msg.set("DeviceID", Value::from_uint(device_id)).unwrap();
    // usbmuxd wants the port in network byte order
    msg.set("PortNumber", Value::from_uint(swap16(port))).unwrap();
    logger()->debug("usbmuxd: Connect device {} port {}", device_id, port);
    BUSQ_TRY(reply, request(std::move(msg)));
    BUSQ_TRY_VOID(check_result(reply, "Connect port " + std::to_string(port)));
    return Ok(std::move(stream_));
}

std::optional<DeviceInfo> device_info_from_record(ValueRef record) {
    ValueRef props = record["Properties"];
    auto     udid  = props["SerialNumber"].as_string();
    auto     id    = record["DeviceID"].as_uint();
    if (!id) {
        id = props["DeviceID"].as_uint();
    }
    if (!udid || !id) {
        return std::nullopt;
    }
    DeviceInfo info;
    info.udid   = std::move(*udid);
    info.handle = static_cast<uint32_t>(*id);
    auto kind   = props["ConnectionType"].as_string().value_or("");
    if (kind == "USB") {
        info.type = ConnectionType::Value::Usb;
    } else if (kind == "Network") {
        info.type = ConnectionType::Value::Network;
    }
    return info;
}

// ---------- UsbmuxdProvider ----------

Result<std::vector<DeviceInfo>, Error> UsbmuxdProvider::list_devices() {
    BUSQ_TRY(conn, UsbmuxdConnection::connect(addr_));
    return conn.get_devices();
}

Result<Disposable, Error> UsbmuxdProvider::subscribe(DeviceEventCallback callback) {
    BUSQ_TRY(conn, UsbmuxdConnection::connect(addr_));
    BUSQ_TRY_VOID(conn.listen());

    struct Listener {
        std::atomic<bool> stop{false};
        std::thread       worker;
    };
    auto listener = std::make_shared<Listener>();
    auto shared_conn = std::make_shared<UsbmuxdConnection>(std::move(conn));

    listener->worker = std::thread([listener, shared_conn, callback = std::move(callback)]() {
        std::map<uint32_t, DeviceInfo> known;
        while (!listener->stop) {
            auto msg = shared_conn->next_message(kEventPollMs);
            if (msg.is_err()) {
                logger()->warn("usbmuxd: event stream ended: {}", msg.unwrap_err().to_string());
                return;
            }
            if (!msg.unwrap()) {
                continue;
            }
            const Value& event = *msg.unwrap();
            auto         kind  = event["MessageType"].as_string().value_or("");
            auto         id    = static_cast<uint32_t>(event["DeviceID"].as_uint().value_or(0));
            if (kind == "Attached") {
                auto info = device_info_from_record(event);
                if (!info) {
                    continue;
                }
                known[info->handle] = *info;
                callback(DeviceEvent{DeviceEventType::Add, *info});
            } else if (kind == "Detached" || kind == "Paired") {
                DeviceInfo info;
                auto       it = known.find(id);
                if (it != known.end()) {
                    info = it->second;
                } else {
                    info.handle = id;
                }
                if (kind == "Detached") {
                    known.erase(id);
                    callback(DeviceEvent{DeviceEventType::Remove, info});
                } else {
                    callback(DeviceEvent{DeviceEventType::Paired, info});
                }
            } else {
                logger()->debug("usbmuxd: ignoring event {}", kind);
            }
        }
    });

    return Ok(Disposable([listener]() {
        listener->stop = true;
        if (listener->worker.joinable()) {
            if (listener->worker.get_id() == std::this_thread::get_id()) {
                listener->worker.detach();
            } else {
                listener->worker.join();
            }
        }
    }));
}

Result<std::unique_ptr<Stream>, Error> UsbmuxdProvider::connect(const DeviceInfo& device,
                                                                uint16_t          port) {
    BUSQ_TRY(conn, UsbmuxdConnection::connect(addr_));
    return std::move(conn).connect_to_device(device.handle, port);
}

Result<PairRecord, Error> UsbmuxdProvider::read_pair_record(const std::string& udid) {
    BUSQ_TRY(conn, UsbmuxdConnection::connect(addr_));
    BUSQ_TRY(bytes, conn.get_pair_record(udid));
    return PairRecord::from_bytes(bytes.data(), bytes.size());
}

Result<void, Error> UsbmuxdProvider::save_pair_record(const DeviceInfo& device,
                                                      const PairRecord& record) {
    BUSQ_TRY(bytes, record.serialize(Format::Binary));
    BUSQ_TRY(conn, UsbmuxdConnection::connect(addr_));
    return conn.save_pair_record(device.udid, device.handle, bytes);
}

Result<void, Error> UsbmuxdProvider::delete_pair_record(const std::string& udid) {
    BUSQ_TRY(conn, UsbmuxdConnection::connect(addr_));
    return conn.delete_pair_record(udid);
}

Result<std::string, Error> UsbmuxdProvider::read_buid() {
    BUSQ_TRY(conn, UsbmuxdConnection::connect(addr_));
    return conn.get_buid();
}

} // namespace Busq
