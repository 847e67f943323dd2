// busq++ contributors

#include <busq++/lockdown.hpp>
#include <busq++/tls.hpp>

#include <cstdlib>

namespace Busq {

namespace {

struct NamedError {
    const char*   name;
    LockdownError kind;
};

// Device-side "Error" strings
constexpr NamedError kDeviceErrors[] = {
    {"InvalidResponse", LockdownError::InvalidResponse},
    {"MissingKey", LockdownError::MissingKey},
    {"MissingValue", LockdownError::MissingValue},
    {"GetProhibited", LockdownError::GetProhibited},
    {"SetProhibited", LockdownError::SetProhibited},
    {"RemoveProhibited", LockdownError::RemoveProhibited},
    {"ImmutableValue", LockdownError::ImmutableValue},
    {"PasswordProtected", LockdownError::PasswordProtected},
    {"UserDeniedPairing", LockdownError::UserDeniedPairing},
    {"PairingDialogResponsePending", LockdownError::PairingDialogResponsePending},
    {"MissingHostID", LockdownError::MissingHostID},
    {"InvalidHostID", LockdownError::InvalidHostID},
    {"SessionActive", LockdownError::SessionActive},
    {"SessionInactive", LockdownError::SessionInactive},
    {"MissingSessionID", LockdownError::MissingSessionID},
    {"InvalidSessionID", LockdownError::InvalidSessionID},
    {"MissingService", LockdownError::MissingService},
    {"InvalidService", LockdownError::InvalidService},
    {"ServiceLimit", LockdownError::ServiceLimit},
    {"MissingPairRecord", LockdownError::MissingPairRecord},
    {"SavePairRecordFailed", LockdownError::SavePairRecordFailed},
    {"InvalidPairRecord", LockdownError::InvalidPairRecord},
    {"InvalidActivationRecord", LockdownError::InvalidActivationRecord},
    {"MissingActivationRecord", LockdownError::MissingActivationRecord},
    {"ServiceProhibited", LockdownError::ServiceProhibited},
    {"EscrowLocked", LockdownError::EscrowLocked},
    {"PairingProhibitedOverThisConnection", LockdownError::PairingProhibitedOverThisConnection},
    {"FMiPProtected", LockdownError::FmipProtected},
    {"MCProtected", LockdownError::McProtected},
    {"MCChallengeRequired", LockdownError::McChallengeRequired},
};

Error remap(const Error& e) {
    return remap_error(e, LockdownError::MuxError, LockdownError::SslError,
                       LockdownError::ReceiveTimeout, LockdownError::PlistError,
                       LockdownError::InvalidArgument);
}

long major_version(const std::string& version) {
    return std::strtol(version.c_str(), nullptr, 10);
}

} // namespace

const char* to_string(LockdownState state) noexcept {
    switch (state) {
    case LockdownState::Unstarted:
        return "Unstarted";
    case LockdownState::Handshaking:
        return "Handshaking";
    case LockdownState::Ready:
        return "Ready";
    case LockdownState::Closed:
        return "Closed";
    }
    return "Unknown";
}

LockdownError lockdown_error_from_string(const std::string& name) noexcept {
    for (const auto& e : kDeviceErrors) {
        if (name == e.name) {
            return e.kind;
        }
    }
    return LockdownError::Unknown;
}

// -------- Factory Methods --------

Result<Lockdown, Error> Lockdown::connect(Device& device, const std::string& label) {
    BUSQ_TRY(provider, device.provider());
    BUSQ_TRY(info, device.info());
    auto conn = device.connect(kPort);
    if (conn.is_err()) {
        return Err(remap(conn.unwrap_err()));
    }
    return Ok(Lockdown(PropertyListService(std::move(conn).unwrap()), std::move(provider),
                       std::move(info), label));
}

Result<Lockdown, Error> Lockdown::connect_with_handshake(Device& device, const std::string& label) {
    BUSQ_TRY(client, connect(device, label));
    BUSQ_TRY_VOID(client.handshake());
    return Ok(std::move(client));
}

Lockdown::~Lockdown() {
    if (state_ == LockdownState::Closed) {
        return;
    }
    auto r = close();
    if (r.is_err()) {
        logger()->debug("lockdown: close on drop: {}", r.unwrap_err().to_string());
    }
}

Lockdown::Lockdown(Lockdown&& other) noexcept
    : service_(std::move(other.service_)), provider_(std::move(other.provider_)),
      device_(std::move(other.device_)), label_(std::move(other.label_)), state_(other.state_),
      record_(std::move(other.record_)), session_id_(std::move(other.session_id_)),
      product_version_(std::move(other.product_version_)) {
    other.state_ = LockdownState::Closed;
}

Lockdown& Lockdown::operator=(Lockdown&& other) noexcept {
    if (this != &other) {
        if (state_ != LockdownState::Closed) {
            auto r = close();
            if (r.is_err()) {
                logger()->debug("lockdown: close on reassign: {}", r.unwrap_err().to_string());
            }
        }
        service_         = std::move(other.service_);
        provider_        = std::move(other.provider_);
        device_          = std::move(other.device_);
        label_           = std::move(other.label_);
        state_           = other.state_;
        record_          = std::move(other.record_);
        session_id_      = std::move(other.session_id_);
        product_version_ = std::move(other.product_version_);
        other.state_     = LockdownState::Closed;
    }
    return *this;
}

// -------- Plumbing --------

Value Lockdown::request(const char* name) const {
    Value msg = Value::new_dict();
    msg.set("Label", Value::from_string(label_)).unwrap();
    msg.set("Request", Value::from_string(name)).unwrap();
    return msg;
}

Result<void, Error> Lockdown::ensure_open() const {
    if (state_ == LockdownState::Closed || !provider_) {
        return Err(Error(LockdownError::Deallocated, "lockdown client is closed"));
    }
    return Ok();
}

Result<void, Error> Lockdown::ensure_ready() const {
    BUSQ_TRY_VOID(ensure_open());
    if (state_ != LockdownState::Ready) {
        return Err(Error(LockdownError::NoRunningSession,
                         std::string("lockdown is ") + to_string(state_)));
    }
    return Ok();
}

Result<Value, Error> Lockdown::exchange(const Value& message) {
    BUSQ_TRY_VOID(ensure_open());
    std::string name = message["Request"].as_string().value_or("?");
    logger()->debug("lockdown: {}", name);

    auto sent = service_.send(message);
    if (sent.is_err()) {
        return Err(remap(sent.unwrap_err()));
    }
    auto received = service_.receive();
    if (received.is_err()) {
        return Err(remap(received.unwrap_err()));
    }
    Value reply = std::move(received).unwrap();
    if (reply.type() != ValueType::Dictionary) {
        return Err(Error(LockdownError::DictError, name + ": reply is not a dictionary"));
    }
    if (auto err = reply["Error"].as_string()) {
        auto kind = lockdown_error_from_string(*err);
        logger()->debug("lockdown: {} failed with {}", name, *err);
        return Err(Error(kind, name + ": " + *err));
    }
    auto echoed = reply["Request"].as_string();
    if (echoed && *echoed != name) {
        return Err(Error(LockdownError::InvalidResponse, "expected " + name + " reply, got " + *echoed));
    }
    if (reply["Result"].as_string() == std::optional<std::string>("Failure")) {
        return Err(Error(LockdownError::Unknown, name + " failed"));
    }
    return Ok(std::move(reply));
}

// -------- Handshake --------

Result<void, Error> Lockdown::handshake() {
    if (state_ == LockdownState::Ready) {
        return Ok();
    }
    if (state_ != LockdownState::Unstarted) {
        return Err(Error(LockdownError::Deallocated,
                         std::string("cannot handshake from ") + to_string(state_)));
    }
    state_ = LockdownState::Handshaking;
    auto r = run_handshake();
    if (r.is_err()) {
        logger()->warn("lockdown: handshake with {} failed: {}", device_.udid,
                       r.unwrap_err().to_string());
        service_.connection().disconnect();
        state_ = LockdownState::Closed;
        return r;
    }
    state_ = LockdownState::Ready;
    logger()->info("lockdown: session {} with {} (iOS {})", session_id_, device_.udid,
                   product_version_);
    return Ok();
}

Result<void, Error> Lockdown::run_handshake() {
    BUSQ_TRY(type, query_type());
    if (type != "com.apple.mobile.lockdown") {
        logger()->warn("lockdown: unexpected QueryType {}", type);
    }
    BUSQ_TRY(version, product_version());
    product_version_ = version;

    auto stored = provider_->read_pair_record(device_.udid);
    if (stored.is_ok()) {
        record_ = std::move(stored).unwrap();
    } else if (stored.unwrap_err().is(LockdownError::MissingPairRecord)) {
        logger()->info("lockdown: no pair record for {}, pairing", device_.udid);
        BUSQ_TRY_VOID(pair());
    } else {
        return Err(remap(stored.unwrap_err()));
    }

    if (major_version(product_version_) < 7) {
        auto valid = validate_pair();
        if (valid.is_err()) {
            if (!valid.unwrap_err().is(LockdownError::InvalidHostID)) {
                return valid;
            }
            BUSQ_TRY_VOID(pair());
            BUSQ_TRY_VOID(validate_pair());
        }
    }
    return start_session();
}

Result<void, Error> Lockdown::start_session() {
    if (!record_) {
        return Err(Error(LockdownError::MissingPairRecord, "StartSession without a pair record"));
    }
    Value msg = request("StartSession");
    msg.set("HostID", Value::from_string(record_->host_id())).unwrap();
    msg.set("SystemBUID", Value::from_string(record_->system_buid())).unwrap();
    BUSQ_TRY(reply, exchange(msg));

    auto sid = reply["SessionID"].as_string();
    if (!sid) {
        return Err(Error(LockdownError::MissingSessionID, "StartSession reply has no SessionID"));
    }
    session_id_ = *sid;

    if (reply["EnableSessionSSL"].as_bool().value_or(false)) {
        auto channel = provider_->new_secure_channel(*record_);
        if (channel.is_err()) {
            return Err(Error(LockdownError::SslError, channel.unwrap_err().to_string()));
        }
        service_.connection().set_security(std::move(channel).unwrap());
        auto on = service_.connection().enable_security();
        if (on.is_err()) {
            return Err(Error(LockdownError::SslError, on.unwrap_err().to_string()));
        }
    }
    return Ok();
}

// -------- Pairing --------

Result<void, Error> Lockdown::pair_request(const char* verb, PairRecord& record) {
    Value msg = request(verb);
    msg.set("PairRecord", record.lockdown_payload()).unwrap();
    msg.set("ProtocolVersion", Value::from_string("2")).unwrap();
    if (std::string(verb) == "Pair") {
        Value options = Value::new_dict();
        options.set("ExtendedPairingErrors", Value::from_bool(true)).unwrap();
        msg.set("PairingOptions", std::move(options)).unwrap();
    }
    BUSQ_TRY(reply, exchange(msg));
    // Only Pair hands out a bag
    if (auto bag = reply["EscrowBag"].as_data()) {
        record.set_escrow_bag(*bag);
    }
    return Ok();
}

Result<void, Error> Lockdown::pair() {
    BUSQ_TRY_VOID(ensure_open());
    BUSQ_TRY(key, device_public_key());
    auto buid = provider_->read_buid();
    if (buid.is_err()) {
        return Err(remap(buid.unwrap_err()));
    }
    BUSQ_TRY(record, generate_pair_record(key, buid.unwrap()));

    auto paired = pair_request("Pair", record);
    if (paired.is_err()) {
        const Error& e = paired.unwrap_err();
        if (e.in(ErrorDomain::Lockdown) && e.code == static_cast<int32_t>(LockdownError::Unknown)) {
            return Err(Error(LockdownError::PairingFailed, e.message));
        }
        return paired;
    }

    auto saved = provider_->save_pair_record(device_, record);
    if (saved.is_err()) {
        if (saved.unwrap_err().in(ErrorDomain::Lockdown)) {
            return saved;
        }
        return Err(Error(LockdownError::SavePairRecordFailed, saved.unwrap_err().to_string()));
    }
    logger()->info("lockdown: paired with {}", device_.udid);
    record_ = std::move(record);
    return Ok();
}

Result<void, Error> Lockdown::validate_pair() {
    BUSQ_TRY_VOID(ensure_open());
    if (!record_) {
        return Err(Error(LockdownError::MissingPairRecord, "ValidatePair without a pair record"));
    }
    return pair_request("ValidatePair", *record_);
}

Result<void, Error> Lockdown::unpair() {
    BUSQ_TRY_VOID(ensure_open());
    if (!record_) {
        return Err(Error(LockdownError::MissingPairRecord, "Unpair without a pair record"));
    }
    BUSQ_TRY_VOID(pair_request("Unpair", *record_));
    auto removed = provider_->delete_pair_record(device_.udid);
    if (removed.is_err()) {
        logger()->warn("lockdown: pair record for {} not deleted: {}", device_.udid,
                       removed.unwrap_err().to_string());
    }
    record_.reset();
    // The session was bound to the removed pairing
    service_.connection().disconnect();
    session_id_.clear();
    state_ = LockdownState::Closed;
    return Ok();
}

// -------- Values --------

Result<std::string, Error> Lockdown::query_type() {
    BUSQ_TRY(reply, exchange(request("QueryType")));
    auto type = reply["Type"].as_string();
    if (!type) {
        return Err(Error(LockdownError::InvalidResponse, "QueryType reply has no Type"));
    }
    return Ok(std::move(*type));
}

Result<Value, Error> Lockdown::get_value(const std::optional<std::string>& domain,
                                         const std::optional<std::string>& key) {
    Value msg = request("GetValue");
    if (domain) {
        msg.set("Domain", Value::from_string(*domain)).unwrap();
    }
    if (key) {
        msg.set("Key", Value::from_string(*key)).unwrap();
    }
    BUSQ_TRY(reply, exchange(msg));
    ValueRef v = reply["Value"];
    if (!v) {
        return Err(Error(LockdownError::MissingValue, key.value_or("(all values)")));
    }
    return Ok(v.copy());
}

Result<void, Error> Lockdown::set_value(const std::optional<std::string>& domain,
                                        const std::string&                key,
                                        Value&&                           value) {
    BUSQ_TRY_VOID(ensure_ready());
    Value msg = request("SetValue");
    if (domain) {
        msg.set("Domain", Value::from_string(*domain)).unwrap();
    }
    msg.set("Key", Value::from_string(key)).unwrap();
    msg.set("Value", std::move(value)).unwrap();
    BUSQ_TRY_VOID(exchange(msg));
    return Ok();
}

Result<void, Error> Lockdown::remove_value(const std::optional<std::string>& domain,
                                           const std::string&                key) {
    BUSQ_TRY_VOID(ensure_ready());
    Value msg = request("RemoveValue");
    if (domain) {
        msg.set("Domain", Value::from_string(*domain)).unwrap();
    }
    msg.set("Key", Value::from_string(key)).unwrap();
    BUSQ_TRY_VOID(exchange(msg));
    return Ok();
}

Result<std::string, Error> Lockdown::string_value(const char* key) {
    BUSQ_TRY(v, get_value(std::nullopt, std::string(key)));
    auto s = v.as_string();
    if (!s) {
        return Err(Error(LockdownError::InvalidResponse, std::string(key) + " is not a string"));
    }
    return Ok(std::move(*s));
}

Result<std::string, Error> Lockdown::device_name() {
    return string_value("DeviceName");
}

Result<std::string, Error> Lockdown::device_udid() {
    return string_value("UniqueDeviceID");
}

Result<std::string, Error> Lockdown::device_class() {
    return string_value("DeviceClass");
}

Result<std::string, Error> Lockdown::device_color() {
    return string_value("DeviceColor");
}

Result<std::string, Error> Lockdown::product_version() {
    return string_value("ProductVersion");
}

Result<std::string, Error> Lockdown::wifi_address() {
    return string_value("WiFiAddress");
}

Result<std::vector<uint8_t>, Error> Lockdown::device_public_key() {
    BUSQ_TRY(v, get_value(std::nullopt, std::string("DevicePublicKey")));
    auto data = v.as_data();
    if (!data) {
        return Err(Error(LockdownError::InvalidResponse, "DevicePublicKey is not data"));
    }
    return Ok(std::move(*data));
}

Result<uint64_t, Error> Lockdown::battery_level() {
    BUSQ_TRY(v, get_value(std::string("com.apple.mobile.battery"),
                          std::string("BatteryCurrentCapacity")));
    auto level = v.as_uint();
    if (!level) {
        return Err(Error(LockdownError::InvalidResponse, "BatteryCurrentCapacity is not an integer"));
    }
    return Ok(*level);
}

// -------- Services --------

Result<ServiceDescriptor, Error> Lockdown::start_service(const std::string& identifier,
                                                         bool               use_escrow_bag) {
    BUSQ_TRY_VOID(ensure_ready());
    Value msg = request("StartService");
    msg.set("Service", Value::from_string(identifier)).unwrap();
    if (use_escrow_bag) {
        auto bag = record_ ? record_->escrow_bag() : std::nullopt;
        if (!bag) {
            return Err(Error(LockdownError::InvalidPairRecord, "pair record has no EscrowBag"));
        }
        msg.set("EscrowBag", Value::from_data(*bag)).unwrap();
    }
    BUSQ_TRY(reply, exchange(msg));

    auto port = reply["Port"].as_uint();
    if (!port || *port == 0 || *port > 0xFFFF) {
        return Err(Error(LockdownError::NotStartService, identifier + ": no port in reply"));
    }
    ServiceDescriptor d;
    d.port                = static_cast<uint16_t>(*port);
    d.identifier          = identifier;
    d.escrow_bag_attached = use_escrow_bag;
    d.ssl_enabled         = reply["EnableServiceSSL"].as_bool().value_or(false);
    if (d.ssl_enabled) {
        if (!record_) {
            return Err(Error(LockdownError::MissingPairRecord, identifier + ": SSL service needs a pair record"));
        }
        auto channel = provider_->new_secure_channel(*record_);
        if (channel.is_err()) {
            return Err(Error(LockdownError::SslError, channel.unwrap_err().to_string()));
        }
        d.security = std::move(channel).unwrap();
    }
    logger()->debug("lockdown: {} on port {}", identifier, d.port);
    return Ok(std::move(d));
}

Result<void, Error> Lockdown::close() {
    if (state_ == LockdownState::Closed) {
        return Ok();
    }
    Result<void, Error> first = Ok();
    if (service_.connection().connected()) {
        if (!session_id_.empty()) {
            Value msg = request("StopSession");
            msg.set("SessionID", Value::from_string(session_id_)).unwrap();
            auto stopped = exchange(msg);
            if (stopped.is_err()) {
                first = Err(std::move(stopped).unwrap_err());
            }
        }
        auto plain = service_.connection().disable_security();
        if (plain.is_err() && first.is_ok()) {
            first = Err(remap(plain.unwrap_err()));
        }
        auto bye = exchange(request("Goodbye"));
        if (bye.is_err() && first.is_ok()) {
            first = Err(std::move(bye).unwrap_err());
        }
        service_.connection().disconnect();
    }
    session_id_.clear();
    state_ = LockdownState::Closed;
    return first;
}

} // namespace Busq
