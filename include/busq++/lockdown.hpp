// busq++ contributors

#ifndef BUSQ_LOCKDOWN_HPP
#define BUSQ_LOCKDOWN_HPP

#include <busq++/device.hpp>
#include <busq++/log.hpp>
#include <busq++/pair_record.hpp>
#include <busq++/property_list_service.hpp>
#include <busq++/service.hpp>

#include <optional>
#include <string>
#include <vector>

namespace Busq {

enum class LockdownState : uint8_t { Unstarted, Handshaking, Ready, Closed };

const char* to_string(LockdownState state) noexcept;

// Maps a device "Error" string onto the taxonomy; unknown strings are Unknown
LockdownError lockdown_error_from_string(const std::string& name) noexcept;

// Session client on the lockdown port. Unstarted -> Handshaking -> Ready -> Closed;
// a failed handshake leaves the client Closed. Not safe for concurrent
// session-mutating calls.
class Lockdown {
  public:
    static constexpr uint16_t kPort = 62078;

    // Connected but without a session: QueryType and public values only
    static Result<Lockdown, Error> connect(Device& device, const std::string& label = "busq");
    static Result<Lockdown, Error> connect_with_handshake(Device&            device,
                                                          const std::string& label = "busq");

    // QueryType, pair record retrieval (pairing when missing), validation on
    // iOS < 7, StartSession and session TLS
    Result<void, Error>              handshake();

    Result<std::string, Error>       query_type();
    Result<Value, Error>             get_value(const std::optional<std::string>& domain,
                                               const std::optional<std::string>& key);
    Result<void, Error>              set_value(const std::optional<std::string>& domain,
                                               const std::string&                key,
                                               Value&&                           value);
    Result<void, Error>              remove_value(const std::optional<std::string>& domain,
                                                  const std::string&                key);

    Result<ServiceDescriptor, Error> start_service(const std::string& identifier,
                                                   bool               use_escrow_bag = false);
    Result<ServiceDescriptor, Error> start_service(ServiceIdentifier id, bool use_escrow_bag = false) {
        return start_service(service_name(id), use_escrow_bag);
    }

    Result<void, Error>              pair();
    Result<void, Error>              validate_pair();
    // Closes the client on success
    Result<void, Error>              unpair();

    Result<std::string, Error>       device_name();
    Result<std::string, Error>       device_udid();
    Result<std::string, Error>       device_class();
    Result<std::string, Error>       device_color();
    Result<std::string, Error>       product_version();
    Result<std::string, Error>       wifi_address();
    Result<std::vector<uint8_t>, Error> device_public_key();
    Result<uint64_t, Error>          battery_level();

    // StopSession + Goodbye, then disconnect. Always ends Closed.
    Result<void, Error>              close();

    LockdownState                    state() const noexcept { return state_; }
    const std::string&               session_id() const noexcept { return session_id_; }
    const std::string&               label() const noexcept { return label_; }

    ~Lockdown();
    Lockdown(Lockdown&& other) noexcept;
    Lockdown& operator=(Lockdown&& other) noexcept;
    Lockdown(const Lockdown&)                = delete;
    Lockdown& operator=(const Lockdown&)     = delete;

  private:
    Lockdown(PropertyListService&&     service,
             std::shared_ptr<Provider> provider,
             DeviceInfo                device,
             std::string               label) noexcept
        : service_(std::move(service)), provider_(std::move(provider)), device_(std::move(device)),
          label_(std::move(label)) {}

    Value                request(const char* name) const;
    Result<Value, Error> exchange(const Value& message);
    Result<Value, Error> exchange(Value&& message) { return exchange(static_cast<const Value&>(message)); }
    Result<void, Error>  ensure_open() const;
    Result<void, Error>  ensure_ready() const;
    Result<void, Error>  run_handshake();
    Result<void, Error>  start_session();
    Result<std::string, Error> string_value(const char* key);
    Result<void, Error>  pair_request(const char* verb, PairRecord& record);

    PropertyListService       service_;
    std::shared_ptr<Provider> provider_;
    DeviceInfo                device_;
    std::string               label_;
    LockdownState             state_ = LockdownState::Unstarted;
    std::optional<PairRecord> record_;
    std::string               session_id_;
    std::string               product_version_;
};

// Handshake, StartService and client construction in one call. Client
// provides kServiceName and connect(Device&, ServiceDescriptor&&).
template <typename Client>
Result<Client, Error>
start_service_client(Device& device, const std::string& label, bool use_escrow_bag = false) {
    BUSQ_TRY(lockdown, Lockdown::connect_with_handshake(device, label));
    BUSQ_TRY(descriptor, lockdown.start_service(Client::kServiceName, use_escrow_bag));
    auto closed = lockdown.close();
    if (closed.is_err()) {
        logger()->debug("lockdown: close after StartService: {}", closed.unwrap_err().to_string());
    }
    return Client::connect(device, std::move(descriptor));
}

} // namespace Busq
#endif
