// busq++ contributors

#ifndef BUSQ_PAIR_RECORD_HPP
#define BUSQ_PAIR_RECORD_HPP

#include <busq++/error.hpp>
#include <busq++/result.hpp>
#include <busq++/value.hpp>

#include <optional>
#include <string>
#include <vector>

namespace Busq {

// Host side pairing material: certificates and keys (PEM), HostID, SystemBUID,
// and the escrow bag once the device handed one out.
class PairRecord {
  public:
    static Result<PairRecord, Error> from_value(Value&& value);
    static Result<PairRecord, Error> from_bytes(const uint8_t* data, size_t size);
    static Result<PairRecord, Error> read(const std::string& path);

    Result<std::vector<uint8_t>, Error> serialize(Format format = Format::Xml) const;

    std::string                         host_id() const;
    std::string                         system_buid() const;
    std::vector<uint8_t>                host_certificate() const;
    std::vector<uint8_t>                host_private_key() const;
    std::vector<uint8_t>                root_certificate() const;
    std::vector<uint8_t>                device_certificate() const;
    std::optional<std::vector<uint8_t>> escrow_bag() const;
    std::optional<std::string>          wifi_mac_address() const;

    void                                set_escrow_bag(const std::vector<uint8_t>& bag);

    // The subset lockdown expects in Pair / ValidatePair / Unpair requests
    Value                               lockdown_payload() const;

    ValueRef                            value() const noexcept { return value_; }
    PairRecord                          clone() const;

    ~PairRecord() noexcept                       = default;
    PairRecord(PairRecord&&) noexcept            = default;
    PairRecord& operator=(PairRecord&&) noexcept = default;
    PairRecord(const PairRecord&)                = delete;
    PairRecord& operator=(const PairRecord&)     = delete;

  private:
    explicit PairRecord(Value&& v) noexcept : value_(std::move(v)) {}
    std::vector<uint8_t> data_field(const char* key) const;

    Value value_;
};

} // namespace Busq
#endif
