// busq++ contributors

#include <busq++/pair_record.hpp>

#include <fstream>
#include <iterator>

namespace Busq {

namespace {
constexpr const char* kRequiredData[] = {"HostCertificate", "HostPrivateKey", "RootCertificate"};

Error invalid_record(const std::string& why) {
    return Error(LockdownError::InvalidPairRecord, why);
}
} // namespace

Result<PairRecord, Error> PairRecord::from_value(Value&& value) {
    if (value.type() != ValueType::Dictionary) {
        return Err(invalid_record("pair record is not a dictionary"));
    }
    if (!value["HostID"].as_string()) {
        return Err(invalid_record("pair record has no HostID"));
    }
    if (!value["SystemBUID"].as_string()) {
        return Err(invalid_record("pair record has no SystemBUID"));
    }
    for (const char* key : kRequiredData) {
        if (!value[key].as_data()) {
            return Err(invalid_record(std::string("pair record has no ") + key));
        }
    }
    return Ok(PairRecord(std::move(value)));
}

Result<PairRecord, Error> PairRecord::from_bytes(const uint8_t* data, size_t size) {
    auto v = Value::from_memory(data, size);
    if (v.is_err()) {
        return Err(invalid_record(v.unwrap_err().to_string()));
    }
    return from_value(std::move(v).unwrap());
}

Result<PairRecord, Error> PairRecord::read(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Err(Error(LockdownError::MissingPairRecord, "cannot open " + path));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return from_bytes(bytes.data(), bytes.size());
}

Result<std::vector<uint8_t>, Error> PairRecord::serialize(Format format) const {
    return value_.encode(format);
}

std::vector<uint8_t> PairRecord::data_field(const char* key) const {
    return value_[key].as_data().value_or(std::vector<uint8_t>{});
}

std::string PairRecord::host_id() const {
    return value_["HostID"].as_string().value_or("");
}

std::string PairRecord::system_buid() const {
    return value_["SystemBUID"].as_string().value_or("");
}

std::vector<uint8_t> PairRecord::host_certificate() const {
    return data_field("HostCertificate");
}

std::vector<uint8_t> PairRecord::host_private_key() const {
    return data_field("HostPrivateKey");
}

std::vector<uint8_t> PairRecord::root_certificate() const {
    return data_field("RootCertificate");
}

std::vector<uint8_t> PairRecord::device_certificate() const {
    return data_field("DeviceCertificate");
}

std::optional<std::vector<uint8_t>> PairRecord::escrow_bag() const {
    return value_["EscrowBag"].as_data();
}

std::optional<std::string> PairRecord::wifi_mac_address() const {
    return value_["WiFiMACAddress"].as_string();
}

void PairRecord::set_escrow_bag(const std::vector<uint8_t>& bag) {
    // value_ is always a dictionary here, so set() cannot fail
    value_.set("EscrowBag", Value::from_data(bag)).unwrap();
}

Value PairRecord::lockdown_payload() const {
    Value out = Value::new_dict();
    for (const char* key : {"DeviceCertificate", "HostCertificate", "RootCertificate"}) {
        ValueRef field = value_[key];
        if (field) {
            out.set(key, field.copy()).unwrap();
        }
    }
    out.set("HostID", Value::from_string(host_id())).unwrap();
    out.set("SystemBUID", Value::from_string(system_buid())).unwrap();
    return out;
}

PairRecord PairRecord::clone() const {
    return PairRecord(value_.copy());
}

} // namespace Busq
