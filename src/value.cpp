// busq++ contributors

#include <busq++/value.hpp>

#include <cstdlib>
#include <cstring>

namespace Busq {

namespace {

// 2001-01-01T00:00:00Z in unix seconds
constexpr int64_t kAppleEpochOffset = 978307200;

// Copies a libplist-allocated C string and frees it
std::string take_plist_string(char* s) {
    std::string out(s ? s : "");
    if (s) {
        plist_mem_free(s);
    }
    return out;
}

Error plist_error(plist_err_t code, const char* what) {
    return Error(ErrorDomain::Plist, static_cast<int32_t>(code), what);
}

Error container_error(const char* what) {
    return Error(PlistError::InvalidArgument, what);
}

bool deep_equal(plist_t a, plist_t b) {
    if (!a || !b) {
        return a == b;
    }
    plist_type ta = plist_get_node_type(a);
    if (ta != plist_get_node_type(b)) {
        return false;
    }
    switch (ta) {
    case PLIST_ARRAY: {
        uint32_t n = plist_array_get_size(a);
        if (n != plist_array_get_size(b)) {
            return false;
        }
        for (uint32_t i = 0; i < n; ++i) {
            if (!deep_equal(plist_array_get_item(a, i), plist_array_get_item(b, i))) {
                return false;
            }
        }
        return true;
    }
    case PLIST_DICT: {
        if (plist_dict_get_size(a) != plist_dict_get_size(b)) {
            return false;
        }
        plist_dict_iter it = nullptr;
        plist_dict_new_iter(a, &it);
        bool equal = true;
        while (equal) {
            char*   key = nullptr;
            plist_t val = nullptr;
            plist_dict_next_item(a, it, &key, &val);
            if (!val) {
                if (key) {
                    plist_mem_free(key);
                }
                break;
            }
            plist_t other = plist_dict_get_item(b, key);
            equal         = other && deep_equal(val, other);
            plist_mem_free(key);
        }
        std::free(it);
        return equal;
    }
    case PLIST_NULL:
    case PLIST_NONE:
        return true;
    default:
        return plist_compare_node_value(a, b) != 0;
    }
}

} // namespace

const char* to_string(ValueType type) noexcept {
    switch (type) {
    case ValueType::Boolean:
        return "boolean";
    case ValueType::UnsignedInteger:
        return "unsigned-integer";
    case ValueType::Real:
        return "real";
    case ValueType::String:
        return "string";
    case ValueType::Date:
        return "date";
    case ValueType::Data:
        return "binary-data";
    case ValueType::Array:
        return "array";
    case ValueType::Dictionary:
        return "dictionary";
    case ValueType::Key:
        return "key";
    case ValueType::Uid:
        return "unique-id";
    case ValueType::None:
        return "none";
    }
    return "none";
}

// ---------- Date ----------

Date Date::normalized(int64_t seconds, int64_t microseconds) noexcept {
    seconds += microseconds / 1000000;
    microseconds %= 1000000;
    if (microseconds < 0) {
        microseconds += 1000000;
        seconds -= 1;
    }
    Date d;
    d.seconds      = static_cast<int32_t>(seconds);
    d.microseconds = static_cast<int32_t>(microseconds);
    return d;
}

Date Date::from_time_point(std::chrono::system_clock::time_point tp) noexcept {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    return normalized(us / 1000000 - kAppleEpochOffset, us % 1000000);
}

std::chrono::system_clock::time_point Date::to_time_point() const noexcept {
    auto us = (static_cast<int64_t>(seconds) + kAppleEpochOffset) * 1000000 + microseconds;
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(us)));
}

// ---------- ValueRef ----------

ValueType ValueRef::type() const noexcept {
    if (!node_) {
        return ValueType::None;
    }
    switch (plist_get_node_type(node_)) {
    case PLIST_BOOLEAN:
        return ValueType::Boolean;
    case PLIST_INT:
        return ValueType::UnsignedInteger;
    case PLIST_REAL:
        return ValueType::Real;
    case PLIST_STRING:
        return ValueType::String;
    case PLIST_DATE:
        return ValueType::Date;
    case PLIST_DATA:
        return ValueType::Data;
    case PLIST_ARRAY:
        return ValueType::Array;
    case PLIST_DICT:
        return ValueType::Dictionary;
    case PLIST_KEY:
        return ValueType::Key;
    case PLIST_UID:
        return ValueType::Uid;
    default:
        return ValueType::None;
    }
}

std::optional<bool> ValueRef::as_bool() const {
    if (type() != ValueType::Boolean) {
        return std::nullopt;
    }
    uint8_t v = 0;
    plist_get_bool_val(node_, &v);
    return v != 0;
}

std::optional<uint64_t> ValueRef::as_uint() const {
    if (type() != ValueType::UnsignedInteger) {
        return std::nullopt;
    }
    uint64_t v = 0;
    plist_get_uint_val(node_, &v);
    return v;
}

std::optional<double> ValueRef::as_real() const {
    if (type() != ValueType::Real) {
        return std::nullopt;
    }
    double v = 0;
    plist_get_real_val(node_, &v);
    return v;
}

std::optional<std::string> ValueRef::as_string() const {
    if (type() != ValueType::String) {
        return std::nullopt;
    }
    char* s = nullptr;
    plist_get_string_val(node_, &s);
    return take_plist_string(s);
}

std::optional<std::string> ValueRef::as_key() const {
    if (type() != ValueType::Key) {
        return std::nullopt;
    }
    char* s = nullptr;
    plist_get_key_val(node_, &s);
    return take_plist_string(s);
}

std::optional<Date> ValueRef::as_date() const {
    if (type() != ValueType::Date) {
        return std::nullopt;
    }
    int32_t sec  = 0;
    int32_t usec = 0;
    plist_get_date_val(node_, &sec, &usec);
    return Date::normalized(sec, usec);
}

std::optional<std::vector<uint8_t>> ValueRef::as_data() const {
    if (type() != ValueType::Data) {
        return std::nullopt;
    }
    char*    buf = nullptr;
    uint64_t len = 0;
    plist_get_data_val(node_, &buf, &len);
    std::vector<uint8_t> out;
    if (buf) {
        out.assign(reinterpret_cast<uint8_t*>(buf), reinterpret_cast<uint8_t*>(buf) + len);
        plist_mem_free(buf);
    }
    return out;
}

std::optional<uint64_t> ValueRef::as_uid() const {
    if (type() != ValueType::Uid) {
        return std::nullopt;
    }
    uint64_t v = 0;
    plist_get_uid_val(node_, &v);
    return v;
}

size_t ValueRef::size() const noexcept {
    switch (type()) {
    case ValueType::Array:
        return plist_array_get_size(node_);
    case ValueType::Dictionary:
        return plist_dict_get_size(node_);
    default:
        return 0;
    }
}

ValueRef ValueRef::operator[](size_t index) const {
    if (type() != ValueType::Array || index >= plist_array_get_size(node_)) {
        return ValueRef();
    }
    return ValueRef(plist_array_get_item(node_, static_cast<uint32_t>(index)));
}

ValueRef ValueRef::operator[](const std::string& key) const {
    if (type() != ValueType::Dictionary) {
        return ValueRef();
    }
    return ValueRef(plist_dict_get_item(node_, key.c_str()));
}

bool ValueRef::contains(const std::string& key) const {
    return !(*this)[key].is_none();
}

std::vector<std::string> ValueRef::keys() const {
    std::vector<std::string> out;
    auto                     it = iter();
    while (auto entry = it.next()) {
        if (entry->key) {
            out.push_back(*entry->key);
        }
    }
    return out;
}

ValueIterator ValueRef::iter() const {
    void* it = nullptr;
    switch (type()) {
    case ValueType::Array:
        plist_array_new_iter(node_, &it);
        return ValueIterator(node_, PLIST_ARRAY, it);
    case ValueType::Dictionary:
        plist_dict_new_iter(node_, &it);
        return ValueIterator(node_, PLIST_DICT, it);
    default:
        return ValueIterator();
    }
}

ValueRef ValueRef::parent() const noexcept {
    if (!node_) {
        return ValueRef();
    }
    return ValueRef(plist_get_parent(node_));
}

std::optional<std::string> ValueRef::key() const {
    ValueRef p = parent();
    if (p.type() != ValueType::Dictionary) {
        return std::nullopt;
    }
    char* k = nullptr;
    plist_dict_get_item_key(node_, &k);
    if (!k) {
        return std::nullopt;
    }
    return take_plist_string(k);
}

Result<void, Error> ValueRef::set(const std::string& key, Value&& child) {
    if (type() != ValueType::Dictionary) {
        return Err(container_error("set on a non-dictionary value"));
    }
    if (child.is_none()) {
        return Err(container_error("cannot insert a none value"));
    }
    plist_dict_set_item(node_, key.c_str(), child.release());
    return Ok();
}

Result<void, Error> ValueRef::remove(const std::string& key) {
    if (type() != ValueType::Dictionary) {
        return Err(container_error("remove on a non-dictionary value"));
    }
    if (!contains(key)) {
        return Err(container_error("no such key"));
    }
    plist_dict_remove_item(node_, key.c_str());
    return Ok();
}

Result<void, Error> ValueRef::append(Value&& child) {
    if (type() != ValueType::Array) {
        return Err(container_error("append on a non-array value"));
    }
    if (child.is_none()) {
        return Err(container_error("cannot insert a none value"));
    }
    plist_array_append_item(node_, child.release());
    return Ok();
}

Result<void, Error> ValueRef::insert(size_t index, Value&& child) {
    if (type() != ValueType::Array || index > plist_array_get_size(node_)) {
        return Err(container_error("insert index out of range"));
    }
    if (child.is_none()) {
        return Err(container_error("cannot insert a none value"));
    }
    if (index == plist_array_get_size(node_)) {
        plist_array_append_item(node_, child.release());
    } else {
        plist_array_insert_item(node_, child.release(), static_cast<uint32_t>(index));
    }
    return Ok();
}

Result<void, Error> ValueRef::set_at(size_t index, Value&& child) {
    if (type() != ValueType::Array || index >= plist_array_get_size(node_)) {
        return Err(container_error("index out of range"));
    }
    if (child.is_none()) {
        return Err(container_error("cannot insert a none value"));
    }
    plist_array_set_item(node_, child.release(), static_cast<uint32_t>(index));
    return Ok();
}

Result<void, Error> ValueRef::remove_at(size_t index) {
    if (type() != ValueType::Array || index >= plist_array_get_size(node_)) {
        return Err(container_error("index out of range"));
    }
    plist_array_remove_item(node_, static_cast<uint32_t>(index));
    return Ok();
}

Value ValueRef::copy() const {
    if (!node_) {
        return Value();
    }
    return Value::adopt(plist_copy(node_));
}

Result<std::vector<uint8_t>, Error> ValueRef::encode(Format format) const {
    if (!node_) {
        return Err(Error(PlistError::InvalidArgument, "cannot encode a none value"));
    }
    char*       out = nullptr;
    uint32_t    len = 0;
    plist_err_t rc  = PLIST_ERR_UNKNOWN;
    switch (format) {
    case Format::Binary:
        rc = plist_to_bin(node_, &out, &len);
        break;
    case Format::Xml:
        rc = plist_to_xml(node_, &out, &len);
        break;
    case Format::Json:
        rc = plist_to_json(node_, &out, &len, 0);
        break;
    }
    if (rc != PLIST_ERR_SUCCESS || !out) {
        if (out) {
            plist_mem_free(out);
        }
        return Err(plist_error(rc, "encode failed"));
    }
    std::vector<uint8_t> bytes(reinterpret_cast<uint8_t*>(out), reinterpret_cast<uint8_t*>(out) + len);
    plist_mem_free(out);
    return Ok(std::move(bytes));
}

Result<std::string, Error> ValueRef::to_xml() const {
    auto bytes = encode(Format::Xml);
    if (bytes.is_err()) {
        return Err(bytes.unwrap_err());
    }
    return Ok(std::string(bytes.unwrap().begin(), bytes.unwrap().end()));
}

Result<std::string, Error> ValueRef::to_json(bool pretty) const {
    if (!node_) {
        return Err(Error(PlistError::InvalidArgument, "cannot encode a none value"));
    }
    char*       out = nullptr;
    uint32_t    len = 0;
    plist_err_t rc  = plist_to_json(node_, &out, &len, pretty ? 1 : 0);
    if (rc != PLIST_ERR_SUCCESS || !out) {
        if (out) {
            plist_mem_free(out);
        }
        return Err(plist_error(rc, "json encode failed"));
    }
    std::string text(out, len);
    plist_mem_free(out);
    return Ok(std::move(text));
}

bool ValueRef::operator==(const ValueRef& other) const {
    return deep_equal(node_, other.node_);
}

// ---------- Value ----------

Value::~Value() {
    reset();
}

Value::Value(Value&& other) noexcept : ValueRef(other.node_) {
    other.node_ = nullptr;
}

Value& Value::operator=(Value&& other) noexcept {
    if (this != &other) {
        reset();
        node_       = other.node_;
        other.node_ = nullptr;
    }
    return *this;
}

void Value::reset() noexcept {
    // A node that was spliced into another tree belongs to that tree
    if (node_ && !plist_get_parent(node_)) {
        plist_free(node_);
    }
    node_ = nullptr;
}

plist_t Value::release() noexcept {
    plist_t n = node_;
    node_     = nullptr;
    return n;
}

Value Value::from_bool(bool v) {
    return Value(plist_new_bool(v ? 1 : 0));
}

Value Value::from_uint(uint64_t v) {
    return Value(plist_new_uint(v));
}

Value Value::from_real(double v) {
    return Value(plist_new_real(v));
}

Value Value::from_string(const std::string& v) {
    return Value(plist_new_string(v.c_str()));
}

Value Value::from_date(Date v) {
    Date n = Date::normalized(v.seconds, v.microseconds);
    return Value(plist_new_date(n.seconds, n.microseconds));
}

Value Value::from_data(const uint8_t* data, size_t len) {
    return Value(plist_new_data(reinterpret_cast<const char*>(data), len));
}

Value Value::from_data(const std::vector<uint8_t>& data) {
    return from_data(data.data(), data.size());
}

Value Value::from_uid(uint64_t v) {
    return Value(plist_new_uid(v));
}

Value Value::new_array() {
    return Value(plist_new_array());
}

Value Value::new_dict() {
    return Value(plist_new_dict());
}

Value Value::from_strings(const std::vector<std::string>& items) {
    Value arr = new_array();
    for (const auto& s : items) {
        plist_array_append_item(arr.raw(), plist_new_string(s.c_str()));
    }
    return arr;
}

Result<Value, Error> Value::decode(const uint8_t* data, size_t len, Format format) {
    if (!data || len == 0) {
        return Err(Error(PlistError::FormatError, "empty input"));
    }
    plist_t     root = nullptr;
    plist_err_t rc   = PLIST_ERR_UNKNOWN;
    auto        text = reinterpret_cast<const char*>(data);
    auto        n    = static_cast<uint32_t>(len);
    switch (format) {
    case Format::Binary:
        rc = plist_from_bin(text, n, &root);
        break;
    case Format::Xml:
        rc = plist_from_xml(text, n, &root);
        break;
    case Format::Json:
        rc = plist_from_json(text, n, &root);
        break;
    }
    if (rc != PLIST_ERR_SUCCESS || !root) {
        if (root) {
            plist_free(root);
        }
        return Err(Error(PlistError::FormatError,
                         "malformed property list (libplist error " + std::to_string(static_cast<int>(rc)) + ")"));
    }
    return Ok(Value(root));
}

Result<Value, Error> Value::decode(const std::vector<uint8_t>& data, Format format) {
    return decode(data.data(), data.size(), format);
}

Result<Value, Error> Value::decode(const std::string& text, Format format) {
    return decode(reinterpret_cast<const uint8_t*>(text.data()), text.size(), format);
}

Result<Value, Error> Value::decode_auto(const uint8_t* data, size_t len) {
    return decode(data, len, is_binary(data, len) ? Format::Binary : Format::Xml);
}

Result<Value, Error> Value::decode_auto(const std::vector<uint8_t>& data) {
    return decode_auto(data.data(), data.size());
}

Result<Value, Error> Value::from_memory(const uint8_t* data, size_t len) {
    if (!data || len == 0) {
        return Err(Error(PlistError::FormatError, "empty input"));
    }
    plist_t        root = nullptr;
    plist_format_t fmt  = PLIST_FORMAT_NONE;
    plist_err_t    rc =
        plist_from_memory(reinterpret_cast<const char*>(data), static_cast<uint32_t>(len), &root, &fmt);
    if (rc != PLIST_ERR_SUCCESS || !root) {
        if (root) {
            plist_free(root);
        }
        return Err(Error(PlistError::FormatError, "unrecognized property list format"));
    }
    return Ok(Value(root));
}

bool Value::is_binary(const uint8_t* data, size_t len) noexcept {
    if (!data || len < 8) {
        return false;
    }
    return plist_is_binary(reinterpret_cast<const char*>(data), static_cast<uint32_t>(len)) != 0;
}

// ---------- ValueIterator ----------

ValueIterator::~ValueIterator() {
    std::free(iter_);
}

ValueIterator::ValueIterator(ValueIterator&& other) noexcept
    : container_(other.container_), type_(other.type_), iter_(other.iter_) {
    other.container_ = nullptr;
    other.iter_      = nullptr;
}

ValueIterator& ValueIterator::operator=(ValueIterator&& other) noexcept {
    if (this != &other) {
        std::free(iter_);
        container_       = other.container_;
        type_            = other.type_;
        iter_            = other.iter_;
        other.container_ = nullptr;
        other.iter_      = nullptr;
    }
    return *this;
}

std::optional<ValueIterator::Entry> ValueIterator::next() {
    if (!container_ || !iter_) {
        return std::nullopt;
    }
    plist_t item = nullptr;
    Entry   entry;
    if (type_ == PLIST_ARRAY) {
        plist_array_next_item(container_, iter_, &item);
    } else {
        char* key = nullptr;
        plist_dict_next_item(container_, iter_, &key, &item);
        if (key) {
            entry.key = take_plist_string(key);
        }
    }
    if (!item) {
        // exhausted; stays exhausted
        std::free(iter_);
        iter_      = nullptr;
        container_ = nullptr;
        return std::nullopt;
    }
    entry.value = ValueRef(item);
    return entry;
}

} // namespace Busq
