// busq++ contributors

#pragma once

#include <busq++/error.hpp>
#include <busq++/result.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <plist/plist.h>
#include <string>
#include <vector>

namespace Busq {

enum class ValueType : uint8_t {
    Boolean,
    UnsignedInteger,
    Real,
    String,
    Date,
    Data,
    Array,
    Dictionary,
    Key,
    Uid,
    None,
};

enum class Format : uint8_t { Binary, Xml, Json };

const char* to_string(ValueType type) noexcept;

// Seconds and microseconds since 2001-01-01T00:00:00Z, 0 <= microseconds < 1000000
struct Date {
    int32_t     seconds      = 0;
    int32_t     microseconds = 0;

    static Date normalized(int64_t seconds, int64_t microseconds) noexcept;
    static Date from_time_point(std::chrono::system_clock::time_point tp) noexcept;
    std::chrono::system_clock::time_point to_time_point() const noexcept;

    bool operator==(const Date& o) const noexcept {
        return seconds == o.seconds && microseconds == o.microseconds;
    }
    bool operator!=(const Date& o) const noexcept { return !(*this == o); }
};

class Value;
class ValueIterator;

// Non-owning view of a node. A default constructed ref is the "none" value, so
// lookups can be chained without checks: apps[0]["CFBundleIdentifier"].as_string()
class ValueRef {
  public:
    ValueRef() noexcept = default;
    explicit ValueRef(plist_t node) noexcept : node_(node) {}

    ValueType                           type() const noexcept;
    bool                                is_none() const noexcept { return node_ == nullptr; }
    explicit                            operator bool() const noexcept { return node_ != nullptr; }

    // Typed accessors: absent unless the tag matches
    std::optional<bool>                 as_bool() const;
    std::optional<uint64_t>             as_uint() const;
    std::optional<double>               as_real() const;
    std::optional<std::string>          as_string() const;
    std::optional<std::string>          as_key() const;
    std::optional<Date>                 as_date() const;
    std::optional<std::vector<uint8_t>> as_data() const;
    std::optional<uint64_t>             as_uid() const;

    // Containers. Out of range indices and missing keys yield a none ref.
    size_t                              size() const noexcept;
    ValueRef                            operator[](size_t index) const;
    ValueRef                            operator[](const std::string& key) const;
    bool                                contains(const std::string& key) const;
    std::vector<std::string>            keys() const;
    ValueIterator                       iter() const;

    // Tree navigation; the parent is never owned through this ref
    ValueRef                            parent() const noexcept;
    std::optional<std::string>          key() const;

    // Mutation of containers. The child's ownership moves into the tree.
    Result<void, Error>                 set(const std::string& key, Value&& child);
    Result<void, Error>                 remove(const std::string& key);
    Result<void, Error>                 append(Value&& child);
    Result<void, Error>                 insert(size_t index, Value&& child);
    Result<void, Error>                 set_at(size_t index, Value&& child);
    Result<void, Error>                 remove_at(size_t index);

    Value                               copy() const;

    Result<std::vector<uint8_t>, Error> encode(Format format) const;
    Result<std::string, Error>          to_xml() const;
    Result<std::string, Error>          to_json(bool pretty = false) const;

    // Deep structural comparison; dictionary order is not significant
    bool                                operator==(const ValueRef& other) const;
    bool                                operator!=(const ValueRef& other) const { return !(*this == other); }

    plist_t                             raw() const noexcept { return node_; }

  protected:
    plist_t node_ = nullptr;
};

// Owning root of a value tree
class Value : public ValueRef {
  public:
    Value() noexcept = default;
    ~Value();

    Value(Value&& other) noexcept;
    Value& operator=(Value&& other) noexcept;
    Value(const Value&)            = delete;
    Value& operator=(const Value&) = delete;

    static Value from_bool(bool v);
    static Value from_uint(uint64_t v);
    static Value from_real(double v);
    static Value from_string(const std::string& v);
    static Value from_date(Date v);
    static Value from_data(const uint8_t* data, size_t len);
    static Value from_data(const std::vector<uint8_t>& data);
    static Value from_uid(uint64_t v);
    static Value new_array();
    static Value new_dict();
    static Value from_strings(const std::vector<std::string>& items);

    static Result<Value, Error> decode(const uint8_t* data, size_t len, Format format);
    static Result<Value, Error> decode(const std::vector<uint8_t>& data, Format format);
    static Result<Value, Error> decode(const std::string& text, Format format);
    // Binary when the bplist signature is present, XML otherwise
    static Result<Value, Error> decode_auto(const uint8_t* data, size_t len);
    static Result<Value, Error> decode_auto(const std::vector<uint8_t>& data);
    // Any of the three formats
    static Result<Value, Error> from_memory(const uint8_t* data, size_t len);
    static bool                 is_binary(const uint8_t* data, size_t len) noexcept;

    // Takes ownership of a detached root node
    static Value                adopt(plist_t node) noexcept { return Value(node); }
    plist_t                     release() noexcept;

  private:
    explicit Value(plist_t node) noexcept : ValueRef(node) {}
    void reset() noexcept;
};

// Forward-only walk over an array or dictionary. Not restartable: call
// ValueRef::iter() again to rescan.
class ValueIterator {
  public:
    struct Entry {
        std::optional<std::string> key;
        ValueRef                   value;
    };

    ValueIterator() noexcept = default;
    ~ValueIterator();
    ValueIterator(ValueIterator&& other) noexcept;
    ValueIterator& operator=(ValueIterator&& other) noexcept;
    ValueIterator(const ValueIterator&)            = delete;
    ValueIterator& operator=(const ValueIterator&) = delete;

    std::optional<Entry> next();

  private:
    friend class ValueRef;
    ValueIterator(plist_t container, plist_type type, void* iter) noexcept
        : container_(container), type_(type), iter_(iter) {}

    plist_t    container_ = nullptr;
    plist_type type_      = PLIST_NONE;
    void*      iter_      = nullptr;
};

} // namespace Busq
