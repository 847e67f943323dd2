// busq++ contributors

#ifndef BUSQ_PROPERTY_LIST_SERVICE_HPP
#define BUSQ_PROPERTY_LIST_SERVICE_HPP

#include <busq++/connection.hpp>
#include <busq++/value.hpp>

#include <optional>

namespace Busq {

// Length-prefixed property list messages: a 4-byte big-endian size followed by
// the encoded plist. Shared by lockdown and every plist based service.
class PropertyListService {
  public:
    explicit PropertyListService(Connection&& conn) noexcept : conn_(std::move(conn)) {}

    Result<void, Error>  send(const Value& message, Format format = Format::Xml);
    // Binary or XML, whichever the peer sent
    Result<Value, Error> receive(std::optional<uint32_t> timeout_ms = std::nullopt);

    Connection&          connection() noexcept { return conn_; }
    Connection           into_connection() && { return std::move(conn_); }

    ~PropertyListService() noexcept                              = default;
    PropertyListService(PropertyListService&&) noexcept          = default;
    PropertyListService& operator=(PropertyListService&&) noexcept = default;
    PropertyListService(const PropertyListService&)              = delete;
    PropertyListService& operator=(const PropertyListService&)   = delete;

  private:
    Connection conn_;
};

} // namespace Busq
#endif
