// busq++ contributors

#ifndef BUSQ_HOUSE_ARREST_HPP
#define BUSQ_HOUSE_ARREST_HPP

#include <busq++/device.hpp>
#include <busq++/property_list_service.hpp>
#include <busq++/service.hpp>

#include <optional>
#include <string>

namespace Busq {

// Vends an app's container or Documents folder. After a successful vend the
// connection speaks AFC: hand it over with AfcClient::from_house_arrest, after
// which this client only answers InvalidMode.
class HouseArrestClient {
  public:
    static constexpr const char* kServiceName = "com.apple.mobile.house_arrest";

    static Result<HouseArrestClient, Error> connect(Device& device, ServiceDescriptor&& descriptor);
    static Result<HouseArrestClient, Error> start(Device& device, const std::string& label = "busq");

    Result<void, Error>       send_request(const Value& request);
    // "VendContainer" or "VendDocuments"
    Result<void, Error>       send_command(const std::string& command, const std::string& app_id);
    // {Status: Complete} or {Error: ...}
    Result<Value, Error>      get_result();

    // send_command + get_result, failing on a device Error
    Result<void, Error>       vend_container(const std::string& app_id);
    Result<void, Error>       vend_documents(const std::string& app_id);

    Result<Connection, Error> into_afc_connection();
    bool                      afc_mode() const noexcept { return afc_mode_; }

    bool                      released() const noexcept { return !service_.has_value() && !afc_mode_; }
    void                      free() noexcept;

    ~HouseArrestClient() noexcept                              = default;
    HouseArrestClient(HouseArrestClient&&) noexcept            = default;
    HouseArrestClient& operator=(HouseArrestClient&&) noexcept = default;
    HouseArrestClient(const HouseArrestClient&)                = delete;
    HouseArrestClient& operator=(const HouseArrestClient&)     = delete;

  private:
    explicit HouseArrestClient(Connection&& conn) noexcept : service_(PropertyListService(std::move(conn))) {}

    Result<void, Error> ensure_usable() const;
    Result<void, Error> vend(const char* command, const std::string& app_id);

    std::optional<PropertyListService> service_;
    bool                               afc_mode_ = false;
};

} // namespace Busq
#endif
