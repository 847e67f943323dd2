// busq++ contributors

#ifndef BUSQ_INSTALLATION_PROXY_HPP
#define BUSQ_INSTALLATION_PROXY_HPP

#include <busq++/device.hpp>
#include <busq++/disposable.hpp>
#include <busq++/property_list_service.hpp>
#include <busq++/service.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Busq {

enum class ApplicationType : uint8_t { System, User, Internal, Any };

const char* to_string(ApplicationType type) noexcept;

// Builder for the ClientOptions dictionary sent with every command
class ClientOptions {
  public:
    ClientOptions() : dict_(Value::new_dict()) {}
    static ClientOptions from_value(Value&& dict);

    ClientOptions& package_type(const std::string& type);
    ClientOptions& skip_uninstall(bool skip);
    ClientOptions& application_sinf(const std::vector<uint8_t>& sinf);
    ClientOptions& itunes_metadata(const std::vector<uint8_t>& metadata);
    ClientOptions& return_attributes(const std::vector<std::string>& attributes);
    ClientOptions& application_type(ApplicationType type);
    ClientOptions& bundle_ids(const std::vector<std::string>& ids);
    ClientOptions& set(const std::string& key, Value&& value);

    ValueRef       value() const noexcept { return dict_; }
    bool           empty() const noexcept { return dict_.size() == 0; }

  private:
    Value dict_;
};

// Typed view of an application record
struct AppInfo {
    std::optional<std::string> bundle_identifier;
    std::optional<std::string> development_region;
    std::optional<std::string> display_name;
    std::optional<std::string> executable;
    std::optional<std::string> name;
    std::optional<std::string> application_type;
    std::optional<std::string> short_version;
    std::optional<std::string> version;
    std::optional<std::string> path;
    std::optional<std::string> signer_identity;
    std::optional<bool>        is_demoted_app;
    std::optional<bool>        is_host_backup_eligible;
    std::optional<bool>        is_upgradeable;
    std::optional<bool>        is_app_clip;

    static AppInfo from_value(ValueRef record);
};

// The Error / ErrorDescription / ErrorDetail triple of a failed status
struct StatusError {
    std::string                name;
    std::optional<std::string> description;
    std::optional<uint64_t>    code;

    InstProxyError             kind() const noexcept;
    Error                      to_error() const;
};

// One page of a Browse reply
struct BrowsePage {
    uint64_t total          = 0;
    uint64_t current_index  = 0;
    uint64_t current_amount = 0;
    ValueRef list;
};

// (command, status) for every status message of an operation
using StatusCallback = std::function<void(ValueRef command, ValueRef status)>;

InstProxyError inst_proxy_error_from_string(const std::string& name) noexcept;

class InstallationProxy {
  public:
    static constexpr const char* kServiceName = "com.apple.mobile.installation_proxy";

    static Result<InstallationProxy, Error> connect(Device& device, ServiceDescriptor&& descriptor);
    static Result<InstallationProxy, Error> start(Device& device, const std::string& label = "busq");
    static InstallationProxy                adopt(Connection&& conn);

    // -------- Synchronous --------
    Result<Value, Error>       browse(const ClientOptions& options = ClientOptions());
    Result<Value, Error>       lookup(const std::optional<std::vector<std::string>>& bundle_ids,
                                      const ClientOptions& options = ClientOptions());
    Result<Value, Error>       lookup_archives(const ClientOptions& options = ClientOptions());
    Result<std::string, Error> get_path_for_bundle_identifier(const std::string& bundle_id);
    Result<Value, Error>       check_capabilities_match(const std::vector<std::string>& capabilities,
                                                        const ClientOptions& options = ClientOptions());
    Result<std::vector<AppInfo>, Error> list_apps(ApplicationType type);

    // -------- Streaming --------
    // Pages arrive on a library thread; the last call carries Status Complete
    Result<Disposable, Error>  browse_with_callback(const ClientOptions& options, StatusCallback callback);

    // Without a callback these block until the device reports completion and
    // return an empty token.
    Result<Disposable, Error>  install(const std::string& package_path,
                                       const ClientOptions& options  = ClientOptions(),
                                       StatusCallback       callback = nullptr);
    Result<Disposable, Error>  upgrade(const std::string& package_path,
                                       const ClientOptions& options  = ClientOptions(),
                                       StatusCallback       callback = nullptr);
    Result<Disposable, Error>  uninstall(const std::string& app_id,
                                         const ClientOptions& options  = ClientOptions(),
                                         StatusCallback       callback = nullptr);
    Result<Disposable, Error>  archive(const std::string& app_id,
                                       const ClientOptions& options  = ClientOptions(),
                                       StatusCallback       callback = nullptr);
    Result<Disposable, Error>  restore(const std::string& app_id,
                                       const ClientOptions& options  = ClientOptions(),
                                       StatusCallback       callback = nullptr);
    Result<Disposable, Error>  remove_archive(const std::string& app_id,
                                              const ClientOptions& options  = ClientOptions(),
                                              StatusCallback       callback = nullptr);

    // -------- Status projections --------
    static std::optional<std::string> command_name(ValueRef command);
    static std::optional<std::string> status_name(ValueRef status);
    static std::optional<StatusError> extract_error(ValueRef status);
    // 0 when the status carries no PercentComplete
    static int32_t                    percent_complete(ValueRef status);
    static std::optional<BrowsePage>  current_list(ValueRef status);

    // An operation is streaming on the library thread
    bool busy() const noexcept;
    bool released() const noexcept { return state_ == nullptr; }
    void free() noexcept;

    // RAII / moves
    ~InstallationProxy() noexcept { free(); }
    InstallationProxy(InstallationProxy&&) noexcept            = default;
    InstallationProxy& operator=(InstallationProxy&& other) noexcept;
    InstallationProxy(const InstallationProxy&)                = delete;
    InstallationProxy& operator=(const InstallationProxy&)     = delete;

    struct State;

  private:
    explicit InstallationProxy(std::shared_ptr<State> state) noexcept : state_(std::move(state)) {}

    Result<void, Error>       begin() const;
    Result<Value, Error>      run_to_completion(const Value&                         command,
                                                const std::function<void(ValueRef)>& on_status);
    Result<Disposable, Error> run_operation(Value&& command, StatusCallback callback);
    Result<Disposable, Error> app_command(const char*          name,
                                          const char*          target_key,
                                          const std::string&   target,
                                          const ClientOptions& options,
                                          StatusCallback       callback);

    std::shared_ptr<State> state_;
};

} // namespace Busq
#endif
