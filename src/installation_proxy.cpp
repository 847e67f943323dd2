// busq++ contributors

#include <busq++/installation_proxy.hpp>
#include <busq++/lockdown.hpp>
#include <busq++/log.hpp>

#include <thread>

namespace Busq {

struct InstallationProxy::State {
    explicit State(Connection&& conn) : service(std::move(conn)) {}

    PropertyListService              service;
    std::atomic<bool>                busy{false};
    std::atomic<bool>                closing{false};
    CallbackRegistry<StatusCallback> callbacks;
    std::mutex                       worker_mutex;
    std::thread                      worker;
    uint64_t                         active_token = 0;
};

// -------- Anonymous Namespace for Helpers --------
namespace {

constexpr uint32_t kPollIntervalMs = 500;

Error remap(const Error& e) {
    return remap_error(e, InstProxyError::ConnectionFailed, InstProxyError::ConnectionFailed,
                       InstProxyError::ReceiveTimeout, InstProxyError::PlistError,
                       InstProxyError::InvalidArgument);
}

// Clears the busy flag when a synchronous call leaves
class BusyGuard {
  public:
    explicit BusyGuard(std::atomic<bool>& flag) noexcept : flag_(flag) {}
    ~BusyGuard() { flag_ = false; }
    BusyGuard(const BusyGuard&)            = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

  private:
    std::atomic<bool>& flag_;
};

Value make_command(const char* name, const ClientOptions& options) {
    Value command = Value::new_dict();
    command.set("Command", Value::from_string(name)).unwrap();
    if (!options.empty()) {
        command.set("ClientOptions", options.value().copy()).unwrap();
    }
    return command;
}

bool is_terminal(ValueRef status) {
    return status["Error"] || status["Status"].as_string() == std::optional<std::string>("Complete");
}

// Status dictionary describing a transport failure, so callbacks see a
// terminal message whatever ended the operation
Value failure_status(const Error& e) {
    Value status = Value::new_dict();
    status.set("Error", Value::from_string(e.kind_name())).unwrap();
    status.set("ErrorDescription", Value::from_string(e.message)).unwrap();
    return status;
}

void run_worker(std::shared_ptr<InstallationProxy::State> state, uint64_t token, Value command) {
    auto entry = state->callbacks.find(token);
    auto deliver = [&](ValueRef status) {
        if (entry && !entry->cancelled && !state->closing) {
            entry->fn(command, status);
        }
    };

    while (!state->closing) {
        auto received = state->service.receive(kPollIntervalMs);
        if (received.is_err()) {
            if (received.unwrap_err().is(MobileDeviceError::Timeout)) {
                continue;
            }
            Error e = remap(received.unwrap_err());
            logger()->debug("installation_proxy: operation ended: {}", e.to_string());
            Value status = failure_status(e);
            deliver(status);
            break;
        }
        Value status = std::move(received).unwrap();
        if (auto percent = InstallationProxy::percent_complete(status)) {
            logger()->trace("installation_proxy: {}%", percent);
        }
        deliver(status);
        if (is_terminal(status)) {
            break;
        }
    }

    state->callbacks.take(token);
    entry.reset();
    state->busy = false;
}

} // namespace

// -------- Options --------

const char* to_string(ApplicationType type) noexcept {
    switch (type) {
    case ApplicationType::System:
        return "System";
    case ApplicationType::User:
        return "User";
    case ApplicationType::Internal:
        return "Internal";
    case ApplicationType::Any:
        return "Any";
    }
    return "Any";
}

ClientOptions ClientOptions::from_value(Value&& dict) {
    ClientOptions options;
    if (dict.type() == ValueType::Dictionary) {
        options.dict_ = std::move(dict);
    }
    return options;
}

ClientOptions& ClientOptions::set(const std::string& key, Value&& value) {
    dict_.set(key, std::move(value)).unwrap();
    return *this;
}

ClientOptions& ClientOptions::package_type(const std::string& type) {
    return set("PackageType", Value::from_string(type));
}

ClientOptions& ClientOptions::skip_uninstall(bool skip) {
    return set("SkipUninstall", Value::from_bool(skip));
}

ClientOptions& ClientOptions::application_sinf(const std::vector<uint8_t>& sinf) {
    return set("ApplicationSINF", Value::from_data(sinf));
}

ClientOptions& ClientOptions::itunes_metadata(const std::vector<uint8_t>& metadata) {
    return set("iTunesMetadata", Value::from_data(metadata));
}

ClientOptions& ClientOptions::return_attributes(const std::vector<std::string>& attributes) {
    return set("ReturnAttributes", Value::from_strings(attributes));
}

ClientOptions& ClientOptions::application_type(ApplicationType type) {
    return set("ApplicationType", Value::from_string(to_string(type)));
}

ClientOptions& ClientOptions::bundle_ids(const std::vector<std::string>& ids) {
    return set("BundleIDs", Value::from_strings(ids));
}

AppInfo AppInfo::from_value(ValueRef record) {
    AppInfo info;
    info.bundle_identifier       = record["CFBundleIdentifier"].as_string();
    info.development_region      = record["CFBundleDevelopmentRegion"].as_string();
    info.display_name            = record["CFBundleDisplayName"].as_string();
    info.executable              = record["CFBundleExecutable"].as_string();
    info.name                    = record["CFBundleName"].as_string();
    info.application_type        = record["ApplicationType"].as_string();
    info.short_version           = record["CFBundleShortVersionString"].as_string();
    info.version                 = record["CFBundleVersion"].as_string();
    info.path                    = record["Path"].as_string();
    info.signer_identity         = record["SignerIdentity"].as_string();
    info.is_demoted_app          = record["IsDemotedApp"].as_bool();
    info.is_host_backup_eligible = record["IsHostBackupEligible"].as_bool();
    info.is_upgradeable          = record["IsUpgradeable"].as_bool();
    info.is_app_clip             = record["IsAppClip"].as_bool();
    return info;
}

InstProxyError inst_proxy_error_from_string(const std::string& name) noexcept {
    auto code = Error::code_for_name(ErrorDomain::InstProxy, name);
    if (!code) {
        return InstProxyError::Unknown;
    }
    return static_cast<InstProxyError>(*code);
}

InstProxyError StatusError::kind() const noexcept {
    return inst_proxy_error_from_string(name);
}

Error StatusError::to_error() const {
    std::string message = name;
    if (description) {
        message += ": " + *description;
    }
    if (code) {
        message += " (" + std::to_string(*code) + ")";
    }
    return Error(kind(), message);
}

// -------- Factory Methods --------

Result<InstallationProxy, Error> InstallationProxy::connect(Device& device, ServiceDescriptor&& descriptor) {
    auto conn = open_service_connection(device, std::move(descriptor));
    if (conn.is_err()) {
        return Err(remap(conn.unwrap_err()));
    }
    return Ok(adopt(std::move(conn).unwrap()));
}

Result<InstallationProxy, Error> InstallationProxy::start(Device& device, const std::string& label) {
    return start_service_client<InstallationProxy>(device, label);
}

InstallationProxy InstallationProxy::adopt(Connection&& conn) {
    return InstallationProxy(std::make_shared<State>(std::move(conn)));
}

InstallationProxy& InstallationProxy::operator=(InstallationProxy&& other) noexcept {
    if (this != &other) {
        free();
        state_ = std::move(other.state_);
    }
    return *this;
}

bool InstallationProxy::busy() const noexcept {
    return state_ && state_->busy;
}

void InstallationProxy::free() noexcept {
    if (!state_) {
        return;
    }
    std::shared_ptr<State> state = std::move(state_);
    state->closing = true;
    if (state->active_token != 0) {
        state->callbacks.cancel(state->active_token);
    }

    bool on_worker = false;
    {
        std::lock_guard<std::mutex> lock(state->worker_mutex);
        if (state->worker.joinable()) {
            if (state->worker.get_id() == std::this_thread::get_id()) {
                // Released from inside a callback; the worker drops the last reference
                state->worker.detach();
                on_worker = true;
            } else {
                state->worker.join();
            }
        }
    }
    if (!on_worker) {
        state->service.connection().disconnect();
    }
}

// -------- Internals --------

Result<void, Error> InstallationProxy::begin() const {
    if (!state_) {
        return Err(Error(InstProxyError::DeallocatedClient, "installation proxy was released"));
    }
    if (state_->busy.exchange(true)) {
        return Err(Error(InstProxyError::OperationInProgress, "another operation is running"));
    }
    return Ok();
}

Result<Value, Error> InstallationProxy::run_to_completion(const Value&                         command,
                                                          const std::function<void(ValueRef)>& on_status) {
    auto sent = state_->service.send(command);
    if (sent.is_err()) {
        return Err(remap(sent.unwrap_err()));
    }
    for (;;) {
        auto received = state_->service.receive();
        if (received.is_err()) {
            return Err(remap(received.unwrap_err()));
        }
        Value status = std::move(received).unwrap();
        if (on_status) {
            on_status(status);
        }
        if (auto err = extract_error(status)) {
            return Err(err->to_error());
        }
        if (status_name(status) == std::optional<std::string>("Complete")) {
            return Ok(std::move(status));
        }
    }
}

Result<Disposable, Error> InstallationProxy::run_operation(Value&& command, StatusCallback callback) {
    BUSQ_TRY_VOID(begin());
    logger()->debug("installation_proxy: {}", command_name(command).value_or("?"));

    if (!callback) {
        BusyGuard guard(state_->busy);
        BUSQ_TRY_VOID(run_to_completion(command, nullptr));
        return Ok(Disposable());
    }

    {
        // The previous worker cleared busy on its way out
        std::lock_guard<std::mutex> lock(state_->worker_mutex);
        if (state_->worker.joinable()) {
            state_->worker.join();
        }
    }

    auto sent = state_->service.send(command);
    if (sent.is_err()) {
        state_->busy = false;
        return Err(remap(sent.unwrap_err()));
    }

    uint64_t token       = state_->callbacks.add(std::move(callback));
    state_->active_token = token;
    {
        std::lock_guard<std::mutex> lock(state_->worker_mutex);
        state_->worker = std::thread(run_worker, state_, token, std::move(command));
    }

    std::weak_ptr<State> weak = state_;
    return Ok(Disposable([weak, token]() {
        if (auto state = weak.lock()) {
            state->callbacks.cancel(token);
            state->callbacks.take(token);
        }
    }));
}

Result<Disposable, Error> InstallationProxy::app_command(const char*          name,
                                                         const char*          target_key,
                                                         const std::string&   target,
                                                         const ClientOptions& options,
                                                         StatusCallback       callback) {
    if (target.empty()) {
        return Err(Error(InstProxyError::InvalidArgument, std::string(target_key) + " is required"));
    }
    Value command = make_command(name, options);
    command.set(target_key, Value::from_string(target)).unwrap();
    return run_operation(std::move(command), std::move(callback));
}

// -------- Ops --------

Result<Value, Error> InstallationProxy::browse(const ClientOptions& options) {
    BUSQ_TRY_VOID(begin());
    BusyGuard guard(state_->busy);

    Value apps    = Value::new_array();
    Value command = make_command("Browse", options);
    BUSQ_TRY_VOID(run_to_completion(command, [&apps](ValueRef status) {
        auto page = current_list(status);
        if (!page) {
            return;
        }
        for (size_t i = 0; i < page->list.size(); ++i) {
            apps.append(page->list[i].copy()).unwrap();
        }
    }));
    return Ok(std::move(apps));
}

Result<Disposable, Error> InstallationProxy::browse_with_callback(const ClientOptions& options,
                                                                  StatusCallback       callback) {
    if (!callback) {
        return Err(Error(InstProxyError::InvalidArgument, "browse callback is required"));
    }
    return run_operation(make_command("Browse", options), std::move(callback));
}

Result<Value, Error> InstallationProxy::lookup(const std::optional<std::vector<std::string>>& bundle_ids,
                                               const ClientOptions&                           options) {
    BUSQ_TRY_VOID(begin());
    BusyGuard guard(state_->busy);

    Value command = make_command("Lookup", options);
    if (bundle_ids) {
        Value client_options = options.value().copy();
        client_options.set("BundleIDs", Value::from_strings(*bundle_ids)).unwrap();
        command.set("ClientOptions", std::move(client_options)).unwrap();
    }
    BUSQ_TRY(reply, run_to_completion(command, nullptr));
    ValueRef result = reply["LookupResult"];
    if (!result) {
        return Ok(Value::new_dict());
    }
    return Ok(result.copy());
}

Result<Value, Error> InstallationProxy::lookup_archives(const ClientOptions& options) {
    BUSQ_TRY_VOID(begin());
    BusyGuard guard(state_->busy);

    BUSQ_TRY(reply, run_to_completion(make_command("LookupArchives", options), nullptr));
    ValueRef result = reply["LookupResult"];
    if (!result) {
        return Ok(Value::new_dict());
    }
    return Ok(result.copy());
}

Result<std::string, Error> InstallationProxy::get_path_for_bundle_identifier(const std::string& bundle_id) {
    if (bundle_id.empty()) {
        return Err(Error(InstProxyError::InvalidArgument, "bundle id is required"));
    }
    ClientOptions options;
    options.return_attributes({"CFBundleIdentifier", "CFBundleExecutable", "Path"});
    BUSQ_TRY(result, lookup(std::vector<std::string>{bundle_id}, options));

    ValueRef app        = result[bundle_id];
    auto     path       = app["Path"].as_string();
    auto     executable = app["CFBundleExecutable"].as_string();
    if (!path || !executable) {
        return Err(Error(InstProxyError::OperationFailed, bundle_id + " is not installed"));
    }
    return Ok(*path + "/" + *executable);
}

Result<Value, Error> InstallationProxy::check_capabilities_match(const std::vector<std::string>& capabilities,
                                                                 const ClientOptions&            options) {
    BUSQ_TRY_VOID(begin());
    BusyGuard guard(state_->busy);

    Value command = make_command("CheckCapabilitiesMatch", options);
    command.set("Capabilities", Value::from_strings(capabilities)).unwrap();
    BUSQ_TRY(reply, run_to_completion(command, nullptr));
    ValueRef result = reply["LookupResult"];
    if (!result) {
        return Err(Error(InstProxyError::OperationFailed, "reply carries no LookupResult"));
    }
    return Ok(result.copy());
}

Result<std::vector<AppInfo>, Error> InstallationProxy::list_apps(ApplicationType type) {
    ClientOptions options;
    options.application_type(type);
    BUSQ_TRY(apps, browse(options));

    std::vector<AppInfo> out;
    out.reserve(apps.size());
    for (size_t i = 0; i < apps.size(); ++i) {
        out.push_back(AppInfo::from_value(apps[i]));
    }
    return Ok(std::move(out));
}

Result<Disposable, Error> InstallationProxy::install(const std::string&   package_path,
                                                     const ClientOptions& options,
                                                     StatusCallback       callback) {
    return app_command("Install", "PackagePath", package_path, options, std::move(callback));
}

Result<Disposable, Error> InstallationProxy::upgrade(const std::string&   package_path,
                                                     const ClientOptions& options,
                                                     StatusCallback       callback) {
    return app_command("Upgrade", "PackagePath", package_path, options, std::move(callback));
}

Result<Disposable, Error> InstallationProxy::uninstall(const std::string&   app_id,
                                                       const ClientOptions& options,
                                                       StatusCallback       callback) {
    return app_command("Uninstall", "ApplicationIdentifier", app_id, options, std::move(callback));
}

Result<Disposable, Error> InstallationProxy::archive(const std::string&   app_id,
                                                     const ClientOptions& options,
                                                     StatusCallback       callback) {
    return app_command("Archive", "ApplicationIdentifier", app_id, options, std::move(callback));
}

Result<Disposable, Error> InstallationProxy::restore(const std::string&   app_id,
                                                     const ClientOptions& options,
                                                     StatusCallback       callback) {
    return app_command("Restore", "ApplicationIdentifier", app_id, options, std::move(callback));
}

Result<Disposable, Error> InstallationProxy::remove_archive(const std::string&   app_id,
                                                            const ClientOptions& options,
                                                            StatusCallback       callback) {
    return app_command("RemoveArchive", "ApplicationIdentifier", app_id, options, std::move(callback));
}

// -------- Status projections --------

std::optional<std::string> InstallationProxy::command_name(ValueRef command) {
    return command["Command"].as_string();
}

std::optional<std::string> InstallationProxy::status_name(ValueRef status) {
    return status["Status"].as_string();
}

std::optional<StatusError> InstallationProxy::extract_error(ValueRef status) {
    auto name = status["Error"].as_string();
    if (!name) {
        return std::nullopt;
    }
    StatusError err;
    err.name        = *name;
    err.description = status["ErrorDescription"].as_string();
    err.code        = status["ErrorDetail"].as_uint();
    return err;
}

int32_t InstallationProxy::percent_complete(ValueRef status) {
    auto percent = status["PercentComplete"].as_uint();
    return percent ? static_cast<int32_t>(*percent) : 0;
}

std::optional<BrowsePage> InstallationProxy::current_list(ValueRef status) {
    ValueRef list = status["CurrentList"];
    if (!list || list.type() != ValueType::Array) {
        return std::nullopt;
    }
    BrowsePage page;
    page.total          = status["Total"].as_uint().value_or(0);
    page.current_index  = status["CurrentIndex"].as_uint().value_or(0);
    page.current_amount = status["CurrentAmount"].as_uint().value_or(list.size());
    page.list           = list;
    return page;
}

} // namespace Busq
