#include <busq++/device.hpp>
#include <busq++/installation_proxy.hpp>
#include <busq++/usbmuxd.hpp>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

using namespace Busq;

int main(int argc, char** argv) {
    // Usage:
    //   installer list [User|System|Any]
    //   installer install <remote package path>
    //   installer uninstall <bundle id>
    if (argc < 2) {
        std::cerr << "Usage:\n"
                  << "  " << argv[0] << " list [User|System|Any]\n"
                  << "  " << argv[0] << " install <remote package path>\n"
                  << "  " << argv[0] << " uninstall <bundle id>\n";
        return 2;
    }
    std::string cmd      = argv[1];

    auto        provider = std::make_shared<UsbmuxdProvider>();
    auto        devices  = Device::list(*provider).expect("failed to list devices");
    if (devices.empty()) {
        std::cerr << "no devices connected\n";
        return 1;
    }
    auto device = Device::adopt(provider, devices[0]).expect("failed to adopt device");
    auto proxy  = InstallationProxy::start(device, "installer").expect("failed to start installation proxy");

    if (cmd == "list") {
        ApplicationType type = ApplicationType::User;
        if (argc > 2) {
            std::string t = argv[2];
            type = t == "System" ? ApplicationType::System : t == "Any" ? ApplicationType::Any : type;
        }
        auto apps = proxy.list_apps(type).expect("browse failed");
        for (const auto& app : apps) {
            std::cout << app.bundle_identifier.value_or("?") << "  "
                      << app.display_name.value_or(app.name.value_or("")) << "  "
                      << app.short_version.value_or("") << "\n";
        }
        return 0;
    }

    if ((cmd != "install" && cmd != "uninstall") || argc != 3) {
        std::cerr << "unknown command\n";
        return 2;
    }

    std::mutex              m;
    std::condition_variable cv;
    bool                    done   = false;
    bool                    failed = false;

    auto                    progress = [&](ValueRef command, ValueRef status) {
        if (auto err = InstallationProxy::extract_error(status)) {
            std::cerr << InstallationProxy::command_name(command).value_or("?") << " failed: "
                      << err->to_error().to_string() << "\n";
        } else {
            std::cout << InstallationProxy::status_name(status).value_or("") << " ("
                      << InstallationProxy::percent_complete(status) << "%)\n";
        }
        bool finished = InstallationProxy::extract_error(status).has_value() ||
                        InstallationProxy::status_name(status) == std::optional<std::string>("Complete");
        if (finished) {
            std::lock_guard<std::mutex> lock(m);
            done   = true;
            failed = InstallationProxy::extract_error(status).has_value();
            cv.notify_one();
        }
    };

    auto token = cmd == "install" ? proxy.install(argv[2], ClientOptions(), progress)
                                  : proxy.uninstall(argv[2], ClientOptions(), progress);
    if (token.is_err()) {
        std::cerr << token.unwrap_err().to_string() << "\n";
        return 1;
    }

    std::unique_lock<std::mutex> lock(m);
    cv.wait(lock, [&] { return done; });
    return failed ? 1 : 0;
}
