#include <busq++/device.hpp>
#include <busq++/syslog_relay.hpp>
#include <busq++/usbmuxd.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace Busq;

static volatile std::sig_atomic_t g_stop = 0;

int main() {
    std::signal(SIGINT, [](int) { g_stop = 1; });

    auto provider = std::make_shared<UsbmuxdProvider>();
    auto devices  = Device::list(*provider).expect("failed to list devices");
    if (devices.empty()) {
        std::cerr << "no devices connected\n";
        return 1;
    }
    auto device = Device::adopt(provider, devices[0]).expect("failed to adopt device");
    auto relay  = SyslogRelayClient::start(device, "syslog").expect("failed to start syslog relay");

    auto token  = relay
                     .start_capture_messages([](const SyslogMessage& m) {
                         if (m.parsed()) {
                             std::cout << *m.timestamp << " " << m.process.value_or("") << " "
                                       << m.level.value_or("-") << ": " << m.message << "\n";
                         } else {
                             std::cout << m.raw << "\n";
                         }
                     })
                     .expect("failed to start capture");

    while (!g_stop && relay.capturing()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    token.dispose();
    relay.stop_capture().expect("failed to stop capture");
    return 0;
}
