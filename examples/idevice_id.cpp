#include <busq++/device.hpp>
#include <busq++/usbmuxd.hpp>
#include <iostream>

int main() {
    Busq::UsbmuxdProvider provider;
    auto devices = Busq::Device::list(provider).expect("failed to get devices from usbmuxd");

    for (const Busq::DeviceInfo& d : devices) {
        std::cout << d.udid << " (" << d.type.to_string() << ")" << "\n";
    }
}
