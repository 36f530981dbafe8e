#include "audio/device_registry.hpp"

#include <algorithm>
#include <iostream>

// Constructor
DeviceRegistry::DeviceRegistry(AudioBackend& backend) : backend_(backend) {}

std::vector<Device> DeviceRegistry::listDevices() const {
    std::vector<Device> devices = backend_.listDevices();
    std::sort(devices.begin(), devices.end(),
              [](const Device& a, const Device& b) { return a.index < b.index; });
    std::cout << "[Devices] [INFO] " << devices.size() << " input device(s) found\n";
    return devices;
}

// Host default input, falling back to the first listed device
std::optional<Device> DeviceRegistry::defaultDevice() const {
    std::optional<Device> device = backend_.defaultDevice();
    if (device) return device;

    std::vector<Device> devices = listDevices();
    if (devices.empty()) return std::nullopt;
    return devices.front();
}

std::optional<Device> DeviceRegistry::findDevice(int index) const {
    for (const auto& device : listDevices()) {
        if (device.index == index) return device;
    }
    return std::nullopt;
}
