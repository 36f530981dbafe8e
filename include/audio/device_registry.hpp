#ifndef DEVICE_REGISTRY_HPP
#define DEVICE_REGISTRY_HPP

#include "audio/audio_backend.hpp"

#include <optional>
#include <vector>

// Read-only view over the host's input devices. Listing never opens a device.
class DeviceRegistry {
public:
    explicit DeviceRegistry(AudioBackend& backend);

    // Throws DeviceEnumerationError when the audio subsystem cannot be
    // queried. An empty result means no input-capable device is present.
    std::vector<Device> listDevices() const;

    std::optional<Device> defaultDevice() const;
    std::optional<Device> findDevice(int index) const;

private:
    AudioBackend& backend_;
};

#endif
