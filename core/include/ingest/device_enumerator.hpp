#pragma once

#include <common/errors.hpp>
#include <common/settings_store.hpp>
#include <pipeline/types.hpp>

#include <string>
#include <vector>

namespace cs {
    enum class DeviceRole { Capture, Output };

    enum class DeviceKind { Capture, Loopback, Other };
    const char* to_string(DeviceKind k);

    struct DeviceInfo {
        std::string path;
        std::string name;
        std::string driver;
        DeviceKind kind = DeviceKind::Other;
    };

    class DeviceEnumerator {
    public:
        explicit DeviceEnumerator(std::string dev_dir = "/dev");
        virtual ~DeviceEnumerator() = default;

        // Existence and access check only, nothing is opened. Capture devices
        // need read/write (V4L2 streaming), the output needs write access.
        virtual bool resolve(const std::string& path, DeviceRole role, DeviceId& out, Error& err) const;

        // /dev/video* nodes, sorted, classified through VIDIOC_QUERYCAP
        virtual std::vector<DeviceInfo> list_devices() const;

    private:
        std::string dev_dir_;
    };

    // Fills empty entries: first two capture nodes become camera A and B, the
    // first loopback node the virtual output.
    Settings fill_device_defaults(Settings s, const std::vector<DeviceInfo>& devices);

    bool validate_selection(const Settings& s, Error& err);
}
