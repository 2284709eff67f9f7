#include <ingest/device_enumerator.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <fcntl.h>
#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace cs {
    namespace fs = std::filesystem;

    const char* to_string(DeviceKind k) {
        switch (k) {
            case DeviceKind::Capture: return "capture";
            case DeviceKind::Loopback: return "loopback";
            case DeviceKind::Other: return "other";
        }
        return "unk";
    }

    DeviceEnumerator::DeviceEnumerator(std::string dev_dir)
        : dev_dir_(std::move(dev_dir)) {}

    bool DeviceEnumerator::resolve(const std::string& path, DeviceRole role, DeviceId& out, Error& err) const {
        if (path.empty()) {
            err = Error(ErrorCode::DeviceNotFound, "no device configured");
            return false;
        }

        std::error_code ec;
        if (!fs::exists(path, ec)) {
            err = Error(ErrorCode::DeviceNotFound, path + " does not exist");
            return false;
        }

        const int mode = role == DeviceRole::Capture ? (R_OK | W_OK) : W_OK;
        if (::access(path.c_str(), mode) != 0) {
            const std::string what = role == DeviceRole::Capture ? "read/write" : "write";
            err = Error(ErrorCode::PermissionDenied,
                        "no " + what + " access to " + path + " (" + std::strerror(errno) +
                        "); add the user to the 'video' group and re-login");
            return false;
        }

        out = path;
        return true;
    }

    std::vector<DeviceInfo> DeviceEnumerator::list_devices() const {
        std::vector<DeviceInfo> devices;
        std::vector<fs::path> nodes;

        std::error_code ec;
        for (fs::directory_iterator it(dev_dir_, ec), end; !ec && it != end; it.increment(ec)) {
            const auto name = it->path().filename().string();
            if (name.rfind("video", 0) == 0) nodes.push_back(it->path());
        }
        if (ec) {
            std::cerr << "[Enumerator](list_devices) cannot scan " << dev_dir_ << ": " << ec.message() << "\n";
        }
        std::sort(nodes.begin(), nodes.end());

        for (const auto& node : nodes) {
            int fd = ::open(node.c_str(), O_RDWR | O_NONBLOCK);
            if (fd < 0) {
                std::cerr << "[Enumerator](list_devices) unable to open " << node.string()
                          << ": " << std::strerror(errno) << "\n";
                continue;
            }

            v4l2_capability caps{};
            if (ioctl(fd, VIDIOC_QUERYCAP, &caps) != 0) {
                std::cerr << "[Enumerator](list_devices) VIDIOC_QUERYCAP failed for " << node.string()
                          << ": " << std::strerror(errno) << "\n";
                ::close(fd);
                continue;
            }
            ::close(fd);

            DeviceInfo info;
            info.path = node.string();
            info.name = reinterpret_cast<const char*>(caps.card);
            info.driver = reinterpret_cast<const char*>(caps.driver);

            const uint32_t c = (caps.capabilities & V4L2_CAP_DEVICE_CAPS) ? caps.device_caps : caps.capabilities;
            if (info.driver == "v4l2 loopback" || (c & V4L2_CAP_VIDEO_OUTPUT)) {
                info.kind = DeviceKind::Loopback;
            } else if (c & (V4L2_CAP_VIDEO_CAPTURE | V4L2_CAP_VIDEO_CAPTURE_MPLANE)) {
                info.kind = DeviceKind::Capture;
            }
            devices.push_back(std::move(info));
        }
        return devices;
    }

    Settings fill_device_defaults(Settings s, const std::vector<DeviceInfo>& devices) {
        std::vector<std::string> captures;
        std::string loopback;
        for (const auto& d : devices) {
            if (d.kind == DeviceKind::Capture) captures.push_back(d.path);
            else if (d.kind == DeviceKind::Loopback && loopback.empty()) loopback = d.path;
        }

        auto take_capture = [&](const std::string& avoid) -> std::string {
            for (const auto& p : captures) {
                if (p != avoid && p != s.virtual_output) return p;
            }
            return {};
        };

        if (s.virtual_output.empty()) s.virtual_output = loopback;
        if (s.camera_a.empty()) s.camera_a = take_capture(s.camera_b);
        if (s.camera_b.empty()) s.camera_b = take_capture(s.camera_a);
        return s;
    }

    bool validate_selection(const Settings& s, Error& err) {
        if (s.camera_a.empty() || s.camera_b.empty() || s.virtual_output.empty()) {
            err = Error(ErrorCode::InvalidConfiguration,
                        "two input cameras and one virtual output device are required");
            return false;
        }
        if (s.camera_a == s.camera_b) {
            err = Error(ErrorCode::InvalidConfiguration, "camera A and camera B must be different devices");
            return false;
        }
        if (s.virtual_output == s.camera_a || s.virtual_output == s.camera_b) {
            err = Error(ErrorCode::InvalidConfiguration,
                        "virtual output must be a v4l2loopback device, not one of the input cameras");
            return false;
        }
        return true;
    }
}
