#include <common/config.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace cs {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static DevicesConfig parse_devices_config(const YAML::Node& d) {
        DevicesConfig c;
        if (!d) return c;
        c.camera_a = get_str(d, "camera_a", c.camera_a);
        c.camera_b = get_str(d, "camera_b", c.camera_b);
        c.virtual_output = get_str(d, "virtual_output", c.virtual_output);
        c.default_active = get_str(d, "default_active", c.default_active);

        SourceSlot slot;
        if (!parse_slot(c.default_active, slot)) {
            throw std::runtime_error("[Config] devices.default_active must be A or B, got " + c.default_active);
        }
        if (!c.camera_a.empty() && c.camera_a == c.camera_b) {
            throw std::runtime_error("[Config] camera_a and camera_b must be different devices!");
        }
        if (!c.virtual_output.empty() &&
            (c.virtual_output == c.camera_a || c.virtual_output == c.camera_b)) {
            throw std::runtime_error("[Config] virtual_output must not be one of the input cameras!");
        }
        return c;
    }

    static FormatConfig parse_format_config(const YAML::Node& f) {
        FormatConfig c;
        if (!f) return c;
        c.width = get_int(f, "width", c.width);
        c.height = get_int(f, "height", c.height);
        c.format = get_str(f, "format", c.format);
        c.fps = get_int(f, "fps", c.fps);
        return c;
    }

    static CaptureConfig parse_capture_config(const YAML::Node& n) {
        CaptureConfig c;
        if (!n) return c;
        c.read_timeout_ms = get_int(n, "read_timeout_ms", c.read_timeout_ms);
        c.stall_timeout_ms = get_int(n, "stall_timeout_ms", c.stall_timeout_ms);
        c.start_timeout_ms = get_int(n, "start_timeout_ms", c.start_timeout_ms);
        c.allow_mjpg = get_bool(n, "allow_mjpg", c.allow_mjpg);
        if (c.read_timeout_ms <= 0) throw std::runtime_error("[Config] capture.read_timeout_ms must be > 0");
        if (c.stall_timeout_ms < 0) throw std::runtime_error("[Config] capture.stall_timeout_ms must be >= 0");
        return c;
    }

    static SwitchingConfig parse_switching_config(const YAML::Node& n) {
        SwitchingConfig c;
        if (!n) return c;
        c.timeout_ms = get_int(n, "timeout_ms", c.timeout_ms);
        c.hold_last_frame = get_bool(n, "hold_last_frame", c.hold_last_frame);
        if (c.timeout_ms <= 0) throw std::runtime_error("[Config] switching.timeout_ms must be > 0");
        return c;
    }

    static RecoveryConfig parse_recovery_config(const YAML::Node& n) {
        RecoveryConfig c;
        if (!n) return c;
        c.initial_backoff_ms = get_int(n, "initial_backoff_ms", c.initial_backoff_ms);
        c.max_backoff_ms = get_int(n, "max_backoff_ms", c.max_backoff_ms);
        c.max_retries = get_int(n, "max_retries", c.max_retries);
        if (c.initial_backoff_ms <= 0) throw std::runtime_error("[Config] recovery.initial_backoff_ms must be > 0");
        if (c.max_backoff_ms < c.initial_backoff_ms) c.max_backoff_ms = c.initial_backoff_ms;
        if (c.max_retries < 0) c.max_retries = 0;
        return c;
    }

    static PreviewConfig parse_preview_config(const YAML::Node& n) {
        PreviewConfig c;
        if (!n) return c;
        c.enabled = get_bool(n, "enabled", c.enabled);
        c.width = get_int(n, "width", c.width);
        c.height = get_int(n, "height", c.height);
        c.keep_aspect = get_bool(n, "keep_aspect", c.keep_aspect);
        c.interp = get_str(n, "interp", c.interp);
        c.jpeg_quality = get_int(n, "jpeg_quality", c.jpeg_quality);
        if (c.jpeg_quality < 1 || c.jpeg_quality > 100) {
            throw std::runtime_error("[Config] preview.jpeg_quality must be in [1, 100]");
        }
        return c;
    }

    static ControlConfig parse_control_config(const YAML::Node& n) {
        ControlConfig c;
        if (!n) return c;
        c.enabled = get_bool(n, "enabled", c.enabled);
        c.host = get_str(n, "host", c.host);
        c.port = get_int(n, "port", c.port);
        if (c.port <= 0 || c.port > 65535) throw std::runtime_error("[Config] control.port out of range");
        return c;
    }

    static SettingsConfig parse_settings_config(const YAML::Node& n) {
        SettingsConfig c;
        if (!n) return c;
        c.path = get_str(n, "path", c.path);
        c.autoload = get_bool(n, "autoload", c.autoload);
        return c;
    }

    FrameFormat AppConfig::session_format() const {
        FrameFormat f;
        f.width = format.width;
        f.height = format.height;
        f.fps_num = format.fps;
        f.fps_den = 1;
        if (!parse_layout(format.format, f.layout) || !is_raw(f.layout)) {
            throw std::runtime_error("[Config] unsupported output pixel format " + format.format);
        }
        if (!f.valid()) {
            throw std::runtime_error("[Config] invalid output format " + f.describe());
        }
        return f;
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);
        if (!root || !root.IsMap()) {
            throw std::runtime_error("[Config] " + path + " is not a YAML map!");
        }

        cfg.devices = parse_devices_config(root["devices"]);
        cfg.format = parse_format_config(root["format"]);
        cfg.capture = parse_capture_config(root["capture"]);
        cfg.switching = parse_switching_config(root["switching"]);
        cfg.recovery = parse_recovery_config(root["recovery"]);
        cfg.preview = parse_preview_config(root["preview"]);
        cfg.control = parse_control_config(root["control"]);
        cfg.settings = parse_settings_config(root["settings"]);

        // throws on an unusable output format
        (void)cfg.session_format();
        return cfg;
    }
}
