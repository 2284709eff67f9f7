#pragma once

#include <pipeline/types.hpp>

#include <string>

namespace cs {
    // Initial device selection. Persisted settings override these, empty
    // entries fall back to the enumerator defaults.
    struct DevicesConfig {
        std::string camera_a;
        std::string camera_b;
        std::string virtual_output;
        std::string default_active = "A";
    };

    // Session format written to the virtual device.
    struct FormatConfig {
        int width = 1280;
        int height = 720;
        std::string format = "YUY2";
        int fps = 30;
    };

    struct CaptureConfig {
        int read_timeout_ms = 100;
        int stall_timeout_ms = 3000; // 0 disables stall detection
        int start_timeout_ms = 3000;
        bool allow_mjpg = true;
    };

    struct SwitchingConfig {
        int timeout_ms = 1000;
        bool hold_last_frame = true;
    };

    struct RecoveryConfig {
        int initial_backoff_ms = 500;
        int max_backoff_ms = 8000;
        int max_retries = 5;
    };

    struct PreviewConfig {
        bool enabled = true;
        int width = 640;
        int height = 360;
        bool keep_aspect = true;
        std::string interp = "linear"; // nearest|cubic|linear|area
        int jpeg_quality = 75;
    };

    struct ControlConfig {
        bool enabled = true;
        std::string host = "127.0.0.1";
        int port = 8090;
    };

    struct SettingsConfig {
        std::string path;     // empty -> $XDG_CONFIG_HOME/camswitch/defaults.yaml
        bool autoload = true; // apply persisted device selection at startup
    };

    struct AppConfig {
        DevicesConfig devices;
        FormatConfig format;
        CaptureConfig capture;
        SwitchingConfig switching;
        RecoveryConfig recovery;
        PreviewConfig preview;
        ControlConfig control;
        SettingsConfig settings;

        FrameFormat session_format() const;
    };

    AppConfig load_config_yaml(const std::string& path);
}
