#include <common/config.hpp>
#include <common/settings_store.hpp>
#include <control/control_server.hpp>
#include <ingest/device_enumerator.hpp>
#include <ingest/frame_source_factory.hpp>
#include <output/gst_output_sink.hpp>
#include <pipeline/supervisor.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::string cfg_path = "configs/camswitch.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    cs::AppConfig cfg;
    cs::FrameFormat session;
    try {
        cfg = cs::load_config_yaml(cfg_path);
        session = cfg.session_format();
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    cs::YamlSettingsStore settings(cfg.settings.path);
    cs::DeviceEnumerator enumerator;

    cs::Supervisor::Options opt;
    opt.format = session;
    opt.capture = cfg.capture;
    opt.switching = cfg.switching;
    opt.recovery = cfg.recovery;
    opt.devices = cfg.devices;
    opt.preview_enabled = cfg.preview.enabled;
    opt.autoload = cfg.settings.autoload;

    const cs::CaptureConfig capture = cfg.capture;
    cs::Supervisor sup(
        opt,
        [capture](cs::SourceSlot slot, const cs::DeviceId& dev) {
            return cs::make_frame_source(slot, dev, capture);
        },
        std::make_unique<cs::GstOutputSink>(),
        settings,
        enumerator);

    cs::Error err;
    if (!sup.start(err)) {
        std::cerr << "Startup failed: " << err.describe() << "\n";
        return err.code == cs::ErrorCode::InvalidConfiguration ? 1 : 2;
    }

    std::unique_ptr<cs::ControlServer> server;
    if (cfg.control.enabled) {
        server = std::make_unique<cs::ControlServer>(sup, cfg.control, cfg.preview);
        if (!server->start()) {
            std::cerr << "Control server unavailable, continuing without it\n";
            server.reset();
        }
    }

    while (g_running && sup.session() != cs::SessionState::Fatal) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    const bool fatal = sup.session() == cs::SessionState::Fatal;
    std::cerr << (fatal ? "Output failed, shutting down...\n" : "Shutting down...\n");

    if (server) server->stop();
    sup.stop();
    return fatal ? 3 : 0;
}
