#pragma once

#include <common/config.hpp>
#include <common/errors.hpp>
#include <common/settings_store.hpp>
#include <ingest/capture_source.hpp>
#include <ingest/device_enumerator.hpp>
#include <ingest/frame_source.hpp>
#include <output/output_sink.hpp>
#include <pipeline/bounded_queue.hpp>
#include <pipeline/preview_sink.hpp>
#include <pipeline/renderer.hpp>
#include <pipeline/switch_router.hpp>
#include <pipeline/types.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace cs {
    // Owns both capture sources and the output sink, wires them through the
    // router and the preview, and keeps the session alive: reconnects lost
    // sources with exponential backoff, fails over to the standby and ends the
    // session when the output breaks.
    class Supervisor {
    public:
        struct Options {
            FrameFormat format;
            CaptureConfig capture;
            SwitchingConfig switching;
            RecoveryConfig recovery;
            DevicesConfig devices;
            bool preview_enabled = true;
            bool autoload = true;
        };

        using SourceFactory = std::function<std::unique_ptr<IFrameSource>(SourceSlot, const DeviceId&)>;
        using EventListener = std::function<void(const StatusEvent&)>;

        Supervisor(Options opt,
                   SourceFactory factory,
                   std::unique_ptr<IOutputSink> output,
                   ISettingsStore& settings,
                   const DeviceEnumerator& enumerator);
        ~Supervisor();

        Supervisor(const Supervisor&) = delete;
        Supervisor& operator=(const Supervisor&) = delete;

        // false when the selection is invalid or the output cannot be opened;
        // capture failures only schedule reconnects. A stopped session can be
        // started again, a fatal one cannot.
        bool start(Error& err);
        void stop();

        SwitchReply switch_to(SourceSlot slot);
        // resets the backoff and reconnects now; true if already running
        bool retry(SourceSlot slot, Error& err);

        Status status() const;
        SessionState session() const;

        int subscribe(EventListener l);
        void unsubscribe(int id);

        void attach_renderer(IRenderer* r);
        void detach_renderer(IRenderer* r);
        void set_preview_enabled(bool on);

        std::vector<DeviceInfo> list_devices() const;
        // Replaces the devices used by the next start(). Only while stopped.
        // Empty entries keep the current choice; every device must resolve.
        bool set_selection(const Settings& wanted, Error& err);
        bool save_defaults(Error& err);
        bool clear_defaults(Error& err);
        Settings selection() const;

        const SwitchRouter& router() const { return *router_; }
        const PreviewSink& preview() const { return preview_; }

    private:
        struct SlotState {
            std::unique_ptr<CaptureSource> source;
            DeviceId device;
            Health health = Health::Unopened;
            int attempts = 0;
            bool persistent = false;
            bool reconnect_due = false;
            std::chrono::steady_clock::time_point next_attempt;
            Error last_error;
            uint64_t generation = 0;
        };

        struct Event {
            enum class Kind { SourceFailed, OutputFailed, RetryRequested };
            Kind kind = Kind::SourceFailed;
            SourceSlot slot = SourceSlot::A;
            uint64_t generation = 0;
            Error err;
        };

        // unresolvable entries are replaced by enumerator defaults where one exists
        Settings resolve_selection_(const Settings& wanted) const;
        bool bring_up_(SourceSlot slot);
        void schedule_reconnect_(SlotState& st);
        std::chrono::milliseconds backoff_(int attempts) const;

        void supervise_loop_();
        void handle_source_failed_(SourceSlot slot, uint64_t generation, const Error& err);
        void handle_retry_(SourceSlot slot);
        void handle_output_failed_(const Error& err);
        void run_reconnects_();

        void on_active_changed_(const ActiveChange& c);
        void set_session_(SessionState s, const std::string& detail);
        void emit_(EventKind kind, const std::string& detail);

        std::unique_ptr<CaptureSource> take_source_(SourceSlot slot);

        Options opt_;
        SourceFactory factory_;
        ISettingsStore& settings_;
        const DeviceEnumerator& enumerator_;

        std::unique_ptr<IOutputSink> output_;
        PreviewSink preview_;
        std::unique_ptr<SwitchRouter> router_;

        // start, stop and set_selection
        std::mutex lifecycle_mtx_;

        mutable std::mutex mtx_;
        std::array<SlotState, 2> slots_{};
        Settings selection_;
        std::optional<Settings> override_;
        SessionState session_ = SessionState::Stopped;
        OutputHealth output_health_ = OutputHealth::Closed;
        DeviceId output_device_;
        bool fatal_ = false;

        std::mutex listen_mtx_;
        std::map<int, EventListener> listeners_;
        std::vector<IRenderer*> renderers_;
        int next_listener_id_ = 1;
        std::atomic<uint64_t> event_seq_{0};

        BoundedQueue<Event> events_{32};
        std::thread thread_;
        std::atomic<bool> running_{false};
    };
}
