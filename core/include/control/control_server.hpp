#pragma once

#include <common/config.hpp>
#include <pipeline/renderer.hpp>
#include <pipeline/types.hpp>

#include <array>
#include <chrono>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cs {
    class Supervisor;

    // HTTP control surface: status, events, switch/retry commands, device
    // list and selection, session start/stop, defaults, and MJPEG previews of
    // both sources.
    class ControlServer: public IRenderer {
    public:
        ControlServer(Supervisor& sup, ControlConfig cfg, PreviewConfig preview);
        ~ControlServer() override;

        ControlServer(const ControlServer&) = delete;
        ControlServer& operator=(const ControlServer&) = delete;

        // Start http server in bg thread
        bool start();
        void stop();

        void render_frame(SourceSlot slot, const FramePtr& frame, bool active) override;
        void render_status(const StatusEvent& ev) override;

        // events with seq > since, waits up to timeout for one to arrive
        std::vector<StatusEvent> events_since(uint64_t since, std::chrono::milliseconds timeout);

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;

        struct StreamState {
            mutable std::mutex mtx;
            std::condition_variable cv;

            FramePtr last;
            bool active = false;
            uint64_t seq = 0;

            // encoded on demand by the http threads, shared between clients
            std::shared_ptr<const std::vector<uint8_t>> jpeg;
            uint64_t jpeg_seq = 0;
        };

        std::shared_ptr<const std::vector<uint8_t>> jpeg_for_(StreamState& st, uint64_t seq);
        void register_routes_();

        Supervisor& sup_;
        ControlConfig cfg_;
        PreviewConfig preview_;
        int interp_;

        std::array<std::shared_ptr<StreamState>, 2> streams_;

        std::mutex events_mtx_;
        std::condition_variable events_cv_;
        std::deque<StatusEvent> events_;

        std::thread server_thread_;
        std::atomic<bool> running_{false};
    };
}
