#pragma once

#include <common/config.hpp>
#include <common/errors.hpp>
#include <ingest/frame_source.hpp>
#include <pipeline/types.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace cs {
    // Owns one camera's acquisition: Unopened -> Negotiating -> Running -> Error -> Closed.
    // Frames are pushed to subscribers from a dedicated worker in arrival
    // order. On device loss the source moves to Error, reports once and stays
    // there; recovery means building a new CaptureSource.
    class CaptureSource {
    public:
        using FrameListener = std::function<void(const FramePtr&)>;
        using ErrorListener = std::function<void(SourceSlot, const Error&)>;

        CaptureSource(SourceSlot slot, std::unique_ptr<IFrameSource> src, CaptureConfig cfg);
        ~CaptureSource();

        CaptureSource(const CaptureSource&) = delete;
        CaptureSource& operator=(const CaptureSource&) = delete;

        // Queries the device modes and negotiates against the downstream session format.
        bool open(const FrameFormat& session, FrameFormat& negotiated, Error& err);
        // idempotent while running
        bool start(Error& err);
        // No frame is delivered once this returns.
        void stop();
        void close();

        // register before start()
        bool subscribe(FrameListener l);
        void on_error(ErrorListener l);

        const std::string& device() const;
        Health state() const;
        Error last_error() const;

    private:
        void capture_loop_();
        void fail_(Error err);
        void set_state_(Health h);

        SourceSlot slot_;
        std::unique_ptr<IFrameSource> src_;
        CaptureConfig cfg_;

        mutable std::mutex mtx_;
        Health state_ = Health::Unopened;
        Error last_error_;

        std::vector<FrameListener> listeners_;
        ErrorListener error_listener_;

        std::thread worker_;
        std::atomic<bool> running_{false};
        int64_t frame_id_ = 0;
    };
}
