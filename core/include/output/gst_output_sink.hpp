#pragma once

#include <output/output_sink.hpp>

#include <cstdint>
#include <mutex>

struct _GstElement;
using GstElement = _GstElement;

namespace cs {
    // appsrc ! queue ! v4l2sink on a v4l2loopback node
    class GstOutputSink: public IOutputSink {
    public:
        GstOutputSink() = default;
        ~GstOutputSink() override;

        GstOutputSink(const GstOutputSink&) = delete;
        GstOutputSink& operator=(const GstOutputSink&) = delete;

        bool open(const DeviceId& device, const FrameFormat& format, Error& err) override;
        bool write(const Frame& frame, Error& err) override;
        void close() override;

        bool is_open() const override;
        FrameFormat format() const override;
        const DeviceId& device() const override { return device_; }

    private:
        void teardown_();

        mutable std::mutex mtx_;
        DeviceId device_;
        FrameFormat format_;
        GstElement* pipeline_ = nullptr;
        GstElement* appsrc_ = nullptr;
        bool open_ = false;
        uint64_t written_ = 0;
    };
}
