#pragma once

#include <common/config.hpp>
#include <ingest/frame_source.hpp>
#include <string>

struct _GstElement;
using GstElement = _GstElement;
struct _GstSample;
using GstSample = _GstSample;

namespace cs {
    class GstFrameSource: public IFrameSource {
    public:
        GstFrameSource(DeviceId device, std::string sink_name, CaptureConfig cfg);

        bool query_modes(std::vector<FrameFormat>& modes, Error& err) override;
        bool configure(const FrameFormat& device_mode,
                       const FrameFormat& session,
                       FrameFormat& delivered,
                       Error& err) override;
        bool start(Error& err) override;
        void stop() override;
        ReadStatus read(Frame& out, int timeout_ms, Error& err) override;
        const std::string& id() const override { return device_; }

        ~GstFrameSource() override;

        GstFrameSource(const GstFrameSource&) = delete;
        GstFrameSource& operator=(const GstFrameSource&) = delete;

    private:
        bool copy_sample_(GstSample* sample, Frame& out);
        void teardown_();

        DeviceId device_;
        std::string sink_name_;
        CaptureConfig cfg_;

        std::string pipeline_str_;
        FrameFormat session_;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;
        bool playing_ = false;
    };
}
