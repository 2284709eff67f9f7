#include <ingest/gst_frame_source.hpp>

#include <common/gst_helpers.hpp>
#include <ingest/pipeline_desc.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <unistd.h>

namespace cs {
    namespace {
        void append_modes(const GstStructure* st, std::vector<FrameFormat>& out) {
            FrameFormat base;
            const gchar* name = gst_structure_get_name(st);
            if (g_str_equal(name, "image/jpeg")) {
                base.layout = PixelLayout::MJPG;
            } else if (g_str_equal(name, "video/x-raw")) {
                const gchar* fmt = gst_structure_get_string(st, "format");
                if (!fmt || !parse_layout(fmt, base.layout)) return;
            } else {
                return;
            }

            // ranges (stepwise devices) are skipped, discrete sizes are what cameras report
            if (!gst_structure_get_int(st, "width", &base.width) ||
                !gst_structure_get_int(st, "height", &base.height)) return;

            const GValue* rate = gst_structure_get_value(st, "framerate");
            if (!rate) return;

            auto emit = [&](const GValue* v) {
                if (!v || !GST_VALUE_HOLDS_FRACTION(v)) return;
                FrameFormat m = base;
                m.fps_num = gst_value_get_fraction_numerator(v);
                m.fps_den = gst_value_get_fraction_denominator(v);
                if (m.fps() > 0.0) out.push_back(m);
            };

            if (GST_VALUE_HOLDS_LIST(rate)) {
                for (guint i = 0; i < gst_value_list_get_size(rate); ++i) {
                    emit(gst_value_list_get_value(rate, i));
                }
            } else if (GST_VALUE_HOLDS_FRACTION_RANGE(rate)) {
                emit(gst_value_get_fraction_range_max(rate));
            } else {
                emit(rate);
            }
        }

        Error classify_open_failure(const DeviceId& device) {
            std::error_code ec;
            if (!std::filesystem::exists(device, ec)) {
                return Error(ErrorCode::DeviceNotFound, device + " does not exist");
            }
            if (::access(device.c_str(), R_OK | W_OK) != 0) {
                return Error(ErrorCode::PermissionDenied, "no read/write access to " + device);
            }
            return Error(ErrorCode::FormatNegotiationFailed, device + " refused to open as a capture device");
        }
    }

    GstFrameSource::GstFrameSource(DeviceId device, std::string sink_name, CaptureConfig cfg)
        : device_(std::move(device)), sink_name_(std::move(sink_name)), cfg_(cfg) {}

    bool GstFrameSource::query_modes(std::vector<FrameFormat>& modes, Error& err) {
        ensure_gst_init();
        modes.clear();

        GstElement* src = gst_element_factory_make("v4l2src", nullptr);
        if (!src) {
            err = Error(ErrorCode::PipelineError, "missing GStreamer 'v4l2src' (install gstreamer1.0-plugins-good)");
            return false;
        }
        gst_object_ref_sink(src);
        g_object_set(src, "device", device_.c_str(), nullptr);

        // READY opens the node, the source pad then reports the device caps
        if (gst_element_set_state(src, GST_STATE_READY) == GST_STATE_CHANGE_FAILURE) {
            err = classify_open_failure(device_);
            gst_element_set_state(src, GST_STATE_NULL);
            gst_object_unref(src);
            return false;
        }

        GstPad* pad = gst_element_get_static_pad(src, "src");
        if (pad) {
            GstCaps* caps = gst_pad_query_caps(pad, nullptr);
            if (caps) {
                for (guint i = 0; i < gst_caps_get_size(caps); ++i) {
                    append_modes(gst_caps_get_structure(caps, i), modes);
                }
                gst_caps_unref(caps);
            }
            gst_object_unref(pad);
        }

        gst_element_set_state(src, GST_STATE_NULL);
        gst_object_unref(src);

        std::cout << "[GStreamer](query_modes) " << device_ << " advertises " << modes.size() << " modes\n";
        return true;
    }

    bool GstFrameSource::configure(const FrameFormat& device_mode,
                                   const FrameFormat& session,
                                   FrameFormat& delivered,
                                   Error& err) {
        ensure_gst_init();
        teardown_();

        session_ = session;
        pipeline_str_ = capture_pipeline(device_, device_mode, session, sink_name_);

        GError* gerr = nullptr;
        pipeline_ = gst_parse_launch(pipeline_str_.c_str(), &gerr);
        if (!pipeline_) {
            std::string msg = "parse_launch failed";
            if (gerr) {
                msg += std::string(": ") + gerr->message;
                g_error_free(gerr);
            }
            err = Error(ErrorCode::PipelineError, msg);
            std::cerr << "[GStreamer](configure) " << msg << "\n";
            return false;
        }
        if (gerr) {
            // recoverable parse warning, e.g. a missing optional property
            std::cerr << "[GStreamer](configure) " << gerr->message << "\n";
            g_error_free(gerr);
        }

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), sink_name_.c_str());
        if (!sink_) {
            err = Error(ErrorCode::PipelineError, "appsink named " + sink_name_ + " not found");
            teardown_();
            return false;
        }

        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_drop(appsink, TRUE);
        gst_app_sink_set_max_buffers(appsink, 1);
        gst_app_sink_set_emit_signals(appsink, FALSE);

        delivered = session;
        return true;
    }

    bool GstFrameSource::start(Error& err) {
        if (playing_) return true;
        if (!pipeline_) {
            err = Error(ErrorCode::PipelineError, "start() before configure()");
            return false;
        }

        GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            if (!pop_bus_error(pipeline_, 0, ErrorCode::PipelineError, err)) {
                err = Error(ErrorCode::PipelineError, "failed to set pipeline to PLAYING");
            }
            gst_element_set_state(pipeline_, GST_STATE_NULL);
            return false;
        }

        // a live source reaches PLAYING without preroll, negotiation errors
        // surface on the bus right after the first buffers
        gst_element_get_state(pipeline_, nullptr, nullptr,
                              static_cast<GstClockTime>(cfg_.start_timeout_ms) * GST_MSECOND);
        if (pop_bus_error(pipeline_, 100 * GST_MSECOND, ErrorCode::PipelineError, err)) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);
            return false;
        }

        playing_ = true;
        return true;
    }

    ReadStatus GstFrameSource::read(Frame& out, int timeout_ms, Error& err) {
        if (!sink_ || !playing_) {
            err = Error(ErrorCode::DeviceDisconnected, device_ + " is not streaming");
            return ReadStatus::Disconnected;
        }

        if (pop_bus_error(pipeline_, 0, ErrorCode::DeviceDisconnected, err)) {
            return ReadStatus::Disconnected;
        }

        GstSample* sample = gst_app_sink_try_pull_sample(
            GST_APP_SINK(sink_), static_cast<GstClockTime>(timeout_ms) * GST_MSECOND);

        if (!sample) {
            if (gst_app_sink_is_eos(GST_APP_SINK(sink_))) {
                err = Error(ErrorCode::DeviceDisconnected, device_ + " reached end of stream");
                return ReadStatus::Disconnected;
            }
            return ReadStatus::Timeout;
        }

        const bool ok = copy_sample_(sample, out);
        gst_sample_unref(sample);
        return ok ? ReadStatus::Frame : ReadStatus::Timeout;
    }

    bool GstFrameSource::copy_sample_(GstSample* sample, Frame& out) {
        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) return false;

        GstVideoInfo vinfo;
        if (!gst_video_info_from_caps(&vinfo, caps)) return false;
        if (GST_VIDEO_INFO_WIDTH(&vinfo) != session_.width ||
            GST_VIDEO_INFO_HEIGHT(&vinfo) != session_.height) {
            std::cerr << "[GStreamer](read) " << device_ << " delivered "
                      << GST_VIDEO_INFO_WIDTH(&vinfo) << "x" << GST_VIDEO_INFO_HEIGHT(&vinfo)
                      << ", expected " << session_.describe() << "\n";
            return false;
        }

        GstVideoFrame vframe;
        if (!gst_video_frame_map(&vframe, &vinfo, buffer, GST_MAP_READ)) return false;

        out.format = session_;
        out.data = allocate_frame_mat(session_);
        uint8_t* dst = out.data.data;
        const size_t dst_size = out.data.total() * out.data.elemSize();
        size_t written = 0;

        // planes are packed back to back without padding
        for (guint p = 0; p < GST_VIDEO_FRAME_N_PLANES(&vframe); ++p) {
            const auto* src = static_cast<const uint8_t*>(GST_VIDEO_FRAME_PLANE_DATA(&vframe, p));
            const int stride = GST_VIDEO_FRAME_PLANE_STRIDE(&vframe, p);
            const size_t row_bytes = static_cast<size_t>(GST_VIDEO_FRAME_COMP_WIDTH(&vframe, p)) *
                                     static_cast<size_t>(GST_VIDEO_FRAME_COMP_PSTRIDE(&vframe, p));
            const int rows = GST_VIDEO_FRAME_COMP_HEIGHT(&vframe, p);

            for (int r = 0; r < rows; ++r) {
                if (written + row_bytes > dst_size) break;
                std::memcpy(dst + written, src + static_cast<size_t>(r) * stride, row_bytes);
                written += row_bytes;
            }
        }
        gst_video_frame_unmap(&vframe);

        if (written != dst_size) {
            std::cerr << "[GStreamer](read) short frame from " << device_ << ": "
                      << written << "/" << dst_size << " bytes\n";
            return false;
        }

        out.pts_ns = (GST_BUFFER_PTS(buffer) == GST_CLOCK_TIME_NONE)
                       ? 0
                       : static_cast<int64_t>(GST_BUFFER_PTS(buffer));
        return true;
    }

    void GstFrameSource::stop() {
        if (pipeline_ && playing_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);
        }
        playing_ = false;
    }

    void GstFrameSource::teardown_() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (sink_) {
                gst_object_unref(sink_);
                sink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
        playing_ = false;
    }

    GstFrameSource::~GstFrameSource() {
        teardown_();
    }
}
