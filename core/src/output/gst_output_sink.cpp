#include <output/gst_output_sink.hpp>

#include <common/gst_helpers.hpp>
#include <ingest/pipeline_desc.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsrc.h>

#include <cstring>
#include <iostream>

namespace cs {
    namespace {
        const char* kSrcName = "out_src";
    }

    GstOutputSink::~GstOutputSink() {
        close();
    }

    bool GstOutputSink::is_open() const {
        std::lock_guard lk(mtx_);
        return open_;
    }

    FrameFormat GstOutputSink::format() const {
        std::lock_guard lk(mtx_);
        return format_;
    }

    bool GstOutputSink::open(const DeviceId& device, const FrameFormat& format, Error& err) {
        std::lock_guard lk(mtx_);
        if (open_ || pipeline_) {
            err = Error(ErrorCode::PipelineError, "output already opened on " + device_);
            return false;
        }
        if (!format.valid() || !is_raw(format.layout)) {
            err = Error(ErrorCode::InvalidConfiguration, "unusable output format " + format.describe());
            return false;
        }

        ensure_gst_init();
        const std::string desc = output_pipeline(device, format, kSrcName);

        GError* gerr = nullptr;
        pipeline_ = gst_parse_launch(desc.c_str(), &gerr);
        if (!pipeline_) {
            std::string msg = "output parse_launch failed";
            if (gerr) {
                msg += std::string(": ") + gerr->message;
                g_error_free(gerr);
            }
            err = Error(ErrorCode::PipelineError, msg);
            return false;
        }
        if (gerr) {
            std::cerr << "[Output](open) " << gerr->message << "\n";
            g_error_free(gerr);
        }

        appsrc_ = gst_bin_get_by_name(GST_BIN(pipeline_), kSrcName);
        if (!appsrc_) {
            err = Error(ErrorCode::PipelineError, "appsrc not found in output pipeline");
            teardown_();
            return false;
        }

        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            if (!pop_bus_error(pipeline_, 0, ErrorCode::PipelineError, err)) {
                err = Error(ErrorCode::PipelineError, "failed to open " + device);
            }
            teardown_();
            return false;
        }
        // v4l2sink opens the node on READY, open failures land on the bus
        if (pop_bus_error(pipeline_, 200 * GST_MSECOND, ErrorCode::PipelineError, err)) {
            teardown_();
            return false;
        }

        device_ = device;
        format_ = format;
        open_ = true;
        written_ = 0;
        std::cout << "[Output](open) " << device_ << " " << format_.describe() << "\n";
        return true;
    }

    bool GstOutputSink::write(const Frame& frame, Error& err) {
        std::lock_guard lk(mtx_);
        if (!open_) {
            err = Error(ErrorCode::OutputWriteFailed, "output is not open");
            return false;
        }
        if (frame.format != format_) {
            err = Error(ErrorCode::OutputWriteFailed,
                        "frame format " + frame.format.describe() + " does not match output " + format_.describe());
            return false;
        }
        if (pop_bus_error(pipeline_, 0, ErrorCode::OutputWriteFailed, err)) {
            err.code = ErrorCode::OutputWriteFailed;
            return false;
        }

        const size_t size = frame.data.total() * frame.data.elemSize();
        if (size != format_.frame_bytes() || !frame.data.isContinuous()) {
            err = Error(ErrorCode::OutputWriteFailed, "frame payload has " + std::to_string(size) + " bytes");
            return false;
        }

        GstBuffer* buf = gst_buffer_new_allocate(nullptr, size, nullptr);
        if (!buf) {
            err = Error(ErrorCode::OutputWriteFailed, "buffer allocation failed");
            return false;
        }
        GstMapInfo map;
        if (!gst_buffer_map(buf, &map, GST_MAP_WRITE)) {
            gst_buffer_unref(buf);
            err = Error(ErrorCode::OutputWriteFailed, "buffer map failed");
            return false;
        }
        std::memcpy(map.data, frame.data.data, size);
        gst_buffer_unmap(buf, &map);

        // appsrc stamps the running time itself, source pts are not carried over
        GST_BUFFER_DURATION(buf) = gst_util_uint64_scale_int(GST_SECOND, format_.fps_den, format_.fps_num);

        GstFlowReturn ret = gst_app_src_push_buffer(GST_APP_SRC(appsrc_), buf);
        if (ret != GST_FLOW_OK) {
            err = Error(ErrorCode::OutputWriteFailed,
                        std::string("push to ") + device_ + " failed: " + gst_flow_get_name(ret));
            return false;
        }
        ++written_;
        return true;
    }

    void GstOutputSink::close() {
        std::lock_guard lk(mtx_);
        if (open_ && appsrc_) {
            gst_app_src_end_of_stream(GST_APP_SRC(appsrc_));
        }
        teardown_();
        if (open_) std::cout << "[Output](close) " << device_ << " after " << written_ << " frames\n";
        open_ = false;
    }

    void GstOutputSink::teardown_() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);
            if (appsrc_) {
                gst_object_unref(appsrc_);
                appsrc_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
    }
}
