#include <common/gst_helpers.hpp>

#include <cstring>
#include <iostream>
#include <mutex>

namespace cs {
    void ensure_gst_init() {
        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, []{ gst_init(nullptr, nullptr); });
    }

    Error error_from_gerror(const GError* e, const gchar* debug, ErrorCode fallback) {
        if (!e) return Error(fallback, "unknown GStreamer error");

        std::string msg = e->message ? e->message : "GStreamer error";
        if (debug && *debug) msg += std::string(" (") + debug + ")";

        if (debug && std::strstr(debug, "not-negotiated")) {
            return Error(ErrorCode::FormatNegotiationFailed, msg);
        }

        if (e->domain == GST_RESOURCE_ERROR) {
            switch (e->code) {
                case GST_RESOURCE_ERROR_NOT_FOUND:
                    return Error(ErrorCode::DeviceNotFound, msg);
                case GST_RESOURCE_ERROR_OPEN_READ:
                case GST_RESOURCE_ERROR_OPEN_WRITE:
                case GST_RESOURCE_ERROR_OPEN_READ_WRITE:
                case GST_RESOURCE_ERROR_NOT_AUTHORIZED:
                    return Error(ErrorCode::PermissionDenied, msg);
                case GST_RESOURCE_ERROR_SETTINGS:
                    return Error(ErrorCode::FormatNegotiationFailed, msg);
                default:
                    break;
            }
        } else if (e->domain == GST_CORE_ERROR && e->code == GST_CORE_ERROR_NEGOTIATION) {
            return Error(ErrorCode::FormatNegotiationFailed, msg);
        } else if (e->domain == GST_STREAM_ERROR && e->code == GST_STREAM_ERROR_FORMAT) {
            return Error(ErrorCode::FormatNegotiationFailed, msg);
        }
        return Error(fallback, msg);
    }

    bool pop_bus_error(GstElement* pipeline, GstClockTime timeout, ErrorCode fallback, Error& err) {
        if (!pipeline) return false;

        GstBus* bus = gst_element_get_bus(pipeline);
        if (!bus) return false;
        GstMessage* msg = gst_bus_timed_pop_filtered(
            bus, timeout, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS));
        gst_object_unref(bus);
        if (!msg) return false;

        if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_EOS) {
            err = Error(fallback, "end of stream");
        } else {
            GError* e = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &e, &dbg);
            err = error_from_gerror(e, dbg, fallback);
            std::cerr << "[GStreamer] error from " << GST_OBJECT_NAME(GST_MESSAGE_SRC(msg))
                      << ": " << err.describe() << "\n";
            if (e) g_error_free(e);
            g_free(dbg);
        }
        gst_message_unref(msg);
        return true;
    }
}
