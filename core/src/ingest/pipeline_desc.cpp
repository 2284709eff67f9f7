#include <ingest/pipeline_desc.hpp>

#include <sstream>

namespace cs {
    static std::string make_queue() {
        return "queue leaky=downstream max-size-buffers=1 max-size-bytes=0 max-size-time=0";
    }

    std::string capture_pipeline(const DeviceId& device,
                                 const FrameFormat& device_mode,
                                 const FrameFormat& session,
                                 const std::string& sink_name) {
        std::ostringstream ss;
        ss << "v4l2src device=\"" << device << "\" do-timestamp=true"
           << " ! " << device_mode.caps();
        if (device_mode.layout == PixelLayout::MJPG) ss << " ! jpegdec";
        ss << " ! " << make_queue()
           << " ! videoconvert"
           << " ! videoscale"
           << " ! videorate drop-only=false"
           << " ! " << session.caps()
           << " ! appsink name=" << sink_name << " max-buffers=1 drop=true sync=false";
        return ss.str();
    }

    std::string output_pipeline(const DeviceId& device,
                                const FrameFormat& format,
                                const std::string& src_name) {
        std::ostringstream ss;
        ss << "appsrc name=" << src_name
           << " is-live=true format=time do-timestamp=true block=false"
           << " caps=\"" << format.caps() << "\""
           << " ! " << make_queue()
           << " ! v4l2sink device=\"" << device << "\" sync=false";
        return ss.str();
    }
}
