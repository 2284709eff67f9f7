#pragma once

#include <pipeline/types.hpp>

#include <string>

namespace cs {
    // v4l2src -> device mode caps [-> jpegdec] -> convert/scale/rate -> session caps -> appsink
    std::string capture_pipeline(const DeviceId& device,
                                 const FrameFormat& device_mode,
                                 const FrameFormat& session,
                                 const std::string& sink_name);

    // appsrc with the session caps -> v4l2sink on the loopback node
    std::string output_pipeline(const DeviceId& device,
                                const FrameFormat& format,
                                const std::string& src_name);
}
