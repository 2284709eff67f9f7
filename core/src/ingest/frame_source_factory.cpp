#include <ingest/frame_source_factory.hpp>
#include <ingest/gst_frame_source.hpp>

#include <stdexcept>

namespace cs {
    std::unique_ptr<IFrameSource> make_frame_source(SourceSlot slot, const DeviceId& device, const CaptureConfig& cfg) {
        if (device.empty()) {
            throw std::invalid_argument(std::string("[Capture] no device for source ") + to_string(slot));
        }
        // named per slot so bus errors identify the camera
        const std::string sink_name = std::string("sink_cam_") + (slot == SourceSlot::A ? "a" : "b");
        return std::make_unique<GstFrameSource>(device, sink_name, cfg);
    }
}
