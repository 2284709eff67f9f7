#pragma once

#include <memory>

#include <common/config.hpp>
#include <ingest/frame_source.hpp>

namespace cs {
    std::unique_ptr<IFrameSource> make_frame_source(SourceSlot slot, const DeviceId& device, const CaptureConfig& cfg);
}
