#pragma once

#include <pipeline/types.hpp>

#include <vector>

namespace cs {
    struct NegotiationResult {
        FrameFormat mode;
        bool fallback = false;   // nothing usable advertised
        bool downscaled = false; // best mode exceeds the session bounds
    };

    // 640x480 YUY2 @ 30/1, requested when a device advertises nothing usable
    FrameFormat fallback_capture_mode();

    bool is_convertible(const FrameFormat& mode, bool allow_mjpg);

    // Highest width*height*fps mode that fits inside the session bounds, raw
    // layouts winning ties over MJPG. Without a fitting mode the cheapest
    // larger one is used, without any convertible mode the fallback.
    NegotiationResult choose_capture_mode(const std::vector<FrameFormat>& advertised,
                                          const FrameFormat& session,
                                          bool allow_mjpg);
}
