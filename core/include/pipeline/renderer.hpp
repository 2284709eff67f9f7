#pragma once

#include <pipeline/types.hpp>

namespace cs {
    // What a control surface has to provide to show the two sources. Calls
    // come from capture workers and the supervisor thread; implementations
    // must not block.
    struct IRenderer {
        virtual ~IRenderer() = default;
        virtual void render_frame(SourceSlot slot, const FramePtr& frame, bool active) = 0;
        virtual void render_status(const StatusEvent& ev) = 0;
    };
}
