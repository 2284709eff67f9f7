#pragma once

#include <pipeline/renderer.hpp>
#include <pipeline/types.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace cs {
    // Fans frames of both sources out to the attached renderers and keeps the
    // most recent one per source. Frames are dropped while disabled.
    class PreviewSink {
    public:
        explicit PreviewSink(bool enabled = true) : enabled_(enabled) {}

        void on_frame(const FramePtr& frame);

        void attach(IRenderer* r);
        void detach(IRenderer* r);

        void set_active(std::optional<SourceSlot> slot);
        std::optional<SourceSlot> active() const;

        void set_enabled(bool on);
        bool enabled() const { return enabled_.load(); }

        // drops the held frame, used when a source goes away
        void clear(SourceSlot slot);

        FramePtr latest(SourceSlot slot) const;
        uint64_t frames_seen(SourceSlot slot) const;

    private:
        std::atomic<bool> enabled_;

        mutable std::mutex mtx_;
        std::array<FramePtr, 2> latest_{};
        std::array<uint64_t, 2> seen_{};
        std::optional<SourceSlot> active_;
        std::vector<IRenderer*> renderers_;
    };
}
