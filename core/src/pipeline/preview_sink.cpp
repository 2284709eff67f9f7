#include <pipeline/preview_sink.hpp>

#include <algorithm>
#include <iostream>

namespace cs {
    void PreviewSink::on_frame(const FramePtr& frame) {
        if (!frame || !enabled_.load(std::memory_order_relaxed)) return;
        const size_t i = index_of(frame->source);

        std::vector<IRenderer*> targets;
        bool is_active = false;
        {
            std::lock_guard lk(mtx_);
            latest_[i] = frame;
            ++seen_[i];
            is_active = active_ == frame->source;
            targets = renderers_;
        }

        for (auto* r : targets) {
            r->render_frame(frame->source, frame, is_active);
        }
    }

    void PreviewSink::attach(IRenderer* r) {
        if (!r) return;
        std::lock_guard lk(mtx_);
        if (std::find(renderers_.begin(), renderers_.end(), r) == renderers_.end()) {
            renderers_.push_back(r);
        }
    }

    void PreviewSink::detach(IRenderer* r) {
        std::lock_guard lk(mtx_);
        renderers_.erase(std::remove(renderers_.begin(), renderers_.end(), r), renderers_.end());
    }

    void PreviewSink::set_active(std::optional<SourceSlot> slot) {
        std::lock_guard lk(mtx_);
        active_ = slot;
    }

    std::optional<SourceSlot> PreviewSink::active() const {
        std::lock_guard lk(mtx_);
        return active_;
    }

    void PreviewSink::set_enabled(bool on) {
        if (enabled_.exchange(on) == on) return;
        std::cout << "[Preview](set_enabled) " << (on ? "on" : "off") << "\n";
        if (!on) {
            std::lock_guard lk(mtx_);
            latest_ = {};
        }
    }

    void PreviewSink::clear(SourceSlot slot) {
        std::lock_guard lk(mtx_);
        latest_[index_of(slot)].reset();
    }

    FramePtr PreviewSink::latest(SourceSlot slot) const {
        std::lock_guard lk(mtx_);
        return latest_[index_of(slot)];
    }

    uint64_t PreviewSink::frames_seen(SourceSlot slot) const {
        std::lock_guard lk(mtx_);
        return seen_[index_of(slot)];
    }
}
