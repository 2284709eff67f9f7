#include <ingest/format_negotiation.hpp>

namespace cs {
    FrameFormat fallback_capture_mode() {
        FrameFormat f;
        f.width = 640;
        f.height = 480;
        f.layout = PixelLayout::YUY2;
        f.fps_num = 30;
        f.fps_den = 1;
        return f;
    }

    bool is_convertible(const FrameFormat& mode, bool allow_mjpg) {
        if (mode.width <= 0 || mode.height <= 0 || mode.fps() <= 0.0) return false;
        if (mode.layout == PixelLayout::MJPG) return allow_mjpg;
        return true;
    }

    static bool fits(const FrameFormat& mode, const FrameFormat& session) {
        constexpr double kFpsEps = 0.01;
        return mode.width <= session.width &&
               mode.height <= session.height &&
               mode.fps() <= session.fps() + kFpsEps;
    }

    static double score(const FrameFormat& mode) {
        return static_cast<double>(mode.width) * static_cast<double>(mode.height) * mode.fps();
    }

    NegotiationResult choose_capture_mode(const std::vector<FrameFormat>& advertised,
                                          const FrameFormat& session,
                                          bool allow_mjpg) {
        const FrameFormat* best_fit = nullptr;
        const FrameFormat* best_over = nullptr;

        for (const auto& m : advertised) {
            if (!is_convertible(m, allow_mjpg)) continue;

            if (fits(m, session)) {
                if (!best_fit) { best_fit = &m; continue; }
                const double s = score(m);
                const double b = score(*best_fit);
                if (s > b || (s == b && is_raw(m.layout) && !is_raw(best_fit->layout))) best_fit = &m;
            } else {
                if (!best_over) { best_over = &m; continue; }
                const double s = score(m);
                const double b = score(*best_over);
                if (s < b || (s == b && is_raw(m.layout) && !is_raw(best_over->layout))) best_over = &m;
            }
        }

        NegotiationResult r;
        if (best_fit) {
            r.mode = *best_fit;
        } else if (best_over) {
            r.mode = *best_over;
            r.downscaled = true;
        } else {
            r.mode = fallback_capture_mode();
            r.fallback = true;
        }
        return r;
    }
}
