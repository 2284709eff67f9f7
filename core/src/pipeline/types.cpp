#include <pipeline/types.hpp>

#include <cmath>
#include <sstream>

namespace cs {
    const char* to_string(SourceSlot s) {
        return s == SourceSlot::A ? "A" : "B";
    }

    bool parse_slot(const std::string& s, SourceSlot& out) {
        if (s == "A" || s == "a") { out = SourceSlot::A; return true; }
        if (s == "B" || s == "b") { out = SourceSlot::B; return true; }
        return false;
    }

    const char* to_string(PixelLayout l) {
        switch (l) {
            case PixelLayout::YUY2: return "YUY2";
            case PixelLayout::UYVY: return "UYVY";
            case PixelLayout::I420: return "I420";
            case PixelLayout::NV12: return "NV12";
            case PixelLayout::BGR: return "BGR";
            case PixelLayout::MJPG: return "MJPG";
        }
        return "unk";
    }

    bool parse_layout(const std::string& s, PixelLayout& out) {
        if (s == "YUY2" || s == "YUYV") out = PixelLayout::YUY2;
        else if (s == "UYVY") out = PixelLayout::UYVY;
        else if (s == "I420") out = PixelLayout::I420;
        else if (s == "NV12") out = PixelLayout::NV12;
        else if (s == "BGR") out = PixelLayout::BGR;
        else if (s == "MJPG" || s == "MJPEG" || s == "JPEG") out = PixelLayout::MJPG;
        else return false;
        return true;
    }

    bool is_raw(PixelLayout l) {
        return l != PixelLayout::MJPG;
    }

    double FrameFormat::fps() const {
        if (fps_num <= 0 || fps_den <= 0) return 0.0;
        return static_cast<double>(fps_num) / static_cast<double>(fps_den);
    }

    std::chrono::nanoseconds FrameFormat::frame_interval() const {
        if (fps_num <= 0 || fps_den <= 0) return std::chrono::nanoseconds(0);
        return std::chrono::nanoseconds(
            static_cast<int64_t>(1000000000LL) * fps_den / fps_num);
    }

    bool FrameFormat::valid() const {
        if (width <= 0 || height <= 0 || fps_num <= 0 || fps_den <= 0) return false;
        // 4:2:x layouts need even dimensions
        if (layout != PixelLayout::BGR && layout != PixelLayout::MJPG) {
            if (width % 2 != 0) return false;
            if ((layout == PixelLayout::I420 || layout == PixelLayout::NV12) && height % 2 != 0) return false;
        }
        return true;
    }

    size_t FrameFormat::frame_bytes() const {
        const size_t px = static_cast<size_t>(width) * static_cast<size_t>(height);
        switch (layout) {
            case PixelLayout::YUY2:
            case PixelLayout::UYVY: return px * 2;
            case PixelLayout::I420:
            case PixelLayout::NV12: return px * 3 / 2;
            case PixelLayout::BGR: return px * 3;
            case PixelLayout::MJPG: return 0;
        }
        return 0;
    }

    std::string FrameFormat::caps() const {
        std::ostringstream ss;
        if (layout == PixelLayout::MJPG) ss << "image/jpeg";
        else ss << "video/x-raw,format=" << to_string(layout);
        if (width > 0 && height > 0) ss << ",width=" << width << ",height=" << height;
        if (fps_num > 0 && fps_den > 0) ss << ",framerate=" << fps_num << "/" << fps_den;
        return ss.str();
    }

    std::string FrameFormat::describe() const {
        std::ostringstream ss;
        ss << width << "x" << height << " " << to_string(layout) << " @ " << fps_num << "/" << fps_den;
        return ss.str();
    }

    bool operator==(const FrameFormat& a, const FrameFormat& b) {
        // 30/1 and 60/2 are the same rate
        return a.width == b.width &&
               a.height == b.height &&
               a.layout == b.layout &&
               static_cast<int64_t>(a.fps_num) * b.fps_den == static_cast<int64_t>(b.fps_num) * a.fps_den;
    }

    bool operator!=(const FrameFormat& a, const FrameFormat& b) {
        return !(a == b);
    }

    cv::Mat allocate_frame_mat(const FrameFormat& f) {
        if (f.width <= 0 || f.height <= 0) return {};
        switch (f.layout) {
            case PixelLayout::YUY2:
            case PixelLayout::UYVY: return cv::Mat(f.height, f.width, CV_8UC2);
            case PixelLayout::I420:
            case PixelLayout::NV12: return cv::Mat(f.height * 3 / 2, f.width, CV_8UC1);
            case PixelLayout::BGR: return cv::Mat(f.height, f.width, CV_8UC3);
            case PixelLayout::MJPG: return {};
        }
        return {};
    }

    const char* to_string(Health h) {
        switch (h) {
            case Health::Unopened: return "unopened";
            case Health::Negotiating: return "negotiating";
            case Health::Running: return "running";
            case Health::Error: return "error";
            case Health::Closed: return "closed";
        }
        return "unk";
    }

    const char* to_string(OutputHealth h) {
        switch (h) {
            case OutputHealth::Closed: return "closed";
            case OutputHealth::Open: return "open";
            case OutputHealth::Failed: return "failed";
        }
        return "unk";
    }

    const char* to_string(SessionState s) {
        switch (s) {
            case SessionState::Stopped: return "stopped";
            case SessionState::Starting: return "starting";
            case SessionState::Running: return "running";
            case SessionState::AllSourcesDown: return "all_sources_down";
            case SessionState::Fatal: return "fatal";
        }
        return "unk";
    }

    const char* to_string(RouterState s) {
        switch (s) {
            case RouterState::Idle: return "idle";
            case RouterState::Routed: return "routed";
            case RouterState::Switching: return "switching";
        }
        return "unk";
    }

    const char* to_string(EventKind k) {
        switch (k) {
            case EventKind::ActiveSourceChanged: return "active_source_changed";
            case EventKind::SourceHealthChanged: return "source_health_changed";
            case EventKind::OutputHealthChanged: return "output_health_changed";
            case EventKind::SessionStateChanged: return "session_state_changed";
        }
        return "unk";
    }
}
