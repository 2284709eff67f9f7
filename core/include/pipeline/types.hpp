#pragma once

#include <opencv2/core.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace cs {
    using DeviceId = std::string;

    enum class SourceSlot { A = 0, B = 1 };

    inline SourceSlot other(SourceSlot s) { return s == SourceSlot::A ? SourceSlot::B : SourceSlot::A; }
    inline size_t index_of(SourceSlot s) { return static_cast<size_t>(s); }
    const char* to_string(SourceSlot s);
    // accepts "A"/"B" in either case
    bool parse_slot(const std::string& s, SourceSlot& out);

    // MJPG only ever appears on the device side of a capture pipeline,
    // frames handed to consumers are always raw.
    enum class PixelLayout { YUY2, UYVY, I420, NV12, BGR, MJPG };
    const char* to_string(PixelLayout l);
    bool parse_layout(const std::string& s, PixelLayout& out);
    bool is_raw(PixelLayout l);

    struct FrameFormat {
        int width = 0;
        int height = 0;
        PixelLayout layout = PixelLayout::YUY2;
        int fps_num = 0;
        int fps_den = 1;

        double fps() const;
        std::chrono::nanoseconds frame_interval() const;
        bool valid() const;
        size_t frame_bytes() const;
        std::string caps() const;
        std::string describe() const;
    };

    bool operator==(const FrameFormat& a, const FrameFormat& b);
    bool operator!=(const FrameFormat& a, const FrameFormat& b);

    struct Frame {
        FrameFormat format;
        cv::Mat data; // contiguous payload, shape from allocate_frame_mat()
        int64_t pts_ns = 0;
        int64_t frame_id = 0;
        SourceSlot source = SourceSlot::A;
        std::chrono::steady_clock::time_point arrival;
    };

    using FramePtr = std::shared_ptr<const Frame>;

    // packed 4:2:2 -> rows x cols x 2, planar 4:2:0 -> (rows * 3 / 2) x cols x 1, BGR -> rows x cols x 3
    cv::Mat allocate_frame_mat(const FrameFormat& f);

    enum class Health { Unopened, Negotiating, Running, Error, Closed };
    enum class OutputHealth { Closed, Open, Failed };
    enum class SessionState { Stopped, Starting, Running, AllSourcesDown, Fatal };
    enum class RouterState { Idle, Routed, Switching };

    const char* to_string(Health h);
    const char* to_string(OutputHealth h);
    const char* to_string(SessionState s);
    const char* to_string(RouterState s);

    struct SourceStatus {
        Health health = Health::Unopened;
        DeviceId device;
        int reconnect_attempts = 0;
        bool persistent_failure = false;
        std::string last_error;
    };

    struct Status {
        SessionState session = SessionState::Stopped;
        RouterState router = RouterState::Idle;
        std::optional<SourceSlot> active;
        SourceStatus source_a;
        SourceStatus source_b;
        OutputHealth output = OutputHealth::Closed;
        DeviceId output_device;
        FrameFormat format;
        bool preview_enabled = true;

        const SourceStatus& source(SourceSlot s) const { return s == SourceSlot::A ? source_a : source_b; }
    };

    enum class EventKind { ActiveSourceChanged, SourceHealthChanged, OutputHealthChanged, SessionStateChanged };
    const char* to_string(EventKind k);

    struct StatusEvent {
        uint64_t seq = 0;
        EventKind kind = EventKind::SessionStateChanged;
        std::string detail;
        Status status;
    };
}
