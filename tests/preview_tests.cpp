#include <common/frame_convert.hpp>
#include <control/status_json.hpp>
#include <pipeline/preview_sink.hpp>

#include <opencv2/imgproc.hpp>

#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    cs::FramePtr make_frame(cs::SourceSlot slot, cs::PixelLayout layout, int w = 64, int h = 48) {
        auto f = std::make_shared<cs::Frame>();
        f->format.width = w;
        f->format.height = h;
        f->format.layout = layout;
        f->format.fps_num = 30;
        f->data = cs::allocate_frame_mat(f->format);
        f->data.setTo(cv::Scalar::all(128));
        f->source = slot;
        return f;
    }

    struct RecordingRenderer: cs::IRenderer {
        std::mutex mtx;
        std::vector<std::pair<cs::SourceSlot, bool>> frames;
        int statuses = 0;

        void render_frame(cs::SourceSlot slot, const cs::FramePtr&, bool active) override {
            std::lock_guard lk(mtx);
            frames.emplace_back(slot, active);
        }
        void render_status(const cs::StatusEvent&) override {
            std::lock_guard lk(mtx);
            ++statuses;
        }
    };

    void test_preview_marks_active_source() {
        cs::PreviewSink preview(true);
        RecordingRenderer r;
        preview.attach(&r);
        preview.attach(&r);
        preview.set_active(cs::SourceSlot::B);

        preview.on_frame(make_frame(cs::SourceSlot::A, cs::PixelLayout::YUY2));
        preview.on_frame(make_frame(cs::SourceSlot::B, cs::PixelLayout::YUY2));

        check(r.frames.size() == 2, "a renderer attached twice receives each frame once");
        check(r.frames[0] == std::make_pair(cs::SourceSlot::A, false), "A is shown as standby");
        check(r.frames[1] == std::make_pair(cs::SourceSlot::B, true), "B is shown as active");
        check(preview.frames_seen(cs::SourceSlot::A) == 1, "frames are counted per source");
        check(preview.latest(cs::SourceSlot::B) != nullptr, "the latest frame is held");

        preview.clear(cs::SourceSlot::B);
        check(preview.latest(cs::SourceSlot::B) == nullptr, "clear drops the held frame");

        preview.set_enabled(false);
        preview.on_frame(make_frame(cs::SourceSlot::A, cs::PixelLayout::YUY2));
        check(r.frames.size() == 2, "a disabled preview forwards nothing");
        check(preview.latest(cs::SourceSlot::A) == nullptr, "disabling drops held frames");

        preview.set_enabled(true);
        preview.detach(&r);
        preview.on_frame(make_frame(cs::SourceSlot::A, cs::PixelLayout::YUY2));
        check(r.frames.size() == 2, "a detached renderer receives nothing");
        check(preview.latest(cs::SourceSlot::A) != nullptr, "frames are held again once enabled");
    }

    void test_conversion_to_bgr() {
        for (auto layout : {cs::PixelLayout::YUY2, cs::PixelLayout::UYVY, cs::PixelLayout::I420,
                            cs::PixelLayout::NV12, cs::PixelLayout::BGR}) {
            const auto f = make_frame(cs::SourceSlot::A, layout);
            const cv::Mat bgr = cs::to_bgr(*f);
            check(bgr.type() == CV_8UC3 && bgr.cols == 64 && bgr.rows == 48,
                  std::string("to_bgr should produce 64x48 BGR from ") + cs::to_string(layout));
        }
        cs::Frame mjpg;
        mjpg.format.layout = cs::PixelLayout::MJPG;
        mjpg.data = cv::Mat(1, 16, CV_8UC1);
        check(cs::to_bgr(mjpg).empty(), "compressed payloads are not converted");
    }

    void test_resize_and_encode() {
        const cv::Mat src(48, 64, CV_8UC3, cv::Scalar(0, 0, 255));

        const cv::Mat boxed = cs::resize_frame(src, 64, 64, true, cs::interp_from_str("area"));
        check(boxed.cols == 64 && boxed.rows == 64, "letterboxing keeps the target size");
        check(boxed.at<cv::Vec3b>(0, 32) == cv::Vec3b(0, 0, 0), "letterbox bars are black");
        check(boxed.at<cv::Vec3b>(32, 32) == cv::Vec3b(0, 0, 255), "content is centered");

        const cv::Mat stretched = cs::resize_frame(src, 32, 32, false, cs::interp_from_str("bogus"));
        check(stretched.cols == 32 && stretched.rows == 32, "without keep_aspect the frame is stretched");

        std::vector<uint8_t> jpeg;
        check(cs::encode_jpeg(src, 80, jpeg), "BGR frames encode");
        check(jpeg.size() > 2 && jpeg[0] == 0xFF && jpeg[1] == 0xD8, "output starts with a JPEG SOI marker");
        check(!cs::encode_jpeg(cv::Mat(), 80, jpeg), "empty frames do not encode");
    }

    void test_status_json() {
        cs::Status st;
        st.session = cs::SessionState::AllSourcesDown;
        st.source_a.device = "/dev/video0";
        st.source_a.last_error = "DeviceDisconnected: \"cam\" gone";
        const std::string json = cs::to_json(st);
        check(json.find("\"active\":null") != std::string::npos, "no active source is null");
        check(json.find("\"session\":\"all_sources_down\"") != std::string::npos, "session state is reported");
        check(json.find("\\\"cam\\\"") != std::string::npos, "quotes in errors are escaped");

        cs::SwitchReply busy{cs::SwitchResult::Busy, "switch to B in progress"};
        const std::string reply = cs::to_json(busy);
        check(reply.find("\"result\":\"busy\"") != std::string::npos, "reply carries its result");
        check(reply.find("\"error\":\"SwitchRejectedBusy\"") != std::string::npos, "busy maps to SwitchRejectedBusy");

        cs::SwitchReply timeout{cs::SwitchResult::Timeout, "no frame"};
        check(timeout.code() == cs::ErrorCode::SwitchTimeout, "timeout maps to SwitchTimeout");
        check(cs::to_json(cs::SwitchReply{}).find("\"error\"") == std::string::npos, "an ack carries no error");
    }
}

int main() {
    test_preview_marks_active_source();
    test_conversion_to_bgr();
    test_resize_and_encode();
    test_status_json();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all preview tests passed\n";
    return 0;
}
