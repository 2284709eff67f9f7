#include <common/frame_convert.hpp>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace cs {
    int interp_from_str(const std::string& s) {
        if (s == "nearest") return cv::INTER_NEAREST;
        if (s == "cubic") return cv::INTER_CUBIC;
        if (s == "area") return cv::INTER_AREA;
        return cv::INTER_LINEAR;
    }

    cv::Mat resize_frame(const cv::Mat& src, int target_w, int target_h, bool keep_aspect, int interp) {
        if (src.empty() || target_w <= 0 || target_h <= 0) return src;
        if (src.cols == target_w && src.rows == target_h) return src;

        if (!keep_aspect) {
            cv::Mat dst;
            cv::resize(src, dst, {target_w, target_h}, 0, 0, interp);
            return dst;
        }

        const float s = std::min(float(target_w) / float(src.cols), float(target_h) / float(src.rows));
        const int new_w = std::max(1, int(src.cols * s));
        const int new_h = std::max(1, int(src.rows * s));

        cv::Mat resized;
        cv::resize(src, resized, {new_w, new_h}, 0, 0, interp);

        cv::Mat out(target_h, target_w, src.type(), cv::Scalar::all(0));
        const int x = (target_w - new_w) / 2;
        const int y = (target_h - new_h) / 2;
        resized.copyTo(out(cv::Rect(x, y, new_w, new_h)));
        return out;
    }

    cv::Mat to_bgr(const Frame& f) {
        if (f.data.empty()) return {};

        cv::Mat bgr;
        switch (f.format.layout) {
            case PixelLayout::BGR:
                return f.data;
            case PixelLayout::YUY2:
                cv::cvtColor(f.data, bgr, cv::COLOR_YUV2BGR_YUY2);
                break;
            case PixelLayout::UYVY:
                cv::cvtColor(f.data, bgr, cv::COLOR_YUV2BGR_UYVY);
                break;
            case PixelLayout::I420:
                cv::cvtColor(f.data, bgr, cv::COLOR_YUV2BGR_I420);
                break;
            case PixelLayout::NV12:
                cv::cvtColor(f.data, bgr, cv::COLOR_YUV2BGR_NV12);
                break;
            case PixelLayout::MJPG:
                return {};
        }
        return bgr;
    }

    bool encode_jpeg(const cv::Mat& bgr, int quality, std::vector<uint8_t>& out) {
        if (bgr.empty() || bgr.type() != CV_8UC3) return false;
        const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 1, 100)};
        return cv::imencode(".jpg", bgr, out, params);
    }
}
