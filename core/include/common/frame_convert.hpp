#pragma once

#include <pipeline/types.hpp>

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace cs {
    int interp_from_str(const std::string& s);

    // Letterboxes into target_w x target_h when keep_aspect is set.
    cv::Mat resize_frame(const cv::Mat& src, int target_w, int target_h, bool keep_aspect, int interp);

    // Raw frame payload -> 8-bit BGR. Returns an empty Mat for layouts that
    // cannot be converted.
    cv::Mat to_bgr(const Frame& f);

    bool encode_jpeg(const cv::Mat& bgr, int quality, std::vector<uint8_t>& out);
}
