/**
 * @file    region.hpp
 * @brief   Candidate watermark region reported by a detector
 * @author  AllenK (Kwyshell)
 * @date    2026.09.02
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <string>

namespace wit {

/**
 * Detector-reported bounding box with confidence and recognized text
 */
struct Region {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    float confidence = 0.0f;            // [0.0, 1.0]
    std::optional<std::string> text;    // Recognized text, if any

    cv::Rect rect() const { return cv::Rect(x, y, width, height); }
};

}  // namespace wit
