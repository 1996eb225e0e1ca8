/**
 * @file    blender.cpp
 * @brief   Blender Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.12
 * @license MIT
 */

#include "core/blender.hpp"

#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace wit {

Blender::Blender(BlendConfig config)
    : config_(config) {
    if (config_.feather_radius < 0) {
        throw std::invalid_argument("Feather radius must be non-negative");
    }
}

cv::Mat Blender::feather_map(const cv::Mat& mask) const {
    CV_Assert(mask.type() == CV_8UC1);

    cv::Mat binary = mask > 127;
    cv::Mat alpha;
    binary.convertTo(alpha, CV_32FC1);

    if (config_.feather_radius > 0) {
        const int ksize = config_.feather_radius * 2 + 1;
        cv::GaussianBlur(alpha, alpha, cv::Size(ksize, ksize), 0);
    }
    alpha *= 1.0 / 255.0;

    // Interior is replaced entirely
    alpha.setTo(1.0f, binary);
    return alpha;
}

void Blender::composite(cv::Mat& base,
                        const cv::Mat& inferred,
                        const cv::Mat& alpha,
                        const cv::Point& origin) {
    if (base.type() != CV_8UC3 || inferred.type() != CV_8UC3) {
        throw std::invalid_argument("Blend expects CV_8UC3 images");
    }
    if (alpha.type() != CV_32FC1 || alpha.size() != inferred.size()) {
        throw std::invalid_argument("Alpha map must be CV_32FC1 of the tile size");
    }

    const cv::Rect roi(origin, inferred.size());
    if ((roi & cv::Rect(0, 0, base.cols, base.rows)) != roi) {
        throw std::invalid_argument("Tile does not fit inside the base image");
    }

    cv::Mat target = base(roi);
    for (int y = 0; y < roi.height; ++y) {
        const float* a_row = alpha.ptr<float>(y);
        const cv::Vec3b* src_row = inferred.ptr<cv::Vec3b>(y);
        cv::Vec3b* dst_row = target.ptr<cv::Vec3b>(y);

        for (int x = 0; x < roi.width; ++x) {
            const float a = a_row[x];
            if (a <= 0.0f) continue;

            for (int c = 0; c < 3; ++c) {
                const float v = dst_row[x][c] * (1.0f - a) + src_row[x][c] * a;
                dst_row[x][c] = cv::saturate_cast<uchar>(v);
            }
        }
    }
}

void Blender::blend(cv::Mat& base,
                    const cv::Mat& inferred,
                    const cv::Mat& mask_crop,
                    const cv::Point& origin) const {
    if (mask_crop.size() != inferred.size()) {
        throw std::invalid_argument("Mask crop must match the tile size");
    }
    composite(base, inferred, feather_map(mask_crop), origin);
}

}  // namespace wit
