/**
 * @file    mask_builder.cpp
 * @brief   Mask Builder Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.04
 * @license MIT
 */

#include "core/mask_builder.hpp"
#include "core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace wit {

MaskBuilder::MaskBuilder(MaskConfig config)
    : config_(config) {}

cv::Mat MaskBuilder::build(
    const cv::Size& image_size,
    const std::optional<cv::Mat>& user_mask,
    const std::optional<std::vector<Region>>& regions) const
{
    if (image_size.width <= 0 || image_size.height <= 0) {
        throw InvalidInputError("Mask requested for an empty image");
    }

    if (user_mask.has_value()) {
        return normalize_user_mask(image_size, *user_mask);
    }

    if (!regions.has_value() || regions->empty()) {
        spdlog::debug("No detector regions, using empty mask");
        return cv::Mat::zeros(image_size, CV_8UC1);
    }

    std::vector<Region> kept = filter_regions(image_size, *regions);
    if (kept.empty()) {
        spdlog::info("All {} detected regions filtered out, nothing to remove",
                     regions->size());
        return cv::Mat::zeros(image_size, CV_8UC1);
    }

    return rasterize_regions(image_size, kept);
}

std::vector<Region> MaskBuilder::filter_regions(
    const cv::Size& image_size,
    const std::vector<Region>& regions) const
{
    const double image_area = static_cast<double>(image_size.area());
    std::vector<Region> kept;
    kept.reserve(regions.size());

    for (const auto& r : regions) {
        if (r.width < config_.min_region_width || r.height < config_.min_region_height) {
            continue;
        }
        if (image_area <= 0.0 ||
            static_cast<double>(r.width) * r.height / image_area > config_.max_area_fraction) {
            spdlog::debug("Dropping region {}x{} at ({},{}): covers too much of the image",
                          r.width, r.height, r.x, r.y);
            continue;
        }
        if (r.confidence < config_.min_confidence) {
            continue;
        }
        kept.push_back(r);
    }

    std::stable_sort(kept.begin(), kept.end(), [](const Region& a, const Region& b) {
        return a.confidence > b.confidence;
    });

    if (config_.max_regions > 0 && kept.size() > static_cast<size_t>(config_.max_regions)) {
        kept.resize(static_cast<size_t>(config_.max_regions));
    }
    return kept;
}

cv::Mat MaskBuilder::normalize_user_mask(const cv::Size& image_size, const cv::Mat& mask) const {
    if (mask.empty()) {
        throw InvalidInputError("Empty mask provided");
    }

    cv::Mat gray;
    switch (mask.channels()) {
        case 1: gray = mask; break;
        case 3: cv::cvtColor(mask, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(mask, gray, cv::COLOR_BGRA2GRAY); break;
        default:
            throw InvalidInputError("Unsupported mask channel count: " +
                                    std::to_string(mask.channels()));
    }

    if (gray.depth() == CV_16U) {
        gray.convertTo(gray, CV_8U, 1.0 / 257.0);
    } else if (gray.depth() != CV_8U) {
        throw InvalidInputError("Unsupported mask bit depth");
    }

    cv::Mat result;
    if (gray.size() != image_size) {
        spdlog::debug("Resampling mask {}x{} -> {}x{} (nearest)",
                      gray.cols, gray.rows, image_size.width, image_size.height);
        // Nearest keeps the mask binary; smooth resampling invents gray levels
        cv::resize(gray, result, image_size, 0, 0, cv::INTER_NEAREST);
    } else {
        result = gray.clone();
    }
    return result;
}

cv::Mat MaskBuilder::rasterize_regions(const cv::Size& image_size,
                                       const std::vector<Region>& regions) const {
    cv::Mat mask = cv::Mat::zeros(image_size, CV_8UC1);
    const cv::Rect bounds(0, 0, image_size.width, image_size.height);
    const int pad = config_.region_padding;

    for (const auto& r : regions) {
        const cv::Rect box = r.rect();
        cv::Rect padded(box.tl() - cv::Point(pad, pad), box.size() + cv::Size(2 * pad, 2 * pad));
        padded &= bounds;
        if (padded.empty()) continue;

        spdlog::debug("Mask region '{}' conf={:.2f} at ({},{}) {}x{}",
                      r.text.value_or(""), r.confidence,
                      padded.x, padded.y, padded.width, padded.height);
        cv::rectangle(mask, padded, cv::Scalar(255), cv::FILLED);
    }

    if (config_.corner_blur_sigma > 0.0) {
        cv::GaussianBlur(mask, mask, cv::Size(0, 0), config_.corner_blur_sigma);
    }
    return mask;
}

}  // namespace wit
