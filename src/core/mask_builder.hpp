/**
 * @file    mask_builder.hpp
 * @brief   Normalized binary mask from a user raster or detector regions
 * @author  AllenK (Kwyshell)
 * @date    2026.09.04
 * @license MIT
 *
 * @details
 * The produced mask is always CV_8UC1 with the exact size of the source
 * image. Pixels > 127 are repainted by the backends.
 *
 * Detector output is filtered before rasterization:
 * 1. Regions narrower than min_region_width or lower than min_region_height
 *    are dropped (noise, single glyphs)
 * 2. Regions covering more than max_area_fraction of the image are dropped
 *    (body text or photo content, not a watermark)
 * 3. Survivors are sorted by confidence and truncated to max_regions
 */

#pragma once

#include "core/region.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <vector>

namespace wit {

struct MaskConfig {
    int region_padding = 10;          // Pixels added around each region
    double corner_blur_sigma = 2.0;   // Softens rectangle corners
    int min_region_width = 20;
    int min_region_height = 10;
    double max_area_fraction = 0.15;
    float min_confidence = 0.0f;
    int max_regions = 5;
};

class MaskBuilder {
public:
    explicit MaskBuilder(MaskConfig config = {});

    /**
     * Build the request mask
     *
     * @param image_size  Source image size
     * @param user_mask   Caller-supplied raster (any size, 1/3/4 channels)
     * @param regions     Detector output, used only without a user mask
     * @return            CV_8UC1 mask of image_size; all-zero means no-op
     * @throws InvalidInputError for masks that cannot be made single-channel
     */
    cv::Mat build(
        const cv::Size& image_size,
        const std::optional<cv::Mat>& user_mask,
        const std::optional<std::vector<Region>>& regions = std::nullopt
    ) const;

    /**
     * Apply size/area filters, sort by confidence, keep the top max_regions
     */
    std::vector<Region> filter_regions(
        const cv::Size& image_size,
        const std::vector<Region>& regions
    ) const;

    const MaskConfig& config() const noexcept { return config_; }

private:
    MaskConfig config_;

    cv::Mat normalize_user_mask(const cv::Size& image_size, const cv::Mat& mask) const;
    cv::Mat rasterize_regions(const cv::Size& image_size,
                              const std::vector<Region>& regions) const;
};

}  // namespace wit
