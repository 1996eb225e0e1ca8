/**
 * @file    blender.hpp
 * @brief   Feathered compositing of inpainted pixels over the original
 * @author  AllenK (Kwyshell)
 * @date    2026.09.12
 * @license MIT
 *
 * @details
 * Math:
 *   alpha  = GaussianBlur(binary(mask)) / 255, forced to 1 inside the mask
 *   result = base * (1 - alpha) + inferred * alpha
 *
 * alpha reaches exactly 0 beyond feather_radius pixels from the mask, so
 * pixels further away keep their original values bit for bit.
 */

#pragma once

#include <opencv2/core.hpp>

namespace wit {

struct BlendConfig {
    int feather_radius = 16;
};

class Blender {
public:
    explicit Blender(BlendConfig config = {});

    /**
     * Build the [0,1] alpha map (CV_32FC1) for a mask crop
     */
    cv::Mat feather_map(const cv::Mat& mask) const;

    /**
     * Composite inferred pixels into base at origin (in place)
     *
     * @param base       CV_8UC3 working image, modified
     * @param inferred   CV_8UC3 tile output
     * @param mask_crop  CV_8UC1 mask of the tile, same size as inferred
     * @param origin     Top-left of the tile in base
     */
    void blend(cv::Mat& base,
               const cv::Mat& inferred,
               const cv::Mat& mask_crop,
               const cv::Point& origin) const;

    /**
     * Composite with a precomputed alpha map (CV_32FC1)
     */
    static void composite(cv::Mat& base,
                          const cv::Mat& inferred,
                          const cv::Mat& alpha,
                          const cv::Point& origin);

    const BlendConfig& config() const noexcept { return config_; }

private:
    BlendConfig config_;
};

}  // namespace wit
