/**
 * @file    region_detector.hpp
 * @brief   Text/watermark region detector interface and factory
 * @author  AllenK (Kwyshell)
 * @date    2026.09.28
 * @license MIT
 */

#pragma once

#include "core/region.hpp"

#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>

namespace wit {

struct DetectorConfig {
    bool enabled = true;
    std::string tessdata_path;               // Empty = TESSDATA_PREFIX / default
    std::string languages = "chi_sim+eng";
};

/**
 * Opaque detector: returns candidate regions, possibly none
 */
class RegionDetector {
public:
    virtual ~RegionDetector() = default;

    /**
     * @param image  CV_8UC3 BGR image
     */
    virtual std::vector<Region> detect(const cv::Mat& image) = 0;
};

/**
 * Create the detector compiled into this build
 *
 * @return  nullptr when detection is disabled, not compiled in, or fails to
 *          initialize; auto-mask requests then degrade to an empty mask
 */
std::shared_ptr<RegionDetector> create_region_detector(const DetectorConfig& config);

/**
 * Whether a detector implementation is compiled into this build
 */
bool is_detector_available() noexcept;

}  // namespace wit
