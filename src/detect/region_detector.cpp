/**
 * @file    region_detector.cpp
 * @brief   Region Detector Factory Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.28
 * @license MIT
 */

#include "detect/region_detector.hpp"

#if defined(WIT_HAS_TESSERACT)
#include "detect/tesseract_detector.hpp"
#endif

#include <spdlog/spdlog.h>

namespace wit {

std::shared_ptr<RegionDetector> create_region_detector(const DetectorConfig& config) {
    if (!config.enabled) {
        spdlog::info("Region detection disabled by configuration");
        return nullptr;
    }

#if defined(WIT_HAS_TESSERACT)
    auto detector = std::make_shared<TesseractRegionDetector>();
    if (detector->initialize(config.tessdata_path, config.languages)) {
        spdlog::info("Tesseract region detector ready ({})", config.languages);
        return detector;
    }
    spdlog::warn("Tesseract initialization failed, auto-detection disabled");
    return nullptr;
#else
    spdlog::info("No region detector compiled in, auto-detection disabled");
    return nullptr;
#endif
}

bool is_detector_available() noexcept {
#if defined(WIT_HAS_TESSERACT)
    return true;
#else
    return false;
#endif
}

}  // namespace wit
