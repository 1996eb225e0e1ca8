/**
 * @file    tesseract_detector.hpp
 * @brief   Text-line detector backed by Tesseract
 * @author  AllenK (Kwyshell)
 * @date    2026.09.29
 * @license MIT
 *
 * @details
 * TessBaseAPI is not thread-safe; calls are serialized with a mutex.
 */

#pragma once

#include "detect/region_detector.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace tesseract {
class TessBaseAPI;
}

namespace wit {

class TesseractRegionDetector : public RegionDetector {
public:
    TesseractRegionDetector();
    ~TesseractRegionDetector() override;

    TesseractRegionDetector(const TesseractRegionDetector&) = delete;
    TesseractRegionDetector& operator=(const TesseractRegionDetector&) = delete;

    bool initialize(const std::string& tessdata_path, const std::string& languages);

    std::vector<Region> detect(const cv::Mat& image) override;

private:
    std::unique_ptr<tesseract::TessBaseAPI> api_;
    std::mutex mutex_;
    bool initialized_ = false;
};

}  // namespace wit
