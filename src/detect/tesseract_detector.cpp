/**
 * @file    tesseract_detector.cpp
 * @brief   Tesseract Region Detector Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.29
 * @license MIT
 */

#include "detect/tesseract_detector.hpp"

#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace wit {

TesseractRegionDetector::TesseractRegionDetector()
    : api_(std::make_unique<tesseract::TessBaseAPI>()) {}

TesseractRegionDetector::~TesseractRegionDetector() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        api_->End();
    }
}

bool TesseractRegionDetector::initialize(const std::string& tessdata_path,
                                         const std::string& languages) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        api_->End();
        initialized_ = false;
    }

    const char* datapath = tessdata_path.empty() ? nullptr : tessdata_path.c_str();
    if (api_->Init(datapath, languages.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
        return false;
    }
    api_->SetPageSegMode(tesseract::PSM_SPARSE_TEXT);
    initialized_ = true;
    return true;
}

std::vector<Region> TesseractRegionDetector::detect(const cv::Mat& image) {
    std::vector<Region> regions;
    if (image.empty() || image.type() != CV_8UC3) {
        return regions;
    }

    cv::Mat rgb;
    cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        spdlog::warn("Tesseract detector used before initialization");
        return regions;
    }

    api_->SetImage(rgb.data, rgb.cols, rgb.rows, 3, static_cast<int>(rgb.step[0]));
    if (api_->Recognize(nullptr) != 0) {
        spdlog::warn("Tesseract recognition failed");
        api_->Clear();
        return regions;
    }

    std::unique_ptr<tesseract::ResultIterator> iter(api_->GetIterator());
    if (iter) {
        const tesseract::PageIteratorLevel level = tesseract::RIL_TEXTLINE;
        do {
            int x1 = 0, y1 = 0, x2 = 0, y2 = 0;
            if (!iter->BoundingBox(level, &x1, &y1, &x2, &y2)) continue;

            Region r;
            r.x = x1;
            r.y = y1;
            r.width = x2 - x1;
            r.height = y2 - y1;
            r.confidence = std::clamp(iter->Confidence(level) / 100.0f, 0.0f, 1.0f);

            std::unique_ptr<char[]> text(iter->GetUTF8Text(level));
            if (text) {
                std::string s(text.get());
                s.erase(std::find_if(s.rbegin(), s.rend(),
                                     [](unsigned char c) { return !std::isspace(c); }).base(),
                        s.end());
                if (!s.empty()) r.text = std::move(s);
            }
            regions.push_back(std::move(r));
        } while (iter->Next(level));
    }
    api_->Clear();

    spdlog::debug("Tesseract found {} text line(s)", regions.size());
    return regions;
}

}  // namespace wit
