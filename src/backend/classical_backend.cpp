/**
 * @file    classical_backend.cpp
 * @brief   Classical Backend Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.16
 * @license MIT
 */

#include "backend/classical_backend.hpp"

#include <opencv2/photo.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace wit {

ClassicalBackend::ClassicalBackend(ClassicalConfig config)
    : config_(config) {}

cv::Mat ClassicalBackend::inpaint(const cv::Mat& image, const cv::Mat& binary_mask) const {
    cv::Mat result;
    cv::inpaint(image, binary_mask, result, config_.radius, cv::INPAINT_TELEA);
    return result;
}

BackendOutcome ClassicalBackend::attempt(const cv::Mat& image, const cv::Mat& mask) {
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        cv::Mat binary = mask > 127;
        cv::Mat result = inpaint(image, binary);

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time).count();
        spdlog::info("Classical inpaint ({}x{}, radius {}) in {} ms",
                     image.cols, image.rows, config_.radius, duration);
        return BackendOutcome::success(std::move(result));
    } catch (const cv::Exception& e) {
        spdlog::error("Classical inpaint failed: {}", e.what());
        return BackendOutcome::failed(e.what());
    }
}

}  // namespace wit
