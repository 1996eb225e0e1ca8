/**
 * @file    classical_backend.hpp
 * @brief   Non-learned fallback (OpenCV Telea fast marching)
 * @author  AllenK (Kwyshell)
 * @date    2026.09.16
 * @license MIT
 */

#pragma once

#include "backend/inpaint_backend.hpp"

namespace wit {

struct ClassicalConfig {
    double radius = 3.0;    // Neighbourhood considered per inpainted pixel
};

class ClassicalBackend : public InpaintBackend {
public:
    explicit ClassicalBackend(ClassicalConfig config = {});

    BackendType type() const noexcept override { return BackendType::Classical; }
    bool is_available() const noexcept override { return true; }

    BackendOutcome attempt(const cv::Mat& image, const cv::Mat& mask) override;

    /**
     * Synchronous inpaint over the binarized mask
     */
    cv::Mat inpaint(const cv::Mat& image, const cv::Mat& binary_mask) const;

private:
    ClassicalConfig config_;
};

}  // namespace wit
