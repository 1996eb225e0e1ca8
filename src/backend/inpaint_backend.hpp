/**
 * @file    inpaint_backend.hpp
 * @brief   Inpainting backend interface and tagged outcome
 * @author  AllenK (Kwyshell)
 * @date    2026.09.15
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <utility>

namespace wit {

enum class BackendType {
    Cloud,
    Local,
    Classical,
};

inline const char* to_string(BackendType type) noexcept {
    switch (type) {
        case BackendType::Cloud:     return "cloud";
        case BackendType::Local:     return "local";
        case BackendType::Classical: return "classical";
    }
    return "unknown";
}

/**
 * Result of one backend attempt
 *
 * Unavailable and Failed are both non-fatal: the engine moves on to the
 * next backend.
 */
struct BackendOutcome {
    enum class Status {
        Success,
        Unavailable,
        Failed,
    };

    Status status = Status::Failed;
    cv::Mat image;          // Set only on Success
    std::string reason;     // Set on Unavailable / Failed

    static BackendOutcome success(cv::Mat image) {
        BackendOutcome o;
        o.status = Status::Success;
        o.image = std::move(image);
        return o;
    }

    static BackendOutcome unavailable(std::string reason) {
        BackendOutcome o;
        o.status = Status::Unavailable;
        o.reason = std::move(reason);
        return o;
    }

    static BackendOutcome failed(std::string reason) {
        BackendOutcome o;
        o.status = Status::Failed;
        o.reason = std::move(reason);
        return o;
    }

    bool ok() const noexcept { return status == Status::Success; }
};

/**
 * One inpainting strategy
 *
 * attempt() never throws for backend-side problems; it reports them through
 * the outcome. Input is a CV_8UC3 BGR image and a CV_8UC1 mask of the same
 * size; a successful image has the input size.
 */
class InpaintBackend {
public:
    virtual ~InpaintBackend() = default;

    virtual BackendType type() const noexcept = 0;

    // Cheap readiness check (model loaded, credential present); the engine
    // does not attempt a backend that reports false
    virtual bool is_available() const noexcept = 0;

    virtual BackendOutcome attempt(const cv::Mat& image, const cv::Mat& mask) = 0;
};

}  // namespace wit
