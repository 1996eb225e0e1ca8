/**
 * @file    inpaint_engine.hpp
 * @brief   Prioritized backend fallback chain
 * @author  AllenK (Kwyshell)
 * @date    2026.09.15
 * @license MIT
 *
 * @details
 * States: Idle -> TryCloud -> TryLocal -> TryClassical -> Done
 *
 * Backends are tried in registration order (cloud, local, classical for the
 * default chain); the first Success ends the run. Unavailable and Failed
 * outcomes only move the chain forward. A classical result is reported as
 * best effort.
 */

#pragma once

#include "backend/inpaint_backend.hpp"

#include <memory>
#include <string>
#include <vector>

namespace wit {

enum class EngineState {
    Idle,
    TryCloud,
    TryLocal,
    TryClassical,
    Done,
};

const char* to_string(EngineState state) noexcept;

/**
 * One backend's contribution to a run, for logging and status reporting
 */
struct AttemptRecord {
    BackendType backend;
    BackendOutcome::Status status;
    std::string reason;
};

struct EngineResult {
    cv::Mat image;
    BackendType backend = BackendType::Classical;
    bool best_effort = false;
    bool no_op = false;                 // Empty mask, input returned as is
    std::vector<AttemptRecord> attempts;
};

class InpaintEngine {
public:
    InpaintEngine() = default;
    explicit InpaintEngine(std::vector<std::unique_ptr<InpaintBackend>> backends);

    InpaintEngine(const InpaintEngine&) = delete;
    InpaintEngine& operator=(const InpaintEngine&) = delete;
    InpaintEngine(InpaintEngine&&) = default;
    InpaintEngine& operator=(InpaintEngine&&) = default;

    /**
     * Append a backend at the lowest priority
     */
    void add_backend(std::unique_ptr<InpaintBackend> backend);

    /**
     * Remove masked content
     *
     * @param image  CV_8UC3 BGR
     * @param mask   CV_8UC1 of the image size, > 127 = repaint
     * @throws InvalidInputError on bad geometry/types (before any backend)
     * @throws AllBackendsExhaustedError if no backend produced an image
     */
    EngineResult run(const cv::Mat& image, const cv::Mat& mask);

    bool has_backend(BackendType type) const noexcept;
    const InpaintBackend* backend(BackendType type) const noexcept;

private:
    std::vector<std::unique_ptr<InpaintBackend>> backends_;
};

}  // namespace wit
