/**
 * @file    inpaint_engine.cpp
 * @brief   Inpaint Engine Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.15
 * @license MIT
 */

#include "core/inpaint_engine.hpp"
#include "core/errors.hpp"
#include "core/patch_planner.hpp"

#include <spdlog/spdlog.h>

namespace wit {

namespace {

EngineState state_for(BackendType type) noexcept {
    switch (type) {
        case BackendType::Cloud:     return EngineState::TryCloud;
        case BackendType::Local:     return EngineState::TryLocal;
        case BackendType::Classical: return EngineState::TryClassical;
    }
    return EngineState::Done;
}

const char* status_name(BackendOutcome::Status status) noexcept {
    switch (status) {
        case BackendOutcome::Status::Success:     return "success";
        case BackendOutcome::Status::Unavailable: return "unavailable";
        case BackendOutcome::Status::Failed:      return "failed";
    }
    return "unknown";
}

}  // namespace

const char* to_string(EngineState state) noexcept {
    switch (state) {
        case EngineState::Idle:         return "Idle";
        case EngineState::TryCloud:     return "TryCloud";
        case EngineState::TryLocal:     return "TryLocal";
        case EngineState::TryClassical: return "TryClassical";
        case EngineState::Done:         return "Done";
    }
    return "Unknown";
}

InpaintEngine::InpaintEngine(std::vector<std::unique_ptr<InpaintBackend>> backends)
    : backends_(std::move(backends)) {}

void InpaintEngine::add_backend(std::unique_ptr<InpaintBackend> backend) {
    if (backend) {
        backends_.push_back(std::move(backend));
    }
}

bool InpaintEngine::has_backend(BackendType type) const noexcept {
    return backend(type) != nullptr;
}

const InpaintBackend* InpaintEngine::backend(BackendType type) const noexcept {
    for (const auto& b : backends_) {
        if (b->type() == type) return b.get();
    }
    return nullptr;
}

EngineResult InpaintEngine::run(const cv::Mat& image, const cv::Mat& mask) {
    if (image.empty() || image.type() != CV_8UC3) {
        throw InvalidInputError("Engine expects a non-empty 8-bit BGR image");
    }
    if (mask.type() != CV_8UC1 || mask.size() != image.size()) {
        throw InvalidInputError("Engine expects a CV_8UC1 mask of the image size");
    }

    EngineResult result;
    if (!mask_bounding_box(mask)) {
        spdlog::info("Empty mask, returning input unchanged");
        result.image = image.clone();
        result.no_op = true;
        return result;
    }

    EngineState state = EngineState::Idle;
    for (size_t i = 0; i < backends_.size(); ++i) {
        InpaintBackend& backend = *backends_[i];
        const EngineState next = state_for(backend.type());
        spdlog::debug("Backend chain: {} -> {}", to_string(state), to_string(next));
        state = next;

        if (!backend.is_available()) {
            spdlog::info("Backend {} unavailable, skipping", to_string(backend.type()));
            result.attempts.push_back({backend.type(), BackendOutcome::Status::Unavailable,
                                       "not available"});
            continue;
        }

        BackendOutcome outcome = backend.attempt(image, mask);
        result.attempts.push_back({backend.type(), outcome.status, outcome.reason});

        if (outcome.ok()) {
            if (outcome.image.size() != image.size() || outcome.image.type() != image.type()) {
                spdlog::warn("Backend {} returned {}x{}, expected {}x{}; skipping",
                             to_string(backend.type()), outcome.image.cols, outcome.image.rows,
                             image.cols, image.rows);
                result.attempts.back().status = BackendOutcome::Status::Failed;
                result.attempts.back().reason = "output geometry mismatch";
                continue;
            }
            result.image = std::move(outcome.image);
            result.backend = backend.type();
            result.best_effort = backend.type() == BackendType::Classical;
            spdlog::debug("Backend chain: {} -> {}", to_string(state),
                          to_string(EngineState::Done));
            spdlog::info("Inpainted with {} backend{}", to_string(backend.type()),
                         result.best_effort ? " (best effort)" : "");
            return result;
        }

        spdlog::info("Backend {} {}: {}", to_string(backend.type()),
                     status_name(outcome.status), outcome.reason);
    }

    throw AllBackendsExhaustedError("No backend could inpaint the image (" +
                                    std::to_string(backends_.size()) + " tried)");
}

}  // namespace wit
