/**
 * @file    local_backend.cpp
 * @brief   Local Backend Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.18
 * @license MIT
 */

#include "backend/local_backend.hpp"

#include <spdlog/spdlog.h>
#include <chrono>

namespace wit {

LocalBackend::LocalBackend(std::shared_ptr<const InpaintModel> model,
                           PlannerConfig planner_config,
                           TileProcessorConfig tile_config,
                           BlendConfig blend_config)
    : model_(std::move(model))
    , planner_config_(planner_config)
    , tile_processor_(tile_config)
    , blender_(blend_config) {}

bool LocalBackend::is_available() const noexcept {
    return model_ && model_->is_loaded();
}

cv::Mat LocalBackend::run(const cv::Mat& image, const cv::Mat& mask) const {
    // The model dictates S; the remaining knobs come from configuration
    PlannerConfig planner_config = planner_config_;
    planner_config.input_size = model_->input_size();
    const PatchPlanner planner(planner_config);

    const PlanResult plan = planner.plan(image.size(), mask);
    cv::Mat result = image.clone();
    if (plan.empty()) {
        return result;
    }

    size_t index = 0;
    for (const auto& tile : plan.tiles) {
        ++index;
        const cv::Mat image_crop = image(tile.rect);
        const cv::Mat mask_crop = mask(tile.rect);

        spdlog::debug("Tile {}/{} at ({},{}) {}x{}, {} mask px",
                      index, plan.tiles.size(), tile.rect.x, tile.rect.y,
                      tile.rect.width, tile.rect.height, tile.mask_pixels);

        // Inference reads the untouched source; blending accumulates
        InferenceResult inferred = tile_processor_.process(image_crop, mask_crop, *model_);
        blender_.blend(result, inferred.pixels, mask_crop, tile.rect.tl());
    }
    return result;
}

BackendOutcome LocalBackend::attempt(const cv::Mat& image, const cv::Mat& mask) {
    if (!is_available()) {
        return BackendOutcome::unavailable("local model not loaded");
    }

    auto start_time = std::chrono::high_resolution_clock::now();
    try {
        cv::Mat result = run(image, mask);

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time).count();
        spdlog::info("Local inpaint ({}x{}) in {} ms", image.cols, image.rows, duration);
        return BackendOutcome::success(std::move(result));
    } catch (const std::exception& e) {
        spdlog::warn("Local inpaint failed: {}", e.what());
        return BackendOutcome::failed(e.what());
    }
}

}  // namespace wit
