/**
 * @file    local_backend.hpp
 * @brief   Local neural backend: plan, infer per tile, feather-blend
 * @author  AllenK (Kwyshell)
 * @date    2026.09.18
 * @license MIT
 *
 * @details
 * The model handle is owned by the service and shared by reference count
 * between requests. A failure on any tile fails the whole attempt; tiles from
 * different backends are never mixed in one output.
 */

#pragma once

#include "backend/inpaint_backend.hpp"
#include "core/blender.hpp"
#include "core/inpaint_model.hpp"
#include "core/patch_planner.hpp"
#include "core/tile_processor.hpp"

#include <memory>

namespace wit {

class LocalBackend : public InpaintBackend {
public:
    LocalBackend(std::shared_ptr<const InpaintModel> model,
                 PlannerConfig planner_config,
                 TileProcessorConfig tile_config,
                 BlendConfig blend_config);

    BackendType type() const noexcept override { return BackendType::Local; }
    bool is_available() const noexcept override;

    BackendOutcome attempt(const cv::Mat& image, const cv::Mat& mask) override;

    /**
     * Run the tiled pipeline; throws on any tile failure
     */
    cv::Mat run(const cv::Mat& image, const cv::Mat& mask) const;

private:
    std::shared_ptr<const InpaintModel> model_;
    PlannerConfig planner_config_;
    TileProcessor tile_processor_;
    Blender blender_;
};

}  // namespace wit
