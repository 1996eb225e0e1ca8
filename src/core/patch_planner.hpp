/**
 * @file    patch_planner.hpp
 * @brief   Processing region and tile layout for fixed-size backends
 * @author  AllenK (Kwyshell)
 * @date    2026.09.07
 * @license MIT
 *
 * @details
 * The neural model only accepts S x S inputs. The planner turns an arbitrary
 * mask into a list of tiles so that:
 *   - each tile is S x S whenever the image is at least S in that dimension
 *     (smaller images yield a tile covering the whole dimension; the Tile
 *     Processor pads it)
 *   - the union of tiles covers every mask pixel > 127
 *   - tiles are ordered row-major, which fixes the compositing order
 */

#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <vector>

namespace wit {

struct PlannerConfig {
    int input_size = 512;              // Backend input size S
    int margin = 32;                   // Context added around the mask bbox
    int overlap = 64;                  // Overlap between neighbouring tiles
    int min_mask_pixels = 10;          // Below this the whole request is a no-op
    int min_tile_mask_pixels = 10;     // Sparser tiles are skipped if covered elsewhere
};

/**
 * One planned inference window in image coordinates
 */
struct TileSpec {
    cv::Rect rect;
    int mask_pixels = 0;    // Mask pixels > 127 inside rect
};

struct PlanResult {
    std::vector<TileSpec> tiles;
    cv::Rect mask_bbox;         // Tight bbox of mask pixels > 127
    cv::Rect processing_box;    // bbox after margin and minimum-size growth
    bool multi_tile = false;

    bool empty() const noexcept { return tiles.empty(); }
};

/**
 * Tight bounding box of mask pixels > 127, or nullopt for an empty mask
 */
std::optional<cv::Rect> mask_bounding_box(const cv::Mat& mask);

class PatchPlanner {
public:
    explicit PatchPlanner(PlannerConfig config = {});

    PlanResult plan(const cv::Size& image_size, const cv::Mat& mask) const;

    const PlannerConfig& config() const noexcept { return config_; }

private:
    PlannerConfig config_;

    cv::Rect expand_box(const cv::Rect& bbox, const cv::Size& image_size) const;
    std::vector<TileSpec> tile_box(const cv::Rect& box, const cv::Size& image_size,
                                   const cv::Mat& binary) const;
};

}  // namespace wit
