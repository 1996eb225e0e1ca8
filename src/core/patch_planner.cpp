/**
 * @file    patch_planner.cpp
 * @brief   Patch Planner Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.07
 * @license MIT
 */

#include "core/patch_planner.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace wit {

namespace {

// Grow [start, start+length) to at least `target` around its centre,
// shifting back inside [0, limit) instead of truncating at an edge.
void grow_span(int& start, int& length, int target, int limit) {
    if (length >= target) return;
    if (limit <= target) {
        start = 0;
        length = limit;
        return;
    }
    const int center = start + length / 2;
    start = std::clamp(center - target / 2, 0, limit - target);
    length = target;
}

// Tile origins along one axis: raster from box start with `step` until a
// tile reaches the box end, each origin clamped so the tile stays inside
// the image.
std::vector<int> tile_origins(int box_start, int box_length, int tile, int step, int limit) {
    std::vector<int> origins;
    const int box_end = box_start + box_length;
    for (int pos = box_start; pos < box_end; pos += step) {
        if (!origins.empty() && origins.back() + tile >= box_end) break;
        int origin = pos;
        if (origin + tile > limit) {
            origin = std::max(0, limit - tile);
        }
        if (origins.empty() || origins.back() != origin) {
            origins.push_back(origin);
        }
    }
    return origins;
}

}  // namespace

std::optional<cv::Rect> mask_bounding_box(const cv::Mat& mask) {
    if (mask.empty()) return std::nullopt;

    cv::Mat binary = mask > 127;
    if (cv::countNonZero(binary) == 0) return std::nullopt;
    return cv::boundingRect(binary);
}

PatchPlanner::PatchPlanner(PlannerConfig config)
    : config_(config) {
    if (config_.input_size <= 0) {
        throw std::invalid_argument("Planner input size must be positive");
    }
    if (config_.overlap < 0 || config_.overlap >= config_.input_size) {
        throw std::invalid_argument("Planner overlap must be in [0, input_size)");
    }
}

PlanResult PatchPlanner::plan(const cv::Size& image_size, const cv::Mat& mask) const {
    PlanResult result;
    if (mask.empty() || mask.size() != image_size || mask.type() != CV_8UC1) {
        throw std::invalid_argument("Planner needs a CV_8UC1 mask of the image size");
    }

    cv::Mat binary = mask > 127;
    const int total = cv::countNonZero(binary);
    if (total == 0 || total < config_.min_mask_pixels) {
        spdlog::debug("Mask has {} active pixels, nothing to plan", total);
        return result;
    }

    result.mask_bbox = cv::boundingRect(binary);
    result.processing_box = expand_box(result.mask_bbox, image_size);

    const int S = config_.input_size;
    const cv::Rect& box = result.processing_box;
    result.multi_tile = box.width > S || box.height > S;

    if (!result.multi_tile) {
        TileSpec tile;
        tile.rect = box;
        tile.mask_pixels = cv::countNonZero(binary(box));
        result.tiles.push_back(tile);
    } else {
        result.tiles = tile_box(box, image_size, binary);
    }

    spdlog::debug("Plan: bbox ({},{}) {}x{} -> box ({},{}) {}x{}, {} tile(s){}",
                  result.mask_bbox.x, result.mask_bbox.y,
                  result.mask_bbox.width, result.mask_bbox.height,
                  box.x, box.y, box.width, box.height,
                  result.tiles.size(), result.multi_tile ? " [tiled]" : "");
    return result;
}

cv::Rect PatchPlanner::expand_box(const cv::Rect& bbox, const cv::Size& image_size) const {
    const cv::Rect bounds(0, 0, image_size.width, image_size.height);
    const int m = config_.margin;

    cv::Rect box(bbox.x - m, bbox.y - m, bbox.width + 2 * m, bbox.height + 2 * m);
    box &= bounds;

    grow_span(box.x, box.width, config_.input_size, image_size.width);
    grow_span(box.y, box.height, config_.input_size, image_size.height);
    return box;
}

std::vector<TileSpec> PatchPlanner::tile_box(const cv::Rect& box,
                                             const cv::Size& image_size,
                                             const cv::Mat& binary) const {
    const int S = config_.input_size;
    const int step = S - config_.overlap;
    const std::vector<int> ys = tile_origins(box.y, box.height, S, step, image_size.height);
    const std::vector<int> xs = tile_origins(box.x, box.width, S, step, image_size.width);
    const cv::Rect bounds(0, 0, image_size.width, image_size.height);

    std::vector<TileSpec> candidates;
    candidates.reserve(xs.size() * ys.size());
    for (int y : ys) {
        for (int x : xs) {
            TileSpec tile;
            tile.rect = cv::Rect(x, y, S, S) & bounds;
            tile.mask_pixels = cv::countNonZero(binary(tile.rect));
            if (tile.mask_pixels > 0) {
                candidates.push_back(tile);
            }
        }
    }

    // Dense tiles are always kept; a sparse tile survives only if it owns
    // mask pixels no dense tile covers.
    cv::Mat covered = cv::Mat::zeros(binary.size(), CV_8UC1);
    for (const auto& tile : candidates) {
        if (tile.mask_pixels >= config_.min_tile_mask_pixels) {
            covered(tile.rect).setTo(255);
        }
    }

    std::vector<TileSpec> tiles;
    int skipped = 0;
    for (const auto& tile : candidates) {
        if (tile.mask_pixels < config_.min_tile_mask_pixels) {
            cv::Mat uncovered;
            cv::bitwise_and(binary(tile.rect), ~covered(tile.rect), uncovered);
            if (cv::countNonZero(uncovered) == 0) {
                ++skipped;
                continue;
            }
        }
        tiles.push_back(tile);
    }

    if (skipped > 0) {
        spdlog::debug("Skipped {} sparse tile(s) already covered by neighbours", skipped);
    }
    return tiles;
}

}  // namespace wit
