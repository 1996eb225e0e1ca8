/**
 * @file    tile_processor.hpp
 * @brief   Tensor bookkeeping around a single inference call
 * @author  AllenK (Kwyshell)
 * @date    2026.09.10
 * @license MIT
 *
 * @details
 * Input layout (LaMa convention):
 *   image: 1 x 3 x S x S, RGB order, values in [0, 1]
 *   mask:  1 x 1 x S x S, values in {0, 1}
 * Crops smaller than S are padded bottom/right: reflection for pixels, zero
 * for the mask. The output is cropped back to the crop size.
 */

#pragma once

#include "core/inpaint_model.hpp"
#include "core/tensor.hpp"

#include <opencv2/core.hpp>

namespace wit {

struct TileProcessorConfig {
    float output_scale = 1.0f;    // LaMa emits 0..255; use 255 for [0,1] models
};

struct InferenceResult {
    Tensor raw;                 // Model output as returned
    cv::Size input_size;        // Padded size fed to the model (S x S)
    cv::Size crop_size;         // Size of the tile actually produced
    cv::Mat pixels;             // CV_8UC3 BGR, crop_size
};

class TileProcessor {
public:
    explicit TileProcessor(TileProcessorConfig config = {});

    /**
     * Run one tile through the model
     *
     * @param image_crop  CV_8UC3 BGR crop, at most S x S
     * @param mask_crop   CV_8UC1 crop of the same size
     * @param model       Loaded model
     * @throws std::invalid_argument on geometry mismatch, anything the model throws
     */
    InferenceResult process(const cv::Mat& image_crop,
                            const cv::Mat& mask_crop,
                            const InpaintModel& model) const;

    // Exposed for tests
    static Tensor to_image_tensor(const cv::Mat& bgr);
    static Tensor to_mask_tensor(const cv::Mat& mask);
    cv::Mat to_pixels(const Tensor& output, const cv::Size& crop_size) const;

private:
    TileProcessorConfig config_;
};

}  // namespace wit
