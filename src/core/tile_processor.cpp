/**
 * @file    tile_processor.cpp
 * @brief   Tile Processor Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.10
 * @license MIT
 */

#include "core/tile_processor.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace wit {

TileProcessor::TileProcessor(TileProcessorConfig config)
    : config_(config) {}

Tensor TileProcessor::to_image_tensor(const cv::Mat& bgr) {
    CV_Assert(bgr.type() == CV_8UC3);
    const int H = bgr.rows;
    const int W = bgr.cols;
    Tensor tensor({1, 3, H, W});

    cv::Mat rgb_f;
    cv::cvtColor(bgr, rgb_f, cv::COLOR_BGR2RGB);
    rgb_f.convertTo(rgb_f, CV_32FC3, 1.0 / 255.0);

    // HWC -> CHW: split writes straight into the tensor planes
    const size_t plane = static_cast<size_t>(H) * W;
    std::vector<cv::Mat> planes;
    for (int c = 0; c < 3; ++c) {
        planes.emplace_back(H, W, CV_32FC1, tensor.data.data() + c * plane);
    }
    cv::split(rgb_f, planes);
    return tensor;
}

Tensor TileProcessor::to_mask_tensor(const cv::Mat& mask) {
    CV_Assert(mask.type() == CV_8UC1);
    Tensor tensor({1, 1, mask.rows, mask.cols});

    cv::Mat view(mask.rows, mask.cols, CV_32FC1, tensor.data.data());
    cv::Mat binary = mask > 127;
    binary.convertTo(view, CV_32FC1, 1.0 / 255.0);
    return tensor;
}

cv::Mat TileProcessor::to_pixels(const Tensor& output, const cv::Size& crop_size) const {
    if (output.shape.size() != 4 || output.shape[0] != 1 || output.shape[1] != 3) {
        throw std::runtime_error("Unexpected model output rank/channels");
    }
    const int H = static_cast<int>(output.shape[2]);
    const int W = static_cast<int>(output.shape[3]);
    if (H < crop_size.height || W < crop_size.width) {
        throw std::runtime_error("Model output smaller than the tile");
    }
    if (output.data.size() != static_cast<size_t>(3) * H * W) {
        throw std::runtime_error("Model output size does not match its shape");
    }

    const size_t plane = static_cast<size_t>(H) * W;
    std::vector<cv::Mat> planes;
    // RGB planes merged in reverse yield BGR
    for (int c = 2; c >= 0; --c) {
        planes.emplace_back(H, W, CV_32FC1,
                            const_cast<float*>(output.data.data()) + c * plane);
    }
    cv::Mat bgr_f;
    cv::merge(planes, bgr_f);

    cv::Mat pixels;
    // convertTo saturates to [0, 255] and rounds
    bgr_f(cv::Rect(0, 0, crop_size.width, crop_size.height))
        .convertTo(pixels, CV_8UC3, config_.output_scale);
    return pixels;
}

InferenceResult TileProcessor::process(const cv::Mat& image_crop,
                                       const cv::Mat& mask_crop,
                                       const InpaintModel& model) const {
    if (image_crop.empty() || image_crop.type() != CV_8UC3) {
        throw std::invalid_argument("Tile image must be non-empty CV_8UC3");
    }
    if (mask_crop.type() != CV_8UC1 || mask_crop.size() != image_crop.size()) {
        throw std::invalid_argument("Tile mask must be CV_8UC1 matching the image crop");
    }

    const int S = model.input_size();
    const cv::Size crop_size = image_crop.size();
    if (crop_size.width > S || crop_size.height > S) {
        throw std::invalid_argument("Tile larger than model input size");
    }

    cv::Mat image_in = image_crop;
    cv::Mat mask_in = mask_crop;
    if (crop_size.width < S || crop_size.height < S) {
        const int pad_bottom = S - crop_size.height;
        const int pad_right = S - crop_size.width;
        spdlog::debug("Padding tile {}x{} -> {}x{}", crop_size.width, crop_size.height, S, S);
        cv::copyMakeBorder(image_crop, image_in, 0, pad_bottom, 0, pad_right,
                           cv::BORDER_REFLECT_101);
        cv::copyMakeBorder(mask_crop, mask_in, 0, pad_bottom, 0, pad_right,
                           cv::BORDER_CONSTANT, cv::Scalar(0));
    }

    const Tensor image_tensor = to_image_tensor(image_in);
    const Tensor mask_tensor = to_mask_tensor(mask_in);

    InferenceResult result;
    result.raw = model.infer(image_tensor, mask_tensor);
    result.input_size = cv::Size(S, S);
    result.crop_size = crop_size;
    result.pixels = to_pixels(result.raw, crop_size);
    return result;
}

}  // namespace wit
