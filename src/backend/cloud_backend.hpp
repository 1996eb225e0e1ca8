/**
 * @file    cloud_backend.hpp
 * @brief   Remote diffusion inpainting with bounded polling
 * @author  AllenK (Kwyshell)
 * @date    2026.10.14
 * @license MIT
 *
 * @details
 * The whole image is sent in one job (no tiling). Large images are
 * downscaled to max_side before upload and the result is scaled back. The
 * remote output is composited over the source through the feathered full
 * mask, so pixels away from the mask keep their original values.
 *
 * `timeout` bounds the whole attempt: submit, polling waits and every
 * client call.
 */

#pragma once

#include "backend/cloud_client.hpp"
#include "backend/inpaint_backend.hpp"
#include "core/blender.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace wit {

struct CloudConfig {
    std::string prompt = "clean background, seamless, high quality, detailed";
    int max_side = 1024;
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds timeout{90000};
};

class CloudBackend : public InpaintBackend {
public:
    /**
     * @param client  Null when no credential is configured
     */
    CloudBackend(std::unique_ptr<CloudClient> client,
                 CloudConfig config,
                 BlendConfig blend_config);

    BackendType type() const noexcept override { return BackendType::Cloud; }
    bool is_available() const noexcept override { return client_ != nullptr; }

    BackendOutcome attempt(const cv::Mat& image, const cv::Mat& mask) override;

private:
    std::unique_ptr<CloudClient> client_;
    CloudConfig config_;
    Blender blender_;

    BackendOutcome wait_for(const std::string& job_id, CloudClient::Deadline deadline);
};

}  // namespace wit
