/**
 * @file    cloud_backend.cpp
 * @brief   Cloud Backend Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.10.14
 * @license MIT
 */

#include "backend/cloud_backend.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace wit {

CloudBackend::CloudBackend(std::unique_ptr<CloudClient> client,
                           CloudConfig config,
                           BlendConfig blend_config)
    : client_(std::move(client))
    , config_(std::move(config))
    , blender_(blend_config) {}

BackendOutcome CloudBackend::wait_for(const std::string& job_id,
                                      CloudClient::Deadline deadline) {
    using clock = std::chrono::steady_clock;

    int polls = 0;
    auto timed_out = [&polls]() {
        return BackendOutcome::failed("job timed out after " +
                                      std::to_string(polls) + " poll(s)");
    };

    while (true) {
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
            deadline - clock::now());
        if (remaining.count() <= 0) {
            return timed_out();
        }
        if (config_.poll_interval.count() > 0) {
            // Never sleep past the deadline
            std::this_thread::sleep_for(std::min(config_.poll_interval, remaining));
            if (clock::now() >= deadline) {
                return timed_out();
            }
        }

        JobStatus status = client_->poll(job_id, deadline);
        ++polls;

        if (status.state == JobState::Succeeded) {
            if (!status.output || status.output->empty()) {
                return BackendOutcome::failed("job succeeded without an image");
            }
            spdlog::debug("Cloud job {} succeeded after {} poll(s)", job_id, polls);
            return BackendOutcome::success(std::move(*status.output));
        }
        if (status.state == JobState::Failed) {
            return BackendOutcome::failed("job failed: " + status.error);
        }
    }
}

BackendOutcome CloudBackend::attempt(const cv::Mat& image, const cv::Mat& mask) {
    if (!client_) {
        return BackendOutcome::unavailable("cloud credential not configured");
    }

    auto start_time = std::chrono::high_resolution_clock::now();
    const auto deadline = std::chrono::steady_clock::now() + config_.timeout;
    try {
        cv::Mat binary = mask > 127;
        cv::Mat upload_image = image;
        cv::Mat upload_mask = binary;

        const int longest = std::max(image.cols, image.rows);
        if (config_.max_side > 0 && longest > config_.max_side) {
            const double ratio = static_cast<double>(config_.max_side) / longest;
            const cv::Size scaled(std::max(1, static_cast<int>(image.cols * ratio)),
                                  std::max(1, static_cast<int>(image.rows * ratio)));
            cv::resize(image, upload_image, scaled, 0, 0, cv::INTER_LANCZOS4);
            cv::resize(binary, upload_mask, scaled, 0, 0, cv::INTER_NEAREST);
            spdlog::debug("Cloud upload downscaled {}x{} -> {}x{}",
                          image.cols, image.rows, scaled.width, scaled.height);
        }

        const std::string job_id =
            client_->submit(upload_image, upload_mask, config_.prompt, deadline);
        BackendOutcome outcome = wait_for(job_id, deadline);
        if (!outcome.ok()) {
            spdlog::warn("Cloud inpaint failed: {}", outcome.reason);
            return outcome;
        }

        cv::Mat remote = std::move(outcome.image);
        if (remote.type() != CV_8UC3) {
            return BackendOutcome::failed("remote image is not 8-bit BGR");
        }
        if (remote.size() != image.size()) {
            cv::resize(remote, remote, image.size(), 0, 0, cv::INTER_LANCZOS4);
        }

        cv::Mat result = image.clone();
        blender_.blend(result, remote, mask, cv::Point(0, 0));

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time).count();
        spdlog::info("Cloud inpaint ({}x{}) in {} ms", image.cols, image.rows, duration);
        return BackendOutcome::success(std::move(result));

    } catch (const std::exception& e) {
        spdlog::warn("Cloud inpaint failed: {}", e.what());
        return BackendOutcome::failed(e.what());
    }
}

}  // namespace wit
