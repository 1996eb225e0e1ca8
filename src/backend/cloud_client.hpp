/**
 * @file    cloud_client.hpp
 * @brief   Remote inpainting job API
 * @author  AllenK (Kwyshell)
 * @date    2026.09.24
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace wit {

enum class JobState {
    Pending,
    Succeeded,
    Failed,
};

struct JobStatus {
    JobState state = JobState::Pending;
    std::optional<cv::Mat> output;     // Decoded BGR image when Succeeded
    std::string error;                 // Remote error text when Failed
};

/**
 * Submit/poll interface of a remote inpainting service
 *
 * Transport problems throw std::runtime_error. Every call gets the deadline
 * of the whole cloud attempt and must not block past it.
 */
class CloudClient {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    virtual ~CloudClient() = default;

    /**
     * @param image     CV_8UC3 BGR image
     * @param mask      CV_8UC1 binary mask (255 = repaint)
     * @param prompt    Text prompt for the diffusion model
     * @param deadline  End of the attempt's time budget
     * @return          Remote job id
     */
    virtual std::string submit(const cv::Mat& image,
                               const cv::Mat& mask,
                               const std::string& prompt,
                               Deadline deadline) = 0;

    virtual JobStatus poll(const std::string& job_id, Deadline deadline) = 0;
};

}  // namespace wit
