/**
 * @file    replicate_client.hpp
 * @brief   CloudClient for the Replicate predictions API
 * @author  AllenK (Kwyshell)
 * @date    2026.10.14
 * @license MIT
 *
 * @details
 * POST {api_base}/v1/predictions   -> 201 {"id": ...}
 * GET  {api_base}/v1/predictions/ID -> {"status": "starting|processing|
 *                                       succeeded|failed|canceled",
 *                                       "output": url | [url, ...],
 *                                       "error": ...}
 * Images travel as PNG data: URIs.
 */

#pragma once

#include "backend/cloud_client.hpp"
#include "utils/http_client.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace wit {

struct ReplicateConfig {
    std::string api_base = "https://api.replicate.com";
    std::string api_token;
    std::string model_version =
        "95b7223104132402a9ae91cc677285bc5eb997834bd2349fa486f53910fd68b3";
    std::string negative_prompt = "watermark, text, logo, blurry, low quality";
    int num_inference_steps = 30;
    double guidance_scale = 7.5;
    int request_timeout_s = 180;
};

class ReplicateClient : public CloudClient {
public:
    explicit ReplicateClient(ReplicateConfig config);

    std::string submit(const cv::Mat& image,
                       const cv::Mat& mask,
                       const std::string& prompt,
                       Deadline deadline) override;

    JobStatus poll(const std::string& job_id, Deadline deadline) override;

    /**
     * Build the prediction request body (exposed for tests)
     */
    std::string build_request_body(const cv::Mat& image,
                                   const cv::Mat& mask,
                                   const std::string& prompt) const;

    /**
     * Parse a prediction status document; output stays unset, the URL is
     * returned through `output_url`
     */
    static JobStatus parse_status(const std::string& body, std::string& output_url);

    /**
     * Time left before `deadline`, used as the per-request timeout
     * @throws std::runtime_error when the deadline has passed
     */
    static std::chrono::milliseconds time_left(Deadline deadline);

private:
    ReplicateConfig config_;
    HttpClient http_;

    std::vector<std::string> auth_headers(bool json) const;
};

}  // namespace wit
