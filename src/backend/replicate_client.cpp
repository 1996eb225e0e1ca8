/**
 * @file    replicate_client.cpp
 * @brief   Replicate Client Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.10.14
 * @license MIT
 */

#include "backend/replicate_client.hpp"
#include "utils/base64.hpp"
#include "utils/image_io.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace wit {

ReplicateClient::ReplicateClient(ReplicateConfig config)
    : config_(std::move(config))
    , http_(std::chrono::seconds(config_.request_timeout_s)) {}

std::vector<std::string> ReplicateClient::auth_headers(bool json) const {
    std::vector<std::string> headers{"Authorization: Bearer " + config_.api_token};
    if (json) {
        headers.emplace_back("Content-Type: application/json");
    }
    return headers;
}

std::string ReplicateClient::build_request_body(const cv::Mat& image,
                                                const cv::Mat& mask,
                                                const std::string& prompt) const {
    nlohmann::json body;
    body["version"] = config_.model_version;
    body["input"] = {
        {"image", make_data_uri("image/png", encode_image(image, ".png"))},
        {"mask", make_data_uri("image/png", encode_image(mask, ".png"))},
        {"prompt", prompt},
        {"negative_prompt", config_.negative_prompt},
        {"num_inference_steps", config_.num_inference_steps},
        {"guidance_scale", config_.guidance_scale},
    };
    return body.dump();
}

std::chrono::milliseconds ReplicateClient::time_left(Deadline deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
        throw std::runtime_error("Cloud deadline exceeded");
    }
    return left;
}

std::string ReplicateClient::submit(const cv::Mat& image,
                                    const cv::Mat& mask,
                                    const std::string& prompt,
                                    Deadline deadline) {
    const std::string body = build_request_body(image, mask, prompt);
    HttpResponse response = http_.post(config_.api_base + "/v1/predictions",
                                       body, auth_headers(true), time_left(deadline));
    if (response.status != 201) {
        throw std::runtime_error("Prediction submit returned HTTP " +
                                 std::to_string(response.status));
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        std::string id = j.at("id").get<std::string>();
        spdlog::info("Submitted cloud prediction {}", id);
        return id;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed submit response: ") + e.what());
    }
}

JobStatus ReplicateClient::parse_status(const std::string& body, std::string& output_url) {
    JobStatus status;
    output_url.clear();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed status response: ") + e.what());
    }

    const std::string state = j.value("status", "");
    if (state == "succeeded") {
        status.state = JobState::Succeeded;
        if (j.contains("output")) {
            const auto& output = j["output"];
            if (output.is_string()) {
                output_url = output.get<std::string>();
            } else if (output.is_array() && !output.empty() && output[0].is_string()) {
                output_url = output[0].get<std::string>();
            }
        }
        if (output_url.empty()) {
            // Succeeded without output is useless to us
            status.state = JobState::Failed;
            status.error = "prediction succeeded without output";
        }
    } else if (state == "failed" || state == "canceled") {
        status.state = JobState::Failed;
        if (j.contains("error") && j["error"].is_string()) {
            status.error = j["error"].get<std::string>();
        } else {
            status.error = "prediction " + state;
        }
    } else {
        status.state = JobState::Pending;
    }
    return status;
}

JobStatus ReplicateClient::poll(const std::string& job_id, Deadline deadline) {
    HttpResponse response = http_.get(config_.api_base + "/v1/predictions/" + job_id,
                                      auth_headers(false), time_left(deadline));
    if (response.status != 200) {
        throw std::runtime_error("Prediction status returned HTTP " +
                                 std::to_string(response.status));
    }

    std::string output_url;
    JobStatus status = parse_status(response.body, output_url);
    if (status.state != JobState::Succeeded) {
        return status;
    }

    HttpResponse image = http_.get(output_url, {}, time_left(deadline));
    if (image.status != 200) {
        throw std::runtime_error("Output download returned HTTP " +
                                 std::to_string(image.status));
    }
    std::vector<uint8_t> bytes(image.body.begin(), image.body.end());
    status.output = decode_image(bytes);
    return status;
}

}  // namespace wit
