/**
 * @file    watermark_service.hpp
 * @brief   Request-level API: remove, detect, status
 * @author  AllenK (Kwyshell)
 * @date    2026.10.16
 * @license MIT
 *
 * @details
 * The service owns the backend chain and holds shared references to the
 * long-lived resources (loaded model, detector). Requests share nothing
 * mutable: each allocates its own image/mask buffers.
 */

#pragma once

#include "backend/cloud_client.hpp"
#include "config/app_config.hpp"
#include "core/errors.hpp"
#include "core/inpaint_engine.hpp"
#include "core/inpaint_model.hpp"
#include "core/mask_builder.hpp"
#include "core/region.hpp"
#include "detect/region_detector.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wit {

/**
 * Outcome of a removal request
 */
struct RemovalResult {
    bool success = false;
    std::vector<uint8_t> image;         // PNG bytes on success
    ErrorKind error = ErrorKind::None;
    std::string message;
    BackendType backend = BackendType::Classical;
    bool best_effort = false;
    bool no_op = false;
};

struct BackendStatus {
    std::string mode;
    bool local_loaded = false;
    bool cloud_available = false;
    bool detector_compiled = false;     // Detector implementation in this build
    bool detector_ready = false;        // Detector initialized for auto masks
};

class WatermarkService {
public:
    /**
     * @param model         Loaded (or unloaded) local model, may be null
     * @param detector      Region detector for auto masks, may be null
     * @param cloud_client  Remote client; ignored unless the cloud is configured
     */
    WatermarkService(AppConfig config,
                     std::shared_ptr<const InpaintModel> model,
                     std::shared_ptr<RegionDetector> detector,
                     std::unique_ptr<CloudClient> cloud_client);

    /**
     * Build a service from configuration: load the ONNX model, create the
     * detector and, in cloud mode with a token, the Replicate client
     */
    static std::unique_ptr<WatermarkService> create(const AppConfig& config);

    WatermarkService(const WatermarkService&) = delete;
    WatermarkService& operator=(const WatermarkService&) = delete;

    /**
     * Remove the watermark
     *
     * @param image_bytes  Encoded source image
     * @param mask_bytes   Encoded mask; absent = detect regions automatically
     */
    RemovalResult remove_watermark(const std::vector<uint8_t>& image_bytes,
                                   const std::optional<std::vector<uint8_t>>& mask_bytes = std::nullopt);

    /**
     * Same as remove_watermark(), run on a worker thread
     *
     * The task refers to this service: keep the service alive until every
     * returned future has been waited on.
     */
    std::future<RemovalResult> remove_watermark_async(std::vector<uint8_t> image_bytes,
                                                      std::optional<std::vector<uint8_t>> mask_bytes = std::nullopt);

    /**
     * Filtered, confidence-sorted detector regions; empty on undecodable
     * input or when no detector is available
     */
    std::vector<Region> detect_regions(const std::vector<uint8_t>& image_bytes);

    BackendStatus backend_status() const;

    /**
     * Decoded-image entry point (used by remove_watermark and tests)
     * @throws InvalidInputError, AllBackendsExhaustedError
     */
    EngineResult process(const cv::Mat& image, const std::optional<cv::Mat>& user_mask);

    const AppConfig& config() const noexcept { return config_; }

private:
    AppConfig config_;
    std::shared_ptr<const InpaintModel> model_;
    std::shared_ptr<RegionDetector> detector_;
    MaskBuilder mask_builder_;
    InpaintEngine engine_;
    bool cloud_available_ = false;

    void check_upload_size(size_t bytes, const char* what) const;
};

}  // namespace wit
