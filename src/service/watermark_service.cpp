/**
 * @file    watermark_service.cpp
 * @brief   Watermark Service Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.10.16
 * @license MIT
 */

#include "service/watermark_service.hpp"
#include "backend/classical_backend.hpp"
#include "backend/cloud_backend.hpp"
#include "backend/local_backend.hpp"
#include "backend/onnx_inpaint_model.hpp"
#include "backend/replicate_client.hpp"
#include "utils/image_io.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <chrono>

namespace wit {

WatermarkService::WatermarkService(AppConfig config,
                                   std::shared_ptr<const InpaintModel> model,
                                   std::shared_ptr<RegionDetector> detector,
                                   std::unique_ptr<CloudClient> cloud_client)
    : config_(std::move(config))
    , model_(std::move(model))
    , detector_(std::move(detector))
    , mask_builder_(config_.mask) {

    if (config_.cloud_configured() && cloud_client) {
        cloud_available_ = true;
        engine_.add_backend(std::make_unique<CloudBackend>(
            std::move(cloud_client), config_.cloud, config_.blend));
    } else if (config_.mode == AiMode::Cloud) {
        spdlog::warn("Cloud mode selected but REPLICATE_API_TOKEN is not set");
    }

    TileProcessorConfig tile_config;
    tile_config.output_scale = config_.local.output_scale;
    engine_.add_backend(std::make_unique<LocalBackend>(
        model_, config_.planner, tile_config, config_.blend));

    engine_.add_backend(std::make_unique<ClassicalBackend>(config_.classical));

    spdlog::info("Watermark service ready (mode: {}, local: {}, cloud: {})",
                 to_string(config_.mode),
                 model_ && model_->is_loaded() ? "loaded" : "not loaded",
                 cloud_available_ ? "enabled" : "disabled");
}

std::unique_ptr<WatermarkService> WatermarkService::create(const AppConfig& config) {
    auto model = std::make_shared<OnnxInpaintModel>(config.local.input_size);
    if (model->load(config.local.model_path)) {
        spdlog::info("Local model ready ({}x{}, providers: {})", model->input_size(),
                     model->input_size(), fmt::join(model->providers(), ", "));
    } else {
        spdlog::warn("Local model unavailable, local backend disabled");
    }

    std::unique_ptr<CloudClient> cloud_client;
    if (config.cloud_configured()) {
        cloud_client = std::make_unique<ReplicateClient>(config.replicate);
    }

    return std::make_unique<WatermarkService>(
        config,
        std::move(model),
        create_region_detector(config.detector),
        std::move(cloud_client));
}

void WatermarkService::check_upload_size(size_t bytes, const char* what) const {
    if (config_.limits.max_upload_bytes > 0 && bytes > config_.limits.max_upload_bytes) {
        throw InvalidInputError(std::string(what) + " exceeds upload limit (" +
                                std::to_string(bytes) + " > " +
                                std::to_string(config_.limits.max_upload_bytes) + " bytes)");
    }
}

EngineResult WatermarkService::process(const cv::Mat& image, const std::optional<cv::Mat>& user_mask) {
    cv::Mat mask;
    if (user_mask) {
        mask = mask_builder_.build(image.size(), user_mask);
    } else if (detector_) {
        std::optional<std::vector<Region>> regions;
        try {
            regions = detector_->detect(image);
            spdlog::debug("Detector returned {} region(s)", regions->size());
        } catch (const std::exception& e) {
            spdlog::warn("Region detection failed, using empty mask: {}", e.what());
        }
        mask = mask_builder_.build(image.size(), std::nullopt, regions);
    } else {
        spdlog::info("No mask and no detector, nothing to remove");
        mask = mask_builder_.build(image.size(), std::nullopt);
    }

    return engine_.run(image, mask);
}

RemovalResult WatermarkService::remove_watermark(
    const std::vector<uint8_t>& image_bytes,
    const std::optional<std::vector<uint8_t>>& mask_bytes) {

    RemovalResult result;
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        check_upload_size(image_bytes.size(), "Image");
        if (mask_bytes) {
            check_upload_size(mask_bytes->size(), "Mask");
        }

        cv::Mat image = decode_image(image_bytes);
        std::optional<cv::Mat> user_mask;
        if (mask_bytes) {
            user_mask = decode_mask(*mask_bytes);
        }

        spdlog::info("Removing watermark from {}x{} image ({} mask)",
                     image.cols, image.rows, user_mask ? "user" : "auto");

        EngineResult engine_result = process(image, user_mask);

        result.image = encode_image(engine_result.image, ".png");
        result.success = true;
        result.backend = engine_result.backend;
        result.best_effort = engine_result.best_effort;
        result.no_op = engine_result.no_op;
        result.message = engine_result.no_op ? "nothing to remove" : "done";

    } catch (const InvalidInputError& e) {
        spdlog::error("Invalid input: {}", e.what());
        result.error = ErrorKind::InvalidInput;
        result.message = e.what();
    } catch (const AllBackendsExhaustedError& e) {
        spdlog::error("Removal failed: {}", e.what());
        result.error = ErrorKind::AllBackendsExhausted;
        result.message = e.what();
    } catch (const std::exception& e) {
        spdlog::error("Removal failed: {}", e.what());
        result.error = ErrorKind::Internal;
        result.message = e.what();
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::debug("Request finished in {} ms ({})", duration,
                  result.success ? "ok" : to_string(result.error));
    return result;
}

std::future<RemovalResult> WatermarkService::remove_watermark_async(
    std::vector<uint8_t> image_bytes,
    std::optional<std::vector<uint8_t>> mask_bytes) {
    return std::async(std::launch::async,
        [this, image = std::move(image_bytes), mask = std::move(mask_bytes)]() {
            return remove_watermark(image, mask);
        });
}

std::vector<Region> WatermarkService::detect_regions(const std::vector<uint8_t>& image_bytes) {
    if (!detector_) {
        spdlog::debug("detect_regions called without a detector");
        return {};
    }

    try {
        check_upload_size(image_bytes.size(), "Image");
        cv::Mat image = decode_image(image_bytes);
        std::vector<Region> regions = mask_builder_.filter_regions(image.size(), detector_->detect(image));
        for (const auto& r : regions) {
            spdlog::debug("  - '{}' conf={:.2f} pos=({},{}) size={}x{}",
                          r.text.value_or(""), r.confidence, r.x, r.y, r.width, r.height);
        }
        return regions;
    } catch (const std::exception& e) {
        spdlog::warn("Region detection failed: {}", e.what());
        return {};
    }
}

BackendStatus WatermarkService::backend_status() const {
    BackendStatus status;
    status.mode = to_string(config_.mode);
    status.local_loaded = model_ && model_->is_loaded();
    status.cloud_available = cloud_available_;
    status.detector_compiled = is_detector_available();
    status.detector_ready = detector_ != nullptr;
    return status;
}

}  // namespace wit
