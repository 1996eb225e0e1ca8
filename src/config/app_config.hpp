/**
 * @file    app_config.hpp
 * @brief   Application configuration (JSON file + environment overrides)
 * @author  AllenK (Kwyshell)
 * @date    2026.10.15
 * @license MIT
 *
 * @details
 * Priority, highest first:
 *   1. Environment: WIT_AI_MODE, REPLICATE_API_TOKEN, WIT_MODEL_PATH,
 *      WIT_LOG_LEVEL
 *   2. JSON config file (sections below, every key optional)
 *   3. Defaults in this header
 *
 *   {
 *     "ai":        { "mode": "local" },
 *     "local":     { "model_path": "...", "input_size": 512, "output_scale": 1.0 },
 *     "cloud":     { "api_token": "...", "prompt": "...", "timeout_ms": 90000, ... },
 *     "mask":      { "region_padding": 10, "max_area_fraction": 0.15, ... },
 *     "planner":   { "margin": 32, "overlap": 64, ... },
 *     "blend":     { "feather_radius": 16 },
 *     "classical": { "radius": 3.0 },
 *     "limits":    { "max_upload_bytes": 10485760 },
 *     "detector":  { "enabled": true, "tessdata_path": "", "languages": "chi_sim+eng" },
 *     "log":       { "level": "info", "file": "" }
 *   }
 */

#pragma once

#include "backend/classical_backend.hpp"
#include "backend/cloud_backend.hpp"
#include "backend/replicate_client.hpp"
#include "core/blender.hpp"
#include "core/mask_builder.hpp"
#include "core/patch_planner.hpp"
#include "core/tile_processor.hpp"
#include "detect/region_detector.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace wit {

/**
 * Model run mode
 */
enum class AiMode {
    Local,   // Local neural model, classical fallback
    Cloud,   // Remote service first, then local, then classical
};

const char* to_string(AiMode mode) noexcept;
std::optional<AiMode> parse_ai_mode(const std::string& text);

struct LocalModelConfig {
    std::filesystem::path model_path = "models/lama_fp32.onnx";
    int input_size = 512;
    float output_scale = 1.0f;
};

struct LimitsConfig {
    size_t max_upload_bytes = 10 * 1024 * 1024;
};

struct LogConfig {
    std::string level = "info";
    std::string file;        // Empty = console only
};

struct AppConfig {
    AiMode mode = AiMode::Local;
    LocalModelConfig local;
    ReplicateConfig replicate;
    CloudConfig cloud;
    MaskConfig mask;
    PlannerConfig planner;
    BlendConfig blend;
    ClassicalConfig classical;
    LimitsConfig limits;
    DetectorConfig detector;
    LogConfig log;

    bool cloud_configured() const noexcept {
        return mode == AiMode::Cloud && !replicate.api_token.empty();
    }
};

/**
 * Parse configuration JSON text
 * @throws std::runtime_error on malformed JSON or invalid values
 */
AppConfig parse_config(const std::string& json_text);

/**
 * Load from file (missing file = defaults) and apply environment overrides
 * @throws std::runtime_error on malformed JSON or invalid values
 */
AppConfig load_config(const std::optional<std::filesystem::path>& path);

/**
 * Apply WIT_* / REPLICATE_API_TOKEN environment variables
 */
void apply_env_overrides(AppConfig& config);

}  // namespace wit
