/**
 * @file    app_config.cpp
 * @brief   Configuration Loader Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.10.15
 * @license MIT
 */

#include "config/app_config.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace wit {

namespace {

// section/key accessor with default; a present key of the wrong type is an error
template <typename T>
T json_get(const nlohmann::json& j, const char* section, const char* key, const T& def) {
    if (!j.contains(section) || !j[section].is_object() || !j[section].contains(key)) {
        return def;
    }
    try {
        return j[section][key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Config ") + section + "." + key + ": " + e.what());
    }
}

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string(value);
}

void validate(const AppConfig& c) {
    if (c.local.input_size <= 0) {
        throw std::runtime_error("local.input_size must be positive");
    }
    if (c.planner.overlap < 0 || c.planner.overlap >= c.local.input_size) {
        throw std::runtime_error("planner.overlap must be in [0, input_size)");
    }
    if (c.planner.margin < 0 || c.mask.region_padding < 0 || c.blend.feather_radius < 0) {
        throw std::runtime_error("margins, paddings and radii must be non-negative");
    }
    if (c.mask.max_area_fraction <= 0.0 || c.mask.max_area_fraction > 1.0) {
        throw std::runtime_error("mask.max_area_fraction must be in (0, 1]");
    }
    if (c.cloud.poll_interval.count() < 0 || c.cloud.timeout.count() < 0) {
        throw std::runtime_error("cloud timings must be non-negative");
    }
}

}  // namespace

const char* to_string(AiMode mode) noexcept {
    switch (mode) {
        case AiMode::Local: return "local";
        case AiMode::Cloud: return "cloud";
    }
    return "unknown";
}

std::optional<AiMode> parse_ai_mode(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "local") return AiMode::Local;
    if (lower == "cloud") return AiMode::Cloud;
    return std::nullopt;
}

AppConfig parse_config(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Config parse error: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    AppConfig c;

    const std::string mode = json_get<std::string>(j, "ai", "mode", to_string(c.mode));
    auto parsed_mode = parse_ai_mode(mode);
    if (!parsed_mode) {
        throw std::runtime_error("ai.mode must be one of local, cloud (got '" + mode + "')");
    }
    c.mode = *parsed_mode;

    c.local.model_path = json_get<std::string>(j, "local", "model_path", c.local.model_path.string());
    c.local.input_size = json_get<int>(j, "local", "input_size", c.local.input_size);
    c.local.output_scale = json_get<float>(j, "local", "output_scale", c.local.output_scale);

    c.replicate.api_base = json_get<std::string>(j, "cloud", "api_base", c.replicate.api_base);
    c.replicate.api_token = json_get<std::string>(j, "cloud", "api_token", c.replicate.api_token);
    c.replicate.model_version = json_get<std::string>(j, "cloud", "model_version", c.replicate.model_version);
    c.replicate.negative_prompt = json_get<std::string>(j, "cloud", "negative_prompt", c.replicate.negative_prompt);
    c.replicate.num_inference_steps = json_get<int>(j, "cloud", "num_inference_steps", c.replicate.num_inference_steps);
    c.replicate.guidance_scale = json_get<double>(j, "cloud", "guidance_scale", c.replicate.guidance_scale);
    c.replicate.request_timeout_s = json_get<int>(j, "cloud", "request_timeout_s", c.replicate.request_timeout_s);
    c.cloud.prompt = json_get<std::string>(j, "cloud", "prompt", c.cloud.prompt);
    c.cloud.max_side = json_get<int>(j, "cloud", "max_side", c.cloud.max_side);
    c.cloud.poll_interval = std::chrono::milliseconds(
        json_get<int64_t>(j, "cloud", "poll_interval_ms", c.cloud.poll_interval.count()));
    c.cloud.timeout = std::chrono::milliseconds(
        json_get<int64_t>(j, "cloud", "timeout_ms", c.cloud.timeout.count()));

    c.mask.region_padding = json_get<int>(j, "mask", "region_padding", c.mask.region_padding);
    c.mask.corner_blur_sigma = json_get<double>(j, "mask", "corner_blur_sigma", c.mask.corner_blur_sigma);
    c.mask.min_region_width = json_get<int>(j, "mask", "min_region_width", c.mask.min_region_width);
    c.mask.min_region_height = json_get<int>(j, "mask", "min_region_height", c.mask.min_region_height);
    c.mask.max_area_fraction = json_get<double>(j, "mask", "max_area_fraction", c.mask.max_area_fraction);
    c.mask.min_confidence = json_get<float>(j, "mask", "min_confidence", c.mask.min_confidence);
    c.mask.max_regions = json_get<int>(j, "mask", "max_regions", c.mask.max_regions);

    c.planner.margin = json_get<int>(j, "planner", "margin", c.planner.margin);
    c.planner.overlap = json_get<int>(j, "planner", "overlap", c.planner.overlap);
    c.planner.min_mask_pixels = json_get<int>(j, "planner", "min_mask_pixels", c.planner.min_mask_pixels);
    c.planner.min_tile_mask_pixels = json_get<int>(j, "planner", "min_tile_mask_pixels", c.planner.min_tile_mask_pixels);
    c.planner.input_size = c.local.input_size;

    c.blend.feather_radius = json_get<int>(j, "blend", "feather_radius", c.blend.feather_radius);
    c.classical.radius = json_get<double>(j, "classical", "radius", c.classical.radius);
    const int64_t upload_limit = json_get<int64_t>(j, "limits", "max_upload_bytes",
                                                   static_cast<int64_t>(c.limits.max_upload_bytes));
    if (upload_limit < 0) {
        throw std::runtime_error("limits.max_upload_bytes must be non-negative");
    }
    c.limits.max_upload_bytes = static_cast<size_t>(upload_limit);

    c.detector.enabled = json_get<bool>(j, "detector", "enabled", c.detector.enabled);
    c.detector.tessdata_path = json_get<std::string>(j, "detector", "tessdata_path", c.detector.tessdata_path);
    c.detector.languages = json_get<std::string>(j, "detector", "languages", c.detector.languages);

    c.log.level = json_get<std::string>(j, "log", "level", c.log.level);
    c.log.file = json_get<std::string>(j, "log", "file", c.log.file);

    validate(c);
    return c;
}

void apply_env_overrides(AppConfig& config) {
    if (auto mode = env("WIT_AI_MODE")) {
        auto parsed = parse_ai_mode(*mode);
        if (!parsed) {
            throw std::runtime_error("WIT_AI_MODE must be one of local, cloud (got '" + *mode + "')");
        }
        config.mode = *parsed;
    }
    if (auto token = env("REPLICATE_API_TOKEN")) {
        config.replicate.api_token = *token;
    }
    if (auto path = env("WIT_MODEL_PATH")) {
        config.local.model_path = *path;
    }
    if (auto level = env("WIT_LOG_LEVEL")) {
        config.log.level = *level;
    }
}

AppConfig load_config(const std::optional<std::filesystem::path>& path) {
    AppConfig config;

    if (path) {
        std::ifstream file(*path);
        if (file.is_open()) {
            std::stringstream buffer;
            buffer << file.rdbuf();
            config = parse_config(buffer.str());
        } else {
            spdlog::warn("Config file not found: {}, using defaults", *path);
        }
    }

    apply_env_overrides(config);
    return config;
}

}  // namespace wit
