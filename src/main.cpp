/**
 * @file    main.cpp
 * @brief   Watermark Inpaint Tool - command line entry point
 * @author  AllenK (Kwyshell)
 * @date    2026.10.16
 * @license MIT
 *
 * @details
 * Usage:
 *   wit remove <input> [-o <output>] [--mask <mask>] [options]
 *   wit detect <input> [options]
 *   wit status [options]
 *
 * Options:
 *   -c, --config <file>   JSON configuration (default: wit.json if present)
 *   -v, --verbose         Debug logging
 */

#include "config/app_config.hpp"
#include "service/watermark_service.hpp"
#include "utils/image_io.hpp"
#include "utils/logging.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CliOptions {
    std::string command;
    std::filesystem::path input;
    std::optional<std::filesystem::path> output;
    std::optional<std::filesystem::path> mask;
    std::optional<std::filesystem::path> config;
    bool verbose = false;
};

void print_usage() {
    fmt::print(stderr,
        "Usage:\n"
        "  wit remove <input> [-o <output>] [--mask <mask>] [-c <config>] [-v]\n"
        "  wit detect <input> [-c <config>] [-v]\n"
        "  wit status [-c <config>] [-v]\n");
}

std::optional<CliOptions> parse_args(int argc, char** argv) {
    if (argc < 2) return std::nullopt;

    CliOptions opts;
    opts.command = argv[1];
    if (opts.command != "remove" && opts.command != "detect" && opts.command != "status") {
        return std::nullopt;
    }

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "-o" || arg == "--output") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.output = *v;
        } else if (arg == "-m" || arg == "--mask") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.mask = *v;
        } else if (arg == "-c" || arg == "--config") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.config = *v;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return std::nullopt;
        } else if (opts.input.empty()) {
            opts.input = arg;
        } else {
            return std::nullopt;
        }
    }

    if (opts.command != "status" && opts.input.empty()) {
        return std::nullopt;
    }
    return opts;
}

int run_remove(wit::WatermarkService& service, const CliOptions& opts) {
    const std::filesystem::path output = opts.output.value_or(
        wit::with_suffix(opts.input, "_clean", ".png"));

    std::optional<std::vector<uint8_t>> mask_bytes;
    if (opts.mask) {
        mask_bytes = wit::read_file_bytes(*opts.mask);
    }

    spdlog::info("Processing: {}", opts.input.filename());
    wit::RemovalResult result = service.remove_watermark(wit::read_file_bytes(opts.input), mask_bytes);
    if (!result.success) {
        spdlog::error("Failed ({}): {}", wit::to_string(result.error), result.message);
        return 1;
    }

    // Service output is PNG; re-encode when another format was requested
    std::string ext = output.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".png") {
        wit::write_file_bytes(output, result.image);
    } else {
        cv::Mat decoded = wit::decode_image(result.image);
        wit::write_file_bytes(output, wit::encode_image(decoded, ext.empty() ? ".png" : ext));
    }

    spdlog::info("Saved: {} ({}{})", output.filename(),
                 result.no_op ? "unchanged" : wit::to_string(result.backend),
                 result.best_effort ? ", best effort" : "");
    return 0;
}

int run_detect(wit::WatermarkService& service, const CliOptions& opts) {
    std::vector<wit::Region> regions = service.detect_regions(wit::read_file_bytes(opts.input));
    fmt::print("{} region(s)\n", regions.size());
    for (const auto& r : regions) {
        fmt::print("  ({}, {}) {}x{}  conf={:.2f}  \"{}\"\n",
                   r.x, r.y, r.width, r.height, r.confidence, r.text.value_or(""));
    }
    return 0;
}

int run_status(const wit::WatermarkService& service) {
    wit::BackendStatus status = service.backend_status();
    fmt::print("mode: {}\nlocal_loaded: {}\ncloud_available: {}\n",
               status.mode, status.local_loaded, status.cloud_available);
    fmt::print("detector: {}\n",
               status.detector_ready ? "ready"
               : status.detector_compiled ? "not initialized" : "not compiled in");
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    try {
        std::optional<std::filesystem::path> config_path = opts->config;
        if (!config_path && std::filesystem::exists("wit.json")) {
            config_path = "wit.json";
        }

        wit::AppConfig config = wit::load_config(config_path);
        if (opts->verbose) {
            config.log.level = "debug";
        }
        wit::setup_logging(config.log);

        auto service = wit::WatermarkService::create(config);

        if (opts->command == "remove") return run_remove(*service, *opts);
        if (opts->command == "detect") return run_detect(*service, *opts);
        return run_status(*service);

    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
