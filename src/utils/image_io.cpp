/**
 * @file    image_io.cpp
 * @brief   Image I/O Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.05
 * @license MIT
 */

#include "utils/image_io.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace wit {

void ensure_bgr(cv::Mat& image) {
    if (image.depth() == CV_16U) {
        image.convertTo(image, CV_8U, 1.0 / 257.0);
    } else if (image.depth() != CV_8U) {
        throw InvalidInputError("Unsupported image bit depth");
    }

    if (image.channels() == 4) {
        cv::cvtColor(image, image, cv::COLOR_BGRA2BGR);
    } else if (image.channels() == 1) {
        cv::cvtColor(image, image, cv::COLOR_GRAY2BGR);
    } else if (image.channels() != 3) {
        throw InvalidInputError("Unsupported image channel count: " +
                                std::to_string(image.channels()));
    }
}

cv::Mat decode_image(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw InvalidInputError("Empty image data");
    }
    cv::Mat image = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        throw InvalidInputError("Failed to decode image");
    }
    ensure_bgr(image);
    return image;
}

cv::Mat decode_mask(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw InvalidInputError("Empty mask data");
    }
    cv::Mat mask = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    if (mask.empty()) {
        throw InvalidInputError("Failed to decode mask");
    }
    return mask;
}

std::vector<int> encode_params_for(const std::string& ext_in) {
    std::string ext = ext_in;
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".jpg" || ext == ".jpeg") {
        // JPEG: 100 = minimal loss (still lossy, but best quality)
        return {cv::IMWRITE_JPEG_QUALITY, 100};
    }
    if (ext == ".png") {
        // PNG: lossless, compression level only affects file size/speed
        return {cv::IMWRITE_PNG_COMPRESSION, 6};
    }
    if (ext == ".webp") {
        // WebP: 101+ = lossless mode
        return {cv::IMWRITE_WEBP_QUALITY, 101};
    }
    return {};
}

std::vector<uint8_t> encode_image(const cv::Mat& image, const std::string& ext) {
    std::vector<uint8_t> buffer;
    if (!cv::imencode(ext, image, buffer, encode_params_for(ext))) {
        throw std::runtime_error("Failed to encode image as " + ext);
    }
    return buffer;
}

std::vector<uint8_t> read_file_bytes(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + to_utf8(path));
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

void write_file_bytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    // Create output directory if needed
    auto output_dir = path.parent_path();
    if (!output_dir.empty() && !std::filesystem::exists(output_dir)) {
        std::filesystem::create_directories(output_dir);
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot write file: " + to_utf8(path));
    }
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw std::runtime_error("Short write: " + to_utf8(path));
    }
    spdlog::debug("Wrote {} bytes to {}", bytes.size(), path);
}

}  // namespace wit
