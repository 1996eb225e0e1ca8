/**
 * @file    image_io.hpp
 * @brief   Image decode/encode helpers (memory and files)
 * @author  AllenK (Kwyshell)
 * @date    2026.09.05
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace wit {

/**
 * Decode an encoded image to 8-bit BGR
 *
 * Gray and BGRA inputs are converted; 16-bit inputs are scaled down.
 * @throws InvalidInputError when the bytes are not a decodable image
 */
cv::Mat decode_image(const std::vector<uint8_t>& bytes);

/**
 * Decode a mask keeping its channel layout (IMREAD_UNCHANGED)
 * @throws InvalidInputError when the bytes are not a decodable image
 */
cv::Mat decode_mask(const std::vector<uint8_t>& bytes);

/**
 * Force 8-bit BGR in place
 */
void ensure_bgr(cv::Mat& image);

/**
 * Encode with the codec selected by `ext` (".png", ".jpg", ".webp", ...)
 * @throws std::runtime_error on encoder failure
 */
std::vector<uint8_t> encode_image(const cv::Mat& image, const std::string& ext = ".png");

/**
 * Quality parameters for an output extension
 *
 * JPEG 100 (minimal loss), PNG compression 6, WebP 101 (lossless)
 */
std::vector<int> encode_params_for(const std::string& ext);

std::vector<uint8_t> read_file_bytes(const std::filesystem::path& path);

void write_file_bytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes);

}  // namespace wit
