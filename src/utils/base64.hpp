/**
 * @file    base64.hpp
 * @brief   Base64 encoding for data: URIs
 * @author  AllenK (Kwyshell)
 * @date    2026.09.24
 * @license MIT
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wit {

std::string base64_encode(const uint8_t* data, size_t len);

inline std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

/**
 * data:<mime>;base64,<payload>
 */
std::string make_data_uri(std::string_view mime, const std::vector<uint8_t>& data);

}  // namespace wit
