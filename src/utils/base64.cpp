/**
 * @file    base64.cpp
 * @brief   Base64 Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.24
 * @license MIT
 */

#include "utils/base64.hpp"

namespace wit {

namespace {

constexpr char kBase64Table[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

}  // namespace

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve((len + 2) / 3 * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result.push_back(kBase64Table[(n >> 18) & 0x3F]);
        result.push_back(kBase64Table[(n >> 12) & 0x3F]);
        result.push_back((i + 1 < len) ? kBase64Table[(n >> 6) & 0x3F] : '=');
        result.push_back((i + 2 < len) ? kBase64Table[n & 0x3F] : '=');
    }
    return result;
}

std::string make_data_uri(std::string_view mime, const std::vector<uint8_t>& data) {
    std::string uri = "data:";
    uri.append(mime);
    uri.append(";base64,");
    uri.append(base64_encode(data));
    return uri;
}

}  // namespace wit
