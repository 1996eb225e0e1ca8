/**
 * @file    path_formatter.hpp
 * @brief   UTF-8 path helpers and fmt formatter for std::filesystem::path
 * @author  AllenK (Kwyshell)
 * @date    2026.01.26
 * @license MIT
 *
 * @details
 * spdlog/fmt expect UTF-8, while path.string() is the native narrow encoding
 * (the ANSI code page on Windows). Everything that logs or prints a path goes
 * through u8string().
 *
 * Usage:
 *   spdlog::info("Processing: {}", some_path);
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace wit {

/**
 * UTF-8 std::string for a path (u8string() is std::u8string in C++20)
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

/**
 * Sibling path with a suffix before the extension
 *
 *   with_suffix("dir/photo.jpg", "_clean", ".png") -> "dir/photo_clean.png"
 *
 * An empty `ext` keeps the original extension.
 */
inline std::filesystem::path with_suffix(const std::filesystem::path& path,
                                         std::string_view suffix,
                                         std::string_view ext = {}) {
    std::filesystem::path result = path.parent_path() / path.stem();
    result += std::string(suffix);
    if (ext.empty()) {
        result += path.extension();
    } else {
        result += std::string(ext);
    }
    return result;
}

}  // namespace wit

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
