// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * @file step_color.h
 * @brief 8-bit RGBA color used by the step indicator core
 *
 * Colors are stored as straight (non-premultiplied) 8-bit channels so they map
 * directly onto renderer color types (lv_color_t + lv_opa_t, Skia, etc.).
 */

namespace stepline {

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t red, uint8_t green, uint8_t blue, uint8_t alpha = 255)
        : r(red), g(green), b(blue), a(alpha) {}

    /// Build from 0x00RRGGBB (alpha forced opaque)
    static constexpr Color from_rgb(uint32_t rgb) {
        return Color(static_cast<uint8_t>((rgb >> 16) & 0xFF),
                     static_cast<uint8_t>((rgb >> 8) & 0xFF), static_cast<uint8_t>(rgb & 0xFF));
    }

    /// Pack to 0x00RRGGBB, dropping alpha
    constexpr uint32_t to_rgb() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }

    bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const Color& o) const {
        return !(*this == o);
    }
};

namespace colors {
// Material blue and grey defaults
constexpr Color BLUE = Color::from_rgb(0x2196F3);
constexpr Color GREY = Color::from_rgb(0x9E9E9E);
constexpr Color WHITE = Color::from_rgb(0xFFFFFF);
} // namespace colors

/**
 * @brief Channel-wise linear interpolation
 *
 * @param a Color at t = 0
 * @param b Color at t = 1
 * @param t Blend factor, clamped to [0, 1]
 * @return Interpolated color (channels rounded to nearest)
 */
Color lerp_color(const Color& a, const Color& b, float t);

/**
 * @brief Parse "#rrggbb" or "#rrggbbaa"
 *
 * @return Parsed color, or std::nullopt if the string is not a valid hex color
 */
std::optional<Color> parse_hex_color(const std::string& str);

/**
 * @brief Format as "#rrggbb", or "#rrggbbaa" when not fully opaque
 */
std::string to_hex_string(const Color& color);

} // namespace stepline
