// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "step_color.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace stepline {

namespace {

uint8_t lerp_channel(uint8_t a, uint8_t b, float t) {
    float v = static_cast<float>(a) + (static_cast<float>(b) - static_cast<float>(a)) * t;
    return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

Color lerp_color(const Color& a, const Color& b, float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return Color(lerp_channel(a.r, b.r, t), lerp_channel(a.g, b.g, t), lerp_channel(a.b, b.b, t),
                 lerp_channel(a.a, b.a, t));
}

std::optional<Color> parse_hex_color(const std::string& str) {
    if (str.empty() || str[0] != '#' || (str.size() != 7 && str.size() != 9)) {
        return std::nullopt;
    }

    uint8_t channels[4] = {0, 0, 0, 255};
    size_t count = (str.size() - 1) / 2;
    for (size_t i = 0; i < count; ++i) {
        int hi = hex_digit(str[1 + i * 2]);
        int lo = hex_digit(str[2 + i * 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Color(channels[0], channels[1], channels[2], channels[3]);
}

std::string to_hex_string(const Color& color) {
    char buf[10];
    if (color.a == 255) {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x", color.r, color.g, color.b);
    } else {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", color.r, color.g, color.b, color.a);
    }
    return buf;
}

} // namespace stepline
