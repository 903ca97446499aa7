// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "step_gradient.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace stepline {

Gradient::Gradient(std::vector<GradientStop> stops) : stops_(std::move(stops)) {
    if (stops_.size() < 2) {
        throw std::invalid_argument("Gradient needs at least 2 stops, got " +
                                    std::to_string(stops_.size()));
    }
    if (stops_.front().position != 0.0f) {
        throw std::invalid_argument("Gradient first stop must be at 0.0");
    }
    if (stops_.back().position != 1.0f) {
        throw std::invalid_argument("Gradient last stop must be at 1.0");
    }
    for (size_t i = 1; i < stops_.size(); ++i) {
        if (!(stops_[i].position > stops_[i - 1].position)) {
            throw std::invalid_argument("Gradient stops must be strictly increasing (stop " +
                                        std::to_string(i) + ")");
        }
    }
}

Gradient Gradient::evenly_spaced(const std::vector<Color>& colors) {
    if (colors.size() < 2) {
        throw std::invalid_argument("Gradient needs at least 2 colors, got " +
                                    std::to_string(colors.size()));
    }

    std::vector<GradientStop> stops;
    stops.reserve(colors.size());
    float last = static_cast<float>(colors.size() - 1);
    for (size_t i = 0; i < colors.size(); ++i) {
        // Pin the last stop exactly; i / last can round below 1.0
        float pos = (i + 1 == colors.size()) ? 1.0f : static_cast<float>(i) / last;
        stops.push_back({colors[i], pos});
    }
    return Gradient(std::move(stops));
}

Color Gradient::sample_at(float position) const {
    if (std::isnan(position) || position <= stops_.front().position) {
        return stops_.front().color;
    }
    if (position >= stops_.back().position) {
        return stops_.back().color;
    }

    // First stop strictly after position; its predecessor brackets from below
    auto upper = std::upper_bound(
        stops_.begin(), stops_.end(), position,
        [](float pos, const GradientStop& stop) { return pos < stop.position; });
    auto lower = upper - 1;

    float span = upper->position - lower->position;
    float t = (position - lower->position) / span;
    return lerp_color(lower->color, upper->color, t);
}

Gradient Gradient::sub_gradient(float start, float end) const {
    start = std::clamp(start, 0.0f, 1.0f);
    end = std::clamp(end, 0.0f, 1.0f);
    return Gradient({{sample_at(start), 0.0f}, {sample_at(end), 1.0f}});
}

} // namespace stepline
