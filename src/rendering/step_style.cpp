// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "step_style.h"

#include <algorithm>
#include <cmath>

namespace stepline {

bool is_only_step(int total_steps, float padding, float animated_value) {
    if (total_steps == 1) {
        return true;
    }
    return total_steps == 2 && padding == 0.0f && std::round(animated_value) == 0.0f;
}

uint8_t corner_mask_for(bool has_radius, bool is_first, bool is_last, bool is_only) {
    if (!has_radius) {
        return CORNER_NONE;
    }
    if (is_only) {
        return CORNER_ALL;
    }

    uint8_t mask = CORNER_NONE;
    if (is_first) {
        mask |= CORNER_LEADING;
    }
    if (is_last) {
        mask |= CORNER_TRAILING;
    }
    return mask;
}

CornerRadii corner_radii(uint8_t mask, Axis axis, float radius) {
    CornerRadii radii;
    bool leading_start = (mask & CORNER_LEADING_START) != 0;
    bool leading_end = (mask & CORNER_LEADING_END) != 0;
    bool trailing_start = (mask & CORNER_TRAILING_START) != 0;
    bool trailing_end = (mask & CORNER_TRAILING_END) != 0;

    // Leading/trailing run along the primary axis, start/end across it
    if (axis == Axis::HORIZONTAL) {
        radii.top_left = leading_start ? radius : 0.0f;
        radii.bottom_left = leading_end ? radius : 0.0f;
        radii.top_right = trailing_start ? radius : 0.0f;
        radii.bottom_right = trailing_end ? radius : 0.0f;
    } else {
        radii.top_left = leading_start ? radius : 0.0f;
        radii.top_right = leading_end ? radius : 0.0f;
        radii.bottom_left = trailing_start ? radius : 0.0f;
        radii.bottom_right = trailing_end ? radius : 0.0f;
    }
    return radii;
}

float resolve_step_size(const IndicatorConfig& config, int traversal_index, bool selected) {
    if (config.size_resolver) {
        if (auto custom = config.size_resolver(traversal_index, selected)) {
            return *custom;
        }
    }
    return selected ? config.selected_size_or_default() : config.unselected_size_or_default();
}

float max_defined_size(const IndicatorConfig& config) {
    float max_size = std::max({config.size, config.selected_size.value_or(0.0f),
                               config.unselected_size.value_or(0.0f)});
    if (!config.size_resolver) {
        return max_size;
    }

    // A resolver may answer differently per state, so probe both
    for (int step = 0; step < config.total_steps; ++step) {
        max_size = std::max(max_size, resolve_step_size(config, step, true));
        max_size = std::max(max_size, resolve_step_size(config, step, false));
    }
    return max_size;
}

Color resolve_flat_color(const IndicatorConfig& config, int traversal_index, bool selected) {
    if (config.color_resolver) {
        if (auto custom = config.color_resolver(traversal_index)) {
            return *custom;
        }
    }
    return selected ? config.selected_color : config.unselected_color;
}

StepPaint resolve_paint(const IndicatorConfig& config, int traversal_index, bool selected,
                        const PaintSpan& span) {
    const auto& bucket = selected ? config.selected_gradient : config.unselected_gradient;

    StepPaint paint;
    if (bucket) {
        paint.gradient = bucket->sub_gradient(span.bucket_start, span.bucket_end);
    } else if (config.gradient) {
        paint.gradient = config.gradient->sub_gradient(span.global_start, span.global_end);
    }

    if (paint.gradient) {
        paint.color = paint.gradient->sample_at(0.5f);
    } else {
        paint.color = resolve_flat_color(config, traversal_index, selected);
    }
    return paint;
}

void bucket_span(float range, float from, float to, TraversalDirection direction, float& start,
                 float& end) {
    if (range <= 0.0f) {
        start = 0.0f;
        end = 0.0f;
        return;
    }

    float a = std::clamp(from / range, 0.0f, 1.0f);
    float b = std::clamp(to / range, 0.0f, 1.0f);
    if (direction == TraversalDirection::FORWARD) {
        start = a;
        end = b;
    } else {
        start = b;
        end = a;
    }
}

} // namespace stepline
