// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "step_fill.h"

#include <cmath>

namespace stepline {

int traversal_index(int step, int total_steps, TraversalDirection direction) {
    return direction == TraversalDirection::FORWARD ? step : total_steps - 1 - step;
}

float step_fill_fraction(int step, int total_steps, float value, TraversalDirection direction) {
    int i = traversal_index(step, total_steps, direction);
    float whole = std::floor(value);

    if (static_cast<float>(i) < whole) {
        return 1.0f;
    }
    if (static_cast<float>(i) == whole) {
        return value - whole;
    }
    return 0.0f;
}

std::vector<float> step_fill_fractions(int total_steps, float value, TraversalDirection direction) {
    std::vector<float> fractions;
    if (total_steps <= 0) {
        return fractions;
    }
    fractions.reserve(static_cast<size_t>(total_steps));
    for (int step = 0; step < total_steps; ++step) {
        fractions.push_back(step_fill_fraction(step, total_steps, value, direction));
    }
    return fractions;
}

} // namespace stepline
