// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "indicator_config.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace stepline {

namespace {

void require_finite(float value, const char* field) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument(std::string(field) + " must be a finite number");
    }
}

void require_non_negative(float value, const char* field) {
    require_finite(value, field);
    if (value < 0.0f) {
        throw std::invalid_argument(std::string(field) + " must be greater than or equal to 0");
    }
}

} // namespace

void IndicatorConfig::validate() const {
    if (total_steps <= 0) {
        throw std::invalid_argument("total_steps must be greater than 0, got " +
                                    std::to_string(total_steps));
    }

    require_finite(current_progress, "current_progress");
    if (current_progress < 0.0f) {
        throw std::invalid_argument("current_progress must be greater than or equal to 0");
    }

    require_finite(padding, "padding");
    if (padding < 0.0f) {
        throw std::invalid_argument("padding must be greater than or equal to 0");
    }

    require_non_negative(size, "size");
    if (selected_size) {
        require_non_negative(*selected_size, "selected_size");
    }
    if (unselected_size) {
        require_non_negative(*unselected_size, "unselected_size");
    }

    if (corner_radius) {
        require_finite(*corner_radius, "corner_radius");
        if (*corner_radius < 0.0f) {
            throw std::invalid_argument("corner_radius must be greater than or equal to 0");
        }
    }

    require_finite(fallback_length, "fallback_length");
    if (fallback_length < 0.0f) {
        throw std::invalid_argument("fallback_length must be greater than or equal to 0");
    }
}

} // namespace stepline
