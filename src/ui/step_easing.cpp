// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "step_easing.h"

#include <algorithm>
#include <cmath>

namespace stepline {

namespace {

constexpr float PI = 3.14159265358979f;

/// Unit cubic bezier through (0,0), (x1,y1), (x2,y2), (1,1), evaluated at x = t.
float cubic_bezier(float t, float x1, float y1, float x2, float y2) {
    auto coord = [](float u, float p1, float p2) {
        float inv = 1.0f - u;
        return 3.0f * inv * inv * u * p1 + 3.0f * inv * u * u * p2 + u * u * u;
    };
    auto slope = [](float u, float p1, float p2) {
        float inv = 1.0f - u;
        return 3.0f * inv * inv * p1 + 6.0f * inv * u * (p2 - p1) + 3.0f * u * u * (1.0f - p2);
    };

    // Newton first, fall back to bisection when the slope flattens out
    float u = t;
    for (int i = 0; i < 8; ++i) {
        float err = coord(u, x1, x2) - t;
        if (std::fabs(err) < 1e-5f) {
            return coord(u, y1, y2);
        }
        float d = slope(u, x1, x2);
        if (std::fabs(d) < 1e-6f) {
            break;
        }
        u -= err / d;
    }

    float lo = 0.0f;
    float hi = 1.0f;
    u = t;
    for (int i = 0; i < 32; ++i) {
        float x = coord(u, x1, x2);
        if (std::fabs(x - t) < 1e-5f) {
            break;
        }
        if (x < t) {
            lo = u;
        } else {
            hi = u;
        }
        u = (lo + hi) * 0.5f;
    }
    return coord(u, y1, y2);
}

float bounce_out(float t) {
    constexpr float n1 = 7.5625f;
    constexpr float d1 = 2.75f;
    if (t < 1.0f / d1) {
        return n1 * t * t;
    }
    if (t < 2.0f / d1) {
        t -= 1.5f / d1;
        return n1 * t * t + 0.75f;
    }
    if (t < 2.5f / d1) {
        t -= 2.25f / d1;
        return n1 * t * t + 0.9375f;
    }
    t -= 2.625f / d1;
    return n1 * t * t + 0.984375f;
}

float elastic_out(float t) {
    constexpr float period = 0.4f;
    constexpr float s = period / 4.0f;
    return std::pow(2.0f, -10.0f * t) * std::sin((t - s) * (2.0f * PI) / period) + 1.0f;
}

} // namespace

float apply_easing(EasingCurve curve, float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    // Pin the endpoints so every curve lands exactly on from/to
    if (t <= 0.0f)
        return 0.0f;
    if (t >= 1.0f)
        return 1.0f;

    switch (curve) {
    case EasingCurve::LINEAR:
        return t;
    case EasingCurve::EASE_IN:
        return cubic_bezier(t, 0.42f, 0.0f, 1.0f, 1.0f);
    case EasingCurve::EASE_OUT:
        return cubic_bezier(t, 0.0f, 0.0f, 0.58f, 1.0f);
    case EasingCurve::EASE_IN_OUT:
        return cubic_bezier(t, 0.42f, 0.0f, 0.58f, 1.0f);
    case EasingCurve::FAST_OUT_SLOW_IN:
        return cubic_bezier(t, 0.4f, 0.0f, 0.2f, 1.0f);
    case EasingCurve::OVERSHOOT:
        return cubic_bezier(t, 0.34f, 1.56f, 0.64f, 1.0f);
    case EasingCurve::ELASTIC_OUT:
        return elastic_out(t);
    case EasingCurve::BOUNCE_OUT:
        return bounce_out(t);
    }
    return t;
}

EasingCurve parse_easing_curve(const std::string& str, EasingCurve default_curve) {
    if (str == "linear")
        return EasingCurve::LINEAR;
    if (str == "ease_in")
        return EasingCurve::EASE_IN;
    if (str == "ease_out")
        return EasingCurve::EASE_OUT;
    if (str == "ease_in_out")
        return EasingCurve::EASE_IN_OUT;
    if (str == "fast_out_slow_in")
        return EasingCurve::FAST_OUT_SLOW_IN;
    if (str == "overshoot")
        return EasingCurve::OVERSHOOT;
    if (str == "elastic_out")
        return EasingCurve::ELASTIC_OUT;
    if (str == "bounce_out")
        return EasingCurve::BOUNCE_OUT;
    return default_curve;
}

const char* easing_curve_name(EasingCurve curve) {
    switch (curve) {
    case EasingCurve::LINEAR:
        return "linear";
    case EasingCurve::EASE_IN:
        return "ease_in";
    case EasingCurve::EASE_OUT:
        return "ease_out";
    case EasingCurve::EASE_IN_OUT:
        return "ease_in_out";
    case EasingCurve::FAST_OUT_SLOW_IN:
        return "fast_out_slow_in";
    case EasingCurve::OVERSHOOT:
        return "overshoot";
    case EasingCurve::ELASTIC_OUT:
        return "elastic_out";
    case EasingCurve::BOUNCE_OUT:
        return "bounce_out";
    }
    return "unknown";
}

} // namespace stepline
