// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "indicator_config.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace stepline {

/**
 * @brief Logical corners of a segment
 *
 * "Leading" is the segment end nearest the physical start of the primary axis
 * (left, or top), "trailing" the opposite end. "Start" and "end" name the two
 * sides across the cross axis. corner_radii() maps these onto physical corners.
 */
enum CornerMask : uint8_t {
    CORNER_NONE = 0,
    CORNER_LEADING_START = 1 << 0,
    CORNER_LEADING_END = 1 << 1,
    CORNER_TRAILING_START = 1 << 2,
    CORNER_TRAILING_END = 1 << 3,
    CORNER_LEADING = CORNER_LEADING_START | CORNER_LEADING_END,
    CORNER_TRAILING = CORNER_TRAILING_START | CORNER_TRAILING_END,
    CORNER_ALL = CORNER_LEADING | CORNER_TRAILING
};

struct CornerRadii {
    float top_left = 0.0f;
    float top_right = 0.0f;
    float bottom_right = 0.0f;
    float bottom_left = 0.0f;
};

/**
 * @brief Physical radii for a logical corner mask
 *
 * Horizontal: leading = left edge (top-left, bottom-left).
 * Vertical: leading = top edge (top-left, top-right).
 */
CornerRadii corner_radii(uint8_t mask, Axis axis, float radius);

/// Flat color or two-stop sub-gradient running leading -> trailing
struct StepPaint {
    Color color;
    std::optional<Gradient> gradient;

    bool has_gradient() const {
        return gradient.has_value();
    }
};

/// What the host should treat as the tap target of a segment
enum class ActivationTarget {
    NONE,          ///< No activation handle
    WHOLE_SEGMENT, ///< Handle present, no content: the full rectangle
    CONTENT_ONLY   ///< Handle and content present: only the content region
};

/**
 * @brief Everything a renderer needs to paint one segment
 *
 * Recomputed every frame. The filled portion sits on the traversal-start side
 * of the segment: the leading side for FORWARD, the trailing side for REVERSE.
 */
struct SegmentDescriptor {
    int index = 0;           ///< Physical position, 0 = leading end of the indicator
    int traversal_index = 0; ///< Position counted from the traversal start

    float offset_primary = 0.0f; ///< Leading edge along the primary axis (padding excluded)
    float offset_cross = 0.0f;   ///< Start edge along the cross axis
    float length_primary = 0.0f;
    float size_cross = 0.0f;

    float fill_fraction = 0.0f;

    Color color;     ///< Resolved bucket color (selected when fill_fraction > 0)
    StepPaint fill;  ///< Paint for the filled portion
    StepPaint track; ///< Paint for the unfilled remainder

    bool is_first = false;
    bool is_last = false;
    bool is_only_step = false;
    uint8_t corner_mask = CORNER_NONE;

    std::shared_ptr<StepContent> content;
    StepActivation on_activate;

    /// Paint of the step's bucket: fill when any part is filled, track otherwise
    const StepPaint& paint() const {
        return fill_fraction > 0.0f ? fill : track;
    }

    ActivationTarget activation_target() const {
        if (!on_activate) {
            return ActivationTarget::NONE;
        }
        return content ? ActivationTarget::CONTENT_ONLY : ActivationTarget::WHOLE_SEGMENT;
    }
};

/**
 * @brief Container extent offered to the indicator
 *
 * An empty optional means the container is unbounded along that axis.
 */
struct LayoutExtent {
    std::optional<float> primary;
    std::optional<float> cross;

    static LayoutExtent unbounded() {
        return {};
    }
};

struct IndicatorLayout {
    std::vector<SegmentDescriptor> segments;
    float total_length = 0.0f; ///< Resolved primary length
    float cross_extent = 0.0f; ///< Resolved cross length
    float animated_value = 0.0f;
    bool optimized = false; ///< Produced by the two-segment path
};

} // namespace stepline
