// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "indicator_config.h"
#include "segment_descriptor.h"

#include <cstdint>

namespace stepline {

/**
 * @brief Span of a painted region, in gradient coordinates
 *
 * `global_*` are fractions of the whole indicator length, physical order.
 * `bucket_*` are fractions of the selected (or unselected) range, already
 * oriented leading -> trailing, so start > end when traversal runs against
 * the physical axis.
 */
struct PaintSpan {
    float global_start = 0.0f;
    float global_end = 0.0f;
    float bucket_start = 0.0f;
    float bucket_end = 0.0f;
};

/**
 * @brief Whether edge rounding should treat the indicator as a single shape
 *
 * True for a one-step indicator, and for two gap-less steps whose progress
 * rounds to zero (the filled segment is invisible, the rest reads as one bar).
 */
bool is_only_step(int total_steps, float padding, float animated_value);

/**
 * @brief Corners that receive the configured radius
 *
 * Only edge segments are rounded: the first gets its leading corners, the
 * last its trailing corners, and a sole segment all four.
 */
uint8_t corner_mask_for(bool has_radius, bool is_first, bool is_last, bool is_only);

/// Cross size of a step: size_resolver first, then selected/unselected/base
float resolve_step_size(const IndicatorConfig& config, int traversal_index, bool selected);

/// Largest cross size the configuration can produce across all steps and states
float max_defined_size(const IndicatorConfig& config);

/// Flat color of a step's bucket: color_resolver first, then selected/unselected color
Color resolve_flat_color(const IndicatorConfig& config, int traversal_index, bool selected);

/**
 * @brief Paint for one bucket of a step
 *
 * Precedence: the bucket's own gradient (selected/unselected), then the
 * global gradient, then resolve_flat_color(). Gradient paints report the
 * slice's midpoint as their flat color.
 */
StepPaint resolve_paint(const IndicatorConfig& config, int traversal_index, bool selected,
                        const PaintSpan& span);

/**
 * @brief Orient a traversal-order span for painting leading -> trailing
 *
 * @param range Length of the bucket in steps (the animated value for the
 *              selected bucket, the remainder for the unselected one)
 * @param from Traversal position where the region starts, relative to the bucket
 * @param to Traversal position where the region ends, relative to the bucket
 */
void bucket_span(float range, float from, float to, TraversalDirection direction, float& start,
                 float& end);

} // namespace stepline
