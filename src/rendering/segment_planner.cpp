// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "segment_planner.h"

#include "step_style.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace stepline {

namespace {

float clamp_progress(const IndicatorConfig& config, float animated_value) {
    return std::clamp(animated_value, 0.0f, static_cast<float>(config.total_steps));
}

/// Fraction of the indicator length at which @p pos sits (0 when there is no length)
float global_position(float pos, float total_length) {
    if (total_length <= 0.0f) {
        return 0.0f;
    }
    return std::clamp(pos / total_length, 0.0f, 1.0f);
}

IndicatorLayout begin_layout(const IndicatorConfig& config, float value,
                             const LayoutExtent& extent, bool optimized) {
    IndicatorLayout layout;
    layout.total_length = resolve_available_length(config, extent);
    layout.cross_extent = resolve_cross_extent(config, extent);
    layout.animated_value = value;
    layout.optimized = optimized;
    return layout;
}

} // namespace

// ============================================================================
// Strategy selection and extent resolution
// ============================================================================

bool is_optimizable(const IndicatorConfig& config) {
    return config.padding == 0.0f && !config.color_resolver && !config.size_resolver &&
           !config.content_factory && !config.activation_factory;
}

float resolve_available_length(const IndicatorConfig& config, const LayoutExtent& extent) {
    if (!extent.primary || !std::isfinite(*extent.primary)) {
        return config.fallback_length;
    }
    return std::max(0.0f, *extent.primary);
}

float resolve_cross_extent(const IndicatorConfig& config, const LayoutExtent& extent) {
    if (!extent.cross || !std::isfinite(*extent.cross)) {
        return max_defined_size(config);
    }
    return std::max(0.0f, *extent.cross);
}

float cross_offset(CrossAlignment alignment, float extent, float size) {
    switch (alignment) {
    case CrossAlignment::START:
        return 0.0f;
    case CrossAlignment::CENTER:
        return (extent - size) / 2.0f;
    case CrossAlignment::END:
        return extent - size;
    }
    return 0.0f;
}

std::unique_ptr<SegmentPlanner> make_segment_planner(const IndicatorConfig& config) {
    if (is_optimizable(config)) {
        return std::make_unique<OptimizedPlanner>();
    }
    return std::make_unique<PerStepPlanner>();
}

// ============================================================================
// Per-step path
// ============================================================================

IndicatorLayout PerStepPlanner::plan(const IndicatorConfig& config, float animated_value,
                                     const LayoutExtent& extent) const {
    const int total = config.total_steps;
    const float value = clamp_progress(config, animated_value);
    IndicatorLayout layout = begin_layout(config, value, extent, false);
    const float length = layout.total_length;

    float step_length = (length - config.padding * 2.0f * total) / total;
    if (step_length < 0.0f) {
        spdlog::trace("[SegmentPlanner] Padding {} exceeds length {}, steps collapse to 0",
                      config.padding, length);
        step_length = 0.0f;
    }

    const bool only = is_only_step(total, config.padding, value);
    const bool forward = config.direction == TraversalDirection::FORWARD;

    layout.segments.reserve(static_cast<size_t>(total));
    for (int step = 0; step < total; ++step) {
        SegmentDescriptor seg;
        seg.index = step;
        seg.traversal_index = traversal_index(step, total, config.direction);
        seg.fill_fraction = step_fill_fraction(step, total, value, config.direction);
        const bool selected = seg.fill_fraction > 0.0f;
        const float t = static_cast<float>(seg.traversal_index);

        seg.length_primary = step_length;
        seg.offset_primary = step * (step_length + config.padding * 2.0f) + config.padding;
        seg.size_cross = resolve_step_size(config, seg.traversal_index, selected);
        seg.offset_cross =
            cross_offset(config.cross_alignment, layout.cross_extent, seg.size_cross);

        // Filled part hugs the traversal-start side of the step
        float filled = step_length * seg.fill_fraction;
        float lo = seg.offset_primary;
        float hi = seg.offset_primary + step_length;
        float fill_lo = forward ? lo : hi - filled;
        float fill_hi = forward ? lo + filled : hi;
        float track_lo = forward ? fill_hi : lo;
        float track_hi = forward ? hi : fill_lo;

        PaintSpan fill_span;
        fill_span.global_start = global_position(fill_lo, length);
        fill_span.global_end = global_position(fill_hi, length);
        bucket_span(value, t, t + seg.fill_fraction, config.direction, fill_span.bucket_start,
                    fill_span.bucket_end);

        PaintSpan track_span;
        track_span.global_start = global_position(track_lo, length);
        track_span.global_end = global_position(track_hi, length);
        bucket_span(total - value, t + seg.fill_fraction - value, t + 1.0f - value,
                    config.direction, track_span.bucket_start, track_span.bucket_end);

        seg.fill = resolve_paint(config, seg.traversal_index, true, fill_span);
        seg.track = resolve_paint(config, seg.traversal_index, false, track_span);
        seg.color = selected ? seg.fill.color : seg.track.color;

        seg.is_first = step == 0;
        seg.is_last = step == total - 1;
        seg.is_only_step = only;
        seg.corner_mask = corner_mask_for(config.corner_radius.has_value(), seg.is_first,
                                          seg.is_last, seg.is_only_step);

        if (config.content_factory) {
            seg.content = config.content_factory(seg.traversal_index, seg.color, seg.size_cross);
        }
        if (config.activation_factory) {
            seg.on_activate = config.activation_factory(seg.traversal_index);
        }

        layout.segments.push_back(std::move(seg));
    }

    return layout;
}

// ============================================================================
// Optimized two-segment path
// ============================================================================

IndicatorLayout OptimizedPlanner::plan(const IndicatorConfig& config, float animated_value,
                                       const LayoutExtent& extent) const {
    const int total = config.total_steps;
    const float value = clamp_progress(config, animated_value);
    IndicatorLayout layout = begin_layout(config, value, extent, true);
    const float length = layout.total_length;
    const bool forward = config.direction == TraversalDirection::FORWARD;
    const bool only = is_only_step(total, config.padding, value);

    const float filled_length = length * (value / static_cast<float>(total));
    const float unfilled_length = length - filled_length;

    // Physical boundary between the two segments
    const float boundary = forward ? filled_length : unfilled_length;
    const float g_boundary = global_position(boundary, length);

    SegmentDescriptor filled;
    filled.traversal_index = 0;
    filled.fill_fraction = 1.0f;
    filled.length_primary = filled_length;
    filled.size_cross = config.selected_size_or_default();

    PaintSpan filled_span;
    filled_span.global_start = forward ? 0.0f : g_boundary;
    filled_span.global_end = forward ? g_boundary : 1.0f;
    bucket_span(1.0f, 0.0f, 1.0f, config.direction, filled_span.bucket_start,
                filled_span.bucket_end);
    filled.fill = resolve_paint(config, 0, true, filled_span);
    filled.track = resolve_paint(config, 0, false, PaintSpan{g_boundary, g_boundary, 0.0f, 0.0f});
    filled.color = filled.fill.color;

    SegmentDescriptor unfilled;
    unfilled.traversal_index = 1;
    unfilled.fill_fraction = 0.0f;
    unfilled.length_primary = unfilled_length;
    unfilled.size_cross = config.unselected_size_or_default();

    PaintSpan unfilled_span;
    unfilled_span.global_start = forward ? g_boundary : 0.0f;
    unfilled_span.global_end = forward ? 1.0f : g_boundary;
    bucket_span(1.0f, 0.0f, 1.0f, config.direction, unfilled_span.bucket_start,
                unfilled_span.bucket_end);
    unfilled.track = resolve_paint(config, 1, false, unfilled_span);
    unfilled.fill = resolve_paint(config, 1, true, PaintSpan{g_boundary, g_boundary, 1.0f, 1.0f});
    unfilled.color = unfilled.track.color;

    SegmentDescriptor first = forward ? std::move(filled) : std::move(unfilled);
    SegmentDescriptor second = forward ? std::move(unfilled) : std::move(filled);

    first.index = 0;
    first.offset_primary = 0.0f;
    first.is_first = true;
    second.index = 1;
    second.offset_primary = first.length_primary;
    second.is_last = true;

    for (auto* seg : {&first, &second}) {
        seg->offset_cross =
            cross_offset(config.cross_alignment, layout.cross_extent, seg->size_cross);
        seg->is_only_step = only;
        seg->corner_mask = corner_mask_for(config.corner_radius.has_value(), seg->is_first,
                                           seg->is_last, seg->is_only_step);
    }

    layout.segments.push_back(std::move(first));
    layout.segments.push_back(std::move(second));
    return layout;
}

} // namespace stepline
