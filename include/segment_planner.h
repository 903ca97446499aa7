// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "indicator_config.h"
#include "segment_descriptor.h"

#include <memory>

namespace stepline {

/**
 * @brief Whether the two-segment fast path can render this configuration
 *
 * Requires zero padding and no per-step callbacks. Depends on configuration
 * only, so callers evaluate it once per configuration change.
 */
bool is_optimizable(const IndicatorConfig& config);

/// Primary length to lay out: the container's extent, or fallback_length when unbounded
float resolve_available_length(const IndicatorConfig& config, const LayoutExtent& extent);

/// Cross length to lay out: the container's extent, or max_defined_size() when unbounded
float resolve_cross_extent(const IndicatorConfig& config, const LayoutExtent& extent);

/// Offset placing a segment of @p size inside @p extent
float cross_offset(CrossAlignment alignment, float extent, float size);

/**
 * @brief Turns (configuration, animated value, container extent) into segments
 *
 * Implementations are stateless; plan() is a pure function of its arguments
 * apart from invoking the configuration's callbacks.
 */
class SegmentPlanner {
  public:
    virtual ~SegmentPlanner() = default;

    /**
     * @param config Validated configuration
     * @param animated_value Current progress, clamped to [0, total_steps] internally
     * @param extent Container extent (unbounded axes resolved via fallbacks)
     */
    virtual IndicatorLayout plan(const IndicatorConfig& config, float animated_value,
                                 const LayoutExtent& extent) const = 0;

    virtual const char* name() const = 0;
};

/**
 * @brief One descriptor per step
 *
 * Every step gets (available - 2 * padding * total_steps) / total_steps along
 * the primary axis; sizes, colors, content and activation resolve per step.
 */
class PerStepPlanner : public SegmentPlanner {
  public:
    IndicatorLayout plan(const IndicatorConfig& config, float animated_value,
                         const LayoutExtent& extent) const override;
    const char* name() const override {
        return "per-step";
    }
};

/**
 * @brief Two abutting descriptors: filled and unfilled
 *
 * The boundary sits at available * (animated_value / total_steps). Segments
 * are emitted in physical order, so REVERSE puts the unfilled one first.
 * The filled segment reports traversal_index 0, the unfilled one 1.
 */
class OptimizedPlanner : public SegmentPlanner {
  public:
    IndicatorLayout plan(const IndicatorConfig& config, float animated_value,
                         const LayoutExtent& extent) const override;
    const char* name() const override {
        return "optimized";
    }
};

/// Planner matching is_optimizable(config)
std::unique_ptr<SegmentPlanner> make_segment_planner(const IndicatorConfig& config);

} // namespace stepline
