// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "indicator_config.h"
#include "progress_animator.h"
#include "segment_descriptor.h"
#include "segment_planner.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace stepline {

/**
 * @brief Stateful step progress indicator, independent of any UI toolkit
 *
 * Owns the configuration, the progress animation and the planner chosen for
 * the configuration. Hosts call advance() once per frame and layout() to get
 * the segments to paint.
 *
 * Changing current_progress through update_config() starts a new transition.
 * Its starting point follows the configuration's RestartPolicy: the previous
 * target (default) or the value currently displayed.
 *
 * Destroying the indicator abandons any transition in flight.
 */
class StepIndicator {
  public:
    /**
     * @throws std::invalid_argument if @p config fails validation
     */
    explicit StepIndicator(IndicatorConfig config);

    StepIndicator(const StepIndicator&) = delete;
    StepIndicator& operator=(const StepIndicator&) = delete;

    /**
     * @brief Replace the configuration
     *
     * A rejected configuration leaves the indicator untouched.
     * @throws std::invalid_argument if @p config fails validation
     */
    void update_config(IndicatorConfig config);

    /// Shorthand for update_config() with only current_progress changed
    void set_progress(float progress);

    /**
     * @brief Deliver a frame tick
     * @return true while a transition is still running
     */
    bool advance(uint32_t delta_ms);

    /// Skip any running transition and show the target immediately
    void finish_animation();

    IndicatorLayout layout(const LayoutExtent& extent) const;

    /**
     * @brief Segment whose primary span contains @p primary_offset
     *
     * Offsets inside padding gaps or outside the indicator hit nothing.
     * @return Index into layout.segments
     */
    static std::optional<size_t> step_at(const IndicatorLayout& layout, float primary_offset);

    /**
     * @brief Run the activation handle of the segment under @p primary_offset
     *
     * Only segments whose tap target is the whole rectangle activate here;
     * segments with content are activated by the host through their content.
     * @return true if a handle ran
     */
    static bool activate_at(const IndicatorLayout& layout, float primary_offset);

    const IndicatorConfig& config() const {
        return config_;
    }
    float animated_value() const {
        return animator_.value();
    }
    float target_value() const {
        return animator_.target();
    }
    bool is_animating() const {
        return animator_.is_running();
    }
    bool is_optimized() const {
        return optimized_;
    }

  private:
    IndicatorConfig config_;
    ProgressAnimator animator_;
    std::unique_ptr<SegmentPlanner> planner_;
    bool optimized_ = false;
};

} // namespace stepline
