// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "step_indicator.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace stepline {

StepIndicator::StepIndicator(IndicatorConfig config)
    : config_(std::move(config)), animator_(config_.current_progress) {
    config_.validate();
    planner_ = make_segment_planner(config_);
    optimized_ = is_optimizable(config_);
    spdlog::debug("[StepIndicator] Created: {} steps, progress {:.2f}, {} planner",
                  config_.total_steps, config_.current_progress, planner_->name());
}

void StepIndicator::update_config(IndicatorConfig config) {
    config.validate();

    const float old_target = config_.current_progress;
    const bool progress_changed = config.current_progress != old_target;

    config_ = std::move(config);
    planner_ = make_segment_planner(config_);
    if (optimized_ != is_optimizable(config_)) {
        optimized_ = !optimized_;
        spdlog::debug("[StepIndicator] Switched to {} planner", planner_->name());
    }

    if (progress_changed) {
        float from = config_.restart_policy == RestartPolicy::FROM_PREVIOUS_TARGET
                         ? old_target
                         : animator_.value();
        spdlog::debug("[StepIndicator] Progress {:.2f} -> {:.2f} (from {:.2f}, {}ms)", old_target,
                      config_.current_progress, from, config_.animation_duration_ms);
        animator_.start(from, config_.current_progress, config_.animation_duration_ms,
                        config_.animation_curve);
    }
}

void StepIndicator::set_progress(float progress) {
    IndicatorConfig next = config_;
    next.current_progress = progress;
    update_config(std::move(next));
}

bool StepIndicator::advance(uint32_t delta_ms) {
    return animator_.advance(delta_ms);
}

void StepIndicator::finish_animation() {
    animator_.jump_to(config_.current_progress);
}

IndicatorLayout StepIndicator::layout(const LayoutExtent& extent) const {
    IndicatorLayout result = planner_->plan(config_, animator_.value(), extent);
    spdlog::trace("[StepIndicator] Layout at {:.3f}: {} segments over {:.1f}",
                  result.animated_value, result.segments.size(), result.total_length);
    return result;
}

std::optional<size_t> StepIndicator::step_at(const IndicatorLayout& layout,
                                             float primary_offset) {
    for (size_t i = 0; i < layout.segments.size(); ++i) {
        const auto& seg = layout.segments[i];
        if (seg.length_primary <= 0.0f) {
            continue;
        }
        if (primary_offset >= seg.offset_primary &&
            primary_offset < seg.offset_primary + seg.length_primary) {
            return i;
        }
    }
    return std::nullopt;
}

bool StepIndicator::activate_at(const IndicatorLayout& layout, float primary_offset) {
    auto hit = step_at(layout, primary_offset);
    if (!hit) {
        return false;
    }

    const auto& seg = layout.segments[*hit];
    if (seg.activation_target() != ActivationTarget::WHOLE_SEGMENT) {
        return false;
    }

    spdlog::debug("[StepIndicator] Activating step {}", seg.traversal_index);
    seg.on_activate();
    return true;
}

} // namespace stepline
