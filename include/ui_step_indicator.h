// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "indicator_config.h"
#include "step_indicator.h"

#include "lvgl/lvgl.h"

/**
 * @file ui_step_indicator.h
 * @brief LVGL host for stepline::StepIndicator
 *
 * Paints the indicator's segments in a plain lv_obj, drives transitions with
 * an lv_timer, and turns clicks into step activations. The widget owns its
 * StepIndicator; deleting the object stops the timer and frees it.
 *
 * XML usage:
 * @code{.xml}
 * <step_indicator width="100%" height="8" total_steps="5" current_step="2"
 *                 padding="2" size="6" corner_radius="3" vertical="false" reverse="false"/>
 * @endcode
 */

/**
 * @brief Create a step indicator widget
 * @return The widget, or nullptr if @p config fails validation
 */
lv_obj_t* ui_step_indicator_create(lv_obj_t* parent, const stepline::IndicatorConfig& config);

/// Animate toward @p progress. Invalid values are logged and ignored.
void ui_step_indicator_set_progress(lv_obj_t* obj, float progress);

/**
 * @brief Replace the widget's configuration
 * @return false if the configuration was rejected (the widget keeps the old one)
 */
bool ui_step_indicator_set_config(lv_obj_t* obj, const stepline::IndicatorConfig& config);

/// Currently displayed progress (0 for objects that are not step indicators)
float ui_step_indicator_get_animated_value(lv_obj_t* obj);

/// Underlying indicator, or nullptr for objects that are not step indicators
const stepline::StepIndicator* ui_step_indicator_get_indicator(lv_obj_t* obj);

/// Register the <step_indicator> XML widget
void ui_step_indicator_register();
