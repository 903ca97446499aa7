// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_step_indicator.h"

#include "lvgl/src/xml/lv_xml_parser.h"
#include "lvgl/src/xml/lv_xml_widget.h"
#include "lvgl/src/xml/parsers/lv_xml_obj_parser.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>

using stepline::Axis;
using stepline::CornerRadii;
using stepline::IndicatorConfig;
using stepline::StepIndicator;
using stepline::StepPaint;

// ============================================================================
// Widget Data
// ============================================================================

static constexpr uint32_t FRAME_PERIOD_MS = 16;

struct StepIndicatorWidgetData {
    std::unique_ptr<StepIndicator> indicator;
    lv_timer_t* timer = nullptr;
    uint32_t last_tick = 0;
};

static StepIndicatorWidgetData* get_data(lv_obj_t* obj) {
    if (!obj)
        return nullptr;
    return static_cast<StepIndicatorWidgetData*>(lv_obj_get_user_data(obj));
}

static stepline::LayoutExtent extent_of(lv_obj_t* obj, Axis axis) {
    stepline::LayoutExtent extent;
    float w = static_cast<float>(lv_obj_get_width(obj));
    float h = static_cast<float>(lv_obj_get_height(obj));
    extent.primary = axis == Axis::HORIZONTAL ? w : h;
    extent.cross = axis == Axis::HORIZONTAL ? h : w;
    return extent;
}

// ============================================================================
// Frame timer
// ============================================================================

static void frame_timer_cb(lv_timer_t* timer) {
    auto* obj = static_cast<lv_obj_t*>(lv_timer_get_user_data(timer));
    auto* data = get_data(obj);
    if (!data || !data->indicator)
        return;

    uint32_t elapsed = lv_tick_elaps(data->last_tick);
    data->last_tick = lv_tick_get();

    bool running = data->indicator->advance(elapsed);
    lv_obj_invalidate(obj);

    if (!running) {
        lv_timer_pause(timer);
        spdlog::trace("[StepIndicatorWidget] Transition finished at {:.2f}",
                      data->indicator->animated_value());
    }
}

/// Restart frame delivery after a transition was started
static void kick_timer(lv_obj_t* obj, StepIndicatorWidgetData* data) {
    if (data->indicator->is_animating()) {
        data->last_tick = lv_tick_get();
        lv_timer_resume(data->timer);
    }
    lv_obj_invalidate(obj);
}

// ============================================================================
// Drawing
// ============================================================================

static lv_color_t to_lv_color(const stepline::Color& c) {
    return lv_color_make(c.r, c.g, c.b);
}

static void fill_rect(lv_layer_t* layer, const lv_area_t& area, const StepPaint& paint,
                      int32_t radius, Axis axis) {
    lv_draw_rect_dsc_t dsc;
    lv_draw_rect_dsc_init(&dsc);
    dsc.radius = radius;
    dsc.bg_color = to_lv_color(paint.color);
    dsc.bg_opa = paint.color.a;

    if (paint.gradient) {
        const auto& stops = paint.gradient->stops();
        size_t count = std::min<size_t>(stops.size(), LV_GRADIENT_MAX_STOPS);
        dsc.bg_grad.dir = axis == Axis::HORIZONTAL ? LV_GRAD_DIR_HOR : LV_GRAD_DIR_VER;
        dsc.bg_grad.stops_count = static_cast<uint8_t>(count);
        for (size_t i = 0; i < count; ++i) {
            dsc.bg_grad.stops[i].color = to_lv_color(stops[i].color);
            dsc.bg_grad.stops[i].opa = stops[i].color.a;
            dsc.bg_grad.stops[i].frac =
                static_cast<uint8_t>(std::lround(stops[i].position * 255.0f));
        }
    }

    lv_draw_rect(layer, &dsc, &area);
}

/**
 * @brief Paint a region with per-corner radii
 *
 * LVGL rectangles have a single radius, so the region is drawn rounded and
 * the corners that should stay square are covered with patches. A gradient
 * patch gets the slice of the gradient it covers.
 */
static void draw_region(lv_layer_t* layer, const lv_area_t& area, const StepPaint& paint,
                        const CornerRadii& radii, Axis axis) {
    int32_t w = lv_area_get_width(&area);
    int32_t h = lv_area_get_height(&area);
    if (w <= 0 || h <= 0)
        return;

    float r = std::max({radii.top_left, radii.top_right, radii.bottom_right, radii.bottom_left});
    int32_t radius = static_cast<int32_t>(std::lround(r));
    fill_rect(layer, area, paint, radius, axis);
    if (radius <= 0)
        return;

    int32_t pw = std::min(radius, w);
    int32_t ph = std::min(radius, h);
    const int32_t primary_len = axis == Axis::HORIZONTAL ? w : h;

    auto patch = [&](bool square, bool right, bool bottom) {
        if (!square)
            return;
        lv_area_t p;
        p.x1 = right ? area.x2 - pw + 1 : area.x1;
        p.x2 = p.x1 + pw - 1;
        p.y1 = bottom ? area.y2 - ph + 1 : area.y1;
        p.y2 = p.y1 + ph - 1;

        StepPaint slice = paint;
        if (paint.gradient) {
            int32_t from = axis == Axis::HORIZONTAL ? p.x1 - area.x1 : p.y1 - area.y1;
            int32_t len = axis == Axis::HORIZONTAL ? pw : ph;
            float start = static_cast<float>(from) / primary_len;
            float end = static_cast<float>(from + len) / primary_len;
            slice.gradient = paint.gradient->sub_gradient(start, end);
        }
        fill_rect(layer, p, slice, 0, axis);
    };

    patch(radii.top_left <= 0.0f, false, false);
    patch(radii.top_right <= 0.0f, true, false);
    patch(radii.bottom_right <= 0.0f, true, true);
    patch(radii.bottom_left <= 0.0f, false, true);
}

static CornerRadii keep_leading(CornerRadii radii, Axis axis) {
    if (axis == Axis::HORIZONTAL) {
        radii.top_right = radii.bottom_right = 0.0f;
    } else {
        radii.bottom_left = radii.bottom_right = 0.0f;
    }
    return radii;
}

static CornerRadii keep_trailing(CornerRadii radii, Axis axis) {
    if (axis == Axis::HORIZONTAL) {
        radii.top_left = radii.bottom_left = 0.0f;
    } else {
        radii.top_left = radii.top_right = 0.0f;
    }
    return radii;
}

/// Area spanning [p0, p1) along the primary axis and [c0, c1) across it
static lv_area_t segment_area(const lv_area_t& coords, Axis axis, float p0, float p1, float c0,
                              float c1) {
    int32_t a0 = static_cast<int32_t>(std::lround(p0));
    int32_t a1 = static_cast<int32_t>(std::lround(p1));
    int32_t b0 = static_cast<int32_t>(std::lround(c0));
    int32_t b1 = static_cast<int32_t>(std::lround(c1));

    lv_area_t area;
    if (axis == Axis::HORIZONTAL) {
        area.x1 = coords.x1 + a0;
        area.x2 = coords.x1 + a1 - 1;
        area.y1 = coords.y1 + b0;
        area.y2 = coords.y1 + b1 - 1;
    } else {
        area.x1 = coords.x1 + b0;
        area.x2 = coords.x1 + b1 - 1;
        area.y1 = coords.y1 + a0;
        area.y2 = coords.y1 + a1 - 1;
    }
    return area;
}

static void indicator_draw_cb(lv_event_t* e) {
    lv_obj_t* obj = lv_event_get_target_obj(e);
    lv_layer_t* layer = lv_event_get_layer(e);
    auto* data = get_data(obj);
    if (!data || !data->indicator)
        return;

    const IndicatorConfig& config = data->indicator->config();
    const Axis axis = config.axis;

    lv_area_t coords;
    lv_obj_get_coords(obj, &coords);

    stepline::IndicatorLayout layout = data->indicator->layout(extent_of(obj, axis));

    for (const auto& seg : layout.segments) {
        if (seg.length_primary <= 0.0f || seg.size_cross <= 0.0f)
            continue;

        CornerRadii radii;
        if (config.corner_radius) {
            radii = stepline::corner_radii(seg.corner_mask, axis, *config.corner_radius);
        }

        const float start = seg.offset_primary;
        const float end = seg.offset_primary + seg.length_primary;
        const float c0 = seg.offset_cross;
        const float c1 = seg.offset_cross + seg.size_cross;

        if (seg.fill_fraction >= 1.0f || seg.fill_fraction <= 0.0f) {
            draw_region(layer, segment_area(coords, axis, start, end, c0, c1), seg.paint(), radii,
                        axis);
            continue;
        }

        // Filled part sits on the traversal-start side
        const bool forward = config.direction == stepline::TraversalDirection::FORWARD;
        const float leading_len =
            seg.length_primary * (forward ? seg.fill_fraction : 1.0f - seg.fill_fraction);
        const float split = start + leading_len;
        const StepPaint& leading = forward ? seg.fill : seg.track;
        const StepPaint& trailing = forward ? seg.track : seg.fill;

        draw_region(layer, segment_area(coords, axis, start, split, c0, c1), leading,
                    keep_leading(radii, axis), axis);
        draw_region(layer, segment_area(coords, axis, split, end, c0, c1), trailing,
                    keep_trailing(radii, axis), axis);
    }
}

// ============================================================================
// Event Callbacks
// ============================================================================

static void indicator_click_cb(lv_event_t* e) {
    lv_obj_t* obj = lv_event_get_target_obj(e);
    auto* data = get_data(obj);
    lv_indev_t* indev = lv_indev_active();
    if (!data || !data->indicator || !indev)
        return;

    lv_point_t point;
    lv_indev_get_point(indev, &point);

    lv_area_t coords;
    lv_obj_get_coords(obj, &coords);

    const Axis axis = data->indicator->config().axis;
    float offset = static_cast<float>(axis == Axis::HORIZONTAL ? point.x - coords.x1
                                                               : point.y - coords.y1);

    auto layout = data->indicator->layout(extent_of(obj, axis));
    if (!StepIndicator::activate_at(layout, offset)) {
        spdlog::trace("[StepIndicatorWidget] Click at {:.0f} hit no activatable step", offset);
    }
}

static void indicator_delete_cb(lv_event_t* e) {
    lv_obj_t* obj = static_cast<lv_obj_t*>(lv_event_get_target(e));
    auto* data = get_data(obj);
    if (data && data->timer) {
        lv_timer_delete(data->timer);
    }
    delete data;
    lv_obj_set_user_data(obj, nullptr);
}

// ============================================================================
// Public API
// ============================================================================

/// Wrap @p obj as a step indicator. Returns false if @p config is rejected.
static bool attach_indicator(lv_obj_t* obj, const IndicatorConfig& config) {
    std::unique_ptr<StepIndicator> indicator;
    try {
        indicator = std::make_unique<StepIndicator>(config);
    } catch (const std::invalid_argument& e) {
        spdlog::error("[StepIndicatorWidget] Rejected configuration: {}", e.what());
        return false;
    }

    auto* data = new StepIndicatorWidgetData{};
    data->indicator = std::move(indicator);
    data->timer = lv_timer_create(frame_timer_cb, FRAME_PERIOD_MS, obj);
    lv_timer_pause(data->timer);
    lv_obj_set_user_data(obj, data);

    lv_obj_remove_flag(obj, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_add_flag(obj, LV_OBJ_FLAG_CLICKABLE);

    lv_obj_add_event_cb(obj, indicator_draw_cb, LV_EVENT_DRAW_POST, nullptr);
    lv_obj_add_event_cb(obj, indicator_click_cb, LV_EVENT_CLICKED, nullptr);
    lv_obj_add_event_cb(obj, indicator_delete_cb, LV_EVENT_DELETE, nullptr);
    return true;
}

lv_obj_t* ui_step_indicator_create(lv_obj_t* parent, const IndicatorConfig& config) {
    lv_obj_t* obj = lv_obj_create(parent);
    if (!obj) {
        spdlog::error("[StepIndicatorWidget] Failed to create lv_obj");
        return nullptr;
    }
    lv_obj_remove_style_all(obj);

    if (!attach_indicator(obj, config)) {
        lv_obj_delete(obj);
        return nullptr;
    }

    spdlog::debug("[StepIndicatorWidget] Created: {} steps", config.total_steps);
    return obj;
}

void ui_step_indicator_set_progress(lv_obj_t* obj, float progress) {
    auto* data = get_data(obj);
    if (!data || !data->indicator)
        return;

    try {
        data->indicator->set_progress(progress);
    } catch (const std::invalid_argument& e) {
        spdlog::warn("[StepIndicatorWidget] Ignoring progress {}: {}", progress, e.what());
        return;
    }
    kick_timer(obj, data);
}

bool ui_step_indicator_set_config(lv_obj_t* obj, const IndicatorConfig& config) {
    auto* data = get_data(obj);
    if (!data || !data->indicator)
        return false;

    try {
        data->indicator->update_config(config);
    } catch (const std::invalid_argument& e) {
        spdlog::warn("[StepIndicatorWidget] Rejected configuration update: {}", e.what());
        return false;
    }
    kick_timer(obj, data);
    return true;
}

float ui_step_indicator_get_animated_value(lv_obj_t* obj) {
    auto* data = get_data(obj);
    if (!data || !data->indicator)
        return 0.0f;
    return data->indicator->animated_value();
}

const StepIndicator* ui_step_indicator_get_indicator(lv_obj_t* obj) {
    auto* data = get_data(obj);
    return data ? data->indicator.get() : nullptr;
}

// ============================================================================
// XML Widget Registration
// ============================================================================

static void* step_indicator_xml_create(lv_xml_parser_state_t* state, const char** attrs) {
    LV_UNUSED(attrs);

    void* parent = lv_xml_state_get_parent(state);
    lv_obj_t* obj = lv_obj_create(static_cast<lv_obj_t*>(parent));
    if (!obj) {
        spdlog::error("[StepIndicatorWidget] Failed to create lv_obj");
        return nullptr;
    }

    lv_obj_remove_style_all(obj);
    lv_obj_set_size(obj, LV_PCT(100), 8);

    // Real values arrive in the apply callback
    if (!attach_indicator(obj, IndicatorConfig{})) {
        lv_obj_delete(obj);
        return nullptr;
    }
    return static_cast<void*>(obj);
}

static void step_indicator_xml_apply(lv_xml_parser_state_t* state, const char** attrs) {
    auto* obj = static_cast<lv_obj_t*>(lv_xml_state_get_item(state));
    auto* data = get_data(obj);

    if (data && data->indicator) {
        IndicatorConfig config = data->indicator->config();
        bool changed = false;

        for (int i = 0; attrs[i] && attrs[i + 1]; i += 2) {
            const char* name = attrs[i];
            const char* value = attrs[i + 1];

            if (strcmp(name, "total_steps") == 0) {
                config.total_steps = atoi(value);
                changed = true;
            } else if (strcmp(name, "current_step") == 0) {
                config.current_progress = strtof(value, nullptr);
                changed = true;
            } else if (strcmp(name, "padding") == 0) {
                config.padding = strtof(value, nullptr);
                changed = true;
            } else if (strcmp(name, "size") == 0) {
                config.size = strtof(value, nullptr);
                changed = true;
            } else if (strcmp(name, "corner_radius") == 0) {
                config.corner_radius = strtof(value, nullptr);
                changed = true;
            } else if (strcmp(name, "vertical") == 0) {
                config.axis = strcmp(value, "true") == 0 ? Axis::VERTICAL : Axis::HORIZONTAL;
                changed = true;
            } else if (strcmp(name, "reverse") == 0) {
                config.direction = strcmp(value, "true") == 0
                                       ? stepline::TraversalDirection::REVERSE
                                       : stepline::TraversalDirection::FORWARD;
                changed = true;
            }
        }

        if (changed && ui_step_indicator_set_config(obj, config)) {
            // Markup describes a resting state, not a transition
            data->indicator->finish_animation();
        }
    }

    lv_xml_obj_apply(state, attrs);
}

void ui_step_indicator_register() {
    lv_xml_register_widget("step_indicator", step_indicator_xml_create, step_indicator_xml_apply);
    spdlog::trace("[StepIndicatorWidget] Registered <step_indicator> widget");
}
