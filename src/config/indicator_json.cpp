// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "indicator_json.h"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stepline {

// ============================================================================
// Enum <-> string helpers
// ============================================================================

static const char* axis_name(Axis axis) {
    return axis == Axis::HORIZONTAL ? "horizontal" : "vertical";
}

static const char* direction_name(TraversalDirection direction) {
    return direction == TraversalDirection::FORWARD ? "forward" : "reverse";
}

static const char* alignment_name(CrossAlignment alignment) {
    switch (alignment) {
    case CrossAlignment::START:
        return "start";
    case CrossAlignment::CENTER:
        return "center";
    case CrossAlignment::END:
        return "end";
    }
    return "center";
}

static const char* restart_policy_name(RestartPolicy policy) {
    return policy == RestartPolicy::FROM_PREVIOUS_TARGET ? "previous_target" : "displayed_value";
}

// ============================================================================
// Field parsers
// ============================================================================

/**
 * @brief Read a "#rrggbb" color field, keeping @p fallback when absent or malformed
 */
static Color parse_color_field(const nlohmann::json& json, const char* key, Color fallback,
                               const std::string& source_name) {
    if (!json.contains(key)) {
        return fallback;
    }
    auto parsed = parse_hex_color(json[key].get<std::string>());
    if (!parsed) {
        spdlog::warn("[IndicatorJson] Invalid color '{}' for '{}' in {}, using {}",
                     json[key].get<std::string>(), key, source_name, to_hex_string(fallback));
        return fallback;
    }
    return *parsed;
}

/**
 * @brief Parse { "colors": [...], "stops": [...] }
 *
 * Stops are optional; without them the colors are spread evenly.
 * @throws std::invalid_argument on malformed colors or stops
 */
static Gradient parse_gradient(const nlohmann::json& json, const char* key) {
    const auto& node = json.at(key);
    std::vector<Color> colors;
    for (const auto& c : node.at("colors")) {
        auto parsed = parse_hex_color(c.get<std::string>());
        if (!parsed) {
            throw std::invalid_argument(std::string(key) + ": invalid color '" +
                                        c.get<std::string>() + "'");
        }
        colors.push_back(*parsed);
    }

    if (!node.contains("stops")) {
        return Gradient::evenly_spaced(colors);
    }

    auto positions = node["stops"].get<std::vector<float>>();
    if (positions.size() != colors.size()) {
        throw std::invalid_argument(std::string(key) + ": " + std::to_string(colors.size()) +
                                    " colors but " + std::to_string(positions.size()) + " stops");
    }
    std::vector<GradientStop> stops;
    for (size_t i = 0; i < colors.size(); ++i) {
        stops.push_back({colors[i], positions[i]});
    }
    return Gradient(std::move(stops));
}

static nlohmann::json gradient_to_json(const Gradient& gradient) {
    nlohmann::json result;
    result["colors"] = nlohmann::json::array();
    result["stops"] = nlohmann::json::array();
    for (const auto& stop : gradient.stops()) {
        result["colors"].push_back(to_hex_string(stop.color));
        result["stops"].push_back(stop.position);
    }
    return result;
}

static nlohmann::json paint_to_json(const StepPaint& paint) {
    nlohmann::json result;
    result["color"] = to_hex_string(paint.color);
    if (paint.gradient) {
        result["gradient"] = gradient_to_json(*paint.gradient);
    }
    return result;
}

// ============================================================================
// Public API
// ============================================================================

std::optional<IndicatorConfig> parse_indicator_json(const std::string& json_str,
                                                    const std::string& source_name) {
    IndicatorConfig config;

    try {
        auto json = nlohmann::json::parse(json_str);

        if (!json.contains("total_steps")) {
            spdlog::error("[IndicatorJson] Missing 'total_steps' in {}", source_name);
            return std::nullopt;
        }
        config.total_steps = json["total_steps"].get<int>();
        config.current_progress = json.value("current_step", 0.0f);

        std::string axis = json.value("axis", "horizontal");
        if (axis == "vertical") {
            config.axis = Axis::VERTICAL;
        } else if (axis != "horizontal") {
            spdlog::warn("[IndicatorJson] Unknown axis '{}' in {}, using horizontal", axis,
                         source_name);
        }

        std::string direction = json.value("direction", "forward");
        if (direction == "reverse" || direction == "rtl") {
            config.direction = TraversalDirection::REVERSE;
        } else if (direction != "forward" && direction != "ltr") {
            spdlog::warn("[IndicatorJson] Unknown direction '{}' in {}, using forward", direction,
                         source_name);
        }

        std::string alignment = json.value("cross_alignment", "center");
        if (alignment == "start") {
            config.cross_alignment = CrossAlignment::START;
        } else if (alignment == "end") {
            config.cross_alignment = CrossAlignment::END;
        }

        config.padding = json.value("padding", config.padding);
        config.size = json.value("size", config.size);
        if (json.contains("selected_size")) {
            config.selected_size = json["selected_size"].get<float>();
        }
        if (json.contains("unselected_size")) {
            config.unselected_size = json["unselected_size"].get<float>();
        }

        config.selected_color =
            parse_color_field(json, "selected_color", config.selected_color, source_name);
        config.unselected_color =
            parse_color_field(json, "unselected_color", config.unselected_color, source_name);

        if (json.contains("gradient")) {
            config.gradient = parse_gradient(json, "gradient");
        }
        if (json.contains("selected_gradient")) {
            config.selected_gradient = parse_gradient(json, "selected_gradient");
        }
        if (json.contains("unselected_gradient")) {
            config.unselected_gradient = parse_gradient(json, "unselected_gradient");
        }

        if (json.contains("corner_radius")) {
            config.corner_radius = json["corner_radius"].get<float>();
        }
        config.fallback_length = json.value("fallback_length", config.fallback_length);

        if (json.contains("animation")) {
            const auto& anim = json["animation"];
            // Signed read so a negative duration is rejected rather than wrapped
            int64_t duration_ms =
                anim.value("duration_ms", static_cast<int64_t>(config.animation_duration_ms));
            if (duration_ms < 0 || duration_ms > static_cast<int64_t>(UINT32_MAX)) {
                throw std::invalid_argument("animation.duration_ms out of range: " +
                                            std::to_string(duration_ms));
            }
            config.animation_duration_ms = static_cast<uint32_t>(duration_ms);
            config.animation_curve =
                parse_easing_curve(anim.value("curve", ""), config.animation_curve);
            if (anim.value("restart", "previous_target") == "displayed_value") {
                config.restart_policy = RestartPolicy::FROM_DISPLAYED_VALUE;
            }
        }

        config.validate();
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("[IndicatorJson] Failed to parse {}: {}", source_name, e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        spdlog::error("[IndicatorJson] Invalid indicator in {}: {}", source_name, e.what());
        return std::nullopt;
    }

    spdlog::debug("[IndicatorJson] Loaded {}: {} steps, progress {}", source_name,
                  config.total_steps, config.current_progress);
    return config;
}

std::optional<IndicatorConfig> load_indicator_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("[IndicatorJson] Failed to open {}", filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string filename = filepath;
    size_t slash = filepath.rfind('/');
    if (slash != std::string::npos) {
        filename = filepath.substr(slash + 1);
    }

    return parse_indicator_json(buffer.str(), filename);
}

nlohmann::json indicator_to_json(const IndicatorConfig& config) {
    nlohmann::json json;

    json["total_steps"] = config.total_steps;
    json["current_step"] = config.current_progress;
    json["axis"] = axis_name(config.axis);
    json["direction"] = direction_name(config.direction);
    json["cross_alignment"] = alignment_name(config.cross_alignment);
    json["padding"] = config.padding;
    json["size"] = config.size;
    if (config.selected_size) {
        json["selected_size"] = *config.selected_size;
    }
    if (config.unselected_size) {
        json["unselected_size"] = *config.unselected_size;
    }
    json["selected_color"] = to_hex_string(config.selected_color);
    json["unselected_color"] = to_hex_string(config.unselected_color);
    if (config.gradient) {
        json["gradient"] = gradient_to_json(*config.gradient);
    }
    if (config.selected_gradient) {
        json["selected_gradient"] = gradient_to_json(*config.selected_gradient);
    }
    if (config.unselected_gradient) {
        json["unselected_gradient"] = gradient_to_json(*config.unselected_gradient);
    }
    if (config.corner_radius) {
        json["corner_radius"] = *config.corner_radius;
    }
    json["fallback_length"] = config.fallback_length;
    json["animation"] = {{"duration_ms", config.animation_duration_ms},
                         {"curve", easing_curve_name(config.animation_curve)},
                         {"restart", restart_policy_name(config.restart_policy)}};

    if (config.size_resolver || config.color_resolver || config.content_factory ||
        config.activation_factory) {
        spdlog::debug("[IndicatorJson] Callbacks are not serialized");
    }
    return json;
}

bool save_indicator_to_file(const IndicatorConfig& config, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("[IndicatorJson] Failed to write {}", filepath);
        return false;
    }

    file << indicator_to_json(config).dump(2);
    return true;
}

nlohmann::json layout_to_json(const IndicatorLayout& layout) {
    nlohmann::json json;
    json["total_length"] = layout.total_length;
    json["cross_extent"] = layout.cross_extent;
    json["animated_value"] = layout.animated_value;
    json["optimized"] = layout.optimized;

    json["segments"] = nlohmann::json::array();
    for (const auto& seg : layout.segments) {
        nlohmann::json s;
        s["index"] = seg.index;
        s["traversal_index"] = seg.traversal_index;
        s["offset_primary"] = seg.offset_primary;
        s["offset_cross"] = seg.offset_cross;
        s["length_primary"] = seg.length_primary;
        s["size_cross"] = seg.size_cross;
        s["fill_fraction"] = seg.fill_fraction;
        s["color"] = to_hex_string(seg.color);
        s["fill"] = paint_to_json(seg.fill);
        s["track"] = paint_to_json(seg.track);
        s["is_first"] = seg.is_first;
        s["is_last"] = seg.is_last;
        s["is_only_step"] = seg.is_only_step;
        s["corner_mask"] = seg.corner_mask;
        s["has_content"] = static_cast<bool>(seg.content);
        s["activatable"] = static_cast<bool>(seg.on_activate);
        json["segments"].push_back(s);
    }
    return json;
}

} // namespace stepline
