// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "indicator_config.h"
#include "segment_descriptor.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

/**
 * @file indicator_json.h
 * @brief JSON persistence for indicator configurations and layouts
 *
 * Example document:
 * @code{.json}
 * {
 *   "total_steps": 10,
 *   "current_step": 3,
 *   "axis": "horizontal",
 *   "direction": "forward",
 *   "padding": 0,
 *   "size": 8,
 *   "selected_color": "#2196f3",
 *   "unselected_color": "#9e9e9e",
 *   "selected_gradient": { "colors": ["#2196f3", "#9c27b0"] },
 *   "corner_radius": 4,
 *   "animation": { "duration_ms": 300, "curve": "ease_in_out" }
 * }
 * @endcode
 *
 * Callbacks (resolvers, content, activation) cannot be expressed in JSON and
 * are never read or written.
 */

namespace stepline {

/**
 * @brief Parse and validate an indicator configuration
 *
 * Missing optional keys keep IndicatorConfig defaults. Malformed colors fall
 * back to the default with a warning.
 *
 * @param json_str JSON document
 * @param source_name Name used in log messages (e.g. the file name)
 * @return Configuration, or std::nullopt if the document is unparseable,
 *         lacks total_steps, or fails validation
 */
std::optional<IndicatorConfig> parse_indicator_json(const std::string& json_str,
                                                    const std::string& source_name);

/**
 * @brief Read and parse a configuration file
 * @return std::nullopt if the file cannot be opened or parsed
 */
std::optional<IndicatorConfig> load_indicator_from_file(const std::string& filepath);

/// Write @p config as pretty-printed JSON. Returns false on I/O failure.
bool save_indicator_to_file(const IndicatorConfig& config, const std::string& filepath);

nlohmann::json indicator_to_json(const IndicatorConfig& config);

/// Serialize a computed layout (segments without content/activation payloads)
nlohmann::json layout_to_json(const IndicatorLayout& layout);

} // namespace stepline
