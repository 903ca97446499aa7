// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <vector>

namespace stepline {

/// Order in which steps fill as progress grows
enum class TraversalDirection {
    FORWARD, ///< left-to-right / top-to-bottom
    REVERSE  ///< right-to-left / bottom-to-top
};

/**
 * @brief Position of a physical step counted from the traversal start
 *
 * FORWARD maps step i to i; REVERSE maps step i to total_steps - 1 - i.
 */
int traversal_index(int step, int total_steps, TraversalDirection direction);

/**
 * @brief How much of @p step is filled for a given animated progress value
 *
 * With i = traversal_index(step): 1.0 when i < floor(value),
 * value - floor(value) when i == floor(value), 0.0 otherwise. Exactly one
 * step is partially filled unless value is a whole number.
 */
float step_fill_fraction(int step, int total_steps, float value, TraversalDirection direction);

/// Fill fraction of every step, in physical order
std::vector<float> step_fill_fractions(int total_steps, float value, TraversalDirection direction);

} // namespace stepline
