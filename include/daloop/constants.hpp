#pragma once

#include <cstddef>

/// @file include/daloop/constants.hpp
/// @brief Numerical constants and defaults for the daloop system.

namespace daloop::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Lower bound on a row norm before division. Rows with a smaller norm are
/// divided by this value instead, so a zero row stays a zero row.
static constexpr double NORM_EPSILON = 1e-12;

/// Lower bound on a column sum in the batch-relative sharpening step.
static constexpr double COLUMN_SUM_EPSILON = 1e-300;

/// Tolerance used when checking unit norms and probability sums.
static constexpr double UNIT_NORM_TOLERANCE = 1e-9;

// ─── Spherical K-Means Defaults ───────────────────────────────────────────────

/// Iteration cap for one Lloyd run.
static constexpr std::size_t KMEANS_MAX_ITER = 300;

/// Largest centroid shift (L2) that still counts as converged.
static constexpr double KMEANS_TOL = 1e-4;

/// Restarts for the random-initialisation fallback.
static constexpr std::size_t KMEANS_N_INIT = 10;

// ─── Memory Bank Defaults ─────────────────────────────────────────────────────

/// Weight given to the freshly computed value in the memory-bank blend.
static constexpr double DEFAULT_MOMENTUM = 0.7;

// ─── Synthetic Data ───────────────────────────────────────────────────────────

/// Domain id assigned to generated source samples.
static constexpr int SYNTHETIC_SOURCE_DOMAIN = 1;

/// Domain id assigned to generated target samples.
static constexpr int SYNTHETIC_TARGET_DOMAIN = -2;

} // namespace daloop::constants
