#pragma once

/// @file include/daloop/types.hpp
/// @brief Shared primitive types for the daloop domain-adaptation loop.
///
/// All modules include this file. It defines the Eigen-based matrix aliases,
/// the strong scalar types and the domain discriminant used throughout.

#include <Eigen/Dense>

#include <cstdint>
#include <string>

namespace daloop {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// A batch of vectors, one sample per row.
/// Row-major so that gathering and scattering whole samples is contiguous.
using Matrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// A single feature vector or a per-sample column of scalars.
using Vector = Eigen::VectorXd;

/// One sample as a row vector.
using RowVector = Eigen::Matrix<double, 1, Eigen::Dynamic>;

// ─── Strong Scalar Types ──────────────────────────────────────────────────────

/// Stable per-sample identifier, unique within a dataset.
using SampleIndex = std::int64_t;

/// Where tensors live. Every memory-bank operation requires the model and
/// the bank to report the same device.
struct Device {
    std::string name = "cpu";

    friend bool operator==(const Device&, const Device&) = default;
};

// ─── Domain Discriminant ──────────────────────────────────────────────────────

/// Source domain ids are non-negative.
[[nodiscard]] constexpr bool is_source(int domain) noexcept {
    return domain >= 0;
}

/// Target domain ids are negative.
[[nodiscard]] constexpr bool is_target(int domain) noexcept {
    return domain < 0;
}

} // namespace daloop
