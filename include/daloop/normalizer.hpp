#pragma once

/// @file include/daloop/normalizer.hpp
/// @brief FeatureNormalizer — row-wise L2 normalization of feature batches.
///
/// # Module: Feature Normalizer
///
/// ## Responsibility
/// Project every sample of a feature batch onto the unit hypersphere before
/// it is compared by cosine similarity (SphericalKMeans), summed into a class
/// centroid (SourceCentroidEstimator) or stored (TargetMemoryBank).
///
/// ## Formula
/// For each row x:
///   x_norm = x / max(‖x‖₂, NORM_EPSILON)
///
/// ## Edge Cases
/// - Zero row: stays a zero row. No exception, no NaN.
/// - Row with ‖x‖ < NORM_EPSILON: scaled by 1/NORM_EPSILON, so its norm
///   stays below 1. Only exact zeros are expected in practice.
/// - Empty batch (0 rows): returned unchanged.
///
/// ## Guarantees
/// - Pure: no state, no side effects on the input
/// - Never divides by zero

#include "daloop/constants.hpp"
#include "daloop/types.hpp"

namespace daloop {

/// Row-wise L2 normalizer. All methods are static.
class FeatureNormalizer {
public:
    FeatureNormalizer() = delete;

    /// Return a copy of `features` with every row L2-normalized.
    [[nodiscard]] static Matrix normalize(const Matrix& features);

    /// Normalize every row of `features` in place.
    static void normalize_in_place(Matrix& features) noexcept;

    /// Euclidean norm of every row; length = features.rows().
    [[nodiscard]] static Vector row_norms(const Matrix& features);

    /// True if every row has norm 1 within `tol`. Vacuously true for 0 rows.
    [[nodiscard]] static bool all_unit_rows(const Matrix& features,
                                            double tol = constants::UNIT_NORM_TOLERANCE) noexcept;
};

} // namespace daloop
