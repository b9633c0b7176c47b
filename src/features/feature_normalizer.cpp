/// @file src/features/feature_normalizer.cpp
/// @brief FeatureNormalizer — row-wise L2 normalization.

#include "daloop/normalizer.hpp"
#include "daloop/constants.hpp"

#include <algorithm>
#include <cmath>

namespace daloop {

// ─── normalize ────────────────────────────────────────────────────────────────

Matrix FeatureNormalizer::normalize(const Matrix& features) {
    Matrix out = features;
    normalize_in_place(out);
    return out;
}

// ─── normalize_in_place ───────────────────────────────────────────────────────

void FeatureNormalizer::normalize_in_place(Matrix& features) noexcept {
    for (Eigen::Index i = 0; i < features.rows(); ++i) {
        // stableNorm: squaring entries near 1e155 would overflow.
        const double norm = features.row(i).stableNorm();
        // Zero rows divide by NORM_EPSILON and therefore stay zero.
        features.row(i) /= std::max(norm, constants::NORM_EPSILON);
    }
}

// ─── row_norms ────────────────────────────────────────────────────────────────

Vector FeatureNormalizer::row_norms(const Matrix& features) {
    return features.rowwise().stableNorm();
}

// ─── all_unit_rows ────────────────────────────────────────────────────────────

bool FeatureNormalizer::all_unit_rows(const Matrix& features,
                                      double tol) noexcept {
    for (Eigen::Index i = 0; i < features.rows(); ++i) {
        if (std::abs(features.row(i).stableNorm() - 1.0) > tol) {
            return false;
        }
    }
    return true;
}

} // namespace daloop
