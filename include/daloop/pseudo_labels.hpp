#pragma once

/// @file include/daloop/pseudo_labels.hpp
/// @brief Softmax and batch-relative sharpening of classifier outputs.
///
/// # Sharpening
/// Given logits for a batch of B samples and C classes:
///   p = softmax(logits) row-wise
///   q_bc = p_bc² / Σ_b' p_b'c²
///
/// The sum runs over the BATCH axis, separately for each class column, so
/// every column of q sums to 1 while rows generally do not. This favours
/// samples that are confident relative to the rest of the batch for a class.
///
/// ## Edge Cases
/// - Column sum below COLUMN_SUM_EPSILON (softmax underflow): the column is
///   divided by the epsilon instead and stays (near) zero.
/// - Empty batch: returned unchanged.

#include "daloop/types.hpp"

#include <vector>

namespace daloop {

class PseudoLabels {
public:
    PseudoLabels() = delete;

    /// Numerically stable row-wise softmax. Every row sums to 1.
    [[nodiscard]] static Matrix softmax_rows(const Matrix& logits);

    /// Square then renormalize each class column over the batch.
    [[nodiscard]] static Matrix sharpen_batch(const Matrix& probabilities);

    /// softmax_rows followed by sharpen_batch.
    [[nodiscard]] static Matrix sharpened_softmax(const Matrix& logits);

    /// Index of the largest entry of each row (ties → lowest column).
    [[nodiscard]] static std::vector<int> argmax_rows(const Matrix& scores);
};

} // namespace daloop
