/// @file src/criterion/pseudo_labels.cpp
/// @brief Row softmax and column-wise squared-softmax renormalization.

#include "daloop/pseudo_labels.hpp"
#include "daloop/constants.hpp"

#include <algorithm>

namespace daloop {

// ─── softmax_rows ─────────────────────────────────────────────────────────────

Matrix PseudoLabels::softmax_rows(const Matrix& logits) {
    Matrix out(logits.rows(), logits.cols());
    for (Eigen::Index i = 0; i < logits.rows(); ++i) {
        // Shift by the row max so exp() cannot overflow.
        const double row_max = logits.row(i).maxCoeff();
        out.row(i) = (logits.row(i).array() - row_max).exp().matrix();
        out.row(i) /= out.row(i).sum();
    }
    return out;
}

// ─── sharpen_batch ────────────────────────────────────────────────────────────

Matrix PseudoLabels::sharpen_batch(const Matrix& probabilities) {
    Matrix squared = probabilities.array().square().matrix();
    for (Eigen::Index c = 0; c < squared.cols(); ++c) {
        const double col_sum = squared.col(c).sum();
        squared.col(c) /= std::max(col_sum, constants::COLUMN_SUM_EPSILON);
    }
    return squared;
}

// ─── sharpened_softmax ────────────────────────────────────────────────────────

Matrix PseudoLabels::sharpened_softmax(const Matrix& logits) {
    return sharpen_batch(softmax_rows(logits));
}

// ─── argmax_rows ──────────────────────────────────────────────────────────────

std::vector<int> PseudoLabels::argmax_rows(const Matrix& scores) {
    std::vector<int> out(static_cast<std::size_t>(scores.rows()), 0);
    for (Eigen::Index i = 0; i < scores.rows(); ++i) {
        Eigen::Index best = 0;
        for (Eigen::Index c = 1; c < scores.cols(); ++c) {
            if (scores(i, c) > scores(i, best)) {
                best = c;
            }
        }
        out[static_cast<std::size_t>(i)] = static_cast<int>(best);
    }
    return out;
}

} // namespace daloop
