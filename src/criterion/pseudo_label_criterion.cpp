/// @file src/criterion/pseudo_label_criterion.cpp
/// @brief PseudoLabelCriterion — source cross-entropy plus a pseudo-label
///        term driven by the published clusterer and the memory bank.

#include "daloop/criterion.hpp"
#include "daloop/errors.hpp"
#include "daloop/pseudo_labels.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <span>

namespace daloop {

// ─── Constructor ──────────────────────────────────────────────────────────────

PseudoLabelCriterion::PseudoLabelCriterion(const AdaptationState& state,
                                           CriterionConfig config)
    : state_(state), config_(config) {}

// ─── pseudo_labels ────────────────────────────────────────────────────────────

std::vector<int> PseudoLabelCriterion::pseudo_labels(const ForwardResult& out,
                                                     const Batch& batch) const {
    std::vector<int> labels(batch.size(), -1);
    const std::vector<std::size_t> rows = batch.target_rows();
    if (rows.empty()) {
        return labels;
    }

    const auto n_classes = static_cast<int>(out.logits.cols());
    const MemoryBank& memory = state_.memory;

    // argmax of the memory row, or −1 while the row has never been updated.
    auto memory_label = [&](SampleIndex idx) {
        if (!memory.contains(idx) || memory.update_count(idx) == 0) {
            return -1;
        }
        const Matrix probs = memory.gather_outputs(std::span<const SampleIndex>(&idx, 1));
        Eigen::Index best = 0;
        probs.row(0).maxCoeff(&best);
        return best < n_classes ? static_cast<int>(best) : -1;
    };

    if (!state_.target_clusterer) {
        for (std::size_t row : rows) {
            labels[row] = memory_label(batch.sample_idx[row]);
        }
        return labels;
    }

    const std::vector<Eigen::Index> idx(rows.begin(), rows.end());
    const Matrix target_features = out.features(idx, Eigen::all);
    const std::vector<int> clusters = state_.target_clusterer->predict(target_features);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const auto cluster = static_cast<std::size_t>(clusters[i]);
        if (cluster >= state_.centroid_classes.size()) {
            continue;
        }
        const int cls = state_.centroid_classes[cluster];
        if (cls >= n_classes) {
            continue;
        }
        if (config_.require_memory_agreement) {
            const int remembered = memory_label(batch.sample_idx[rows[i]]);
            if (remembered >= 0 && remembered != cls) {
                continue;
            }
        }
        labels[rows[i]] = cls;
    }
    return labels;
}

// ─── evaluate ─────────────────────────────────────────────────────────────────

LossResult PseudoLabelCriterion::evaluate(const ForwardResult& out,
                                          const Batch& batch) const {
    const auto n = static_cast<Eigen::Index>(batch.size());
    if (out.logits.rows() != n || out.features.rows() != n) {
        throw InvalidArgument(fmt::format(
            "PseudoLabelCriterion: batch has {} rows but logits {} and features {}",
            n, out.logits.rows(), out.features.rows()));
    }

    const Matrix probs = PseudoLabels::softmax_rows(out.logits);
    const std::vector<int> pseudo = pseudo_labels(out, batch);
    const auto n_classes = static_cast<int>(out.logits.cols());

    LossResult result{
        .value       = 0.0,
        .grad_logits = Matrix::Zero(out.logits.rows(), out.logits.cols()),
        .n_source    = 0,
        .n_pseudo    = 0,
    };

    // Per-row cross-entropy, accumulated separately per term.
    double source_loss = 0.0;
    double pseudo_loss = 0.0;
    std::vector<bool> row_is_source(batch.size(), false);

    for (std::size_t i = 0; i < batch.size(); ++i) {
        int y = -1;
        if (is_source(batch.domain[i])) {
            if (batch.label[i] && *batch.label[i] >= 0 && *batch.label[i] < n_classes) {
                y = *batch.label[i];
                row_is_source[i] = true;
                ++result.n_source;
            }
        } else if (pseudo[i] >= 0) {
            y = pseudo[i];
            ++result.n_pseudo;
        }
        if (y < 0) {
            continue;
        }

        const auto r = static_cast<Eigen::Index>(i);
        const double p = std::max(probs(r, y), std::numeric_limits<double>::min());
        if (row_is_source[i]) {
            source_loss -= std::log(p);
        } else {
            pseudo_loss -= std::log(p);
        }

        // ∂CE/∂logits = softmax − onehot(y)
        result.grad_logits.row(r) = probs.row(r);
        result.grad_logits(r, y) -= 1.0;
    }

    const double source_scale =
        result.n_source > 0 ? 1.0 / static_cast<double>(result.n_source) : 0.0;
    const double pseudo_scale =
        result.n_pseudo > 0 ? config_.target_weight / static_cast<double>(result.n_pseudo) : 0.0;

    result.value = source_loss * source_scale + pseudo_loss * pseudo_scale;
    for (std::size_t i = 0; i < batch.size(); ++i) {
        result.grad_logits.row(static_cast<Eigen::Index>(i)) *=
            row_is_source[i] ? source_scale : pseudo_scale;
    }
    return result;
}

} // namespace daloop
