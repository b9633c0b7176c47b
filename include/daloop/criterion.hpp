#pragma once

/// @file include/daloop/criterion.hpp
/// @brief PseudoLabelCriterion — the downstream loss that reads the state
///        published by the adaptation hooks.
///
/// # Loss
///   L = mean_{source} CE(logits, y)  +  λ · mean_{pseudo} CE(logits, ŷ)
///
/// Pseudo-label ŷ of a target row:
///   1. with a published clusterer: the class that seeded the cluster the
///      row's features fall in, kept only if the row's memory-bank argmax
///      agrees (or the row has not been updated yet)
///   2. without one: argmax of the row's memory-bank output, once the row
///      has been updated at least once
///   3. none — the row does not contribute
///
/// Gradients are returned with respect to the logits so any TrainableModel
/// can back-propagate them.

#include "daloop/adaptation.hpp"
#include "daloop/dataset.hpp"
#include "daloop/model.hpp"

#include <cstddef>
#include <vector>

namespace daloop {

struct CriterionConfig {
    /// λ — weight of the pseudo-label term.
    double target_weight = 0.5;

    /// Drop a cluster label that the row's memory-bank argmax contradicts.
    bool require_memory_agreement = true;
};

struct LossResult {
    double      value;        ///< total loss
    Matrix      grad_logits;  ///< ∂L/∂logits, same shape as the logits
    std::size_t n_source;     ///< rows in the source term
    std::size_t n_pseudo;     ///< target rows with a pseudo-label
};

class PseudoLabelCriterion {
public:
    explicit PseudoLabelCriterion(const AdaptationState& state,
                                  CriterionConfig config = CriterionConfig{});

    /// Loss and logit gradient for one batch. Throws InvalidArgument if the
    /// forward result does not match the batch.
    [[nodiscard]] LossResult evaluate(const ForwardResult& out,
                                      const Batch& batch) const;

    /// Pseudo-label for every row of `batch` (−1 where none is available;
    /// source rows always get −1).
    [[nodiscard]] std::vector<int> pseudo_labels(const ForwardResult& out,
                                                 const Batch& batch) const;

    [[nodiscard]] const CriterionConfig& config() const noexcept { return config_; }

private:
    const AdaptationState& state_;
    CriterionConfig        config_;
};

} // namespace daloop
