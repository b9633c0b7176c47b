#pragma once

/// @file include/daloop/trainer.hpp
/// @brief Trainer — the minibatch loop that drives the adaptation hooks.
///
/// # Loop
/// ```
/// for epoch in 1..max_epochs:
///     for cb in callbacks: cb.on_epoch_begin(model, train)
///     for batch in make_batches(train, batch_size, shuffled):
///         model.set_training(true)
///         out  = model.forward(batch.X)
///         loss = criterion.evaluate(out, batch)
///         model.zero_grad(); model.backward(loss.grad_logits); model.step(lr)
///         for cb in callbacks: cb.on_batch_end(model, batch)
/// ```
///
/// ## Guarantees
/// - Callbacks run synchronously, in registration order
/// - Exceptions from the model, criterion or callbacks abort fit() and
///   propagate unchanged
/// - Deterministic for a given seed

#include "daloop/callbacks.hpp"
#include "daloop/criterion.hpp"
#include "daloop/dataset.hpp"
#include "daloop/model.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace daloop {

// ─── TrainerConfig ────────────────────────────────────────────────────────────

struct TrainerConfig {
    std::size_t max_epochs    = 10;
    std::size_t batch_size    = 32;
    double      learning_rate = 0.1;

    /// Seed for the per-epoch batch shuffle.
    unsigned seed = 0;

    /// If false, batches follow dataset order.
    bool shuffle = true;

    /// If true, print one line per epoch to stderr.
    bool verbose = false;
};

// ─── EpochSummary ─────────────────────────────────────────────────────────────

struct EpochSummary {
    std::size_t epoch;       ///< 1-based
    std::size_t n_batches;
    double      mean_loss;   ///< mean of per-batch loss values
    std::size_t n_pseudo;    ///< target rows that received a pseudo-label
    std::size_t n_clusters;  ///< k of the clusterer published this epoch (0 if none)
};

// ─── Trainer ──────────────────────────────────────────────────────────────────

class Trainer {
public:
    Trainer(TrainableModel& model,
            const PseudoLabelCriterion& criterion,
            const AdaptationState& state,
            TrainerConfig config = TrainerConfig{});

    /// Append a callback. Callbacks run in the order they were added.
    void add_callback(std::shared_ptr<TrainingCallback> callback);

    /// Run max_epochs epochs over `train`. Returns one summary per epoch.
    /// Throws InvalidArgument if `train` is malformed.
    std::vector<EpochSummary> fit(const DomainDataset& train);

    [[nodiscard]] const TrainerConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::size_t n_callbacks() const noexcept { return callbacks_.size(); }

private:
    TrainableModel&                                model_;
    const PseudoLabelCriterion&                    criterion_;
    const AdaptationState&                         state_;
    TrainerConfig                                  config_;
    std::vector<std::shared_ptr<TrainingCallback>> callbacks_;
};

} // namespace daloop
