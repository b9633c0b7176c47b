/// @file src/core/trainer.cpp
/// @brief Trainer — minibatch gradient descent with epoch/batch hooks.

#include "daloop/trainer.hpp"
#include "daloop/errors.hpp"

#include <fmt/core.h>

#include <random>
#include <utility>

namespace daloop {

// ─── Constructor ──────────────────────────────────────────────────────────────

Trainer::Trainer(TrainableModel& model,
                 const PseudoLabelCriterion& criterion,
                 const AdaptationState& state,
                 TrainerConfig config)
    : model_(model), criterion_(criterion), state_(state), config_(config) {}

// ─── add_callback ─────────────────────────────────────────────────────────────

void Trainer::add_callback(std::shared_ptr<TrainingCallback> callback) {
    if (!callback) {
        throw InvalidArgument("Trainer::add_callback: null callback");
    }
    callbacks_.push_back(std::move(callback));
}

// ─── fit ──────────────────────────────────────────────────────────────────────

std::vector<EpochSummary> Trainer::fit(const DomainDataset& train) {
    train.validate();
    if (train.dim() != model_.input_dim()) {
        throw InvalidArgument(fmt::format(
            "Trainer::fit: dataset has {} features, model expects {}",
            train.dim(), model_.input_dim()));
    }

    std::mt19937 rng(config_.seed);
    std::vector<EpochSummary> history;
    history.reserve(config_.max_epochs);

    for (std::size_t epoch = 1; epoch <= config_.max_epochs; ++epoch) {
        // ── Epoch-begin hooks ─────────────────────────────────────────────────
        for (const auto& cb : callbacks_) {
            cb->on_epoch_begin(model_, train);
        }

        const std::vector<Batch> batches =
            make_batches(train, config_.batch_size, config_.shuffle ? &rng : nullptr);

        double loss_sum = 0.0;
        std::size_t n_pseudo = 0;

        for (const Batch& batch : batches) {
            // ── Training step ─────────────────────────────────────────────────
            model_.set_training(true);
            const ForwardResult out = model_.forward(batch.X);
            const LossResult loss = criterion_.evaluate(out, batch);

            model_.zero_grad();
            model_.backward(loss.grad_logits);
            model_.step(config_.learning_rate);

            loss_sum += loss.value;
            n_pseudo += loss.n_pseudo;

            // ── Batch-end hooks ───────────────────────────────────────────────
            for (const auto& cb : callbacks_) {
                cb->on_batch_end(model_, batch);
            }
        }

        const EpochSummary summary{
            .epoch      = epoch,
            .n_batches  = batches.size(),
            .mean_loss  = batches.empty() ? 0.0
                                          : loss_sum / static_cast<double>(batches.size()),
            .n_pseudo   = n_pseudo,
            .n_clusters = state_.target_clusterer ? state_.target_clusterer->n_clusters() : 0,
        };
        history.push_back(summary);

        if (config_.verbose) {
            fmt::print(stderr,
                "[trainer] epoch {:3d}: batches={} loss={:.5f} pseudo={} k={}\n",
                summary.epoch, summary.n_batches, summary.mean_loss,
                summary.n_pseudo, summary.n_clusters);
        }
    }

    return history;
}

} // namespace daloop
