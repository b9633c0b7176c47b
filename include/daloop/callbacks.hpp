#pragma once

/// @file include/daloop/callbacks.hpp
/// @brief Training-loop hooks: the two-method callback interface and the
///        two adaptation hooks built on it.
///
/// # Module: Adaptation Callbacks
///
/// ## Hook Points
/// The Trainer calls every registered callback, in registration order:
///   on_epoch_begin(net, train)  — before the first batch of each epoch
///   on_batch_end(net, batch)    — after the optimizer step of each batch
/// Both run synchronously; the loop does not proceed until they return.
/// Exceptions propagate out of Trainer::fit.
///
/// ## SourceCentroidEstimator (epoch begin)
///   1. split train by domain sign
///   2. features of both subsets, evaluation mode, const model path
///   3. per class c with ≥ 1 source sample: Σ normalize(features of class c)
///      (a SUM, so the magnitude grows with class size)
///   4. SphericalKMeans on target features, seeded by those centroids
///   5. publish a new clusterer into AdaptationState
///
/// ## TargetMemoryBank (batch end)
///   1. target rows of the batch and their stable sample indices
///   2. evaluation-mode forward → (logits, features)
///   3. features normalized, logits → sharpened batch-relative softmax
///   4. MemoryBank::update with the configured momentum and rule

#include "daloop/adaptation.hpp"
#include "daloop/clustering.hpp"
#include "daloop/constants.hpp"
#include "daloop/dataset.hpp"
#include "daloop/memory_bank.hpp"
#include "daloop/model.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace daloop {

// ─── TrainingCallback ─────────────────────────────────────────────────────────

class TrainingCallback {
public:
    virtual ~TrainingCallback() = default;

    virtual void on_epoch_begin(Model& net, const DomainDataset& train);
    virtual void on_batch_end(Model& net, const Batch& batch);
};

// ─── SourceCentroidEstimator ──────────────────────────────────────────────────

struct SourceCentroidConfig {
    /// Number of classes. If unset, max(source label) + 1 of each epoch.
    std::optional<std::size_t> n_classes;

    /// Configuration for the target clustering (seeded path only).
    SphericalKMeansConfig kmeans{};

    /// If true, print one summary line per epoch to stderr.
    bool verbose = false;
};

class SourceCentroidEstimator : public TrainingCallback {
public:
    explicit SourceCentroidEstimator(AdaptationState& state,
                                     SourceCentroidConfig config = SourceCentroidConfig{});

    void on_epoch_begin(Model& net, const DomainDataset& train) override;

    /// Per-class summed normalized source features. Classes with no samples
    /// are skipped; `classes` receives the class id of every output row.
    ///
    /// Throws InvalidArgument on a source row without label or with a
    /// negative label, EmptyPartition if no class has a sample.
    [[nodiscard]] static Matrix
    class_centroids(const Matrix& source_features,
                    const std::vector<std::optional<int>>& labels,
                    std::size_t n_classes,
                    std::vector<int>& classes);

    /// Epochs processed so far.
    [[nodiscard]] std::size_t epochs_seen() const noexcept { return epoch_; }

private:
    AdaptationState&     state_;
    SourceCentroidConfig config_;
    std::size_t          epoch_ = 0;
};

// ─── TargetMemoryBank ─────────────────────────────────────────────────────────

struct TargetMemoryBankConfig {
    /// Weight of the fresh value; must lie in [0, 1).
    double momentum = constants::DEFAULT_MOMENTUM;

    /// Blend rule. Ema is the correct moving average; the other two
    /// reproduce historical behaviours for comparison runs.
    MemoryUpdateRule rule = MemoryUpdateRule::Ema;

    /// If true, print one line per batch to stderr.
    bool verbose = false;
};

class TargetMemoryBank : public TrainingCallback {
public:
    /// Throws InvalidArgument if momentum is outside [0, 1).
    explicit TargetMemoryBank(AdaptationState& state,
                              TargetMemoryBankConfig config = TargetMemoryBankConfig{});

    void on_batch_end(Model& net, const Batch& batch) override;

    [[nodiscard]] const TargetMemoryBankConfig& config() const noexcept { return config_; }

    /// Batches that contained at least one target row.
    [[nodiscard]] std::size_t batches_applied() const noexcept { return batches_applied_; }

private:
    AdaptationState&       state_;
    TargetMemoryBankConfig config_;
    std::size_t            batches_applied_ = 0;
};

} // namespace daloop
