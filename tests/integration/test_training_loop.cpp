/// @file tests/integration/test_training_loop.cpp
/// @brief End-to-end tests: Trainer + SourceCentroidEstimator +
///        TargetMemoryBank + PseudoLabelCriterion on shifted blobs.
///
/// These tests exercise the complete hook path:
///   epoch begin → source centroids → seeded target clustering → publish
///   batch step  → criterion reads clusterer / memory
///   batch end   → sharpened outputs → memory EMA

#include "daloop/adaptation.hpp"
#include "daloop/callbacks.hpp"
#include "daloop/criterion.hpp"
#include "daloop/normalizer.hpp"
#include "daloop/synthetic.hpp"
#include "daloop/trainer.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace daloop;

// ─── Helpers ──────────────────────────────────────────────────────────────────

namespace {

/// Copies the published clusterer pointer at every epoch begin. Registered
/// after the estimator, so it sees the clusterer of the current epoch.
class ClustererSnapshot : public TrainingCallback {
public:
    explicit ClustererSnapshot(const AdaptationState& state) : state_(state) {}

    void on_epoch_begin(Model& /*net*/, const DomainDataset& /*train*/) override {
        seen.push_back(state_.target_clusterer);
    }

    std::vector<std::shared_ptr<const SphericalKMeans>> seen;

private:
    const AdaptationState& state_;
};

struct LoopFixture {
    explicit LoopFixture(std::size_t epochs, std::size_t batch_size = 16)
        : blobs(make_shifted_blobs(ShiftedBlobsConfig{})),
          net(MlpConfig{
              .input_dim  = 2,
              .hidden_dim = 8,
              .n_classes  = 2,
              .seed       = 3,
              .device     = Device{},
          }),
          state(blobs.train, net.feature_dim(), 2, net.device(), 3),
          criterion(state),
          trainer(net, criterion, state, TrainerConfig{
              .max_epochs    = epochs,
              .batch_size    = batch_size,
              .learning_rate = 0.1,
              .seed          = 5,
              .shuffle       = true,
              .verbose       = false,
          }) {
        centroids = std::make_shared<SourceCentroidEstimator>(state);
        memory    = std::make_shared<TargetMemoryBank>(state);
        snapshot  = std::make_shared<ClustererSnapshot>(state);
        trainer.add_callback(centroids);
        trainer.add_callback(snapshot);
        trainer.add_callback(memory);
    }

    ShiftedBlobs                        blobs;
    MlpClassifier                       net;
    AdaptationState                     state;
    PseudoLabelCriterion                criterion;
    Trainer                             trainer;
    std::shared_ptr<SourceCentroidEstimator> centroids;
    std::shared_ptr<TargetMemoryBank>        memory;
    std::shared_ptr<ClustererSnapshot>       snapshot;
};

}  // anonymous namespace

// ─── Epoch-begin hook ─────────────────────────────────────────────────────────

TEST(TrainingLoop, FreshClustererEveryEpoch) {
    LoopFixture f(3);
    const auto history = f.trainer.fit(f.blobs.train);

    ASSERT_EQ(f.snapshot->seen.size(), 3u);
    for (const auto& c : f.snapshot->seen) {
        ASSERT_NE(c, nullptr);
        EXPECT_EQ(c->n_clusters(), 2u);
    }
    EXPECT_NE(f.snapshot->seen[0].get(), f.snapshot->seen[1].get());
    EXPECT_NE(f.snapshot->seen[1].get(), f.snapshot->seen[2].get());
    EXPECT_EQ(f.state.target_clusterer.get(), f.snapshot->seen[2].get());
    EXPECT_EQ(f.state.clusterer_epoch, 3u);
    EXPECT_EQ(f.centroids->epochs_seen(), 3u);
    for (const auto& e : history) EXPECT_EQ(e.n_clusters, 2u);
}

// ─── Batch-end hook ───────────────────────────────────────────────────────────

TEST(TrainingLoop, EveryTargetUpdatedOncePerEpoch) {
    const std::size_t epochs = 4;
    LoopFixture f(epochs);
    (void)f.trainer.fit(f.blobs.train);

    for (SampleIndex idx : f.blobs.train.target_sample_indices()) {
        EXPECT_EQ(f.state.memory.update_count(idx), epochs);
    }
    EXPECT_TRUE(f.state.memory.features().allFinite());
    EXPECT_TRUE(f.state.memory.outputs().allFinite());
    EXPECT_GE(f.state.memory.outputs().minCoeff(), 0.0);
}

TEST(TrainingLoop, BatchesAppliedCountsTargetBatches) {
    // Shuffle off: 100 source rows then 100 target rows, batches of 40.
    // Batches 0, 1 are source only; batch 2 mixes; 3, 4 are target only.
    ShiftedBlobs blobs = make_shifted_blobs(ShiftedBlobsConfig{});
    MlpClassifier net(MlpConfig{});
    AdaptationState state(blobs.train, net.feature_dim(), 2);
    const PseudoLabelCriterion crit(state);
    TrainerConfig cfg;
    cfg.max_epochs = 1;
    cfg.batch_size = 40;
    cfg.shuffle = false;
    Trainer trainer(net, crit, state, cfg);
    auto memory = std::make_shared<TargetMemoryBank>(state);
    trainer.add_callback(memory);

    (void)trainer.fit(blobs.train);
    EXPECT_EQ(memory->batches_applied(), 3u);
}

// ─── Whole loop ───────────────────────────────────────────────────────────────

TEST(TrainingLoop, PseudoLabelsFlowAfterFirstEpoch) {
    LoopFixture f(2);
    const auto history = f.trainer.fit(f.blobs.train);
    ASSERT_EQ(history.size(), 2u);
    // The clusterer is published before the first batch and no memory row
    // has been updated when its own batch is scored, so every target row
    // gets a cluster label in the first epoch. From the second epoch on the
    // memory bank can veto labels it disagrees with.
    EXPECT_EQ(history[0].n_pseudo, f.blobs.train.n_target());
    EXPECT_GT(history[1].n_pseudo, 0u);
    EXPECT_LE(history[1].n_pseudo, f.blobs.train.n_target());
}

TEST(TrainingLoop, AdaptsToShiftedTarget) {
    LoopFixture f(15);
    (void)f.trainer.fit(f.blobs.train);

    const auto target = f.blobs.train.select(f.blobs.train.target_rows());
    const std::vector<int> pred = f.net.predict(target.X);
    ASSERT_EQ(pred.size(), f.blobs.target_truth.size());

    std::size_t correct = 0;
    for (std::size_t i = 0; i < pred.size(); ++i) {
        if (pred[i] == f.blobs.target_truth[i]) ++correct;
    }
    EXPECT_GE(static_cast<double>(correct) / static_cast<double>(pred.size()), 0.75);
}

TEST(TrainingLoop, DeterministicForSeeds) {
    LoopFixture a(2);
    LoopFixture b(2);
    const auto ha = a.trainer.fit(a.blobs.train);
    const auto hb = b.trainer.fit(b.blobs.train);
    ASSERT_EQ(ha.size(), hb.size());
    for (std::size_t i = 0; i < ha.size(); ++i) {
        EXPECT_DOUBLE_EQ(ha[i].mean_loss, hb[i].mean_loss);
    }
    EXPECT_EQ(a.state.memory.outputs(), b.state.memory.outputs());
}
