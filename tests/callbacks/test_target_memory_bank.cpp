/// @file tests/callbacks/test_target_memory_bank.cpp
/// @brief Unit tests for TargetMemoryBank (batch-end hook).
///
/// Test categories:
///   - Stored outputs are the batch-relative sharpened softmax
///   - Stored features are normalized model features
///   - Source-only batches are a no-op
///   - Evaluation-mode forward with mode restore
///   - Momentum validation and device mismatch

#include <gtest/gtest.h>
#include "daloop/adaptation.hpp"
#include "daloop/callbacks.hpp"
#include "daloop/errors.hpp"
#include "daloop/normalizer.hpp"
#include "daloop/pseudo_labels.hpp"
#include "support/fake_model.hpp"

#include <vector>

using namespace daloop;
using daloop::testing::FakeModel;
using daloop::testing::make_dataset;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

constexpr int kSrc = 0;
constexpr int kTgt = -1;

/// Two source rows followed by three target rows (sample_idx 2, 3, 4).
DomainDataset mixed_batch() {
    return make_dataset(
        {{1.0, 0.0}, {0.0, 1.0}, {2.0, 0.5}, {0.3, 1.5}, {1.0, 1.0}},
        {kSrc, kSrc, kTgt, kTgt, kTgt},
        {0, 1, -1, -1, -1});
}

/// Overwrite-with-fresh-values config: EMA with momentum close to zero
/// would hide the written values, so tests read the scaled-overwrite rule
/// at momentum 0.5 and divide back.
TargetMemoryBankConfig overwrite_half() {
    TargetMemoryBankConfig cfg;
    cfg.momentum = 0.5;
    cfg.rule = MemoryUpdateRule::ScaledOverwrite;
    return cfg;
}

}  // anonymous namespace

// ─── Stored values ───────────────────────────────────────────────────────────

TEST(TargetMemoryBank, OutputColumnsSumToOneOverBatch) {
    const DomainDataset batch = mixed_batch();
    FakeModel net(Matrix::Identity(2, 2));
    AdaptationState state(batch, 2, 2);
    TargetMemoryBank hook(state, overwrite_half());

    hook.on_batch_end(net, batch);

    const std::vector<SampleIndex> idx = {2, 3, 4};
    const Matrix stored = state.memory.gather_outputs(idx) / 0.5;
    for (Eigen::Index c = 0; c < stored.cols(); ++c) {
        EXPECT_NEAR(stored.col(c).sum(), 1.0, 1e-12);
    }
}

TEST(TargetMemoryBank, OutputsMatchSharpenedSoftmax) {
    const DomainDataset batch = mixed_batch();
    FakeModel net(Matrix::Identity(2, 2));
    AdaptationState state(batch, 2, 2);
    TargetMemoryBank hook(state, overwrite_half());
    hook.on_batch_end(net, batch);

    // FakeModel logits = features = X for the identity head.
    Matrix target_logits(3, 2);
    target_logits << 2.0, 0.5,
                     0.3, 1.5,
                     1.0, 1.0;
    const Matrix expected = PseudoLabels::sharpened_softmax(target_logits);
    const Matrix stored = state.memory.gather_outputs(std::vector<SampleIndex>{2, 3, 4}) / 0.5;
    EXPECT_TRUE(stored.isApprox(expected, 1e-12));
}

TEST(TargetMemoryBank, FeaturesAreNormalized) {
    const DomainDataset batch = mixed_batch();
    FakeModel net(Matrix::Identity(2, 2));
    AdaptationState state(batch, 2, 2);
    TargetMemoryBank hook(state, overwrite_half());
    hook.on_batch_end(net, batch);

    const Matrix stored = state.memory.gather_features(std::vector<SampleIndex>{2, 3, 4}) / 0.5;
    EXPECT_TRUE(FeatureNormalizer::all_unit_rows(stored, 1e-12));
    EXPECT_NEAR(stored(2, 0), stored(2, 1), 1e-15);
}

TEST(TargetMemoryBank, DefaultConfigIsEmaAtPointSeven) {
    const DomainDataset batch = mixed_batch();
    AdaptationState state(batch, 2, 2);
    const TargetMemoryBank hook(state);
    EXPECT_DOUBLE_EQ(hook.config().momentum, 0.7);
    EXPECT_EQ(hook.config().rule, MemoryUpdateRule::Ema);
}

TEST(TargetMemoryBank, EmaMovesTowardFreshOutputs) {
    const DomainDataset batch = mixed_batch();
    FakeModel net(Matrix::Identity(2, 2));
    AdaptationState state(batch, 2, 2);
    TargetMemoryBank hook(state);
    hook.on_batch_end(net, batch);

    Matrix logits(3, 2);
    logits << 2.0, 0.5,
              0.3, 1.5,
              1.0, 1.0;
    const Matrix fresh = PseudoLabels::sharpened_softmax(logits);
    const Matrix expected = 0.3 * Matrix::Constant(3, 2, 0.5) + 0.7 * fresh;
    EXPECT_TRUE(state.memory.gather_outputs(std::vector<SampleIndex>{2, 3, 4})
                    .isApprox(expected, 1e-12));
    EXPECT_EQ(state.memory.update_count(3), 1u);
    EXPECT_EQ(hook.batches_applied(), 1u);
}

// ─── No-op / modes ───────────────────────────────────────────────────────────

TEST(TargetMemoryBank, SourceOnlyBatchIsNoOp) {
    const DomainDataset train = mixed_batch();
    const std::vector<std::size_t> source_rows = train.source_rows();
    const DomainDataset batch = train.select(source_rows);

    FakeModel net(Matrix::Identity(2, 2));
    AdaptationState state(train, 2, 2);
    const Matrix f_before = state.memory.features();
    const Matrix o_before = state.memory.outputs();
    TargetMemoryBank hook(state);

    hook.on_batch_end(net, batch);

    EXPECT_EQ(net.forward_calls, 0u);
    EXPECT_EQ(state.memory.features(), f_before);
    EXPECT_EQ(state.memory.outputs(), o_before);
    EXPECT_EQ(hook.batches_applied(), 0u);
}

TEST(TargetMemoryBank, ForwardRunsInEvalModeAndModeRestored) {
    const DomainDataset batch = mixed_batch();
    FakeModel net(Matrix::Identity(2, 2));
    net.set_training(true);
    AdaptationState state(batch, 2, 2);
    TargetMemoryBank hook(state);

    hook.on_batch_end(net, batch);

    EXPECT_TRUE(net.is_training());
    ASSERT_EQ(net.modes_seen().size(), 1u);
    EXPECT_FALSE(net.modes_seen()[0]);
}

TEST(TargetMemoryBank, OnlyBatchRowsChange) {
    const DomainDataset train = mixed_batch();
    const std::vector<std::size_t> rows = {0, 3};   // one source, one target (idx 3)
    const DomainDataset batch = train.select(rows);

    FakeModel net(Matrix::Identity(2, 2));
    AdaptationState state(train, 2, 2);
    const Matrix before = state.memory.outputs();
    TargetMemoryBank hook(state);
    hook.on_batch_end(net, batch);

    for (SampleIndex untouched : {SampleIndex{2}, SampleIndex{4}}) {
        const auto r = static_cast<Eigen::Index>(state.memory.row_of(untouched));
        EXPECT_EQ(state.memory.outputs().row(r), before.row(r));
    }
    // A single target row sharpens to exactly one in every column.
    const Matrix stored = state.memory.gather_outputs(std::vector<SampleIndex>{3});
    EXPECT_NEAR(stored(0, 0), 0.3 * 0.5 + 0.7, 1e-12);
    EXPECT_NEAR(stored(0, 1), 0.3 * 0.5 + 0.7, 1e-12);
}

// ─── Errors ──────────────────────────────────────────────────────────────────

TEST(TargetMemoryBank, MomentumOutOfRangeRejected) {
    const DomainDataset batch = mixed_batch();
    AdaptationState state(batch, 2, 2);
    TargetMemoryBankConfig cfg;
    cfg.momentum = 1.0;
    EXPECT_THROW(TargetMemoryBank(state, cfg), InvalidArgument);
    cfg.momentum = -0.2;
    EXPECT_THROW(TargetMemoryBank(state, cfg), InvalidArgument);
}

TEST(TargetMemoryBank, DeviceMismatchRejected) {
    const DomainDataset batch = mixed_batch();
    FakeModel net(Matrix::Identity(2, 2), Device{"cuda:1"});
    AdaptationState state(batch, 2, 2);
    TargetMemoryBank hook(state);
    EXPECT_THROW(hook.on_batch_end(net, batch), InvalidArgument);
    EXPECT_EQ(state.memory.update_count(2), 0u);
}

TEST(TargetMemoryBank, UnknownTargetIndexRejected) {
    const DomainDataset train = mixed_batch();
    DomainDataset batch = train;
    batch.sample_idx[4] = 99;   // not in the bank
    FakeModel net(Matrix::Identity(2, 2));
    AdaptationState state(train, 2, 2);
    TargetMemoryBank hook(state);
    EXPECT_THROW(hook.on_batch_end(net, batch), InvalidArgument);
    EXPECT_EQ(state.memory.update_count(2), 0u);
}
