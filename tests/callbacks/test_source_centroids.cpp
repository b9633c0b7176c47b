/// @file tests/callbacks/test_source_centroids.cpp
/// @brief Unit tests for SourceCentroidEstimator (epoch-begin hook).
///
/// Test categories:
///   - Summed normalized centroids (norm equals class size for colinear
///     features)
///   - Classes without samples are skipped, and counted again once they
///     reappear
///   - A new clusterer is published every epoch
///   - Feature extraction runs in evaluation mode, mode restored
///   - Empty partitions, unlabelled source rows, device mismatch

#include <gtest/gtest.h>
#include "daloop/adaptation.hpp"
#include "daloop/callbacks.hpp"
#include "daloop/errors.hpp"
#include "daloop/normalizer.hpp"
#include "support/fake_model.hpp"

#include <memory>

using namespace daloop;
using daloop::testing::FakeModel;
using daloop::testing::make_dataset;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

constexpr int kSrc = 1;
constexpr int kTgt = -2;

/// 3 source rows of class 0 along +x, 2 of class 1 along +y, 10 target
/// rows split between the two axes.
DomainDataset five_source_ten_target() {
    std::vector<std::vector<double>> X = {
        {1.0, 0.0}, {2.0, 0.0}, {0.5, 0.0},   // class 0
        {0.0, 1.0}, {0.0, 3.0},               // class 1
    };
    std::vector<int> dom(5, kSrc);
    std::vector<int> lab = {0, 0, 0, 1, 1};
    for (int i = 0; i < 5; ++i) {
        X.push_back({1.0, 0.1 * i});
        X.push_back({0.1 * i, 1.0});
        dom.push_back(kTgt);
        dom.push_back(kTgt);
        lab.push_back(-1);
        lab.push_back(-1);
    }
    return make_dataset(X, dom, lab);
}

Matrix head2x2() {
    return Matrix::Identity(2, 2);
}

}  // anonymous namespace

// ─── class_centroids ─────────────────────────────────────────────────────────

TEST(SourceCentroidEstimator, CentroidNormEqualsClassSize) {
    Matrix F(5, 2);
    F << 1.0, 0.0,
         2.0, 0.0,
         0.5, 0.0,
         0.0, 1.0,
         0.0, 3.0;
    const std::vector<std::optional<int>> y = {0, 0, 0, 1, 1};
    std::vector<int> classes;
    const Matrix C = SourceCentroidEstimator::class_centroids(F, y, 2, classes);

    ASSERT_EQ(C.rows(), 2);
    EXPECT_EQ(classes, (std::vector<int>{0, 1}));
    EXPECT_DOUBLE_EQ(C.row(0).norm(), 3.0);
    EXPECT_DOUBLE_EQ(C.row(1).norm(), 2.0);
    EXPECT_DOUBLE_EQ(C(0, 0), 3.0);
    EXPECT_DOUBLE_EQ(C(1, 1), 2.0);
}

TEST(SourceCentroidEstimator, MissingClassSkipped) {
    Matrix F(3, 2);
    F << 1.0, 0.0,
         0.0, 1.0,
         0.0, 2.0;
    const std::vector<std::optional<int>> y = {0, 2, 2};
    std::vector<int> classes;
    const Matrix C = SourceCentroidEstimator::class_centroids(F, y, 3, classes);
    EXPECT_EQ(C.rows(), 2);
    EXPECT_EQ(classes, (std::vector<int>{0, 2}));
    EXPECT_DOUBLE_EQ(C(1, 1), 2.0);
}

TEST(SourceCentroidEstimator, ZeroFeatureRowContributesNothing) {
    Matrix F(2, 2);
    F << 0.0, 0.0,
         0.0, 5.0;
    const std::vector<std::optional<int>> y = {0, 0};
    std::vector<int> classes;
    const Matrix C = SourceCentroidEstimator::class_centroids(F, y, 1, classes);
    EXPECT_TRUE(C.allFinite());
    EXPECT_DOUBLE_EQ(C(0, 1), 1.0);
}

TEST(SourceCentroidEstimator, LabelOutOfRangeRejected) {
    Matrix F = Matrix::Ones(2, 2);
    std::vector<int> classes;
    EXPECT_THROW((void)SourceCentroidEstimator::class_centroids(
                     F, {0, 4}, 2, classes), InvalidArgument);
    EXPECT_THROW((void)SourceCentroidEstimator::class_centroids(
                     F, {0, std::nullopt}, 2, classes), InvalidArgument);
    EXPECT_THROW((void)SourceCentroidEstimator::class_centroids(
                     Matrix(0, 2), {}, 2, classes), EmptyPartition);
}

// ─── on_epoch_begin ──────────────────────────────────────────────────────────

TEST(SourceCentroidEstimator, PublishesSeededClusterer) {
    const DomainDataset train = five_source_ten_target();
    FakeModel net(head2x2());
    AdaptationState state(train, 2, 2);
    SourceCentroidEstimator hook(state);

    ASSERT_EQ(state.target_clusterer, nullptr);
    hook.on_epoch_begin(net, train);

    ASSERT_NE(state.target_clusterer, nullptr);
    EXPECT_EQ(state.target_clusterer->n_clusters(), 2u);
    EXPECT_TRUE(state.target_clusterer->is_fitted());
    EXPECT_EQ(state.centroid_classes, (std::vector<int>{0, 1}));
    EXPECT_DOUBLE_EQ(state.source_centroids.row(0).norm(), 3.0);
    EXPECT_DOUBLE_EQ(state.source_centroids.row(1).norm(), 2.0);
    EXPECT_EQ(state.clusterer_epoch, 1u);
    EXPECT_EQ(hook.epochs_seen(), 1u);

    // Target rows near +x fall in the class-0 cluster, near +y in class 1.
    const auto& labels = state.target_clusterer->labels();
    ASSERT_EQ(labels.size(), 10u);
    for (std::size_t i = 0; i < 10; i += 2) {
        EXPECT_EQ(labels[i], 0);
        EXPECT_EQ(labels[i + 1], 1);
    }
    EXPECT_TRUE(FeatureNormalizer::all_unit_rows(state.target_clusterer->centroids()));
}

TEST(SourceCentroidEstimator, ConfiguredClassCountWithMissingClass) {
    const DomainDataset train = five_source_ten_target();
    FakeModel net(head2x2());
    AdaptationState state(train, 2, 3);
    SourceCentroidConfig cfg;
    cfg.n_classes = 3;
    SourceCentroidEstimator hook(state, cfg);

    hook.on_epoch_begin(net, train);
    EXPECT_EQ(state.target_clusterer->n_clusters(), 2u);
    EXPECT_EQ(state.centroid_classes, (std::vector<int>{0, 1}));
}

TEST(SourceCentroidEstimator, ClusterCountRecoversWhenClassReturns) {
    // Source rows along +x, +y, +z for classes 0, 1, 2; two target rows per axis.
    const std::vector<std::vector<double>> src = {
        {1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}};
    const std::vector<std::vector<double>> tgt = {
        {1.0, 0.1, 0.0}, {0.9, 0.0, 0.1}, {0.1, 1.0, 0.0},
        {0.0, 0.9, 0.1}, {0.1, 0.0, 1.0}, {0.0, 0.1, 0.9}};

    auto build = [&](std::size_t n_source) {
        std::vector<std::vector<double>> X(src.begin(), src.begin() + n_source);
        std::vector<int> dom(n_source, kSrc);
        std::vector<int> lab;
        for (std::size_t c = 0; c < n_source; ++c) lab.push_back(static_cast<int>(c));
        for (const auto& row : tgt) {
            X.push_back(row);
            dom.push_back(kTgt);
            lab.push_back(-1);
        }
        return make_dataset(X, dom, lab);
    };
    const DomainDataset complete = build(3);
    const DomainDataset missing  = build(2);   // no class-2 source row

    FakeModel net(Matrix::Identity(3, 3));
    AdaptationState state(complete, 3, 3);
    SourceCentroidConfig cfg;
    cfg.n_classes = 3;
    SourceCentroidEstimator hook(state, cfg);

    hook.on_epoch_begin(net, missing);
    EXPECT_EQ(state.target_clusterer->n_clusters(), 2u);
    EXPECT_EQ(state.centroid_classes, (std::vector<int>{0, 1}));

    hook.on_epoch_begin(net, complete);
    EXPECT_EQ(state.target_clusterer->n_clusters(), 3u);
    EXPECT_EQ(state.centroid_classes, (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(state.source_centroids.rows(), 3);
    EXPECT_EQ(state.clusterer_epoch, 2u);
}

TEST(SourceCentroidEstimator, NewClustererEveryEpoch) {
    const DomainDataset train = five_source_ten_target();
    FakeModel net(head2x2());
    AdaptationState state(train, 2, 2);
    SourceCentroidEstimator hook(state);

    hook.on_epoch_begin(net, train);
    const std::shared_ptr<const SphericalKMeans> first = state.target_clusterer;
    hook.on_epoch_begin(net, train);

    EXPECT_NE(state.target_clusterer.get(), first.get());
    EXPECT_EQ(state.clusterer_epoch, 2u);
    // A reader holding the old clusterer keeps a usable object.
    EXPECT_TRUE(first->is_fitted());
    EXPECT_EQ(first->labels(), state.target_clusterer->labels());
}

TEST(SourceCentroidEstimator, UsesEvalModeAndRestoresIt) {
    const DomainDataset train = five_source_ten_target();
    FakeModel net(head2x2());
    net.set_training(true);
    AdaptationState state(train, 2, 2);
    SourceCentroidEstimator hook(state);

    hook.on_epoch_begin(net, train);

    EXPECT_TRUE(net.is_training());
    EXPECT_EQ(net.predict_calls(), 2u);
    EXPECT_EQ(net.forward_calls, 0u);
    for (bool training : net.modes_seen()) EXPECT_FALSE(training);
}

TEST(SourceCentroidEstimator, ModeRestoredWhenAlreadyEval) {
    const DomainDataset train = five_source_ten_target();
    FakeModel net(head2x2());
    net.set_training(false);
    AdaptationState state(train, 2, 2);
    SourceCentroidEstimator hook(state);
    hook.on_epoch_begin(net, train);
    EXPECT_FALSE(net.is_training());
}

// ─── Errors ──────────────────────────────────────────────────────────────────

TEST(SourceCentroidEstimator, NoTargetSamples) {
    const DomainDataset train = make_dataset({{1.0, 0.0}, {0.0, 1.0}}, {kSrc, kSrc}, {0, 1});
    FakeModel net(head2x2());
    AdaptationState state(train, 2, 2);
    SourceCentroidEstimator hook(state);
    EXPECT_THROW(hook.on_epoch_begin(net, train), EmptyPartition);
    EXPECT_EQ(state.target_clusterer, nullptr);
}

TEST(SourceCentroidEstimator, NoSourceSamples) {
    const DomainDataset train = make_dataset({{1.0, 0.0}, {0.0, 1.0}}, {kTgt, kTgt}, {-1, -1});
    FakeModel net(head2x2());
    AdaptationState state(train, 2, 2);
    SourceCentroidEstimator hook(state);
    EXPECT_THROW(hook.on_epoch_begin(net, train), EmptyPartition);
}

TEST(SourceCentroidEstimator, UnlabelledSourceRejected) {
    const DomainDataset train = make_dataset(
        {{1.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}}, {kSrc, kSrc, kTgt}, {0, -1, -1});
    FakeModel net(head2x2());
    AdaptationState state(train, 2, 2);
    SourceCentroidEstimator hook(state);
    EXPECT_THROW(hook.on_epoch_begin(net, train), InvalidArgument);
}

TEST(SourceCentroidEstimator, DeviceMismatchRejected) {
    const DomainDataset train = five_source_ten_target();
    FakeModel net(head2x2(), Device{"cuda:0"});
    AdaptationState state(train, 2, 2);
    SourceCentroidEstimator hook(state);
    EXPECT_THROW(hook.on_epoch_begin(net, train), InvalidArgument);
    EXPECT_EQ(state.target_clusterer, nullptr);
}
