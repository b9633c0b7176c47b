/// @file src/callbacks/source_centroids.cpp
/// @brief SourceCentroidEstimator — class centroids of source features seed
///        the target clustering at every epoch begin.

#include "daloop/callbacks.hpp"
#include "daloop/errors.hpp"
#include "daloop/normalizer.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <memory>
#include <utility>

namespace daloop {

// ─── Constructor ──────────────────────────────────────────────────────────────

SourceCentroidEstimator::SourceCentroidEstimator(AdaptationState& state,
                                                 SourceCentroidConfig config)
    : state_(state), config_(std::move(config)) {}

// ─── class_centroids ──────────────────────────────────────────────────────────

Matrix SourceCentroidEstimator::class_centroids(
        const Matrix& source_features,
        const std::vector<std::optional<int>>& labels,
        std::size_t n_classes,
        std::vector<int>& classes) {
    if (static_cast<std::size_t>(source_features.rows()) != labels.size()) {
        throw InvalidArgument(fmt::format(
            "class_centroids: {} feature rows but {} labels",
            source_features.rows(), labels.size()));
    }

    // Bucket rows by class; unlabelled or out-of-range rows are malformed.
    std::vector<std::vector<Eigen::Index>> members(n_classes);
    for (std::size_t i = 0; i < labels.size(); ++i) {
        if (!labels[i]) {
            throw InvalidArgument(fmt::format(
                "class_centroids: source row {} has no label", i));
        }
        const int y = *labels[i];
        if (y < 0 || static_cast<std::size_t>(y) >= n_classes) {
            throw InvalidArgument(fmt::format(
                "class_centroids: label {} outside [0, {})", y, n_classes));
        }
        members[static_cast<std::size_t>(y)].push_back(static_cast<Eigen::Index>(i));
    }

    classes.clear();
    for (std::size_t c = 0; c < n_classes; ++c) {
        if (!members[c].empty()) {
            classes.push_back(static_cast<int>(c));
        }
    }
    if (classes.empty()) {
        throw EmptyPartition("class_centroids: no class has a source sample");
    }

    Matrix centroids = Matrix::Zero(static_cast<Eigen::Index>(classes.size()),
                                    source_features.cols());
    for (std::size_t k = 0; k < classes.size(); ++k) {
        const auto& rows = members[static_cast<std::size_t>(classes[k])];
        const Matrix class_features =
            FeatureNormalizer::normalize(source_features(rows, Eigen::all));
        // Sum, not mean: the centroid's norm grows with the class size.
        centroids.row(static_cast<Eigen::Index>(k)) = class_features.colwise().sum();
    }
    return centroids;
}

// ─── on_epoch_begin ───────────────────────────────────────────────────────────

void SourceCentroidEstimator::on_epoch_begin(Model& net, const DomainDataset& train) {
    ++epoch_;

    if (!(net.device() == state_.memory.device())) {
        throw InvalidArgument(fmt::format(
            "SourceCentroidEstimator: model on '{}' but adaptation state on '{}'",
            net.device().name, state_.memory.device().name));
    }

    const std::vector<std::size_t> source_rows = train.source_rows();
    const std::vector<std::size_t> target_rows = train.target_rows();
    if (source_rows.empty()) {
        throw EmptyPartition("SourceCentroidEstimator: training set has no source samples");
    }
    if (target_rows.empty()) {
        throw EmptyPartition("SourceCentroidEstimator: training set has no target samples");
    }

    const DomainDataset source = train.select(source_rows);
    const DomainDataset target = train.select(target_rows);

    // Feature collection only: evaluation mode, const path, no gradients.
    Matrix source_features;
    Matrix target_features;
    {
        EvalModeGuard eval(net);
        const Model& frozen = net;
        source_features = frozen.predict_features(source.X);
        target_features = frozen.predict_features(target.X);
    }

    std::size_t n_classes = 0;
    if (config_.n_classes) {
        n_classes = *config_.n_classes;
    } else {
        int max_label = -1;
        for (const auto& y : source.label) {
            if (!y) {
                throw InvalidArgument("SourceCentroidEstimator: source sample without label");
            }
            max_label = std::max(max_label, *y);
        }
        n_classes = static_cast<std::size_t>(max_label + 1);
    }

    std::vector<int> classes;
    Matrix centroids = class_centroids(source_features, source.label, n_classes, classes);

    auto clusterer = std::make_shared<SphericalKMeans>(classes.size(), config_.kmeans);
    clusterer->fit(target_features, centroids);

    if (config_.verbose) {
        fmt::print(stderr,
            "[source-centroids] epoch {}: k={} n_source={} n_target={} n_iter={} inertia={:.4f}\n",
            epoch_, classes.size(), source_rows.size(), target_rows.size(),
            clusterer->result().n_iter, clusterer->result().inertia);
    }

    // Publish. The previous epoch's clusterer is released here.
    state_.target_clusterer = std::move(clusterer);
    state_.source_centroids = std::move(centroids);
    state_.centroid_classes = std::move(classes);
    state_.clusterer_epoch  = epoch_;
}

} // namespace daloop
