/// @file src/clustering/spherical_kmeans.cpp
/// @brief SphericalKMeans — seeded Lloyd iteration with cosine similarity.

#include "daloop/clustering.hpp"
#include "daloop/errors.hpp"
#include "daloop/normalizer.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace daloop {

// ─── Constructor ──────────────────────────────────────────────────────────────

SphericalKMeans::SphericalKMeans(std::size_t n_clusters,
                                 SphericalKMeansConfig config)
    : n_clusters_(n_clusters), config_(config) {
    if (n_clusters_ == 0) {
        throw InvalidArgument("SphericalKMeans: n_clusters must be > 0");
    }
}

// ─── validate_features ────────────────────────────────────────────────────────

void SphericalKMeans::validate_features(const Matrix& features) const {
    if (features.rows() == 0) {
        throw EmptyPartition("SphericalKMeans: no feature rows to cluster");
    }
    if (features.cols() == 0) {
        throw InvalidArgument("SphericalKMeans: features have zero dimensions");
    }
    if (!features.allFinite()) {
        throw InvalidArgument("SphericalKMeans: features contain non-finite values");
    }
}

// ─── assign ───────────────────────────────────────────────────────────────────

double SphericalKMeans::assign(const Matrix& points, const Matrix& centroids,
                               std::vector<int>& labels) {
    const Matrix sims = points * centroids.transpose();
    labels.assign(static_cast<std::size_t>(points.rows()), 0);

    double inertia = 0.0;
    for (Eigen::Index i = 0; i < sims.rows(); ++i) {
        // Strict '>' keeps the lowest cluster id on ties.
        Eigen::Index best = 0;
        double best_sim = sims(i, 0);
        for (Eigen::Index c = 1; c < sims.cols(); ++c) {
            if (sims(i, c) > best_sim) {
                best_sim = sims(i, c);
                best = c;
            }
        }
        labels[static_cast<std::size_t>(i)] = static_cast<int>(best);
        inertia += 1.0 - best_sim;
    }
    return inertia;
}

// ─── lloyd ────────────────────────────────────────────────────────────────────

ClusteringResult SphericalKMeans::lloyd(const Matrix& points,
                                        Matrix centroids) const {
    const auto k = static_cast<Eigen::Index>(n_clusters_);
    const Eigen::Index dim = points.cols();

    std::vector<int> labels(static_cast<std::size_t>(points.rows()), -1);
    std::vector<int> next_labels;
    Matrix sums(k, dim);
    std::vector<std::size_t> counts(n_clusters_);

    std::size_t n_iter = 0;
    bool converged = false;

    for (std::size_t iter = 0; iter < config_.max_iter; ++iter) {
        // ── Assignment step ───────────────────────────────────────────────────
        assign(points, centroids, next_labels);
        const bool changed = next_labels != labels;
        labels.swap(next_labels);

        // ── Update step ───────────────────────────────────────────────────────
        sums.setZero();
        std::fill(counts.begin(), counts.end(), 0);
        for (Eigen::Index i = 0; i < points.rows(); ++i) {
            const int l = labels[static_cast<std::size_t>(i)];
            sums.row(l) += points.row(i);
            ++counts[static_cast<std::size_t>(l)];
        }

        double max_shift = 0.0;
        for (Eigen::Index c = 0; c < k; ++c) {
            const std::size_t cnt = counts[static_cast<std::size_t>(c)];
            if (cnt == 0) {
                continue;  // empty cluster keeps its previous centroid
            }
            RowVector mean = sums.row(c) / static_cast<double>(cnt);
            const double norm = mean.norm();
            if (norm < constants::NORM_EPSILON) {
                continue;  // points cancel out; keep the previous centroid
            }
            mean /= norm;
            max_shift = std::max(max_shift, (mean - centroids.row(c)).norm());
            centroids.row(c) = mean;
        }

        n_iter = iter + 1;
        if (!changed || max_shift <= config_.tol) {
            converged = true;
            break;
        }
    }

    ClusteringResult result{
        .centroids = std::move(centroids),
        .labels    = {},
        .n_iter    = n_iter,
        .inertia   = 0.0,
        .converged = converged,
    };
    result.inertia = assign(points, result.centroids, result.labels);
    return result;
}

// ─── kmeanspp_init ────────────────────────────────────────────────────────────

Matrix SphericalKMeans::kmeanspp_init(const Matrix& points,
                                      std::mt19937& rng) const {
    const Eigen::Index n = points.rows();
    Matrix centroids(static_cast<Eigen::Index>(n_clusters_), points.cols());

    std::uniform_int_distribution<Eigen::Index> first_pick(0, n - 1);
    centroids.row(0) = points.row(first_pick(rng));

    // Cosine distance 1 − x·c to the closest chosen centroid, clamped at 0.
    Vector min_dist = (1.0 - (points * centroids.row(0).transpose()).array())
                          .max(0.0)
                          .matrix();

    for (Eigen::Index cc = 1; cc < centroids.rows(); ++cc) {
        const double total = min_dist.sum();
        Eigen::Index chosen = 0;
        if (total <= 0.0) {
            // All points coincide with chosen centroids; any pick is as good.
            std::uniform_int_distribution<Eigen::Index> pick(0, n - 1);
            chosen = pick(rng);
        } else {
            std::uniform_real_distribution<double> u(0.0, total);
            double r = u(rng);
            for (; chosen < n - 1; ++chosen) {
                r -= min_dist(chosen);
                if (r < 0.0) break;
            }
        }
        centroids.row(cc) = points.row(chosen);

        const Vector d = (1.0 - (points * centroids.row(cc).transpose()).array())
                             .max(0.0)
                             .matrix();
        min_dist = min_dist.cwiseMin(d);
    }
    return centroids;
}

// ─── fit (seeded) ─────────────────────────────────────────────────────────────

const ClusteringResult& SphericalKMeans::fit(const Matrix& features,
                                             const Matrix& initial_centroids) {
    validate_features(features);
    if (initial_centroids.rows() != static_cast<Eigen::Index>(n_clusters_)) {
        throw InvalidArgument(fmt::format(
            "SphericalKMeans: expected {} initial centroids, got {}",
            n_clusters_, initial_centroids.rows()));
    }
    if (initial_centroids.cols() != features.cols()) {
        throw InvalidArgument(fmt::format(
            "SphericalKMeans: centroid dimension {} does not match feature dimension {}",
            initial_centroids.cols(), features.cols()));
    }
    if (!initial_centroids.allFinite()) {
        throw InvalidArgument("SphericalKMeans: initial centroids contain non-finite values");
    }

    const Vector seed_norms = FeatureNormalizer::row_norms(initial_centroids);
    for (Eigen::Index c = 0; c < seed_norms.size(); ++c) {
        if (!(seed_norms(c) >= constants::NORM_EPSILON && std::isfinite(seed_norms(c)))) {
            throw InvalidArgument(fmt::format(
                "SphericalKMeans: initial centroid {} has zero or overflowing norm", c));
        }
    }

    const Matrix points = FeatureNormalizer::normalize(features);
    result_ = lloyd(points, FeatureNormalizer::normalize(initial_centroids));
    fitted_ = true;

    if (config_.verbose) {
        fmt::print(stderr,
            "[spherical-kmeans] k={} n={} n_iter={} inertia={:.6f} converged={}\n",
            n_clusters_, features.rows(), result_.n_iter, result_.inertia,
            result_.converged);
    }
    return result_;
}

// ─── fit (random fallback) ────────────────────────────────────────────────────

const ClusteringResult& SphericalKMeans::fit(const Matrix& features) {
    validate_features(features);
    if (features.rows() < static_cast<Eigen::Index>(n_clusters_)) {
        throw InvalidArgument(fmt::format(
            "SphericalKMeans: need at least {} points for random init, got {}",
            n_clusters_, features.rows()));
    }

    const Matrix points = FeatureNormalizer::normalize(features);
    const std::size_t runs = std::max<std::size_t>(config_.n_init, 1);

    ClusteringResult best{};
    double best_inertia = std::numeric_limits<double>::infinity();
    for (std::size_t run = 0; run < runs; ++run) {
        std::mt19937 rng(config_.seed + static_cast<unsigned>(run));
        ClusteringResult candidate = lloyd(points, kmeanspp_init(points, rng));
        // Strict '<' keeps the earliest run on ties.
        if (candidate.inertia < best_inertia) {
            best_inertia = candidate.inertia;
            best = std::move(candidate);
        }
    }

    result_ = std::move(best);
    fitted_ = true;

    if (config_.verbose) {
        fmt::print(stderr,
            "[spherical-kmeans] k={} n={} runs={} n_iter={} inertia={:.6f}\n",
            n_clusters_, features.rows(), runs, result_.n_iter, result_.inertia);
    }
    return result_;
}

// ─── cluster ──────────────────────────────────────────────────────────────────

ClusteringResult SphericalKMeans::cluster(const Matrix& features, std::size_t k,
                                          const Matrix& initial_centroids,
                                          const SphericalKMeansConfig& config) {
    SphericalKMeans model(k, config);
    return model.fit(features, initial_centroids);
}

// ─── predict / similarities ──────────────────────────────────────────────────

Matrix SphericalKMeans::similarities(const Matrix& features) const {
    if (!fitted_) {
        throw InvalidArgument("SphericalKMeans: model is not fitted");
    }
    if (features.cols() != result_.centroids.cols()) {
        throw InvalidArgument(fmt::format(
            "SphericalKMeans: feature dimension {} does not match centroid dimension {}",
            features.cols(), result_.centroids.cols()));
    }
    return FeatureNormalizer::normalize(features) * result_.centroids.transpose();
}

std::vector<int> SphericalKMeans::predict(const Matrix& features) const {
    if (!fitted_) {
        throw InvalidArgument("SphericalKMeans: model is not fitted");
    }
    if (features.cols() != result_.centroids.cols()) {
        throw InvalidArgument(fmt::format(
            "SphericalKMeans: feature dimension {} does not match centroid dimension {}",
            features.cols(), result_.centroids.cols()));
    }
    std::vector<int> labels;
    if (features.rows() == 0) {
        return labels;
    }
    assign(FeatureNormalizer::normalize(features), result_.centroids, labels);
    return labels;
}

} // namespace daloop
