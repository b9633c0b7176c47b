#pragma once

/// @file include/daloop/clustering.hpp
/// @brief SphericalKMeans — cosine-similarity k-means on the unit hypersphere.
///
/// # Module: Spherical K-Means
///
/// ## Responsibility
/// Cluster target-domain feature vectors by direction. Centroids are seeded
/// from externally supplied vectors (the per-class source centroids) instead
/// of a random draw, so cluster c starts at class c.
///
/// ## Algorithm
/// Inputs and seeds are L2-normalized, then Lloyd iteration runs:
///   1. label(x) = argmax_c  x · c          (ties → lowest c)
///   2. c ← normalize(mean of points labelled c)
/// until no label changes, the largest centroid shift ‖c_new − c_old‖ is
/// ≤ tol, or max_iter iterations have run. A final assignment pass against
/// the final centroids produces labels() and inertia().
///
/// Inertia is the spherical objective Σᵢ (1 − maxc xᵢ · c).
///
/// ## Edge Cases
/// - Cluster with no points: keeps its previous centroid.
/// - Cluster whose mean is the zero vector: keeps its previous centroid.
/// - Zero-norm feature rows stay zero and are assigned to cluster 0.
///
/// ## Random Fallback
/// Without seeds, centroids start from a cosine k-means++ draw using
/// std::mt19937(seed + restart); n_init restarts run and the lowest inertia
/// wins. The seeded path uses no randomness at all.
///
/// ## Errors
/// - InvalidArgument: k == 0, seed count ≠ k, dimension mismatch, non-finite
///   input, zero or non-finite norm seed, n < k on the random path, predict() before fit().
/// - EmptyPartition: no feature rows.

#include "daloop/constants.hpp"
#include "daloop/types.hpp"

#include <cstddef>
#include <random>
#include <vector>

namespace daloop {

// ─── SphericalKMeansConfig ────────────────────────────────────────────────────

struct SphericalKMeansConfig {
    /// Iteration cap for one Lloyd run.
    std::size_t max_iter = constants::KMEANS_MAX_ITER;

    /// Largest centroid shift that counts as converged.
    double tol = constants::KMEANS_TOL;

    /// Seed for the random-initialisation fallback.
    unsigned seed = 0;

    /// Restarts for the random-initialisation fallback. Ignored when seeds
    /// are supplied.
    std::size_t n_init = constants::KMEANS_N_INIT;

    /// If true, print one line per fit to stderr.
    bool verbose = false;
};

// ─── ClusteringResult ─────────────────────────────────────────────────────────

struct ClusteringResult {
    Matrix           centroids;  ///< k × dim, unit rows
    std::vector<int> labels;     ///< cluster id per input row
    std::size_t      n_iter;     ///< Lloyd iterations run
    double           inertia;    ///< Σ (1 − best cosine similarity)
    bool             converged;  ///< stopped before max_iter
};

// ─── SphericalKMeans ──────────────────────────────────────────────────────────

class SphericalKMeans {
public:
    /// Construct an unfitted model with `n_clusters` clusters.
    /// Throws InvalidArgument if n_clusters == 0.
    explicit SphericalKMeans(std::size_t n_clusters,
                             SphericalKMeansConfig config = SphericalKMeansConfig{});

    /// Fit using `initial_centroids` (n_clusters × dim) as seeds.
    const ClusteringResult& fit(const Matrix& features,
                                const Matrix& initial_centroids);

    /// Fit using the cosine k-means++ fallback.
    const ClusteringResult& fit(const Matrix& features);

    /// One-shot form: build a model with `k` clusters and fit it with seeds.
    [[nodiscard]] static ClusteringResult
    cluster(const Matrix& features, std::size_t k,
            const Matrix& initial_centroids,
            const SphericalKMeansConfig& config = SphericalKMeansConfig{});

    /// Nearest-centroid cluster id for each row of `features`.
    [[nodiscard]] std::vector<int> predict(const Matrix& features) const;

    /// Cosine similarity of each (normalized) row to each centroid: n × k.
    [[nodiscard]] Matrix similarities(const Matrix& features) const;

    [[nodiscard]] bool is_fitted() const noexcept { return fitted_; }
    [[nodiscard]] std::size_t n_clusters() const noexcept { return n_clusters_; }
    [[nodiscard]] const SphericalKMeansConfig& config() const noexcept { return config_; }

    /// Result of the last fit. Meaningful only when is_fitted().
    [[nodiscard]] const ClusteringResult& result() const noexcept { return result_; }
    [[nodiscard]] const Matrix& centroids() const noexcept { return result_.centroids; }
    [[nodiscard]] const std::vector<int>& labels() const noexcept { return result_.labels; }

private:
    /// Lloyd iteration from unit-norm `centroids` over unit-norm `points`.
    [[nodiscard]] ClusteringResult lloyd(const Matrix& points,
                                         Matrix centroids) const;

    /// Cosine k-means++ draw of n_clusters_ rows of `points`.
    [[nodiscard]] Matrix kmeanspp_init(const Matrix& points,
                                       std::mt19937& rng) const;

    /// Argmax of each row of points · centroidsᵀ; fills `labels`, returns
    /// the inertia of that assignment.
    static double assign(const Matrix& points, const Matrix& centroids,
                         std::vector<int>& labels);

    /// Throws InvalidArgument / EmptyPartition on malformed features.
    void validate_features(const Matrix& features) const;

    std::size_t           n_clusters_;
    SphericalKMeansConfig config_;
    ClusteringResult      result_{};
    bool                  fitted_ = false;
};

} // namespace daloop
