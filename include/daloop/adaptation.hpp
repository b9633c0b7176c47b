#pragma once

/// @file include/daloop/adaptation.hpp
/// @brief AdaptationState — the shared state written by the two adaptation
///        hooks and read by the pseudo-label criterion.
///
/// Exactly one instance per training run. The caller owns it and passes it
/// by reference to SourceCentroidEstimator, TargetMemoryBank and
/// PseudoLabelCriterion.
///
/// Writers:
///   target_clusterer, source_centroids, centroid_classes, clusterer_epoch
///       — SourceCentroidEstimator, replaced wholesale at every epoch begin
///   memory
///       — TargetMemoryBank, row updates after every batch

#include "daloop/clustering.hpp"
#include "daloop/dataset.hpp"
#include "daloop/memory_bank.hpp"
#include "daloop/types.hpp"

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace daloop {

struct AdaptationState {
    /// Allocate the memory bank for every target sample of `train`.
    AdaptationState(const DomainDataset& train,
                    std::size_t feature_dim,
                    std::size_t n_classes,
                    Device device = Device{},
                    unsigned seed = 0)
        : memory(train.target_sample_indices(), feature_dim, n_classes,
                 std::move(device), seed) {}

    /// Clusterer fitted on target features at the start of the current
    /// epoch. Null before the first epoch.
    std::shared_ptr<const SphericalKMeans> target_clusterer;

    /// Summed normalized source features per non-empty class (k × dim).
    Matrix source_centroids;

    /// centroid_classes[c] is the class id that seeded cluster c.
    std::vector<int> centroid_classes;

    /// 1-based epoch that produced target_clusterer; 0 before the first.
    std::size_t clusterer_epoch = 0;

    /// Persistent per-target-sample memory.
    MemoryBank memory;
};

} // namespace daloop
