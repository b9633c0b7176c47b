#pragma once

/// @file include/daloop/synthetic.hpp
/// @brief Shifted Gaussian blobs: a toy source/target pair with covariate
///        shift, for demos, tests and benchmarks.
///
/// Class c's source blob is centred on a point of a circle of radius
/// `class_separation` in the first two feature dimensions. The target copy
/// of every blob is rotated by `rotation` radians in that plane and then
/// translated by `shift` along every axis.
///
/// Source rows come first (domain SYNTHETIC_SOURCE_DOMAIN), target rows
/// second (domain SYNTHETIC_TARGET_DOMAIN); sample_idx equals the row.

#include "daloop/constants.hpp"
#include "daloop/dataset.hpp"

#include <cstddef>
#include <vector>

namespace daloop {

struct ShiftedBlobsConfig {
    std::size_t n_classes          = 2;
    std::size_t n_source_per_class = 50;
    std::size_t n_target_per_class = 50;
    std::size_t dim                = 2;     ///< ≥ 2
    double      class_separation   = 3.0;
    double      noise              = 0.5;   ///< per-axis standard deviation
    double      shift              = 0.5;
    double      rotation           = 0.3;   ///< radians
    unsigned    seed               = 0;
};

struct ShiftedBlobs {
    DomainDataset    train;         ///< target rows carry no label
    std::vector<int> target_truth;  ///< held-out class of every target row
};

/// Throws InvalidArgument if n_classes == 0, dim < 2 or noise < 0.
[[nodiscard]] ShiftedBlobs make_shifted_blobs(const ShiftedBlobsConfig& config);

} // namespace daloop
