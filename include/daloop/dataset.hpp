#pragma once

/// @file include/daloop/dataset.hpp
/// @brief DomainDataset — samples tagged with a domain and a stable index.
///
/// # Module: Domain Dataset
///
/// ## Layout
/// Structure of arrays, one entry per sample:
///   X          — features, one row per sample
///   domain     — ≥ 0 source domain id, < 0 target
///   sample_idx — stable id, unique within the dataset
///   label      — class id for source samples, nullopt otherwise
///
/// A minibatch is a DomainDataset holding a subset of rows; the stable
/// sample_idx values travel with the rows, which is how the memory bank
/// finds its arena rows.

#include "daloop/types.hpp"

#include <cstddef>
#include <optional>
#include <random>
#include <span>
#include <vector>

namespace daloop {

struct DomainDataset {
    Matrix                          X;
    std::vector<int>                domain;
    std::vector<SampleIndex>        sample_idx;
    std::vector<std::optional<int>> label;

    /// Number of samples.
    [[nodiscard]] std::size_t size() const noexcept { return domain.size(); }

    [[nodiscard]] bool empty() const noexcept { return domain.empty(); }

    /// Feature dimension.
    [[nodiscard]] std::size_t dim() const noexcept {
        return static_cast<std::size_t>(X.cols());
    }

    /// Row positions of source samples, in dataset order.
    [[nodiscard]] std::vector<std::size_t> source_rows() const;

    /// Row positions of target samples, in dataset order.
    [[nodiscard]] std::vector<std::size_t> target_rows() const;

    [[nodiscard]] std::size_t n_source() const noexcept;
    [[nodiscard]] std::size_t n_target() const noexcept;

    /// Stable indices of the target samples, in dataset order.
    [[nodiscard]] std::vector<SampleIndex> target_sample_indices() const;

    /// Copy the given rows (in the given order) into a new dataset.
    /// Throws InvalidArgument on an out-of-range row.
    [[nodiscard]] DomainDataset select(std::span<const std::size_t> rows) const;

    /// Throws InvalidArgument if the per-sample arrays disagree in length or
    /// sample indices repeat.
    void validate() const;
};

/// A minibatch has the same layout as a full dataset.
using Batch = DomainDataset;

/// Split `dataset` into consecutive batches of at most `batch_size` rows.
/// If `rng` is non-null the row order is shuffled first.
/// Throws InvalidArgument if batch_size == 0.
[[nodiscard]] std::vector<Batch>
make_batches(const DomainDataset& dataset, std::size_t batch_size,
             std::mt19937* rng = nullptr);

} // namespace daloop
