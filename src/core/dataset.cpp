/// @file src/core/dataset.cpp
/// @brief DomainDataset partitioning, row selection and minibatching.

#include "daloop/dataset.hpp"
#include "daloop/errors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <numeric>
#include <unordered_set>

namespace daloop {

// ─── Domain partition ─────────────────────────────────────────────────────────

std::vector<std::size_t> DomainDataset::source_rows() const {
    std::vector<std::size_t> rows;
    for (std::size_t i = 0; i < domain.size(); ++i) {
        if (is_source(domain[i])) rows.push_back(i);
    }
    return rows;
}

std::vector<std::size_t> DomainDataset::target_rows() const {
    std::vector<std::size_t> rows;
    for (std::size_t i = 0; i < domain.size(); ++i) {
        if (is_target(domain[i])) rows.push_back(i);
    }
    return rows;
}

std::size_t DomainDataset::n_source() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(domain.begin(), domain.end(), is_source));
}

std::size_t DomainDataset::n_target() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(domain.begin(), domain.end(), is_target));
}

std::vector<SampleIndex> DomainDataset::target_sample_indices() const {
    std::vector<SampleIndex> out;
    for (std::size_t i = 0; i < domain.size(); ++i) {
        if (is_target(domain[i])) out.push_back(sample_idx[i]);
    }
    return out;
}

// ─── select ───────────────────────────────────────────────────────────────────

DomainDataset DomainDataset::select(std::span<const std::size_t> rows) const {
    DomainDataset out;
    out.X.resize(static_cast<Eigen::Index>(rows.size()), X.cols());
    out.domain.reserve(rows.size());
    out.sample_idx.reserve(rows.size());
    out.label.reserve(rows.size());

    for (std::size_t r = 0; r < rows.size(); ++r) {
        const std::size_t src = rows[r];
        if (src >= size()) {
            throw InvalidArgument(fmt::format(
                "DomainDataset::select: row {} out of range (size {})", src, size()));
        }
        out.X.row(static_cast<Eigen::Index>(r)) = X.row(static_cast<Eigen::Index>(src));
        out.domain.push_back(domain[src]);
        out.sample_idx.push_back(sample_idx[src]);
        out.label.push_back(label[src]);
    }
    return out;
}

// ─── validate ─────────────────────────────────────────────────────────────────

void DomainDataset::validate() const {
    const std::size_t n = domain.size();
    if (static_cast<std::size_t>(X.rows()) != n || sample_idx.size() != n ||
        label.size() != n) {
        throw InvalidArgument(fmt::format(
            "DomainDataset: inconsistent lengths (X={}, domain={}, sample_idx={}, label={})",
            X.rows(), n, sample_idx.size(), label.size()));
    }
    std::unordered_set<SampleIndex> seen;
    seen.reserve(n);
    for (SampleIndex idx : sample_idx) {
        if (!seen.insert(idx).second) {
            throw InvalidArgument(fmt::format(
                "DomainDataset: duplicate sample index {}", idx));
        }
    }
}

// ─── make_batches ─────────────────────────────────────────────────────────────

std::vector<Batch> make_batches(const DomainDataset& dataset,
                                std::size_t batch_size, std::mt19937* rng) {
    if (batch_size == 0) {
        throw InvalidArgument("make_batches: batch_size must be > 0");
    }

    std::vector<std::size_t> order(dataset.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    if (rng != nullptr) {
        std::shuffle(order.begin(), order.end(), *rng);
    }

    std::vector<Batch> batches;
    batches.reserve((order.size() + batch_size - 1) / batch_size);
    for (std::size_t start = 0; start < order.size(); start += batch_size) {
        const std::size_t len = std::min(batch_size, order.size() - start);
        batches.push_back(dataset.select(
            std::span<const std::size_t>(order.data() + start, len)));
    }
    return batches;
}

} // namespace daloop
