/// @file src/adaptation/memory_bank.cpp
/// @brief MemoryBank — arena storage with index-selected momentum updates.

#include "daloop/memory_bank.hpp"
#include "daloop/errors.hpp"
#include "daloop/normalizer.hpp"

#include <fmt/core.h>

#include <random>
#include <utility>

namespace daloop {

// ─── to_string ────────────────────────────────────────────────────────────────

std::string_view to_string(MemoryUpdateRule rule) noexcept {
    switch (rule) {
        case MemoryUpdateRule::Ema:             return "ema";
        case MemoryUpdateRule::ScaledOverwrite: return "scaled-overwrite";
        case MemoryUpdateRule::LegacyDecay:     return "legacy-decay";
    }
    return "unknown";
}

// ─── Constructor ──────────────────────────────────────────────────────────────

MemoryBank::MemoryBank(std::span<const SampleIndex> target_indices,
                       std::size_t feature_dim,
                       std::size_t n_classes,
                       Device device,
                       unsigned seed)
    : device_(std::move(device)) {
    if (feature_dim == 0 || n_classes == 0) {
        throw InvalidArgument(fmt::format(
            "MemoryBank: feature_dim ({}) and n_classes ({}) must be > 0",
            feature_dim, n_classes));
    }

    row_lookup_.reserve(target_indices.size());
    for (std::size_t row = 0; row < target_indices.size(); ++row) {
        const SampleIndex idx = target_indices[row];
        if (idx < 0) {
            throw InvalidArgument(fmt::format(
                "MemoryBank: negative sample index {}", idx));
        }
        if (!row_lookup_.emplace(idx, row).second) {
            throw InvalidArgument(fmt::format(
                "MemoryBank: duplicate sample index {}", idx));
        }
    }

    const auto n = static_cast<Eigen::Index>(target_indices.size());

    // Random directions: Gaussian draws projected onto the unit sphere.
    std::mt19937 rng(seed);
    std::normal_distribution<double> gauss(0.0, 1.0);
    features_.resize(n, static_cast<Eigen::Index>(feature_dim));
    for (Eigen::Index i = 0; i < features_.rows(); ++i) {
        for (Eigen::Index j = 0; j < features_.cols(); ++j) {
            features_(i, j) = gauss(rng);
        }
    }
    FeatureNormalizer::normalize_in_place(features_);

    outputs_ = Matrix::Constant(n, static_cast<Eigen::Index>(n_classes),
                                1.0 / static_cast<double>(n_classes));
    update_counts_.assign(target_indices.size(), 0);
}

// ─── Lookup ───────────────────────────────────────────────────────────────────

bool MemoryBank::contains(SampleIndex idx) const noexcept {
    return row_lookup_.find(idx) != row_lookup_.end();
}

std::size_t MemoryBank::row_of(SampleIndex idx) const {
    const auto it = row_lookup_.find(idx);
    if (it == row_lookup_.end()) {
        throw InvalidArgument(fmt::format(
            "MemoryBank: sample index {} is not a target sample of this bank", idx));
    }
    return it->second;
}

std::vector<std::size_t>
MemoryBank::rows_for(std::span<const SampleIndex> indices) const {
    std::vector<std::size_t> rows;
    rows.reserve(indices.size());
    for (SampleIndex idx : indices) {
        rows.push_back(row_of(idx));
    }
    return rows;
}

// ─── update ───────────────────────────────────────────────────────────────────

void MemoryBank::update(std::span<const SampleIndex> indices,
                        const Matrix& features,
                        const Matrix& outputs,
                        double momentum,
                        MemoryUpdateRule rule) {
    if (!(momentum >= 0.0 && momentum < 1.0)) {
        throw InvalidArgument(fmt::format(
            "MemoryBank: momentum {} outside [0, 1)", momentum));
    }
    const auto n = static_cast<Eigen::Index>(indices.size());
    if (features.rows() != n || outputs.rows() != n) {
        throw InvalidArgument(fmt::format(
            "MemoryBank: {} indices but {} feature rows and {} output rows",
            n, features.rows(), outputs.rows()));
    }
    if (features.cols() != features_.cols() || outputs.cols() != outputs_.cols()) {
        throw InvalidArgument(fmt::format(
            "MemoryBank: expected {} feature and {} output columns, got {} and {}",
            features_.cols(), outputs_.cols(), features.cols(), outputs.cols()));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Resolve every index before writing so a bad index leaves the bank intact.
    const std::vector<std::size_t> rows = rows_for(indices);
    const double keep = 1.0 - momentum;

    for (Eigen::Index i = 0; i < n; ++i) {
        const auto r = static_cast<Eigen::Index>(rows[static_cast<std::size_t>(i)]);
        switch (rule) {
            case MemoryUpdateRule::Ema:
                features_.row(r) = keep * features_.row(r) + momentum * features.row(i);
                outputs_.row(r)  = keep * outputs_.row(r)  + momentum * outputs.row(i);
                break;
            case MemoryUpdateRule::ScaledOverwrite:
                features_.row(r) = momentum * features.row(i);
                outputs_.row(r)  = momentum * outputs.row(i);
                break;
            case MemoryUpdateRule::LegacyDecay:
                features_.row(r) *= keep;
                outputs_.row(r)  *= keep;
                break;
        }
        ++update_counts_[static_cast<std::size_t>(r)];
    }
}

// ─── gather ───────────────────────────────────────────────────────────────────

Matrix MemoryBank::gather_features(std::span<const SampleIndex> indices) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::vector<std::size_t> rows = rows_for(indices);
    Matrix out(static_cast<Eigen::Index>(rows.size()), features_.cols());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) =
            features_.row(static_cast<Eigen::Index>(rows[i]));
    }
    return out;
}

Matrix MemoryBank::gather_outputs(std::span<const SampleIndex> indices) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::vector<std::size_t> rows = rows_for(indices);
    Matrix out(static_cast<Eigen::Index>(rows.size()), outputs_.cols());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) =
            outputs_.row(static_cast<Eigen::Index>(rows[i]));
    }
    return out;
}

std::uint64_t MemoryBank::update_count(SampleIndex idx) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return update_counts_[row_of(idx)];
}

} // namespace daloop
