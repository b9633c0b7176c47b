#pragma once

/// @file include/daloop/memory_bank.hpp
/// @brief MemoryBank — persistent per-target-sample features and outputs.
///
/// # Module: Memory Bank
///
/// ## Responsibility
/// Hold one row of normalized features and one row of sharpened class
/// probabilities for every target sample of the training set, for the whole
/// run. The batch-end hook blends fresh values into the rows of the samples
/// it saw; the pseudo-label criterion reads them back.
///
/// ## Storage
/// Two flat arrays (arena rows 0..n_target−1) plus a hash map from stable
/// sample index to arena row, so memory is proportional to the number of
/// target samples whatever the index values. Rows never move and are never
/// reallocated after construction.
///
/// ## Update Rules
/// For momentum m ∈ [0, 1), old row o and fresh value v:
///   Ema             : o ← (1 − m)·o + m·v
///   ScaledOverwrite : o ← m·v
///   LegacyDecay     : o ← (1 − m)·o
///
/// ## Guarantees
/// - Only rows named in an update change; all others stay bit-identical
/// - update() is serialized by an internal mutex
/// - Indices repeated within one update are applied in order

#include "daloop/types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace daloop {

enum class MemoryUpdateRule {
    Ema,
    ScaledOverwrite,
    LegacyDecay,
};

/// "ema", "scaled-overwrite" or "legacy-decay".
[[nodiscard]] std::string_view to_string(MemoryUpdateRule rule) noexcept;

class MemoryBank {
public:
    /// Allocate one row per entry of `target_indices`.
    ///
    /// Feature rows start as seeded random unit vectors, output rows as the
    /// uniform distribution 1/n_classes.
    ///
    /// Throws InvalidArgument for feature_dim == 0, n_classes == 0, negative
    /// or repeated indices.
    MemoryBank(std::span<const SampleIndex> target_indices,
               std::size_t feature_dim,
               std::size_t n_classes,
               Device device = Device{},
               unsigned seed = 0);

    MemoryBank(const MemoryBank&) = delete;
    MemoryBank& operator=(const MemoryBank&) = delete;

    /// Blend `features` and `outputs` (one row per entry of `indices`) into
    /// the bank using `rule`.
    ///
    /// Throws InvalidArgument for momentum outside [0, 1), shape mismatch or
    /// an index that is not in the bank. Nothing is written on error.
    void update(std::span<const SampleIndex> indices,
                const Matrix& features,
                const Matrix& outputs,
                double momentum,
                MemoryUpdateRule rule = MemoryUpdateRule::Ema);

    [[nodiscard]] bool contains(SampleIndex idx) const noexcept;

    /// Arena row of `idx`. Throws InvalidArgument if absent.
    [[nodiscard]] std::size_t row_of(SampleIndex idx) const;

    /// Copies of the rows for `indices`, in order.
    [[nodiscard]] Matrix gather_features(std::span<const SampleIndex> indices) const;
    [[nodiscard]] Matrix gather_outputs(std::span<const SampleIndex> indices) const;

    /// Number of update() calls that touched `idx` (repeats within a call
    /// count once per occurrence).
    [[nodiscard]] std::uint64_t update_count(SampleIndex idx) const;

    /// memory_features: rows() × feature_dim().
    [[nodiscard]] const Matrix& features() const noexcept { return features_; }

    /// memory_outputs: rows() × n_classes().
    [[nodiscard]] const Matrix& outputs() const noexcept { return outputs_; }

    [[nodiscard]] std::size_t rows() const noexcept {
        return static_cast<std::size_t>(features_.rows());
    }
    [[nodiscard]] std::size_t feature_dim() const noexcept {
        return static_cast<std::size_t>(features_.cols());
    }
    [[nodiscard]] std::size_t n_classes() const noexcept {
        return static_cast<std::size_t>(outputs_.cols());
    }
    [[nodiscard]] const Device& device() const noexcept { return device_; }

private:
    /// Arena rows for `indices`; throws InvalidArgument on an unknown index.
    [[nodiscard]] std::vector<std::size_t>
    rows_for(std::span<const SampleIndex> indices) const;

    Matrix                     features_;
    Matrix                     outputs_;
    std::unordered_map<SampleIndex, std::size_t> row_lookup_;   ///< sample index → arena row
    std::vector<std::uint64_t> update_counts_;
    Device                     device_;
    mutable std::mutex         mutex_;
};

} // namespace daloop
