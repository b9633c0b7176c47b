/**
 * @file  fuzz_spherical_kmeans.cpp
 * @brief libFuzzer target for SphericalKMeans (seeded path)
 *
 * Build:
 *   cmake -DDALOOP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_spherical_kmeans
 *
 * Input layout:
 *   byte 0        k − 1        (k ∈ [1, 8])
 *   byte 1        dim − 1      (dim ∈ [1, 8])
 *   rest          doubles, first k·dim are seeds, the remainder features
 *
 * Safety invariants verified on every input:
 *   1. Only InvalidArgument / EmptyPartition may escape fit().
 *   2. On success: centroids are unit rows, labels lie in [0, k), inertia
 *      is finite and non-negative (up to rounding).
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "daloop/clustering.hpp"
#include "daloop/errors.hpp"
#include "daloop/normalizer.hpp"

using namespace daloop;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) {
        return 0;
    }
    const auto k = static_cast<Eigen::Index>(1 + data[0] % 8);
    const auto dim = static_cast<Eigen::Index>(1 + data[1] % 8);

    const std::size_t n_doubles = (size - 2) / sizeof(double);
    const auto n_seed_values = static_cast<std::size_t>(k * dim);
    if (n_doubles < n_seed_values) {
        return 0;
    }
    const auto n_points = static_cast<Eigen::Index>(
        (n_doubles - n_seed_values) / static_cast<std::size_t>(dim));

    auto read = [&](std::size_t i) {
        double v = 0.0;
        std::memcpy(&v, data + 2 + i * sizeof(double), sizeof(double));
        return v;
    };

    Matrix seeds(k, dim);
    Matrix X(n_points, dim);
    std::size_t pos = 0;
    for (Eigen::Index i = 0; i < k; ++i) {
        for (Eigen::Index j = 0; j < dim; ++j) seeds(i, j) = read(pos++);
    }
    for (Eigen::Index i = 0; i < n_points; ++i) {
        for (Eigen::Index j = 0; j < dim; ++j) X(i, j) = read(pos++);
    }

    SphericalKMeans km(static_cast<std::size_t>(k));
    try {
        const ClusteringResult& res = km.fit(X, seeds);

        // Invariant 2
        assert(FeatureNormalizer::all_unit_rows(res.centroids, 1e-6));
        assert(res.labels.size() == static_cast<std::size_t>(n_points));
        for (int l : res.labels) {
            assert(l >= 0 && l < k);
        }
        assert(std::isfinite(res.inertia));
        assert(res.inertia >= -1e-9);
    } catch (const InvalidArgument&) {
        // Non-finite input or a zero seed.
    } catch (const EmptyPartition&) {
        // No points.
    }
    return 0;
}
