/**
 * @file  bench/bench_adaptation.cpp
 * @brief Google Benchmark suite for the adaptation hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_Normalize               — row-wise L2 normalization
 *   BM_SphericalKMeans_Seeded  — one seeded fit (epoch-begin cost)
 *   BM_SharpenedSoftmax        — batch-relative squared softmax
 *   BM_MemoryBank_Update       — EMA update of one batch (batch-end cost)
 *   BM_SourceCentroids_Epoch   — full epoch-begin hook on an MLP
 *
 * Build (CMake):
 *   cmake -DDALOOP_BENCH=ON ..
 *   cmake --build build --target bench_adaptation
 *   ./build/bench_adaptation --benchmark_format=json
 *
 * Throughput units: items/second (rows processed).
 */

#include "benchmark/benchmark.h"

#include "daloop/adaptation.hpp"
#include "daloop/callbacks.hpp"
#include "daloop/clustering.hpp"
#include "daloop/memory_bank.hpp"
#include "daloop/model.hpp"
#include "daloop/normalizer.hpp"
#include "daloop/pseudo_labels.hpp"
#include "daloop/synthetic.hpp"

#include <cstddef>
#include <algorithm>
#include <numeric>
#include <random>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// n × d standard-normal matrix from a fixed seed.
static daloop::Matrix gaussian(Eigen::Index n, Eigen::Index d, unsigned seed = 1) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> g(0.0, 1.0);
    daloop::Matrix m(n, d);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < d; ++j) m(i, j) = g(rng);
    }
    return m;
}

// ── Kernels ────────────────────────────────────────────────────────────────────

static void BM_Normalize(benchmark::State& state) {
    const auto n = static_cast<Eigen::Index>(state.range(0));
    const daloop::Matrix X = gaussian(n, 64);
    for (auto _ : state) {
        daloop::Matrix out = daloop::FeatureNormalizer::normalize(X);
        benchmark::DoNotOptimize(out.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Normalize)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

static void BM_SphericalKMeans_Seeded(benchmark::State& state) {
    const auto n = static_cast<Eigen::Index>(state.range(0));
    const auto k = static_cast<Eigen::Index>(state.range(1));
    const daloop::Matrix X = gaussian(n, 32, 2);
    const daloop::Matrix seeds = gaussian(k, 32, 3);
    for (auto _ : state) {
        auto res = daloop::SphericalKMeans::cluster(
            X, static_cast<std::size_t>(k), seeds, daloop::SphericalKMeansConfig{});
        benchmark::DoNotOptimize(res.inertia);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_SphericalKMeans_Seeded)
    ->Args({1024, 10})->Args({4096, 10})->Args({4096, 65})
    ->Unit(benchmark::kMillisecond);

static void BM_SharpenedSoftmax(benchmark::State& state) {
    const auto n = static_cast<Eigen::Index>(state.range(0));
    const daloop::Matrix logits = gaussian(n, 31, 4);
    for (auto _ : state) {
        daloop::Matrix s = daloop::PseudoLabels::sharpened_softmax(logits);
        benchmark::DoNotOptimize(s.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_SharpenedSoftmax)->RangeMultiplier(4)->Range(32, 2048)->Unit(benchmark::kMicrosecond);

static void BM_MemoryBank_Update(benchmark::State& state) {
    const auto batch = static_cast<std::size_t>(state.range(0));
    std::vector<daloop::SampleIndex> all(50000);
    std::iota(all.begin(), all.end(), daloop::SampleIndex{0});
    daloop::MemoryBank bank(all, 256, 31);

    // A random batch of distinct target samples.
    std::vector<daloop::SampleIndex> idx = all;
    std::mt19937 rng(5);
    std::shuffle(idx.begin(), idx.end(), rng);
    idx.resize(batch);
    const daloop::Matrix f = gaussian(static_cast<Eigen::Index>(batch), 256, 6);
    const daloop::Matrix o = daloop::PseudoLabels::sharpened_softmax(
        gaussian(static_cast<Eigen::Index>(batch), 31, 7));

    for (auto _ : state) {
        bank.update(idx, f, o, 0.7);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_MemoryBank_Update)->RangeMultiplier(2)->Range(32, 512)->Unit(benchmark::kMicrosecond);

// ── Hooks ──────────────────────────────────────────────────────────────────────

static void BM_SourceCentroids_Epoch(benchmark::State& state) {
    daloop::ShiftedBlobsConfig cfg;
    cfg.n_classes = 4;
    cfg.n_source_per_class = static_cast<std::size_t>(state.range(0));
    cfg.n_target_per_class = static_cast<std::size_t>(state.range(0));
    const daloop::ShiftedBlobs blobs = daloop::make_shifted_blobs(cfg);

    daloop::MlpClassifier net(daloop::MlpConfig{
        .input_dim  = 2,
        .hidden_dim = 64,
        .n_classes  = 4,
        .seed       = 0,
        .device     = daloop::Device{},
    });
    daloop::AdaptationState adapt(blobs.train, net.feature_dim(), 4);
    daloop::SourceCentroidEstimator hook(adapt);

    for (auto _ : state) {
        hook.on_epoch_begin(net, blobs.train);
        benchmark::DoNotOptimize(adapt.target_clusterer.get());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(blobs.train.size()));
}
BENCHMARK(BM_SourceCentroids_Epoch)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMillisecond);
