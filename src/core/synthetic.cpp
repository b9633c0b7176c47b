/// @file src/core/synthetic.cpp
/// @brief Shifted Gaussian blob generator.

#include "daloop/synthetic.hpp"
#include "daloop/errors.hpp"

#include <fmt/core.h>

#include <cmath>
#include <numbers>
#include <random>

namespace daloop {

ShiftedBlobs make_shifted_blobs(const ShiftedBlobsConfig& config) {
    if (config.n_classes == 0 || config.dim < 2 || !(config.noise >= 0.0)) {
        throw InvalidArgument(fmt::format(
            "make_shifted_blobs: need n_classes > 0, dim >= 2, noise >= 0 "
            "(got {}, {}, {})", config.n_classes, config.dim, config.noise));
    }

    const std::size_t n_source = config.n_classes * config.n_source_per_class;
    const std::size_t n_target = config.n_classes * config.n_target_per_class;
    const std::size_t n = n_source + n_target;
    const auto dim = static_cast<Eigen::Index>(config.dim);

    // Class means on a circle in the (x0, x1) plane.
    Matrix means = Matrix::Zero(static_cast<Eigen::Index>(config.n_classes), dim);
    for (std::size_t c = 0; c < config.n_classes; ++c) {
        const double angle = 2.0 * std::numbers::pi * static_cast<double>(c) /
                             static_cast<double>(config.n_classes);
        means(static_cast<Eigen::Index>(c), 0) = config.class_separation * std::cos(angle);
        means(static_cast<Eigen::Index>(c), 1) = config.class_separation * std::sin(angle);
    }

    const double cos_r = std::cos(config.rotation);
    const double sin_r = std::sin(config.rotation);

    std::mt19937 rng(config.seed);
    std::normal_distribution<double> gauss(0.0, 1.0);

    ShiftedBlobs out;
    DomainDataset& ds = out.train;
    ds.X.resize(static_cast<Eigen::Index>(n), dim);
    ds.domain.reserve(n);
    ds.sample_idx.reserve(n);
    ds.label.reserve(n);
    out.target_truth.reserve(n_target);

    std::size_t row = 0;
    auto emit = [&](std::size_t cls, bool target) {
        const auto r = static_cast<Eigen::Index>(row);
        for (Eigen::Index j = 0; j < dim; ++j) {
            ds.X(r, j) = means(static_cast<Eigen::Index>(cls), j) + config.noise * gauss(rng);
        }
        if (target) {
            const double x = ds.X(r, 0);
            const double y = ds.X(r, 1);
            ds.X(r, 0) = cos_r * x - sin_r * y;
            ds.X(r, 1) = sin_r * x + cos_r * y;
            ds.X.row(r).array() += config.shift;
            ds.domain.push_back(constants::SYNTHETIC_TARGET_DOMAIN);
            ds.label.push_back(std::nullopt);
            out.target_truth.push_back(static_cast<int>(cls));
        } else {
            ds.domain.push_back(constants::SYNTHETIC_SOURCE_DOMAIN);
            ds.label.push_back(static_cast<int>(cls));
        }
        ds.sample_idx.push_back(static_cast<SampleIndex>(row));
        ++row;
    };

    for (std::size_t c = 0; c < config.n_classes; ++c) {
        for (std::size_t i = 0; i < config.n_source_per_class; ++i) emit(c, false);
    }
    for (std::size_t c = 0; c < config.n_classes; ++c) {
        for (std::size_t i = 0; i < config.n_target_per_class; ++i) emit(c, true);
    }
    return out;
}

} // namespace daloop
