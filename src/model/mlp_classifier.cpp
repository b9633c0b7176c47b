/// @file src/model/mlp_classifier.cpp
/// @brief MlpClassifier — one tanh hidden layer and a linear head, trained by
///        hand-written backpropagation.

#include "daloop/model.hpp"
#include "daloop/errors.hpp"
#include "daloop/pseudo_labels.hpp"

#include <fmt/core.h>

#include <cmath>
#include <random>
#include <utility>

namespace daloop {

namespace {

/// Uniform Xavier/Glorot draw: U(−a, a) with a = √(6 / (fan_in + fan_out)).
Matrix xavier(std::size_t fan_in, std::size_t fan_out, std::mt19937& rng) {
    const double a = std::sqrt(6.0 / static_cast<double>(fan_in + fan_out));
    std::uniform_real_distribution<double> u(-a, a);
    Matrix w(static_cast<Eigen::Index>(fan_in), static_cast<Eigen::Index>(fan_out));
    for (Eigen::Index i = 0; i < w.rows(); ++i) {
        for (Eigen::Index j = 0; j < w.cols(); ++j) {
            w(i, j) = u(rng);
        }
    }
    return w;
}

}  // anonymous namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

MlpClassifier::MlpClassifier(MlpConfig config)
    : config_(std::move(config)) {
    if (config_.input_dim == 0 || config_.hidden_dim == 0 || config_.n_classes == 0) {
        throw InvalidArgument(fmt::format(
            "MlpClassifier: dimensions must be > 0 (input={}, hidden={}, classes={})",
            config_.input_dim, config_.hidden_dim, config_.n_classes));
    }

    std::mt19937 rng(config_.seed);
    W1_ = xavier(config_.input_dim, config_.hidden_dim, rng);
    W2_ = xavier(config_.hidden_dim, config_.n_classes, rng);
    b1_ = RowVector::Zero(static_cast<Eigen::Index>(config_.hidden_dim));
    b2_ = RowVector::Zero(static_cast<Eigen::Index>(config_.n_classes));
    zero_grad();
}

// ─── Forward ──────────────────────────────────────────────────────────────────

void MlpClassifier::check_input(const Matrix& X) const {
    if (X.cols() != static_cast<Eigen::Index>(config_.input_dim)) {
        throw InvalidArgument(fmt::format(
            "MlpClassifier: expected {} input columns, got {}",
            config_.input_dim, X.cols()));
    }
}

Matrix MlpClassifier::hidden(const Matrix& X) const {
    Matrix pre = X * W1_;
    pre.rowwise() += b1_;
    return pre.array().tanh().matrix();
}

Matrix MlpClassifier::predict_features(const Matrix& X) const {
    check_input(X);
    return hidden(X);
}

ForwardResult MlpClassifier::forward(const Matrix& X) {
    check_input(X);
    ForwardResult out;
    out.features = hidden(X);
    out.logits = out.features * W2_;
    out.logits.rowwise() += b2_;

    if (training_) {
        cached_X_  = X;
        cached_H_  = out.features;
        has_cache_ = true;
    }
    return out;
}

Matrix MlpClassifier::predict_proba(const Matrix& X) const {
    check_input(X);
    Matrix logits = hidden(X) * W2_;
    logits.rowwise() += b2_;
    return PseudoLabels::softmax_rows(logits);
}

std::vector<int> MlpClassifier::predict(const Matrix& X) const {
    return PseudoLabels::argmax_rows(predict_proba(X));
}

// ─── Backward ─────────────────────────────────────────────────────────────────

void MlpClassifier::zero_grad() noexcept {
    dW1_.setZero(W1_.rows(), W1_.cols());
    db1_.setZero(b1_.size());
    dW2_.setZero(W2_.rows(), W2_.cols());
    db2_.setZero(b2_.size());
}

void MlpClassifier::backward(const Matrix& grad_logits) {
    if (!has_cache_) {
        throw InvalidArgument("MlpClassifier::backward: no training-mode forward pass to differentiate");
    }
    if (grad_logits.rows() != cached_H_.rows() ||
        grad_logits.cols() != static_cast<Eigen::Index>(config_.n_classes)) {
        throw InvalidArgument(fmt::format(
            "MlpClassifier::backward: gradient is {}x{}, expected {}x{}",
            grad_logits.rows(), grad_logits.cols(),
            cached_H_.rows(), config_.n_classes));
    }

    // Head: logits = H·W2 + b2
    dW2_ += cached_H_.transpose() * grad_logits;
    db2_ += grad_logits.colwise().sum();

    // tanh'(z) = 1 − tanh(z)²
    const Matrix grad_hidden =
        ((grad_logits * W2_.transpose()).array() *
         (1.0 - cached_H_.array().square())).matrix();

    dW1_ += cached_X_.transpose() * grad_hidden;
    db1_ += grad_hidden.colwise().sum();

    has_cache_ = false;
}

void MlpClassifier::step(double learning_rate) noexcept {
    W1_ -= learning_rate * dW1_;
    b1_ -= learning_rate * db1_;
    W2_ -= learning_rate * dW2_;
    b2_ -= learning_rate * db2_;
}

} // namespace daloop
