#pragma once

/// @file include/daloop/model.hpp
/// @brief Model boundary consumed by the adaptation hooks, plus a reference
///        MLP classifier that implements it.
///
/// # Module: Model
///
/// ## Contract
/// - predict_features(X) is const: it cannot touch cached activations,
///   gradients or parameters.
/// - forward(X) returns logits and the intermediate features. In training
///   mode it also caches what backward() needs; in evaluation mode it caches
///   nothing, so a hook's forward pass never disturbs the training step.
/// - EvalModeGuard switches a model to evaluation mode for a scope and
///   restores the previous mode on exit, including on exceptions.

#include "daloop/types.hpp"

#include <cstddef>
#include <vector>

namespace daloop {

// ─── ForwardResult ────────────────────────────────────────────────────────────

struct ForwardResult {
    Matrix logits;    ///< n × n_classes, unnormalized
    Matrix features;  ///< n × feature_dim, input to the classifier head
};

// ─── Model ────────────────────────────────────────────────────────────────────

class Model {
public:
    virtual ~Model() = default;

    /// Feature extractor only.
    [[nodiscard]] virtual Matrix predict_features(const Matrix& X) const = 0;

    /// Full forward pass returning logits and features.
    [[nodiscard]] virtual ForwardResult forward(const Matrix& X) = 0;

    virtual void set_training(bool training) noexcept = 0;
    [[nodiscard]] virtual bool is_training() const noexcept = 0;

    [[nodiscard]] virtual const Device& device() const noexcept = 0;
    [[nodiscard]] virtual std::size_t input_dim() const noexcept = 0;
    [[nodiscard]] virtual std::size_t feature_dim() const noexcept = 0;
    [[nodiscard]] virtual std::size_t n_classes() const noexcept = 0;
};

// ─── TrainableModel ───────────────────────────────────────────────────────────

/// A model the Trainer can optimize with plain gradient descent.
class TrainableModel : public Model {
public:
    virtual void zero_grad() noexcept = 0;

    /// Accumulate parameter gradients for ∂loss/∂logits of the last
    /// training-mode forward(). Throws InvalidArgument if there is none or
    /// the shape differs.
    virtual void backward(const Matrix& grad_logits) = 0;

    /// Gradient-descent step: θ ← θ − learning_rate · ∇θ.
    virtual void step(double learning_rate) noexcept = 0;
};

// ─── EvalModeGuard ────────────────────────────────────────────────────────────

class EvalModeGuard {
public:
    explicit EvalModeGuard(Model& model) noexcept
        : model_(model), was_training_(model.is_training()) {
        model_.set_training(false);
    }

    ~EvalModeGuard() { model_.set_training(was_training_); }

    EvalModeGuard(const EvalModeGuard&) = delete;
    EvalModeGuard& operator=(const EvalModeGuard&) = delete;

private:
    Model& model_;
    bool   was_training_;
};

// ─── MlpClassifier ────────────────────────────────────────────────────────────

struct MlpConfig {
    std::size_t input_dim  = 2;
    std::size_t hidden_dim = 16;   ///< feature dimension
    std::size_t n_classes  = 2;
    unsigned    seed       = 0;
    Device      device{};
};

/// features = tanh(X·W1 + b1),  logits = features·W2 + b2.
///
/// Weights start from a seeded uniform Xavier draw; biases start at zero.
class MlpClassifier : public TrainableModel {
public:
    /// Throws InvalidArgument if any dimension is zero.
    explicit MlpClassifier(MlpConfig config);

    [[nodiscard]] Matrix predict_features(const Matrix& X) const override;
    [[nodiscard]] ForwardResult forward(const Matrix& X) override;

    /// Row-wise softmax of the logits.
    [[nodiscard]] Matrix predict_proba(const Matrix& X) const;

    /// Argmax class per row.
    [[nodiscard]] std::vector<int> predict(const Matrix& X) const;

    void set_training(bool training) noexcept override { training_ = training; }
    [[nodiscard]] bool is_training() const noexcept override { return training_; }

    [[nodiscard]] const Device& device() const noexcept override { return config_.device; }
    [[nodiscard]] std::size_t input_dim() const noexcept override { return config_.input_dim; }
    [[nodiscard]] std::size_t feature_dim() const noexcept override { return config_.hidden_dim; }
    [[nodiscard]] std::size_t n_classes() const noexcept override { return config_.n_classes; }

    void zero_grad() noexcept override;
    void backward(const Matrix& grad_logits) override;
    void step(double learning_rate) noexcept override;

    /// True while a training-mode forward() is waiting for backward().
    [[nodiscard]] bool has_cached_activations() const noexcept { return has_cache_; }

private:
    /// Throws InvalidArgument if X has the wrong number of columns.
    void check_input(const Matrix& X) const;

    [[nodiscard]] Matrix hidden(const Matrix& X) const;

    MlpConfig config_;
    bool      training_ = true;

    Matrix    W1_;   ///< input_dim × hidden_dim
    RowVector b1_;
    Matrix    W2_;   ///< hidden_dim × n_classes
    RowVector b2_;

    Matrix    dW1_;
    RowVector db1_;
    Matrix    dW2_;
    RowVector db2_;

    Matrix    cached_X_;
    Matrix    cached_H_;
    bool      has_cache_ = false;
};

} // namespace daloop
